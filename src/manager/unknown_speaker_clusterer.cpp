#include "manager/unknown_speaker_clusterer.h"
#include "core/similarity.h"
#include "utils/logger.h"
#include <algorithm>

namespace sid {

UnknownSpeakerClusterer::UnknownSpeakerClusterer(const UnknownClusterConfig& config)
    : config_(config) {
    config_.sanitize();
}

std::optional<ClosestEnrolled> UnknownSpeakerClusterer::closest_enrolled(
    const std::vector<CandidateScore>& candidates) {
    const CandidateScore* best = nullptr;
    for (const auto& c : candidates) {
        if (!c.enrolled) continue;
        if (!best || c.similarity > best->similarity) {
            best = &c;
        }
    }
    if (!best) return std::nullopt;
    return ClosestEnrolled{best->label, best->similarity};
}

UnknownClusterResult UnknownSpeakerClusterer::process_unknown_segment(
    const std::vector<float>& embedding,
    const std::vector<CandidateScore>& candidates) {
    auto closest = closest_enrolled(candidates);
    const int reuse_id = reuse_id_;
    reuse_id_ = kUnassignedSpeakerId;

    UnknownClusterResult result;
    result.closest_enrolled = closest;
    result.cluster_count = live_cluster_count();

    auto unit = SimilarityCalculator::l2_normalized(embedding);
    if (unit.empty()) {
        result.unknown_id = kUnknownSpeakerBase;
        result.reason = DecisionReason::NoEmbedding;
        return result;
    }

    if (!clusters_.empty() &&
        static_cast<int>(unit.size()) != clusters_.front().centroid.dimension()) {
        SID_LOG_WARN("Unknown segment dimension {} does not match cluster dimension {}",
                     unit.size(), clusters_.front().centroid.dimension());
        result.unknown_id = kUnknownSpeakerBase;
        result.reason = DecisionReason::NoEmbedding;
        return result;
    }

    // Scoring pass over live clusters
    std::vector<int> live;
    std::vector<float> scores;
    for (size_t i = 0; i < clusters_.size(); ++i) {
        if (!clusters_[i].active) continue;
        live.push_back(static_cast<int>(i));
        scores.push_back(SimilarityCalculator::cosine_similarity(
            unit, clusters_[i].centroid.centroid()));
    }

    if (live.empty()) {
        return create_cluster(unit, closest, reuse_id);
    }

    auto ranked = SimilarityCalculator::rank(scores);
    const float second = ranked.second_index >= 0 ? ranked.second_score : 0.0f;

    result.similarity = ranked.best_score;
    result.margin = ranked.best_score - second;

    if (ranked.best_score < config_.similarity_threshold &&
        live_cluster_count() < config_.max_unknown_speakers) {
        return create_cluster(unit, closest, reuse_id);
    }

    // Ambiguity between two unknown clusters does not block assignment
    auto& cluster = clusters_[live[ranked.best_index]];
    result.unknown_id = cluster.id;
    result.reason = DecisionReason::UnknownClusterMatch;
    result.forced_assignment = ranked.best_score < config_.similarity_threshold;
    result.centroid_updated = cluster.centroid.add(unit);
    if (result.centroid_updated) {
        record_closest(cluster, closest);
    }

    SID_LOG_DEBUG("{} matched: sim={:.3f} margin={:.3f} count={}{}",
                  label(cluster.id), result.similarity, result.margin, cluster.count(),
                  result.forced_assignment ? " (forced)" : "");
    return result;
}

UnknownClusterResult UnknownSpeakerClusterer::create_cluster(
    const std::vector<float>& unit_embedding,
    const std::optional<ClosestEnrolled>& closest,
    int reuse_id) {
    UnknownClusterRecord* target = find_mutable(reuse_id);
    if (target && !target->active) {
        UnknownClusterRecord revived;
        revived.id = reuse_id;
        *target = std::move(revived);
    } else {
        UnknownClusterRecord cluster;
        cluster.id = kUnknownSpeakerBase - cluster_count();
        clusters_.push_back(std::move(cluster));
        target = &clusters_.back();
    }
    target->centroid = RunningCentroid(unit_embedding);
    record_closest(*target, closest);

    UnknownClusterResult result;
    result.unknown_id = target->id;
    result.closest_enrolled = closest;
    result.reason = DecisionReason::UnknownNewCluster;
    result.similarity = 1.0f;
    result.margin = 1.0f;
    result.cluster_count = live_cluster_count();
    result.centroid_updated = true;

    SID_LOG_INFO("New unknown cluster {} ({} live)", label(result.unknown_id),
                 live_cluster_count());
    return result;
}

void UnknownSpeakerClusterer::record_closest(UnknownClusterRecord& cluster,
                                             const std::optional<ClosestEnrolled>& closest) {
    if (!closest) return;
    cluster.closest_enrolled_history.push_back(*closest);
    update_aggregate(cluster);
}

void UnknownSpeakerClusterer::update_aggregate(UnknownClusterRecord& cluster) {
    struct Tally {
        std::string name;
        int count;
        double total_similarity;
    };

    // Kept in order of first appearance so remaining ties resolve deterministically
    std::vector<Tally> tallies;
    for (const auto& entry : cluster.closest_enrolled_history) {
        if (entry.name.empty()) continue;
        auto it = std::find_if(tallies.begin(), tallies.end(),
                               [&](const Tally& t) { return t.name == entry.name; });
        if (it == tallies.end()) {
            tallies.push_back({entry.name, 1, entry.similarity});
        } else {
            ++it->count;
            it->total_similarity += entry.similarity;
        }
    }

    const Tally* best = nullptr;
    for (const auto& t : tallies) {
        if (!best || t.count > best->count ||
            (t.count == best->count &&
             t.total_similarity / t.count > best->total_similarity / best->count)) {
            best = &t;
        }
    }

    if (!best) {
        cluster.closest_enrolled_aggregate.reset();
        return;
    }

    ClosestEnrolledAggregate aggregate;
    aggregate.name = best->name;
    aggregate.similarity = static_cast<float>(best->total_similarity / best->count);
    aggregate.occurrences = best->count;
    aggregate.total_segments = static_cast<int>(cluster.closest_enrolled_history.size());
    cluster.closest_enrolled_aggregate = aggregate;
}

bool UnknownSpeakerClusterer::remove_from_centroid(int unknown_id,
                                                   const std::vector<float>& embedding,
                                                   const std::string& closest_enrolled) {
    UnknownClusterRecord* cluster = find_mutable(unknown_id);
    if (!cluster || !cluster->active) {
        SID_LOG_WARN("remove_from_centroid: no live unknown cluster with id {}", unknown_id);
        return false;
    }

    auto unit = SimilarityCalculator::l2_normalized(embedding);
    if (unit.empty() || !cluster->centroid.remove(unit)) {
        SID_LOG_DEBUG("remove_from_centroid: {} refused the inverse update", label(unknown_id));
        return false;
    }

    if (!closest_enrolled.empty()) {
        auto& history = cluster->closest_enrolled_history;
        for (auto it = history.rbegin(); it != history.rend(); ++it) {
            if (it->name == closest_enrolled) {
                history.erase(std::next(it).base());
                break;
            }
        }
        update_aggregate(*cluster);
    }
    return true;
}

bool UnknownSpeakerClusterer::retire_cluster(int unknown_id) {
    UnknownClusterRecord* cluster = find_mutable(unknown_id);
    if (!cluster || !cluster->active) return false;
    cluster->active = false;
    SID_LOG_DEBUG("Retired {}", label(unknown_id));
    return true;
}

int UnknownSpeakerClusterer::live_cluster_count() const {
    return static_cast<int>(std::count_if(clusters_.begin(), clusters_.end(),
                                          [](const UnknownClusterRecord& c) { return c.active; }));
}

std::vector<UnknownSpeakerClusterer::UnknownSpeakerInfo>
UnknownSpeakerClusterer::all_unknown_speakers() const {
    std::vector<UnknownSpeakerInfo> result;
    for (const auto& c : clusters_) {
        if (!c.active || c.count() < config_.min_segments_for_cluster) continue;
        result.push_back({c.id, label(c.id), c.count(), c.closest_enrolled_aggregate,
                          std::min(0.9f, 0.5f + 0.05f * static_cast<float>(c.count()))});
    }
    return result;
}

std::optional<UnknownSpeakerClusterer::UnknownSpeakerInfo>
UnknownSpeakerClusterer::cluster_info(int unknown_id) const {
    const UnknownClusterRecord* c = find_cluster(unknown_id);
    if (!c) return std::nullopt;
    return UnknownSpeakerInfo{c->id, label(c->id), c->count(), c->closest_enrolled_aggregate,
                              std::min(0.9f, 0.5f + 0.05f * static_cast<float>(c->count()))};
}

std::string UnknownSpeakerClusterer::label(int unknown_id) const {
    return "Unknown " + std::to_string(kUnknownSpeakerBase - unknown_id + 1);
}

std::vector<UnknownClusterSnapshot> UnknownSpeakerClusterer::serialize() const {
    std::vector<UnknownClusterSnapshot> snapshot;
    snapshot.reserve(clusters_.size());
    for (const auto& c : clusters_) {
        if (!c.active) continue;
        snapshot.push_back({c.id, c.centroid.centroid(), c.count(), c.closest_enrolled_aggregate});
    }
    return snapshot;
}

void UnknownSpeakerClusterer::restore(const std::vector<UnknownClusterSnapshot>& snapshot) {
    std::vector<UnknownClusterSnapshot> ordered;
    for (const auto& s : snapshot) {
        if (s.centroid.empty() || !is_unknown_id(s.id)) {
            SID_LOG_WARN("Skipping invalid unknown cluster snapshot (id={})", s.id);
            continue;
        }
        ordered.push_back(s);
    }
    // First-created cluster first
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const UnknownClusterSnapshot& a, const UnknownClusterSnapshot& b) {
                         return a.id > b.id;
                     });

    clusters_.clear();
    for (const auto& s : ordered) {
        UnknownClusterRecord cluster;
        cluster.id = kUnknownSpeakerBase - cluster_count();
        if (cluster.id != s.id) {
            SID_LOG_WARN("Unknown cluster {} restored as {}", s.id, cluster.id);
        }
        cluster.centroid = RunningCentroid::from_snapshot(s.centroid, s.count);
        if (cluster.centroid.empty()) continue;
        cluster.closest_enrolled_aggregate = s.closest_enrolled_aggregate;
        clusters_.push_back(std::move(cluster));
    }
    SID_LOG_INFO("Restored {} unknown clusters", clusters_.size());
}

void UnknownSpeakerClusterer::reset() {
    clusters_.clear();
}

UnknownClusterRecord* UnknownSpeakerClusterer::find_mutable(int unknown_id) {
    if (!is_unknown_id(unknown_id)) return nullptr;
    const int index = kUnknownSpeakerBase - unknown_id;
    if (index >= cluster_count()) return nullptr;
    return &clusters_[index];
}

const UnknownClusterRecord* UnknownSpeakerClusterer::find_cluster(int unknown_id) const {
    if (!is_unknown_id(unknown_id)) return nullptr;
    const int index = kUnknownSpeakerBase - unknown_id;
    if (index >= cluster_count()) return nullptr;
    return &clusters_[index];
}

} // namespace sid
