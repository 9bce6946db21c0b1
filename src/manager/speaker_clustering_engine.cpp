#include "manager/speaker_clustering_engine.h"
#include "core/similarity.h"
#include "utils/logger.h"
#include <algorithm>

namespace sid {

SpeakerClusteringEngine::SpeakerClusteringEngine(const EngineConfig& config)
    : config_(config) {
    config_.sanitize();
    dimension_ = config_.dimension;
}

std::vector<float> SpeakerClusteringEngine::prepare_embedding(
    const std::vector<float>& embedding) const {
    if (embedding.empty()) return {};

    if (dimension_ > 0 && static_cast<int>(embedding.size()) != dimension_) {
        SID_LOG_WARN("Embedding dimension {} does not match engine dimension {}",
                     embedding.size(), dimension_);
        return {};
    }

    auto unit = SimilarityCalculator::l2_normalized(embedding);
    if (unit.empty()) {
        SID_LOG_WARN("Embedding has zero or non-finite norm, ignored");
    }
    return unit;
}

std::vector<CandidateScore> SpeakerClusteringEngine::score_candidates(
    const std::vector<float>& unit_embedding) const {
    std::vector<CandidateScore> scores;
    scores.reserve(speakers_.size());

    for (const auto& rec : speakers_) {
        if (!rec.active) continue;
        CandidateScore score;
        score.speaker_id = rec.id;
        score.label = speaker_label(rec.id);
        score.similarity = SimilarityCalculator::cosine_similarity(
            unit_embedding, rec.centroid.centroid());
        score.enrolled = rec.enrolled;
        scores.push_back(std::move(score));
    }

    return scores;
}

AssignmentDecision SpeakerClusteringEngine::assign_speaker(const std::vector<float>& embedding) {
    AssignmentDecision decision;
    const int reuse_id = reuse_id_;
    reuse_id_ = kUnassignedSpeakerId;

    auto unit = prepare_embedding(embedding);
    if (unit.empty()) {
        // Degenerate default; does not create speaker 0
        decision.speaker_id = 0;
        decision.reason = DecisionReason::NoEmbedding;
        return decision;
    }

    if (speaker_count() == 0) {
        int id = create_discovered(unit, reuse_id);
        decision.speaker_id = id;
        decision.reason = DecisionReason::NewSpeaker;
        decision.similarity = 1.0f;
        decision.margin = 1.0f;
        decision.centroid_updated = true;
        decision.candidates.push_back({id, speaker_label(id), 1.0f, false});
        SID_LOG_DEBUG("First speaker created: id={}", id);
        return decision;
    }

    // Scoring pass: read-only
    auto candidates = score_candidates(unit);

    std::vector<float> scores;
    scores.reserve(candidates.size());
    for (const auto& c : candidates) scores.push_back(c.similarity);
    auto ranked = SimilarityCalculator::rank(scores);

    int winner = ranked.best_index;
    if (!candidates[winner].enrolled) {
        int best_enrolled = -1;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (!candidates[i].enrolled) continue;
            if (best_enrolled < 0 ||
                candidates[i].similarity > candidates[best_enrolled].similarity) {
                best_enrolled = static_cast<int>(i);
            }
        }
        if (best_enrolled >= 0 &&
            candidates[winner].similarity - candidates[best_enrolled].similarity <=
                config_.enrolled_priority_margin) {
            winner = best_enrolled;
        }
    }

    int runner_up = -1;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (static_cast<int>(i) == winner) continue;
        if (runner_up < 0 || candidates[i].similarity > candidates[runner_up].similarity) {
            runner_up = static_cast<int>(i);
        }
    }

    const CandidateScore best = candidates[winner];
    const float second = runner_up >= 0 ? candidates[runner_up].similarity : 0.0f;
    const float margin = std::max(0.0f, best.similarity - second);
    const bool has_runner_up = runner_up >= 0;

    decision.similarity = best.similarity;
    decision.second_best_similarity = second;
    decision.margin = margin;
    decision.is_enrolled = best.enrolled;
    decision.second_best_speaker_id =
        has_runner_up ? candidates[runner_up].speaker_id : kUnassignedSpeakerId;

    // Write pass: at most one record changes
    if (best.similarity >= config_.similarity_threshold) {
        decision.speaker_id = best.speaker_id;
        if (has_runner_up && margin < config_.confidence_margin) {
            decision.reason = DecisionReason::AmbiguousMatch;
        } else {
            decision.reason = DecisionReason::ConfidentMatch;
            SpeakerRecord* rec = find_mutable(best.speaker_id);
            if (rec && (!rec->enrolled || config_.update_enrolled_centroids)) {
                decision.centroid_updated = rec->centroid.add(unit);
            }
        }
    } else if (speaker_count() < config_.num_speakers &&
               (best.similarity >= config_.minimum_similarity_threshold || config_.closed_set)) {
        int id = create_discovered(unit, reuse_id);
        decision.speaker_id = id;
        decision.reason = DecisionReason::NewSpeaker;
        decision.is_enrolled = false;
        decision.similarity = 1.0f;
        decision.margin = 1.0f;
        decision.second_best_similarity = best.similarity;
        decision.second_best_speaker_id = best.speaker_id;
        decision.centroid_updated = true;
    } else if (!config_.closed_set) {
        // Below the minimum, or no free slot: the unknown clusterer decides
        decision.speaker_id = kUnassignedSpeakerId;
        decision.reason = DecisionReason::NoConfidentMatch;
        decision.is_enrolled = false;
    } else {
        decision.speaker_id = best.speaker_id;
        decision.reason = DecisionReason::BelowMinimumThreshold;
        decision.forced_assignment = true;
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CandidateScore& a, const CandidateScore& b) {
                         return a.similarity > b.similarity;
                     });
    decision.candidates = std::move(candidates);

    SID_LOG_DEBUG("Assigned {} ({}): sim={:.3f} margin={:.3f} speakers={}",
                  speaker_label(decision.speaker_id), reason_to_string(decision.reason),
                  decision.similarity, decision.margin, speaker_count());
    return decision;
}

bool SpeakerClusteringEngine::remove_from_centroid(int speaker_id,
                                                   const std::vector<float>& embedding) {
    SpeakerRecord* rec = find_mutable(speaker_id);
    if (!rec || !rec->active) {
        SID_LOG_WARN("remove_from_centroid: no live speaker with id {}", speaker_id);
        return false;
    }
    if (rec->enrolled) {
        SID_LOG_DEBUG("remove_from_centroid: speaker {} is enrolled, centroid is fixed", speaker_id);
        return false;
    }
    if (rec->sample_count() <= 1) {
        SID_LOG_DEBUG("remove_from_centroid: speaker {} holds a single sample", speaker_id);
        return false;
    }

    auto unit = prepare_embedding(embedding);
    if (unit.empty()) return false;

    if (!rec->centroid.remove(unit)) {
        SID_LOG_WARN("remove_from_centroid: speaker {} rejected the inverse update", speaker_id);
        return false;
    }
    SID_LOG_DEBUG("Removed one sample from speaker {} (count={})", speaker_id, rec->sample_count());
    return true;
}

bool SpeakerClusteringEngine::retire_discovered(int speaker_id) {
    SpeakerRecord* rec = find_mutable(speaker_id);
    if (!rec || !rec->active || rec->enrolled) return false;
    rec->active = false;
    SID_LOG_DEBUG("Retired discovered speaker {}", speaker_id);
    return true;
}

bool SpeakerClusteringEngine::enroll_speaker(const std::string& name,
                                             const std::vector<float>& embedding,
                                             const std::string& enrollment_id,
                                             int color_index) {
    auto unit = prepare_embedding(embedding);
    if (unit.empty()) {
        SID_LOG_WARN("Enrollment '{}' has no usable centroid", name);
        return false;
    }

    std::string eid = enrollment_id.empty()
        ? "enrolled-" + std::to_string(speakers_.size())
        : enrollment_id;

    SpeakerRecord* existing = nullptr;
    for (auto& rec : speakers_) {
        if (rec.enrolled && rec.enrollment_id == eid) {
            existing = &rec;
            break;
        }
    }

    if (existing) {
        existing->centroid = RunningCentroid(unit);
        existing->name = name;
        existing->color_index = color_index;
        if (!existing->active) {
            existing->active = true;
            enrolled_order_.push_back(existing->id);
        }
    } else {
        SpeakerRecord rec;
        rec.id = static_cast<int>(speakers_.size());
        rec.centroid = RunningCentroid(unit);
        rec.enrolled = true;
        rec.enrollment_id = eid;
        rec.name = name;
        rec.color_index = color_index;
        enrolled_order_.push_back(rec.id);
        speakers_.push_back(std::move(rec));
    }

    if (dimension_ == 0) dimension_ = static_cast<int>(unit.size());
    SID_LOG_INFO("Enrolled speaker '{}' ({})", name, eid);
    return true;
}

std::vector<SimilarityWarning> SpeakerClusteringEngine::import_enrolled_speakers(
    const std::vector<EnrolledSpeaker>& enrollments) {
    // Replace, never merge
    for (int id : enrolled_order_) {
        speakers_[id].active = false;
    }
    enrolled_order_.clear();

    int imported = 0;
    for (size_t i = 0; i < enrollments.size(); ++i) {
        const auto& e = enrollments[i];
        if (e.centroid.empty()) {
            SID_LOG_DEBUG("Skipping enrollment '{}' without centroid", e.name);
            continue;
        }
        if (enroll_speaker(e.name, e.centroid, e.id, e.color_index)) {
            ++imported;
        }
    }

    SID_LOG_INFO("Imported {} enrolled speakers ({} supplied)", imported, enrollments.size());
    return check_enrolled_similarities();
}

std::vector<EnrolledSpeaker> SpeakerClusteringEngine::export_enrolled_speakers() const {
    std::vector<EnrolledSpeaker> result;
    result.reserve(enrolled_order_.size());
    for (int id : enrolled_order_) {
        const auto& rec = speakers_[id];
        result.emplace_back(rec.enrollment_id, rec.name, rec.centroid.centroid(), rec.color_index);
    }
    return result;
}

bool SpeakerClusteringEngine::remove_enrolled_speaker(const std::string& enrollment_id) {
    for (auto it = enrolled_order_.begin(); it != enrolled_order_.end(); ++it) {
        auto& rec = speakers_[*it];
        if (rec.enrollment_id == enrollment_id) {
            rec.active = false;
            enrolled_order_.erase(it);
            SID_LOG_INFO("Removed enrolled speaker '{}' ({})", rec.name, enrollment_id);
            return true;
        }
    }
    return false;
}

void SpeakerClusteringEngine::clear_all_enrollments() {
    for (int id : enrolled_order_) {
        speakers_[id].active = false;
    }
    enrolled_order_.clear();
    SID_LOG_INFO("Cleared all enrollments");
}

std::vector<SimilarityWarning> SpeakerClusteringEngine::check_enrolled_similarities() const {
    std::vector<SimilarityWarning> warnings;
    if (enrolled_order_.size() < 2) return warnings;

    for (size_t i = 0; i < enrolled_order_.size(); ++i) {
        const auto& a = speakers_[enrolled_order_[i]];
        for (size_t j = i + 1; j < enrolled_order_.size(); ++j) {
            const auto& b = speakers_[enrolled_order_[j]];
            float sim = SimilarityCalculator::cosine_similarity(a.centroid.centroid(),
                                                                b.centroid.centroid());
            SID_LOG_DEBUG("Enrolled similarity {} <-> {}: {:.3f}", a.name, b.name, sim);
            if (sim > config_.inter_enrollment_warning_threshold) {
                SID_LOG_WARN("Enrolled speakers '{}' and '{}' are very similar ({:.3f})",
                             a.name, b.name, sim);
                warnings.push_back({a.name, b.name, sim});
            }
        }
    }
    return warnings;
}

void SpeakerClusteringEngine::reset(bool preserve_enrolled) {
    std::vector<SpeakerRecord> kept;
    std::vector<int> order;

    if (preserve_enrolled) {
        for (int id : enrolled_order_) {
            SpeakerRecord rec = speakers_[id];
            rec.id = static_cast<int>(kept.size());
            order.push_back(rec.id);
            kept.push_back(std::move(rec));
        }
    }

    speakers_ = std::move(kept);
    enrolled_order_ = std::move(order);
    if (speakers_.empty()) {
        dimension_ = config_.dimension;
    }
    SID_LOG_INFO("Engine reset (preserve_enrolled={}, speakers={})",
                 preserve_enrolled, speakers_.size());
}

void SpeakerClusteringEngine::set_num_speakers(int n) {
    config_.num_speakers = std::max(kMinSpeakers, std::min(kMaxSpeakers, n));
    SID_LOG_INFO("num_speakers set to {}", config_.num_speakers);
}

std::string SpeakerClusteringEngine::speaker_label(int speaker_id) const {
    const SpeakerRecord* rec = find_speaker(speaker_id);
    if (rec && !rec->name.empty()) {
        return rec->name;
    }
    if (speaker_id >= 0) {
        return "Speaker " + std::to_string(speaker_id + 1);
    }
    return "Unknown";
}

int SpeakerClusteringEngine::speaker_count() const {
    return static_cast<int>(std::count_if(speakers_.begin(), speakers_.end(),
                                          [](const SpeakerRecord& r) { return r.active; }));
}

int SpeakerClusteringEngine::enrolled_count() const {
    return static_cast<int>(enrolled_order_.size());
}

const SpeakerRecord* SpeakerClusteringEngine::find_speaker(int speaker_id) const {
    if (speaker_id < 0 || speaker_id >= static_cast<int>(speakers_.size())) return nullptr;
    return &speakers_[speaker_id];
}

SpeakerRecord* SpeakerClusteringEngine::find_mutable(int speaker_id) {
    if (speaker_id < 0 || speaker_id >= static_cast<int>(speakers_.size())) return nullptr;
    return &speakers_[speaker_id];
}

int SpeakerClusteringEngine::create_discovered(const std::vector<float>& unit_embedding,
                                               int reuse_id) {
    SpeakerRecord* retired = find_mutable(reuse_id);
    if (retired && !retired->enrolled && !retired->active) {
        retired->centroid = RunningCentroid(unit_embedding);
        retired->active = true;
        SID_LOG_INFO("Revived discovered speaker: id={}", reuse_id);
        return reuse_id;
    }

    SpeakerRecord rec;
    rec.id = static_cast<int>(speakers_.size());
    rec.centroid = RunningCentroid(unit_embedding);
    if (dimension_ == 0) dimension_ = static_cast<int>(unit_embedding.size());
    speakers_.push_back(std::move(rec));
    SID_LOG_INFO("New discovered speaker: id={}", speakers_.back().id);
    return speakers_.back().id;
}

} // namespace sid
