#ifndef SID_UNKNOWN_SPEAKER_CLUSTERER_H
#define SID_UNKNOWN_SPEAKER_CLUSTERER_H

#include "core/decision.h"
#include "core/engine_config.h"
#include "storage/speaker_record.h"
#include <optional>
#include <string>
#include <vector>

namespace sid {

/**
 * Secondary clustering for segments the primary engine could not place.
 *
 * Builds anonymous pseudo-speakers ("Unknown 1", "Unknown 2", ...) with ids
 * counting down from kUnknownSpeakerBase. Each cluster remembers which
 * enrolled speaker its segments were closest to, as a hint for the UI; the
 * hint never turns into a match.
 */
class UnknownSpeakerClusterer {
public:
    struct UnknownSpeakerInfo {
        int unknown_id;
        std::string label;
        int segment_count;
        std::optional<ClosestEnrolledAggregate> closest_enrolled;
        float confidence;   // min(0.9, 0.5 + 0.05 * count), a heuristic
    };

    explicit UnknownSpeakerClusterer(const UnknownClusterConfig& config = UnknownClusterConfig());

    // candidates: the primary engine's scores for this embedding (any order)
    UnknownClusterResult process_unknown_segment(const std::vector<float>& embedding,
                                                 const std::vector<CandidateScore>& candidates);

    // Inverse of one cluster update; also drops the newest history entry for
    // closest_enrolled (when non-empty). False (no mutation) if the cluster
    // holds a single segment or the id is not a live cluster.
    bool remove_from_centroid(int unknown_id, const std::vector<float>& embedding,
                              const std::string& closest_enrolled = std::string());

    // Drop a cluster whose last segment is being replayed elsewhere. The id
    // stays allocated; only reuse_retired_id() brings it back.
    bool retire_cluster(int unknown_id);

    // If the next process_unknown_segment() creates a cluster, revive this
    // retired id instead of allocating a new one. One-shot.
    void reuse_retired_id(int unknown_id) { reuse_id_ = unknown_id; }

    // Live clusters with at least min_segments_for_cluster segments
    std::vector<UnknownSpeakerInfo> all_unknown_speakers() const;

    std::optional<UnknownSpeakerInfo> cluster_info(int unknown_id) const;

    std::string label(int unknown_id) const;

    static bool is_unknown_id(int speaker_id) {
        return speaker_id <= kUnknownSpeakerBase && speaker_id != kUnassignedSpeakerId;
    }

    // Enrolled candidate with the highest similarity, if any
    static std::optional<ClosestEnrolled> closest_enrolled(
        const std::vector<CandidateScore>& candidates);

    std::vector<UnknownClusterSnapshot> serialize() const;

    // Replace all clusters; histories start empty, aggregates are kept as given
    void restore(const std::vector<UnknownClusterSnapshot>& snapshot);

    void reset();

    // All clusters ever created, retired ones included
    int cluster_count() const { return static_cast<int>(clusters_.size()); }
    int live_cluster_count() const;
    const std::vector<UnknownClusterRecord>& clusters() const { return clusters_; }
    const UnknownClusterConfig& config() const { return config_; }

private:
    UnknownClusterResult create_cluster(const std::vector<float>& unit_embedding,
                                        const std::optional<ClosestEnrolled>& closest,
                                        int reuse_id);
    void record_closest(UnknownClusterRecord& cluster,
                        const std::optional<ClosestEnrolled>& closest);
    static void update_aggregate(UnknownClusterRecord& cluster);
    UnknownClusterRecord* find_mutable(int unknown_id);
    const UnknownClusterRecord* find_cluster(int unknown_id) const;

    UnknownClusterConfig config_;
    std::vector<UnknownClusterRecord> clusters_;   // index i holds id kUnknownSpeakerBase - i
    int reuse_id_ = kUnassignedSpeakerId;
};

} // namespace sid

#endif // SID_UNKNOWN_SPEAKER_CLUSTERER_H
