#ifndef SID_SPEAKER_CLUSTERING_ENGINE_H
#define SID_SPEAKER_CLUSTERING_ENGINE_H

#include "core/decision.h"
#include "core/engine_config.h"
#include "storage/speaker_record.h"
#include <string>
#include <vector>

namespace sid {

/**
 * Online speaker clustering for one input channel.
 *
 * Each embedding is scored against every live speaker record (enrolled and
 * discovered), then matched, turned into a new discovered speaker, or handed
 * off as "no confident match" when it is below the minimum similarity or the
 * speaker cap is reached. With EngineConfig::closed_set nothing is handed off:
 * sub-threshold voices fill free slots and are force-assigned at the cap.
 * Records live in an arena indexed by their id; an id never moves to a
 * different speaker within a session, so past decisions keep pointing at the
 * right record.
 *
 * Not thread-safe. Decisions depend on arrival order; callers must serialize
 * access per instance.
 */
class SpeakerClusteringEngine {
public:
    explicit SpeakerClusteringEngine(const EngineConfig& config = EngineConfig());

    // Classify one embedding and update state. Empty embedding = no_embedding.
    AssignmentDecision assign_speaker(const std::vector<float>& embedding);

    // Read-only scoring pass over live records, in id order.
    // The embedding must already be L2-normalized.
    std::vector<CandidateScore> score_candidates(const std::vector<float>& unit_embedding) const;

    // Undo one assign_speaker() contribution. Refused for enrolled speakers,
    // records holding a single sample, unknown/retired ids and bad dimensions.
    bool remove_from_centroid(int speaker_id, const std::vector<float>& embedding);

    // Take a discovered speaker out of scoring once its founding sample is
    // being replayed. Only reuse_retired_id() brings the id back.
    bool retire_discovered(int speaker_id);

    // If the next assign_speaker() creates a speaker, revive this retired
    // discovered id instead of taking a fresh slot. One-shot.
    void reuse_retired_id(int speaker_id) { reuse_id_ = speaker_id; }

    // Add one enrolled speaker after the existing enrolled ones
    bool enroll_speaker(const std::string& name, const std::vector<float>& embedding,
                        const std::string& enrollment_id, int color_index);

    // Replace the enrolled set (no merge). Discovered speakers are untouched.
    std::vector<SimilarityWarning> import_enrolled_speakers(
        const std::vector<EnrolledSpeaker>& enrollments);

    std::vector<EnrolledSpeaker> export_enrolled_speakers() const;

    // Retire one enrolled speaker; its id stays resolvable for labels
    bool remove_enrolled_speaker(const std::string& enrollment_id);

    void clear_all_enrollments();

    // Enrolled pairs above inter_enrollment_warning_threshold
    std::vector<SimilarityWarning> check_enrolled_similarities() const;

    // Start a new session. Ids restart at 0; kept enrolled speakers are renumbered.
    void reset(bool preserve_enrolled);

    void set_num_speakers(int n);
    int num_speakers() const { return config_.num_speakers; }

    // Enrolled name, or "Speaker N" for discovered speakers
    std::string speaker_label(int speaker_id) const;

    // Live records (enrolled + discovered)
    int speaker_count() const;
    int enrolled_count() const;
    bool has_enrolled_speaker() const { return enrolled_count() > 0; }

    // Embedding dimension, 0 until the first record fixes it
    int dimension() const { return dimension_; }

    const SpeakerRecord* find_speaker(int speaker_id) const;
    const std::vector<SpeakerRecord>& speakers() const { return speakers_; }
    const EngineConfig& config() const { return config_; }

private:
    // Normalized copy of a usable embedding, empty if unusable
    std::vector<float> prepare_embedding(const std::vector<float>& embedding) const;

    int create_discovered(const std::vector<float>& unit_embedding, int reuse_id);
    SpeakerRecord* find_mutable(int speaker_id);

    EngineConfig config_;
    std::vector<SpeakerRecord> speakers_;
    std::vector<int> enrolled_order_;   // ids of active enrolled records, registry order
    int dimension_ = 0;
    int reuse_id_ = kUnassignedSpeakerId;
};

} // namespace sid

#endif // SID_SPEAKER_CLUSTERING_ENGINE_H
