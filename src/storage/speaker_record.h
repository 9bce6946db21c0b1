#ifndef SID_SPEAKER_RECORD_H
#define SID_SPEAKER_RECORD_H

#include "core/centroid.h"
#include "core/decision.h"
#include <optional>
#include <string>
#include <vector>

namespace sid {

// One matched identity, enrolled or discovered. Indexed by id in the engine's arena.
struct SpeakerRecord {
    int id = 0;
    RunningCentroid centroid;
    bool enrolled = false;
    bool active = true;            // false once retired (replaced by an import, or replayed away)
    std::string enrollment_id;
    std::string name;              // empty for discovered speakers
    int color_index = 0;

    int sample_count() const { return centroid.count(); }
};

// Enrolled speaker as supplied by / handed back to the enrollment registry
struct EnrolledSpeaker {
    std::string id;
    std::string name;
    std::vector<float> centroid;
    int color_index = 0;

    EnrolledSpeaker() = default;

    EnrolledSpeaker(const std::string& enrollment_id, const std::string& speaker_name,
                    const std::vector<float>& emb, int color = 0)
        : id(enrollment_id), name(speaker_name), centroid(emb), color_index(color) {}
};

// Enrolled pair whose centroids are close enough to be confused
struct SimilarityWarning {
    std::string speaker1;
    std::string speaker2;
    float similarity = 0.0f;
};

struct UnknownClusterRecord {
    int id = kUnknownSpeakerBase;
    RunningCentroid centroid;
    bool active = true;            // false once a replay undid every segment it held
    std::vector<ClosestEnrolled> closest_enrolled_history;
    std::optional<ClosestEnrolledAggregate> closest_enrolled_aggregate;

    int count() const { return centroid.count(); }
};

struct UnknownClusterSnapshot {
    int id = kUnknownSpeakerBase;
    std::vector<float> centroid;
    int count = 0;
    std::optional<ClosestEnrolledAggregate> closest_enrolled_aggregate;
};

// One past utterance of a session, as needed to re-decide it
struct SegmentRecord {
    std::vector<float> embedding;   // empty = no embedding
    bool environmental = false;     // non-speech; never attributed
    int speaker_id = kUnassignedSpeakerId;
    bool contributed = false;       // embedding was folded into speaker_id's centroid
    std::string closest_enrolled;   // name recorded in the unknown cluster's history, if any
};

} // namespace sid

#endif // SID_SPEAKER_RECORD_H
