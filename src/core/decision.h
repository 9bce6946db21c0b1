#ifndef SID_DECISION_H
#define SID_DECISION_H

#include <optional>
#include <string>
#include <vector>

namespace sid {

// Sentinel for "no speaker assigned" (environmental phrases, hand-off pending)
constexpr int kUnassignedSpeakerId = -1;

// First unknown pseudo-speaker id; later clusters count downwards from here
constexpr int kUnknownSpeakerBase = -100;

// Why a segment got the speaker it got. Values are part of the C ABI
// (SID_REASON_*), do not reorder.
enum class DecisionReason {
    NoEmbedding = 0,
    NewSpeaker = 1,
    ConfidentMatch = 2,
    AmbiguousMatch = 3,
    BelowMinimumThreshold = 4,
    NoConfidentMatch = 5,
    UnknownNewCluster = 6,
    UnknownClusterMatch = 7,
    Inherited = 8,
    BoostedMatch = 9   // reserved for an upstream boosting stage, never produced here
};

// snake_case name, e.g. "confident_match"
const char* reason_to_string(DecisionReason reason);

// One live speaker's score against the current embedding
struct CandidateScore {
    int speaker_id = kUnassignedSpeakerId;
    std::string label;
    float similarity = 0.0f;
    bool enrolled = false;
};

struct AssignmentDecision {
    int speaker_id = 0;
    DecisionReason reason = DecisionReason::NoEmbedding;
    float similarity = 0.0f;
    float second_best_similarity = 0.0f;
    float margin = 0.0f;
    bool is_enrolled = false;
    bool forced_assignment = false;
    bool centroid_updated = false;
    int second_best_speaker_id = kUnassignedSpeakerId;
    std::vector<CandidateScore> candidates;  // descending similarity, ties by id
};

struct ClosestEnrolled {
    std::string name;
    float similarity = 0.0f;
};

struct ClosestEnrolledAggregate {
    std::string name;
    float similarity = 0.0f;  // average over this name's occurrences
    int occurrences = 0;
    int total_segments = 0;
};

struct UnknownClusterResult {
    int unknown_id = kUnknownSpeakerBase;
    std::optional<ClosestEnrolled> closest_enrolled;
    DecisionReason reason = DecisionReason::NoEmbedding;
    float similarity = 0.0f;
    float margin = 0.0f;
    int cluster_count = 0;
    bool forced_assignment = false;
    bool centroid_updated = false;
};

} // namespace sid

#endif // SID_DECISION_H
