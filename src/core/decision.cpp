#include "core/decision.h"

namespace sid {

const char* reason_to_string(DecisionReason reason) {
    switch (reason) {
        case DecisionReason::NoEmbedding: return "no_embedding";
        case DecisionReason::NewSpeaker: return "new_speaker";
        case DecisionReason::ConfidentMatch: return "confident_match";
        case DecisionReason::AmbiguousMatch: return "ambiguous_match";
        case DecisionReason::BelowMinimumThreshold: return "below_minimum_threshold";
        case DecisionReason::NoConfidentMatch: return "no_confident_match";
        case DecisionReason::UnknownNewCluster: return "unknown_new_cluster";
        case DecisionReason::UnknownClusterMatch: return "unknown_cluster_match";
        case DecisionReason::Inherited: return "inherited";
        case DecisionReason::BoostedMatch: return "boosted_match";
    }
    return "unknown_reason";
}

} // namespace sid
