#ifndef SID_RESOLUTION_H
#define SID_RESOLUTION_H

#include "core/decision.h"
#include <optional>
#include <string>
#include <vector>

namespace sid {

class SpeakerClusteringEngine;
class UnknownSpeakerClusterer;

// Final identity of one segment: primary decision plus the unknown-path result
struct Resolution {
    int speaker_id = 0;                       // primary id (>= 0), unknown id (<= -100) or -1
    std::string label;
    AssignmentDecision decision;
    std::optional<UnknownClusterResult> unknown;
    bool contributed = false;                 // embedding folded into speaker_id's centroid
    std::string closest_enrolled;             // recorded in the unknown cluster's history
    bool environmental = false;
};

// Primary decision, with hand-off to the unknown clusterer on no_confident_match
Resolution resolve_embedding(SpeakerClusteringEngine& engine,
                             UnknownSpeakerClusterer& unknown,
                             const std::vector<float>& embedding);

// Label for any id the pipeline can produce
std::string speaker_label(const SpeakerClusteringEngine& engine,
                          const UnknownSpeakerClusterer& unknown, int speaker_id);

// "Speaker A (Speaker B?)" for ambiguous matches, otherwise the plain label
std::string display_label(const SpeakerClusteringEngine& engine, const Resolution& resolution);

} // namespace sid

#endif // SID_RESOLUTION_H
