#include "manager/resolution.h"
#include "manager/speaker_clustering_engine.h"
#include "manager/unknown_speaker_clusterer.h"

namespace sid {

Resolution resolve_embedding(SpeakerClusteringEngine& engine,
                             UnknownSpeakerClusterer& unknown,
                             const std::vector<float>& embedding) {
    Resolution res;
    res.decision = engine.assign_speaker(embedding);
    res.speaker_id = res.decision.speaker_id;
    res.contributed = res.decision.centroid_updated;

    if (res.decision.reason == DecisionReason::NoConfidentMatch) {
        UnknownClusterResult result =
            unknown.process_unknown_segment(embedding, res.decision.candidates);
        res.speaker_id = result.unknown_id;
        res.contributed = result.centroid_updated;
        if (result.centroid_updated && result.closest_enrolled) {
            res.closest_enrolled = result.closest_enrolled->name;
        }
        res.unknown = std::move(result);
    }

    res.label = speaker_label(engine, unknown, res.speaker_id);
    return res;
}

std::string speaker_label(const SpeakerClusteringEngine& engine,
                          const UnknownSpeakerClusterer& unknown, int speaker_id) {
    if (UnknownSpeakerClusterer::is_unknown_id(speaker_id)) {
        return unknown.label(speaker_id);
    }
    return engine.speaker_label(speaker_id);
}

std::string display_label(const SpeakerClusteringEngine& engine, const Resolution& resolution) {
    const auto& d = resolution.decision;
    if (d.reason == DecisionReason::AmbiguousMatch &&
        d.second_best_speaker_id != kUnassignedSpeakerId) {
        return resolution.label + " (" + engine.speaker_label(d.second_best_speaker_id) + "?)";
    }
    return resolution.label;
}

} // namespace sid
