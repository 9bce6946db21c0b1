#include "manager/persistence_bridge.h"
#include "utils/logger.h"

namespace sid {

std::vector<EnrolledSpeaker> PersistenceBridge::export_enrolled(
    const SpeakerClusteringEngine& engine) {
    return engine.export_enrolled_speakers();
}

std::vector<SimilarityWarning> PersistenceBridge::import_enrolled(
    SpeakerClusteringEngine& engine, const std::vector<EnrolledSpeaker>& enrollments) {
    return engine.import_enrolled_speakers(enrollments);
}

std::vector<UnknownClusterSnapshot> PersistenceBridge::snapshot_unknown(
    const UnknownSpeakerClusterer& clusterer) {
    return clusterer.serialize();
}

void PersistenceBridge::restore_unknown(UnknownSpeakerClusterer& clusterer,
                                        const std::vector<UnknownClusterSnapshot>& snapshot) {
    clusterer.restore(snapshot);
}

void PersistenceBridge::propagate_enrolled(const SpeakerClusteringEngine& source,
                                           const std::vector<SpeakerClusteringEngine*>& targets) {
    const auto enrolled = source.export_enrolled_speakers();
    int propagated = 0;
    for (auto* target : targets) {
        if (!target || target == &source) continue;
        target->import_enrolled_speakers(enrolled);
        ++propagated;
    }
    SID_LOG_INFO("Propagated {} enrolled speakers to {} engines", enrolled.size(), propagated);
}

} // namespace sid
