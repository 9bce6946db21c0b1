#ifndef SID_PERSISTENCE_BRIDGE_H
#define SID_PERSISTENCE_BRIDGE_H

#include "manager/speaker_clustering_engine.h"
#include "manager/unknown_speaker_clusterer.h"
#include "storage/speaker_record.h"
#include <vector>

namespace sid {

/**
 * Plain-data snapshots for an external store. Storage itself (files,
 * key-value stores) belongs to the caller.
 */
class PersistenceBridge {
public:
    // Active enrolled speakers in registry order
    static std::vector<EnrolledSpeaker> export_enrolled(const SpeakerClusteringEngine& engine);

    // Replace the enrolled set; entries without a centroid are skipped
    static std::vector<SimilarityWarning> import_enrolled(
        SpeakerClusteringEngine& engine, const std::vector<EnrolledSpeaker>& enrollments);

    static std::vector<UnknownClusterSnapshot> snapshot_unknown(
        const UnknownSpeakerClusterer& clusterer);

    static void restore_unknown(UnknownSpeakerClusterer& clusterer,
                                const std::vector<UnknownClusterSnapshot>& snapshot);

    // Copy source's enrolled set into every target. Point in time: later
    // changes to source are not seen by targets until propagated again.
    static void propagate_enrolled(const SpeakerClusteringEngine& source,
                                   const std::vector<SpeakerClusteringEngine*>& targets);
};

} // namespace sid

#endif // SID_PERSISTENCE_BRIDGE_H
