#ifndef SID_CORRECTION_REPLAY_H
#define SID_CORRECTION_REPLAY_H

#include "manager/resolution.h"
#include "manager/speaker_clustering_engine.h"
#include "manager/unknown_speaker_clusterer.h"
#include "storage/speaker_record.h"
#include <cstddef>
#include <string>
#include <vector>

namespace sid {

// One segment whose speaker changed during a replay
struct SpeakerChange {
    size_t index;
    int old_speaker;
    int new_speaker;
    std::string new_label;
    Resolution resolution;
};

// Result of a replay. Holds the replayed engine state until apply() commits it.
struct ReplayOutcome {
    size_t from_index = 0;
    size_t replayed_count = 0;                 // segments actually re-decided
    std::vector<SpeakerChange> changes;        // ascending index
    std::vector<SegmentRecord> segments;       // full list with updated assignments
    SpeakerClusteringEngine engine;
    UnknownSpeakerClusterer unknown;
};

// Subtract one recorded segment's embedding from the record it was folded
// into, passing the segment's closest-enrolled name to unknown clusters.
// False when the segment never contributed or the record refuses the undo.
// The caller owns clearing seg.contributed.
bool undo_contribution(SpeakerClusteringEngine& engine,
                       UnknownSpeakerClusterer& unknown,
                       const SegmentRecord& seg);

/**
 * Re-decides a suffix of a session after a correction (mid-session
 * enrollment, manual centroid edit).
 *
 * The replay runs on copies of the live engines: contributions recorded for
 * segments [from_index..] are undone, then those segments are decided again
 * in order. Nothing live changes until apply(), so replaying the same slice
 * twice against the same state yields the same diff. Segments whose
 * contribution was already undone by hand (contributed == false) are not
 * undone a second time.
 */
class CorrectionReplay {
public:
    CorrectionReplay(const SpeakerClusteringEngine& engine,
                     const UnknownSpeakerClusterer& unknown);

    ReplayOutcome recluster_from_index(const std::vector<SegmentRecord>& segments,
                                       size_t from_index) const;

    // Commit a replay: engines and segment list take the replayed state
    static void apply(ReplayOutcome&& outcome,
                      SpeakerClusteringEngine& engine,
                      UnknownSpeakerClusterer& unknown,
                      std::vector<SegmentRecord>& segments);

private:
    const SpeakerClusteringEngine& engine_;
    const UnknownSpeakerClusterer& unknown_;
};

} // namespace sid

#endif // SID_CORRECTION_REPLAY_H
