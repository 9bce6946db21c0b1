#ifndef SID_SESSION_RESOLVER_H
#define SID_SESSION_RESOLVER_H

#include "core/engine_config.h"
#include "manager/correction_replay.h"
#include "manager/resolution.h"
#include "manager/speaker_clustering_engine.h"
#include "manager/unknown_speaker_clusterer.h"
#include "storage/speaker_record.h"
#include <string>
#include <vector>

namespace sid {

// One phrase from the transcription pipeline
struct Phrase {
    std::vector<float> embedding;   // empty when the phrase was too short to embed
    bool environmental = false;
};

/**
 * Speaker resolution for one input channel.
 *
 * Owns the primary engine, the unknown clusterer and the ordered segment
 * history that corrections replay over. Every appended segment lands in the
 * history, including environmental and embedding-less ones, so history
 * indices match the caller's phrase indices.
 */
class SessionResolver {
public:
    explicit SessionResolver(const EngineConfig& engine_config = EngineConfig(),
                             const UnknownClusterConfig& unknown_config = UnknownClusterConfig());

    // Decide one embedding without recording it in the history
    Resolution resolve(const std::vector<float>& embedding);

    // Decide one segment and append it to the history
    Resolution append_segment(const std::vector<float>& embedding, bool environmental = false);

    /**
     * Decide a batch of phrases in order. Embedding-less phrases inherit the
     * previous phrase's speaker (reason inherited), or speaker 0 when no
     * earlier phrase had one. Environmental phrases are never attributed.
     */
    std::vector<Resolution> process_phrases(const std::vector<Phrase>& phrases);

    // Undo history[index]'s contribution and mark it as not contributing, so
    // a later replay does not subtract it again. False if it never
    // contributed or the record refuses.
    bool undo_segment(size_t index);

    // Undo by speaker and embedding. The newest contributing history segment
    // with that speaker and embedding is undone through undo_segment(); with
    // no such segment the record is edited directly.
    bool remove_from_centroid(int speaker_id, const std::vector<float>& embedding);

    // Dry run over history[from_index..]; nothing changes until apply()
    ReplayOutcome recluster_from_index(size_t from_index) const;
    void apply(ReplayOutcome&& outcome);

    std::string speaker_label(int speaker_id) const;
    std::string display_label(const Resolution& resolution) const;

    // Drops discovered speakers, unknown clusters and the history
    void reset(bool preserve_enrolled);

    SpeakerClusteringEngine& engine() { return engine_; }
    const SpeakerClusteringEngine& engine() const { return engine_; }
    UnknownSpeakerClusterer& unknown() { return unknown_; }
    const UnknownSpeakerClusterer& unknown() const { return unknown_; }
    const std::vector<SegmentRecord>& history() const { return history_; }

private:
    Resolution make_environmental() const;

    SpeakerClusteringEngine engine_;
    UnknownSpeakerClusterer unknown_;
    std::vector<SegmentRecord> history_;
};

} // namespace sid

#endif // SID_SESSION_RESOLVER_H
