#include "manager/correction_replay.h"
#include "utils/logger.h"
#include <map>

namespace sid {

bool undo_contribution(SpeakerClusteringEngine& engine,
                       UnknownSpeakerClusterer& unknown,
                       const SegmentRecord& seg) {
    if (!seg.contributed || seg.environmental || seg.embedding.empty()) return false;
    if (UnknownSpeakerClusterer::is_unknown_id(seg.speaker_id)) {
        return unknown.remove_from_centroid(seg.speaker_id, seg.embedding, seg.closest_enrolled);
    }
    if (seg.speaker_id < 0) return false;
    return engine.remove_from_centroid(seg.speaker_id, seg.embedding);
}

CorrectionReplay::CorrectionReplay(const SpeakerClusteringEngine& engine,
                                   const UnknownSpeakerClusterer& unknown)
    : engine_(engine), unknown_(unknown) {}

ReplayOutcome CorrectionReplay::recluster_from_index(const std::vector<SegmentRecord>& segments,
                                                     size_t from_index) const {
    ReplayOutcome outcome{from_index, 0, {}, segments, engine_, unknown_};
    if (from_index >= segments.size()) {
        return outcome;
    }

    // Segment index -> id of the record it founded and that was retired
    std::map<size_t, int> founded;

    // Undo newest first
    for (size_t i = segments.size(); i-- > from_index;) {
        const auto& seg = segments[i];
        if (!seg.contributed || seg.environmental || seg.embedding.empty()) continue;

        // The last sample of a record is its founding segment; with that
        // segment being replayed the record has no evidence left, so retire it.
        bool undone = undo_contribution(outcome.engine, outcome.unknown, seg);
        if (!undone && UnknownSpeakerClusterer::is_unknown_id(seg.speaker_id)) {
            auto info = outcome.unknown.cluster_info(seg.speaker_id);
            if (info && info->segment_count == 1) {
                undone = outcome.unknown.retire_cluster(seg.speaker_id);
                if (undone) founded[i] = seg.speaker_id;
            }
        } else if (!undone && seg.speaker_id >= 0) {
            const SpeakerRecord* rec = outcome.engine.find_speaker(seg.speaker_id);
            if (rec && !rec->enrolled && rec->sample_count() == 1) {
                undone = outcome.engine.retire_discovered(seg.speaker_id);
                if (undone) founded[i] = seg.speaker_id;
            }
        }
        if (!undone) {
            SID_LOG_DEBUG("Replay: contribution of segment {} to {} kept", i, seg.speaker_id);
        }
    }

    for (size_t i = from_index; i < segments.size(); ++i) {
        auto& seg = outcome.segments[i];
        if (seg.environmental || seg.embedding.empty()) continue;

        // A segment that founded a record founds it again under the same id
        auto it = founded.find(i);
        if (it != founded.end()) {
            if (UnknownSpeakerClusterer::is_unknown_id(it->second)) {
                outcome.unknown.reuse_retired_id(it->second);
            } else {
                outcome.engine.reuse_retired_id(it->second);
            }
        }

        Resolution res = resolve_embedding(outcome.engine, outcome.unknown, seg.embedding);
        outcome.engine.reuse_retired_id(kUnassignedSpeakerId);
        outcome.unknown.reuse_retired_id(kUnassignedSpeakerId);
        ++outcome.replayed_count;

        const int old_speaker = seg.speaker_id;
        seg.speaker_id = res.speaker_id;
        seg.contributed = res.contributed;
        seg.closest_enrolled = res.closest_enrolled;

        if (res.speaker_id != old_speaker) {
            outcome.changes.push_back({i, old_speaker, res.speaker_id, res.label, std::move(res)});
        }
    }

    SID_LOG_INFO("Replayed {} segments from index {}: {} changed",
                 outcome.replayed_count, from_index, outcome.changes.size());
    return outcome;
}

void CorrectionReplay::apply(ReplayOutcome&& outcome,
                             SpeakerClusteringEngine& engine,
                             UnknownSpeakerClusterer& unknown,
                             std::vector<SegmentRecord>& segments) {
    engine = std::move(outcome.engine);
    unknown = std::move(outcome.unknown);
    segments = std::move(outcome.segments);
}

} // namespace sid
