#include "manager/session_resolver.h"
#include "utils/logger.h"

namespace sid {

SessionResolver::SessionResolver(const EngineConfig& engine_config,
                                 const UnknownClusterConfig& unknown_config)
    : engine_(engine_config), unknown_(unknown_config) {}

Resolution SessionResolver::resolve(const std::vector<float>& embedding) {
    return resolve_embedding(engine_, unknown_, embedding);
}

Resolution SessionResolver::make_environmental() const {
    Resolution res;
    res.speaker_id = kUnassignedSpeakerId;
    res.decision.speaker_id = kUnassignedSpeakerId;
    res.decision.reason = DecisionReason::NoEmbedding;
    res.environmental = true;
    return res;
}

Resolution SessionResolver::append_segment(const std::vector<float>& embedding,
                                           bool environmental) {
    SegmentRecord seg;
    seg.embedding = embedding;
    seg.environmental = environmental;

    Resolution res = environmental ? make_environmental() : resolve(embedding);
    if (!environmental) {
        seg.speaker_id = res.speaker_id;
        seg.contributed = res.contributed;
        seg.closest_enrolled = res.closest_enrolled;
    }
    history_.push_back(std::move(seg));
    return res;
}

std::vector<Resolution> SessionResolver::process_phrases(const std::vector<Phrase>& phrases) {
    std::vector<Resolution> results;
    results.reserve(phrases.size());

    int last_speaker = kUnassignedSpeakerId;
    for (const auto& phrase : phrases) {
        if (phrase.environmental) {
            results.push_back(append_segment(phrase.embedding, true));
            continue;
        }

        if (phrase.embedding.empty()) {
            Resolution res;
            res.speaker_id = last_speaker != kUnassignedSpeakerId ? last_speaker : 0;
            res.decision.speaker_id = res.speaker_id;
            res.decision.reason = DecisionReason::Inherited;
            res.label = speaker_label(res.speaker_id);

            SegmentRecord seg;
            seg.speaker_id = res.speaker_id;
            history_.push_back(std::move(seg));
            results.push_back(std::move(res));
            continue;
        }

        Resolution res = append_segment(phrase.embedding);
        if (res.decision.reason != DecisionReason::NoEmbedding) {
            last_speaker = res.speaker_id;
        }
        results.push_back(std::move(res));
    }

    SID_LOG_DEBUG("Processed {} phrases (history={})", phrases.size(), history_.size());
    return results;
}

bool SessionResolver::undo_segment(size_t index) {
    if (index >= history_.size()) return false;
    SegmentRecord& seg = history_[index];
    if (!undo_contribution(engine_, unknown_, seg)) {
        SID_LOG_DEBUG("Segment {} contribution to {} not undone", index, seg.speaker_id);
        return false;
    }
    seg.contributed = false;
    SID_LOG_DEBUG("Undid segment {} from speaker {}", index, seg.speaker_id);
    return true;
}

bool SessionResolver::remove_from_centroid(int speaker_id, const std::vector<float>& embedding) {
    for (size_t i = history_.size(); i-- > 0;) {
        const SegmentRecord& seg = history_[i];
        if (seg.contributed && seg.speaker_id == speaker_id && seg.embedding == embedding) {
            return undo_segment(i);
        }
    }
    if (UnknownSpeakerClusterer::is_unknown_id(speaker_id)) {
        return unknown_.remove_from_centroid(speaker_id, embedding);
    }
    return engine_.remove_from_centroid(speaker_id, embedding);
}

ReplayOutcome SessionResolver::recluster_from_index(size_t from_index) const {
    return CorrectionReplay(engine_, unknown_).recluster_from_index(history_, from_index);
}

void SessionResolver::apply(ReplayOutcome&& outcome) {
    CorrectionReplay::apply(std::move(outcome), engine_, unknown_, history_);
}

std::string SessionResolver::speaker_label(int speaker_id) const {
    return sid::speaker_label(engine_, unknown_, speaker_id);
}

std::string SessionResolver::display_label(const Resolution& resolution) const {
    return sid::display_label(engine_, resolution);
}

void SessionResolver::reset(bool preserve_enrolled) {
    engine_.reset(preserve_enrolled);
    unknown_.reset();
    history_.clear();
}

} // namespace sid
