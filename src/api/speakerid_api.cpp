#include <speakerid/speakerid_api.h>
#include "manager/persistence_bridge.h"
#include "manager/session_resolver.h"
#include "utils/error_codes.h"
#include "utils/logger.h"
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// One input channel. Calls on the same handle are serialized.
struct SidSession {
    std::mutex mutex;
    sid::SessionResolver resolver;

    SidSession(const sid::EngineConfig& engine_config,
               const sid::UnknownClusterConfig& unknown_config)
        : resolver(engine_config, unknown_config) {}
};

namespace {

void copy_string(char* dst, size_t dst_size, const std::string& src) {
    if (dst_size == 0) return;
    std::strncpy(dst, src.c_str(), dst_size - 1);
    dst[dst_size - 1] = '\0';
}

std::string bounded_string(const char* src, size_t max_len) {
    size_t len = 0;
    while (len < max_len && src[len] != '\0') ++len;
    return std::string(src, len);
}

std::vector<float> to_vector(const float* data, int dimension) {
    if (!data || dimension <= 0) return {};
    return std::vector<float>(data, data + dimension);
}

void to_configs(const SidConfig& c, sid::EngineConfig& engine, sid::UnknownClusterConfig& unknown) {
    engine.num_speakers = c.num_speakers;
    engine.similarity_threshold = c.similarity_threshold;
    engine.minimum_similarity_threshold = c.minimum_similarity_threshold;
    engine.confidence_margin = c.confidence_margin;
    engine.enrolled_priority_margin = c.enrolled_priority_margin;
    engine.inter_enrollment_warning_threshold = c.inter_enrollment_warning_threshold;
    engine.update_enrolled_centroids = c.update_enrolled_centroids != 0;
    engine.closed_set = c.closed_set != 0;
    engine.dimension = c.dimension;

    unknown.similarity_threshold = c.unknown_similarity_threshold;
    unknown.confidence_margin = c.unknown_confidence_margin;
    unknown.max_unknown_speakers = c.max_unknown_speakers;
    unknown.min_segments_for_cluster = c.min_segments_for_cluster;
}

void fill_decision(const sid::SessionResolver& resolver, const sid::Resolution& res,
                   SidDecision* out) {
    std::memset(out, 0, sizeof(*out));
    const auto& d = res.decision;
    out->speaker_id = res.speaker_id;
    out->primary_reason = static_cast<int>(d.reason);
    out->reason = res.unknown ? static_cast<int>(res.unknown->reason) : out->primary_reason;
    out->similarity = res.unknown ? res.unknown->similarity : d.similarity;
    out->second_best_similarity = d.second_best_similarity;
    out->margin = res.unknown ? res.unknown->margin : d.margin;
    out->is_enrolled = d.is_enrolled ? 1 : 0;
    out->forced_assignment =
        (res.unknown ? res.unknown->forced_assignment : d.forced_assignment) ? 1 : 0;
    out->centroid_updated = res.contributed ? 1 : 0;
    out->second_best_speaker_id = d.second_best_speaker_id;
    copy_string(out->label, sizeof(out->label), res.label);
    copy_string(out->display_label, sizeof(out->display_label), resolver.display_label(res));
    if (res.unknown && res.unknown->closest_enrolled) {
        copy_string(out->closest_enrolled, sizeof(out->closest_enrolled),
                    res.unknown->closest_enrolled->name);
        out->closest_enrolled_similarity = res.unknown->closest_enrolled->similarity;
    }
}

int fail(sid::ErrorCode code, int result) {
    sid::set_last_error(code);
    return result;
}

int fail(sid::ErrorCode code, const std::string& detail, int result) {
    sid::set_last_error(code, detail);
    return result;
}

} // namespace

SID_API int sid_default_config(SidConfig* out) {
    if (!out) return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);

    const sid::EngineConfig engine;
    const sid::UnknownClusterConfig unknown;
    out->num_speakers = engine.num_speakers;
    out->similarity_threshold = engine.similarity_threshold;
    out->minimum_similarity_threshold = engine.minimum_similarity_threshold;
    out->confidence_margin = engine.confidence_margin;
    out->enrolled_priority_margin = engine.enrolled_priority_margin;
    out->inter_enrollment_warning_threshold = engine.inter_enrollment_warning_threshold;
    out->update_enrolled_centroids = engine.update_enrolled_centroids ? 1 : 0;
    out->closed_set = engine.closed_set ? 1 : 0;
    out->dimension = engine.dimension;
    out->unknown_similarity_threshold = unknown.similarity_threshold;
    out->unknown_confidence_margin = unknown.confidence_margin;
    out->max_unknown_speakers = unknown.max_unknown_speakers;
    out->min_segments_for_cluster = unknown.min_segments_for_cluster;
    return SID_OK;
}

SID_API int sid_session_create(const SidConfig* config, SidSession** out) {
    if (!out) return fail(sid::ErrorCode::INVALID_PARAM, "out must not be null", SID_ERROR_INVALID_PARAM);
    *out = nullptr;

    try {
        sid::Logger::instance().init();

        sid::EngineConfig engine_config;
        sid::UnknownClusterConfig unknown_config;
        if (config) {
            to_configs(*config, engine_config, unknown_config);
        }

        auto session = std::make_unique<SidSession>(engine_config, unknown_config);
        SID_LOG_INFO("Session created (num_speakers={})",
                     session->resolver.engine().num_speakers());
        *out = session.release();
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API void sid_session_destroy(SidSession* session) {
    if (!session) return;
    delete session;
    try {
        SID_LOG_INFO("Session destroyed");
    } catch (const std::exception& e) {
        sid::set_last_error(sid::ErrorCode::UNKNOWN, e.what());
    } catch (...) {
        sid::set_last_error(sid::ErrorCode::UNKNOWN);
    }
}

SID_API int sid_assign(SidSession* session, const float* embedding, int dimension,
                       SidDecision* out) {
    if (!session || !out || dimension < 0 || (dimension > 0 && !embedding)) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto res = session->resolver.append_segment(to_vector(embedding, dimension));
        fill_decision(session->resolver, res, out);
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_add_environmental(SidSession* session) {
    if (!session) return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->resolver.append_segment({}, true);
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_import_enrolled(SidSession* session, const SidEnrolledSpeaker* speakers,
                                int count, int* out_warning_count) {
    if (!session || count < 0 || (count > 0 && !speakers)) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::vector<sid::EnrolledSpeaker> enrollments;
        enrollments.reserve(count);
        for (int i = 0; i < count; ++i) {
            const auto& s = speakers[i];
            enrollments.emplace_back(bounded_string(s.id, sizeof(s.id)),
                                     bounded_string(s.name, sizeof(s.name)),
                                     to_vector(s.centroid, s.dimension), s.color_index);
        }

        std::lock_guard<std::mutex> lock(session->mutex);
        auto warnings = sid::PersistenceBridge::import_enrolled(session->resolver.engine(),
                                                                enrollments);
        if (out_warning_count) *out_warning_count = static_cast<int>(warnings.size());
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_enroll_speaker(SidSession* session, const char* enrollment_id,
                               const char* name, const float* embedding, int dimension,
                               int color_index) {
    if (!session || !name || !embedding || dimension <= 0) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto& engine = session->resolver.engine();
        if (engine.dimension() > 0 && engine.dimension() != dimension) {
            return fail(sid::ErrorCode::DIMENSION_MISMATCH,
                        "expected " + std::to_string(engine.dimension()),
                        SID_ERROR_DIMENSION_MISMATCH);
        }
        if (!engine.enroll_speaker(name, to_vector(embedding, dimension),
                                   enrollment_id ? enrollment_id : "", color_index)) {
            return fail(sid::ErrorCode::REJECTED, "embedding has no usable norm",
                        SID_ERROR_REJECTED);
        }
        engine.check_enrolled_similarities();
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_remove_enrolled(SidSession* session, const char* enrollment_id) {
    if (!session || !enrollment_id) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (!session->resolver.engine().remove_enrolled_speaker(enrollment_id)) {
            return fail(sid::ErrorCode::NOT_FOUND, enrollment_id, SID_ERROR_NOT_FOUND);
        }
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_export_enrolled(SidSession* session, SidEnrolledSpeaker* out, int max_speakers,
                                float* centroid_buf, int centroid_buf_floats, int* out_count) {
    if (!session || !out_count || max_speakers < 0 || centroid_buf_floats < 0 ||
        (max_speakers > 0 && !out) || (centroid_buf_floats > 0 && !centroid_buf)) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::vector<sid::EnrolledSpeaker> enrolled;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            enrolled = sid::PersistenceBridge::export_enrolled(session->resolver.engine());
        }

        size_t floats_needed = 0;
        for (const auto& e : enrolled) floats_needed += e.centroid.size();

        *out_count = static_cast<int>(enrolled.size());
        if (static_cast<int>(enrolled.size()) > max_speakers ||
            floats_needed > static_cast<size_t>(centroid_buf_floats)) {
            return fail(sid::ErrorCode::BUFFER_TOO_SMALL,
                        std::to_string(enrolled.size()) + " speakers, " +
                            std::to_string(floats_needed) + " floats",
                        SID_ERROR_BUFFER_TOO_SMALL);
        }

        float* cursor = centroid_buf;
        for (size_t i = 0; i < enrolled.size(); ++i) {
            const auto& e = enrolled[i];
            auto& dst = out[i];
            copy_string(dst.id, sizeof(dst.id), e.id);
            copy_string(dst.name, sizeof(dst.name), e.name);
            dst.dimension = static_cast<int>(e.centroid.size());
            dst.color_index = e.color_index;
            std::memcpy(cursor, e.centroid.data(), e.centroid.size() * sizeof(float));
            dst.centroid = cursor;
            cursor += e.centroid.size();
        }
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_propagate_enrolled(SidSession* source, SidSession* const* targets,
                                   int target_count) {
    if (!source || target_count < 0 || (target_count > 0 && !targets)) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        // Snapshot first; never hold two session locks at once
        std::vector<sid::EnrolledSpeaker> enrolled;
        {
            std::lock_guard<std::mutex> lock(source->mutex);
            enrolled = sid::PersistenceBridge::export_enrolled(source->resolver.engine());
        }

        int propagated = 0;
        for (int i = 0; i < target_count; ++i) {
            SidSession* target = targets[i];
            if (!target || target == source) continue;
            std::lock_guard<std::mutex> lock(target->mutex);
            sid::PersistenceBridge::import_enrolled(target->resolver.engine(), enrolled);
            ++propagated;
        }
        SID_LOG_INFO("Propagated {} enrolled speakers to {} sessions", enrolled.size(), propagated);
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_remove_from_centroid(SidSession* session, int speaker_id,
                                     const float* embedding, int dimension) {
    if (!session || !embedding || dimension <= 0 || speaker_id == SID_UNASSIGNED_SPEAKER_ID) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto& resolver = session->resolver;
        auto emb = to_vector(embedding, dimension);

        if (sid::UnknownSpeakerClusterer::is_unknown_id(speaker_id)) {
            if (!resolver.unknown().cluster_info(speaker_id)) {
                return fail(sid::ErrorCode::NOT_FOUND, SID_ERROR_NOT_FOUND);
            }
        } else if (!resolver.engine().find_speaker(speaker_id)) {
            return fail(sid::ErrorCode::NOT_FOUND, SID_ERROR_NOT_FOUND);
        }
        if (!resolver.remove_from_centroid(speaker_id, emb)) {
            return fail(sid::ErrorCode::REJECTED, "speaker " + std::to_string(speaker_id),
                        SID_ERROR_REJECTED);
        }
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_undo_segment(SidSession* session, int index) {
    if (!session) return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto& resolver = session->resolver;
        if (index < 0 || static_cast<size_t>(index) >= resolver.history().size()) {
            return fail(sid::ErrorCode::OUT_OF_RANGE, "segment " + std::to_string(index),
                        SID_ERROR_OUT_OF_RANGE);
        }
        if (!resolver.undo_segment(static_cast<size_t>(index))) {
            return fail(sid::ErrorCode::REJECTED, "segment " + std::to_string(index),
                        SID_ERROR_REJECTED);
        }
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_recluster_from_index(SidSession* session, int from_index,
                                     SidSpeakerChange* out_changes, int max_changes,
                                     int* out_count) {
    if (!session || !out_count || max_changes < 0 || (max_changes > 0 && !out_changes)) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }
    if (from_index < 0) {
        return fail(sid::ErrorCode::OUT_OF_RANGE, SID_ERROR_OUT_OF_RANGE);
    }

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto outcome = session->resolver.recluster_from_index(static_cast<size_t>(from_index));

        *out_count = static_cast<int>(outcome.changes.size());
        if (static_cast<int>(outcome.changes.size()) > max_changes) {
            return fail(sid::ErrorCode::BUFFER_TOO_SMALL,
                        std::to_string(outcome.changes.size()) + " changes",
                        SID_ERROR_BUFFER_TOO_SMALL);
        }

        for (size_t i = 0; i < outcome.changes.size(); ++i) {
            const auto& change = outcome.changes[i];
            auto& dst = out_changes[i];
            dst.index = static_cast<int>(change.index);
            dst.old_speaker_id = change.old_speaker;
            dst.new_speaker_id = change.new_speaker;
            dst.reason = change.resolution.unknown
                ? static_cast<int>(change.resolution.unknown->reason)
                : static_cast<int>(change.resolution.decision.reason);
            copy_string(dst.new_label, sizeof(dst.new_label), change.new_label);
        }

        session->resolver.apply(std::move(outcome));
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_get_unknown_speakers(SidSession* session, SidUnknownSpeaker* out,
                                     int max_speakers, int* out_count) {
    if (!session || !out_count || max_speakers < 0 || (max_speakers > 0 && !out)) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        auto speakers = session->resolver.unknown().all_unknown_speakers();

        *out_count = static_cast<int>(speakers.size());
        if (static_cast<int>(speakers.size()) > max_speakers) {
            return fail(sid::ErrorCode::BUFFER_TOO_SMALL, SID_ERROR_BUFFER_TOO_SMALL);
        }

        for (size_t i = 0; i < speakers.size(); ++i) {
            const auto& s = speakers[i];
            auto& dst = out[i];
            std::memset(&dst, 0, sizeof(dst));
            dst.unknown_id = s.unknown_id;
            copy_string(dst.label, sizeof(dst.label), s.label);
            dst.segment_count = s.segment_count;
            if (s.closest_enrolled) {
                copy_string(dst.closest_enrolled, sizeof(dst.closest_enrolled),
                            s.closest_enrolled->name);
                dst.closest_enrolled_similarity = s.closest_enrolled->similarity;
                dst.closest_enrolled_occurrences = s.closest_enrolled->occurrences;
            }
            dst.confidence = s.confidence;
        }
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_get_label(SidSession* session, int speaker_id, char* out_label, int buf_size) {
    if (!session || !out_label || buf_size <= 0) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }

    try {
        std::string label;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            label = session->resolver.speaker_label(speaker_id);
        }
        if (static_cast<int>(label.size()) >= buf_size) {
            out_label[0] = '\0';
            return fail(sid::ErrorCode::BUFFER_TOO_SMALL, SID_ERROR_BUFFER_TOO_SMALL);
        }
        copy_string(out_label, static_cast<size_t>(buf_size), label);
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_set_num_speakers(SidSession* session, int num_speakers) {
    if (!session) return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->resolver.engine().set_num_speakers(num_speakers);
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_reset(SidSession* session, int preserve_enrolled) {
    if (!session) return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        session->resolver.reset(preserve_enrolled != 0);
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API int sid_get_speaker_count(SidSession* session) {
    if (!session) return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);

    try {
        std::lock_guard<std::mutex> lock(session->mutex);
        return session->resolver.engine().speaker_count();
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API const char* sid_reason_name(int reason) {
    if (reason < SID_REASON_NO_EMBEDDING || reason > SID_REASON_BOOSTED_MATCH) {
        return "invalid";
    }
    return sid::reason_to_string(static_cast<sid::DecisionReason>(reason));
}

SID_API int sid_set_log_level(int level) {
    if (level < SID_LOG_LEVEL_TRACE || level > SID_LOG_LEVEL_OFF) {
        return fail(sid::ErrorCode::INVALID_PARAM, SID_ERROR_INVALID_PARAM);
    }
    try {
        sid::Logger::instance().set_level(static_cast<spdlog::level::level_enum>(level));
        return SID_OK;
    } catch (const std::exception& e) {
        return fail(sid::ErrorCode::UNKNOWN, e.what(), SID_ERROR_UNKNOWN);
    } catch (...) {
        return fail(sid::ErrorCode::UNKNOWN, SID_ERROR_UNKNOWN);
    }
}

SID_API const char* sid_get_last_error() {
    return sid::get_last_error();
}
