#include "core/engine_config.h"
#include "utils/logger.h"
#include <algorithm>
#include <cmath>

namespace sid {

namespace {

float clamp_field(const char* name, float value, float lo, float hi, float fallback) {
    if (!std::isfinite(value)) {
        SID_LOG_WARN("Config {} is not finite, using {:.3f}", name, fallback);
        return fallback;
    }
    float clamped = std::max(lo, std::min(hi, value));
    if (clamped != value) {
        SID_LOG_WARN("Config {}={:.3f} out of range, clamped to {:.3f}", name, value, clamped);
    }
    return clamped;
}

int clamp_field(const char* name, int value, int lo, int hi) {
    int clamped = std::max(lo, std::min(hi, value));
    if (clamped != value) {
        SID_LOG_WARN("Config {}={} out of range, clamped to {}", name, value, clamped);
    }
    return clamped;
}

} // namespace

void EngineConfig::sanitize() {
    num_speakers = clamp_field("num_speakers", num_speakers, kMinSpeakers, kMaxSpeakers);
    similarity_threshold = clamp_field("similarity_threshold", similarity_threshold,
                                       -1.0f, 1.0f, 0.75f);
    minimum_similarity_threshold = clamp_field("minimum_similarity_threshold",
                                               minimum_similarity_threshold,
                                               -1.0f, similarity_threshold,
                                               std::min(0.5f, similarity_threshold));
    confidence_margin = clamp_field("confidence_margin", confidence_margin, 0.0f, 2.0f, 0.15f);
    enrolled_priority_margin = clamp_field("enrolled_priority_margin", enrolled_priority_margin,
                                           0.0f, 2.0f, 0.02f);
    inter_enrollment_warning_threshold = clamp_field("inter_enrollment_warning_threshold",
                                                     inter_enrollment_warning_threshold,
                                                     -1.0f, 1.0f, 0.72f);
    dimension = std::max(0, dimension);
}

void UnknownClusterConfig::sanitize() {
    similarity_threshold = clamp_field("unknown.similarity_threshold", similarity_threshold,
                                       -1.0f, 1.0f, 0.70f);
    confidence_margin = clamp_field("unknown.confidence_margin", confidence_margin,
                                    0.0f, 2.0f, 0.10f);
    max_unknown_speakers = clamp_field("unknown.max_unknown_speakers", max_unknown_speakers,
                                       1, 1000);
    min_segments_for_cluster = clamp_field("unknown.min_segments_for_cluster",
                                           min_segments_for_cluster, 1, 1000000);
}

} // namespace sid
