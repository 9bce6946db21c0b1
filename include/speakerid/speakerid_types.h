#ifndef SPEAKERID_TYPES_H
#define SPEAKERID_TYPES_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================
// Decision reasons (SidDecision.reason)
// ============================================================
#define SID_REASON_NO_EMBEDDING            0
#define SID_REASON_NEW_SPEAKER             1
#define SID_REASON_CONFIDENT_MATCH         2
#define SID_REASON_AMBIGUOUS_MATCH         3
#define SID_REASON_BELOW_MINIMUM_THRESHOLD 4
#define SID_REASON_NO_CONFIDENT_MATCH      5
#define SID_REASON_UNKNOWN_NEW_CLUSTER     6
#define SID_REASON_UNKNOWN_CLUSTER_MATCH   7
#define SID_REASON_INHERITED               8
#define SID_REASON_BOOSTED_MATCH           9

// Speaker id sentinels
#define SID_UNASSIGNED_SPEAKER_ID   -1
#define SID_UNKNOWN_SPEAKER_BASE  -100

// Log levels for sid_set_log_level()
#define SID_LOG_LEVEL_TRACE 0
#define SID_LOG_LEVEL_DEBUG 1
#define SID_LOG_LEVEL_INFO  2
#define SID_LOG_LEVEL_WARN  3
#define SID_LOG_LEVEL_ERROR 4
#define SID_LOG_LEVEL_OFF   6

// Opaque per-channel session
typedef struct SidSession SidSession;

// ============================================================
// Configuration (fill with sid_default_config() first)
// ============================================================
typedef struct SidConfig {
    int   num_speakers;                         // 1..10, default 2
    float similarity_threshold;                 // default 0.75
    float minimum_similarity_threshold;         // default 0.50
    float confidence_margin;                    // default 0.15
    float enrolled_priority_margin;             // default 0.02
    float inter_enrollment_warning_threshold;   // default 0.72
    int   update_enrolled_centroids;            // 0 or 1, default 0
    int   closed_set;                           // 0 or 1, default 0: 1 never hands off to unknown clusters
    int   dimension;                            // 0 = infer from first embedding

    float unknown_similarity_threshold;         // default 0.70
    float unknown_confidence_margin;            // default 0.10
    int   max_unknown_speakers;                 // default 5
    int   min_segments_for_cluster;             // default 2
} SidConfig;

// Result of one sid_assign() call
typedef struct SidDecision {
    int   speaker_id;              // >= 0 primary speaker, <= -100 unknown cluster, -1 none
    int   reason;                  // SID_REASON_*; for handed-off segments the unknown result's reason
    int   primary_reason;          // the primary engine's own reason
    float similarity;
    float second_best_similarity;
    float margin;
    int   is_enrolled;
    int   forced_assignment;
    int   centroid_updated;
    int   second_best_speaker_id;  // -1 if none
    char  label[64];               // "Alice", "Speaker 2", "Unknown 1"
    char  display_label[160];      // "Alice (Speaker 2?)" for ambiguous matches
    char  closest_enrolled[64];    // unknown path only, empty otherwise
    float closest_enrolled_similarity;
} SidDecision;

// Enrolled speaker. Input: centroid points at caller memory.
// Output (sid_export_enrolled): centroid points into the caller's float buffer.
typedef struct SidEnrolledSpeaker {
    char         id[128];
    char         name[64];
    const float* centroid;
    int          dimension;
    int          color_index;
} SidEnrolledSpeaker;

// One segment whose speaker changed during sid_recluster_from_index()
typedef struct SidSpeakerChange {
    int  index;
    int  old_speaker_id;
    int  new_speaker_id;
    int  reason;
    char new_label[64];
} SidSpeakerChange;

// One reportable unknown cluster
typedef struct SidUnknownSpeaker {
    int   unknown_id;
    char  label[32];
    int   segment_count;
    char  closest_enrolled[64];       // empty if no enrolled candidate was ever seen
    float closest_enrolled_similarity;
    int   closest_enrolled_occurrences;
    float confidence;
} SidUnknownSpeaker;

#ifdef __cplusplus
} // extern "C"
#endif

#endif // SPEAKERID_TYPES_H
