#ifndef SPEAKERID_API_H
#define SPEAKERID_API_H

#include <speakerid/speakerid_types.h>

#ifdef _WIN32
    #ifdef SPEAKERID_EXPORTS
        #define SID_API extern "C" __declspec(dllexport)
    #else
        #define SID_API extern "C" __declspec(dllimport)
    #endif
#else
    #define SID_API extern "C" __attribute__((visibility("default")))
#endif

// Error codes
#define SID_OK                          0
#define SID_ERROR_UNKNOWN              -1
#define SID_ERROR_INVALID_PARAM        -2
#define SID_ERROR_NOT_FOUND            -3
#define SID_ERROR_DIMENSION_MISMATCH   -4
#define SID_ERROR_REJECTED             -5
#define SID_ERROR_BUFFER_TOO_SMALL     -6
#define SID_ERROR_OUT_OF_RANGE         -7

/**
 * Fill a config with the default thresholds.
 */
SID_API int sid_default_config(SidConfig* out);

/**
 * Create a session for one input channel.
 * @param config   NULL for defaults. Out-of-range values are clamped.
 * @param out      Receives the session handle.
 * @return SID_OK on success, error code on failure
 */
SID_API int sid_session_create(const SidConfig* config, SidSession** out);

/**
 * Destroy a session. NULL is ignored.
 */
SID_API void sid_session_destroy(SidSession* session);

/**
 * Decide the speaker of one segment and append it to the session history.
 * @param embedding  Float vector, or NULL / dimension 0 for a segment without embedding
 * @param dimension  Number of floats in embedding
 * @param out        Receives the decision
 * @return SID_OK; the outcome itself is in out->reason
 */
SID_API int sid_assign(SidSession* session, const float* embedding, int dimension,
                       SidDecision* out);

/**
 * Append a non-speech segment. It is never attributed to a speaker.
 */
SID_API int sid_add_environmental(SidSession* session);

/**
 * Replace the enrolled set (no merge). Entries with no centroid are skipped.
 * @param out_warning_count  Optional; receives the number of enrolled pairs
 *                           that are suspiciously similar.
 */
SID_API int sid_import_enrolled(SidSession* session, const SidEnrolledSpeaker* speakers,
                                int count, int* out_warning_count);

/**
 * Add one enrolled speaker after the existing ones.
 * @param enrollment_id  NULL or "" to generate one
 */
SID_API int sid_enroll_speaker(SidSession* session, const char* enrollment_id,
                               const char* name, const float* embedding, int dimension,
                               int color_index);

/**
 * Retire one enrolled speaker.
 * @return SID_ERROR_NOT_FOUND if no active enrolled speaker has this id
 */
SID_API int sid_remove_enrolled(SidSession* session, const char* enrollment_id);

/**
 * Export the active enrolled speakers in order.
 * Centroids are written back to back into centroid_buf; each entry's
 * centroid pointer points at its slice.
 * @param out_count  Receives the number of enrolled speakers (also on
 *                   SID_ERROR_BUFFER_TOO_SMALL)
 */
SID_API int sid_export_enrolled(SidSession* session, SidEnrolledSpeaker* out, int max_speakers,
                                float* centroid_buf, int centroid_buf_floats, int* out_count);

/**
 * Copy the source session's enrolled set into every target session.
 * Snapshot semantics; targets do not follow later changes to the source.
 */
SID_API int sid_propagate_enrolled(SidSession* source, SidSession* const* targets,
                                   int target_count);

/**
 * Undo one contribution of an embedding to a speaker or unknown cluster.
 * When a recorded segment with this speaker and embedding still counts as
 * contributing, it is undone like sid_undo_segment(), so a later recluster
 * does not subtract it twice.
 * @return SID_ERROR_REJECTED for enrolled speakers, single-sample records or
 *         mismatched dimensions; SID_ERROR_NOT_FOUND for unknown ids
 */
SID_API int sid_remove_from_centroid(SidSession* session, int speaker_id,
                                     const float* embedding, int dimension);

/**
 * Undo the contribution of recorded segment `index` (0-based, counting every
 * sid_assign() and sid_add_environmental() call).
 * @return SID_ERROR_OUT_OF_RANGE for a bad index; SID_ERROR_REJECTED when the
 *         segment never contributed or its record refuses the undo
 */
SID_API int sid_undo_segment(SidSession* session, int index);

/**
 * Re-decide history[from_index..] and commit the result.
 * @param out_changes  Caller-allocated, receives segments whose speaker changed
 * @param out_count    Receives the number of changes (also on
 *                     SID_ERROR_BUFFER_TOO_SMALL, in which case nothing is committed)
 * @return SID_ERROR_OUT_OF_RANGE if from_index is negative
 */
SID_API int sid_recluster_from_index(SidSession* session, int from_index,
                                     SidSpeakerChange* out_changes, int max_changes,
                                     int* out_count);

/**
 * Unknown clusters with at least min_segments_for_cluster segments.
 */
SID_API int sid_get_unknown_speakers(SidSession* session, SidUnknownSpeaker* out,
                                     int max_speakers, int* out_count);

/**
 * Label of any speaker id the session produced.
 */
SID_API int sid_get_label(SidSession* session, int speaker_id, char* out_label, int buf_size);

SID_API int sid_set_num_speakers(SidSession* session, int num_speakers);

/**
 * Start a new session on the same handle.
 * @param preserve_enrolled  1 keeps the enrolled speakers
 */
SID_API int sid_reset(SidSession* session, int preserve_enrolled);

/**
 * @return Number of live speakers (enrolled + discovered), or negative error code
 */
SID_API int sid_get_speaker_count(SidSession* session);

/**
 * @return Static snake_case name of a SID_REASON_* value. Never NULL.
 */
SID_API const char* sid_reason_name(int reason);

/**
 * @param level  SID_LOG_LEVEL_*
 */
SID_API int sid_set_log_level(int level);

/**
 * Get the last error message.
 * @return Error message string (thread-local, valid until next API call)
 */
SID_API const char* sid_get_last_error();

#endif // SPEAKERID_API_H
