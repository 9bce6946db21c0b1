#ifndef SID_ENGINE_CONFIG_H
#define SID_ENGINE_CONFIG_H

namespace sid {

constexpr int kMinSpeakers = 1;
constexpr int kMaxSpeakers = 10;

struct EngineConfig {
    int   num_speakers = 2;                          // cap on live enrolled + discovered records
    float similarity_threshold = 0.75f;              // confident match
    float minimum_similarity_threshold = 0.5f;       // below this: handed to the unknown clusterer
    float confidence_margin = 0.15f;                 // best - second_best
    float enrolled_priority_margin = 0.02f;          // near-ties resolve toward enrolled
    float inter_enrollment_warning_threshold = 0.72f;
    bool  update_enrolled_centroids = false;         // enrolled centroids are frozen anchors by default
    // Closed set: nothing goes to the unknown clusterer. A sub-threshold voice
    // founds a new speaker while a slot is free, at capacity it is forced onto
    // the closest record (below_minimum_threshold).
    bool  closed_set = false;
    int   dimension = 0;                             // 0 = take from first embedding/import

    // Clamp every field into its valid range, logging what changed
    void sanitize();
};

struct UnknownClusterConfig {
    float similarity_threshold = 0.70f;
    float confidence_margin = 0.10f;     // informational only
    int   max_unknown_speakers = 5;
    int   min_segments_for_cluster = 2;  // reporting filter for all_unknown_speakers()

    void sanitize();
};

} // namespace sid

#endif // SID_ENGINE_CONFIG_H
