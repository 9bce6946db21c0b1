#ifndef SID_SIMILARITY_H
#define SID_SIMILARITY_H

#include <vector>

namespace sid {

class SimilarityCalculator {
public:
    // Cosine similarity between two vectors (assumes L2-normalized)
    // Returns 0 for empty or mismatched vectors
    static float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

    // Cosine similarity using raw pointers (for performance)
    static float cosine_similarity(const float* a, const float* b, int dim);

    // L2 normalize in place. Returns false (vector untouched) for a zero vector.
    static bool l2_normalize(std::vector<float>& vec);

    // Normalized copy, or an empty vector if the input has no direction
    static std::vector<float> l2_normalized(const std::vector<float>& vec);

    static float l2_norm(const std::vector<float>& vec);

    // Best and second-best entries of a score list
    // Returns indices of -1 when fewer than one/two scores exist
    struct RankResult {
        int best_index;
        float best_score;
        int second_index;
        float second_score;
    };

    static RankResult rank(const std::vector<float>& scores);
};

} // namespace sid

#endif // SID_SIMILARITY_H
