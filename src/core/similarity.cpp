#include "core/similarity.h"
#include <cmath>
#include <algorithm>

#ifdef __AVX2__
#include <immintrin.h>
#endif

namespace sid {

float SimilarityCalculator::cosine_similarity(const std::vector<float>& a,
                                               const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    return cosine_similarity(a.data(), b.data(), static_cast<int>(a.size()));
}

float SimilarityCalculator::cosine_similarity(const float* a, const float* b, int dim) {
    // For L2-normalized vectors, cosine similarity = dot product
    float dot = 0.0f;

#if defined(__AVX2__) && defined(__FMA__)
    int i = 0;
    __m256 sum = _mm256_setzero_ps();
    for (; i + 8 <= dim; i += 8) {
        __m256 va = _mm256_loadu_ps(a + i);
        __m256 vb = _mm256_loadu_ps(b + i);
        sum = _mm256_fmadd_ps(va, vb, sum);
    }

    // Horizontal sum
    __m128 hi = _mm256_extractf128_ps(sum, 1);
    __m128 lo = _mm256_castps256_ps128(sum);
    __m128 sum128 = _mm_add_ps(lo, hi);
    sum128 = _mm_hadd_ps(sum128, sum128);
    sum128 = _mm_hadd_ps(sum128, sum128);
    dot = _mm_cvtss_f32(sum128);

    for (; i < dim; ++i) {
        dot += a[i] * b[i];
    }
#else
    for (int i = 0; i < dim; ++i) {
        dot += a[i] * b[i];
    }
#endif

    // Clamp to [-1, 1]
    return std::max(-1.0f, std::min(1.0f, dot));
}

float SimilarityCalculator::l2_norm(const std::vector<float>& vec) {
    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    return static_cast<float>(std::sqrt(norm));
}

bool SimilarityCalculator::l2_normalize(std::vector<float>& vec) {
    float norm = l2_norm(vec);
    if (!(norm > 1e-10f) || !std::isfinite(norm)) {
        return false;
    }
    for (float& v : vec) {
        v /= norm;
    }
    return true;
}

std::vector<float> SimilarityCalculator::l2_normalized(const std::vector<float>& vec) {
    std::vector<float> copy = vec;
    if (!l2_normalize(copy)) {
        return {};
    }
    return copy;
}

SimilarityCalculator::RankResult SimilarityCalculator::rank(const std::vector<float>& scores) {
    RankResult result{-1, -1.0f, -1, -1.0f};

    // Strict comparison: on equal scores the earlier entry wins
    for (size_t i = 0; i < scores.size(); ++i) {
        float score = scores[i];
        if (result.best_index < 0 || score > result.best_score) {
            result.second_index = result.best_index;
            result.second_score = result.best_score;
            result.best_index = static_cast<int>(i);
            result.best_score = score;
        } else if (result.second_index < 0 || score > result.second_score) {
            result.second_index = static_cast<int>(i);
            result.second_score = score;
        }
    }

    return result;
}

} // namespace sid
