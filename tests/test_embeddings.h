#ifndef SID_TEST_EMBEDDINGS_H
#define SID_TEST_EMBEDDINGS_H

#include <cmath>
#include <random>
#include <vector>

// Synthetic speaker embeddings for tests. Stand-ins for ECAPA-style vectors.
namespace sid_test {

constexpr int kDim = 192;

// Unit vector along axis k
inline std::vector<float> axis(int k, int dim = 8) {
    std::vector<float> v(dim, 0.0f);
    v[k] = 1.0f;
    return v;
}

// Unit vector with cosine `cos` to axis a, the rest on axis b (a != b)
inline std::vector<float> tilt(int a, int b, float cos, int dim = 8) {
    std::vector<float> v(dim, 0.0f);
    v[a] = cos;
    v[b] = std::sqrt(1.0f - cos * cos);
    return v;
}

inline std::vector<float> normalized(std::vector<float> v) {
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    norm = std::sqrt(norm);
    for (float& x : v) x = static_cast<float>(x / norm);
    return v;
}

// Random unit "voice"; unrelated seeds give near-orthogonal voices in 192 dims
inline std::vector<float> random_voice(unsigned seed, int dim = kDim) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(dim);
    for (auto& x : v) x = dist(rng);
    return normalized(v);
}

// Same voice, another utterance: noise with relative norm `level`
inline std::vector<float> noisy(const std::vector<float>& base, float level, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, level / std::sqrt(static_cast<float>(base.size())));
    std::vector<float> v(base);
    for (auto& x : v) x += dist(rng);
    return normalized(v);
}

// Family of voices: a shared direction spread over the upper half of the
// dimensions plus a personal axis k < dim / 2. Two members with different k
// have cosine exactly `cos`.
inline std::vector<float> related_voice(int k, float cos = 0.6f, int dim = kDim) {
    std::vector<float> v(dim, 0.0f);
    const int half = dim / 2;
    const float shared = std::sqrt(cos / static_cast<float>(dim - half));
    for (int i = half; i < dim; ++i) v[i] = shared;
    v[k] = std::sqrt(1.0f - cos);
    return v;
}

// Unit vector with cosine `similarity` to every family member whose personal
// axis is not k
inline std::vector<float> stranger(int k, float similarity, float cos = 0.6f, int dim = kDim) {
    std::vector<float> v(dim, 0.0f);
    const int half = dim / 2;
    const float along = similarity / std::sqrt(cos);
    const float shared = along / std::sqrt(static_cast<float>(dim - half));
    for (int i = half; i < dim; ++i) v[i] = shared;
    v[k] = std::sqrt(1.0f - along * along);
    return v;
}

inline float dot(const std::vector<float>& a, const std::vector<float>& b) {
    double s = 0.0;
    for (size_t i = 0; i < a.size(); ++i) s += static_cast<double>(a[i]) * b[i];
    return static_cast<float>(s);
}

} // namespace sid_test

#endif // SID_TEST_EMBEDDINGS_H
