#ifndef SID_CENTROID_H
#define SID_CENTROID_H

#include <vector>

namespace sid {

/**
 * Running-average speaker centroid.
 *
 * The unit-length centroid itself is averaged and renormalized:
 *   add:    c' = normalize((c * n + e) / (n + 1))
 * remove() solves the same equation backwards. With c' and e unit-length and
 * m = n + 1 samples before the removal, the pre-normalization scale is the
 * positive root s = (d + sqrt(d^2 + n^2 - 1)) / m, where d = c' . e, and
 *   remove: c = (s * m * c' - e) / n
 * Arithmetic runs in double; similarity scoring uses the float centroid().
 */
class RunningCentroid {
public:
    RunningCentroid() = default;

    // Founding sample; count = 1. Input must be L2-normalized.
    explicit RunningCentroid(const std::vector<float>& unit_embedding);

    // Rebuild from a persisted unit centroid and its sample count
    static RunningCentroid from_snapshot(const std::vector<float>& centroid, int count);

    // Fold a normalized sample in. Returns false on dimension mismatch or
    // when the average has no direction.
    bool add(const std::vector<float>& unit_embedding);

    // Inverse of add(). Returns false (no mutation) when count <= 1, on
    // dimension mismatch, or when the sample cannot have been folded into
    // this centroid.
    bool remove(const std::vector<float>& unit_embedding);

    const std::vector<float>& centroid() const { return centroid_; }
    int count() const { return count_; }
    int dimension() const { return static_cast<int>(centroid_.size()); }
    bool empty() const { return centroid_.empty(); }

private:
    // Normalize v into unit_/centroid_; false if v has no direction
    bool assign_normalized(const std::vector<double>& v);

    std::vector<double> unit_;
    std::vector<float> centroid_;
    int count_ = 0;
};

} // namespace sid

#endif // SID_CENTROID_H
