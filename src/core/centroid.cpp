#include "core/centroid.h"
#include <cmath>

namespace sid {

RunningCentroid::RunningCentroid(const std::vector<float>& unit_embedding)
    : unit_(unit_embedding.begin(), unit_embedding.end()),
      centroid_(unit_embedding),
      count_(unit_embedding.empty() ? 0 : 1) {}

RunningCentroid RunningCentroid::from_snapshot(const std::vector<float>& centroid, int count) {
    RunningCentroid rc;
    if (centroid.empty()) return rc;
    if (!rc.assign_normalized(std::vector<double>(centroid.begin(), centroid.end()))) return rc;
    rc.count_ = count < 1 ? 1 : count;
    return rc;
}

bool RunningCentroid::add(const std::vector<float>& unit_embedding) {
    if (unit_embedding.size() != unit_.size() || unit_.empty()) return false;

    const double n = static_cast<double>(count_);
    std::vector<double> avg(unit_.size());
    for (size_t i = 0; i < unit_.size(); ++i) {
        avg[i] = (unit_[i] * n + unit_embedding[i]) / (n + 1.0);
    }
    if (!assign_normalized(avg)) return false;

    ++count_;
    return true;
}

bool RunningCentroid::remove(const std::vector<float>& unit_embedding) {
    if (count_ <= 1) return false;
    if (unit_embedding.size() != unit_.size()) return false;

    const double m = static_cast<double>(count_);
    const double n = m - 1.0;

    double d = 0.0;
    for (size_t i = 0; i < unit_.size(); ++i) d += unit_[i] * unit_embedding[i];

    const double disc = d * d + n * n - 1.0;
    if (disc < 0.0) return false;
    const double s = (d + std::sqrt(disc)) / m;
    if (!(s > 1e-10)) return false;

    std::vector<double> prior(unit_.size());
    for (size_t i = 0; i < unit_.size(); ++i) {
        prior[i] = (s * m * unit_[i] - unit_embedding[i]) / n;
    }
    if (!assign_normalized(prior)) return false;

    --count_;
    return true;
}

bool RunningCentroid::assign_normalized(const std::vector<double>& v) {
    double norm = 0.0;
    for (double x : v) norm += x * x;
    norm = std::sqrt(norm);
    if (!(norm > 1e-10) || !std::isfinite(norm)) return false;

    unit_.resize(v.size());
    centroid_.resize(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        unit_[i] = v[i] / norm;
        centroid_[i] = static_cast<float>(unit_[i]);
    }
    return true;
}

} // namespace sid
