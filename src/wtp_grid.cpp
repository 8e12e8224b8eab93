#include "wtp_grid.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace cohortcea {

WTPGrid::WTPGrid(std::vector<double> values) : values_(std::move(values)) {}

WTPGrid WTPGrid::range(double lower, double upper, double step) {
    if (!std::isfinite(lower) || !std::isfinite(upper) || !std::isfinite(step)) {
        throw ValidationError("WTP grid bounds must be finite");
    }
    if (step <= 0.0) {
        throw ValidationError("WTP grid step must be positive");
    }
    if (upper < lower) {
        throw ValidationError("WTP grid upper bound is below the lower bound");
    }
    if (lower < 0.0) {
        throw ValidationError("WTP grid values must be non-negative");
    }

    std::vector<double> values;
    const double tolerance = 1e-9 * step;
    // Point k computed directly from lower, not accumulated
    for (size_t k = 0;; ++k) {
        double w = lower + static_cast<double>(k) * step;
        if (w > upper + tolerance) break;
        values.push_back(std::min(w, upper));
    }
    return WTPGrid(std::move(values));
}

WTPGrid WTPGrid::from_values(std::vector<double> values) {
    if (values.empty()) {
        throw ValidationError("WTP grid must contain at least one value");
    }
    for (double w : values) {
        if (!std::isfinite(w) || w < 0.0) {
            throw ValidationError("WTP grid values must be finite and non-negative");
        }
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return WTPGrid(std::move(values));
}

size_t WTPGrid::nearest_index(double w) const {
    size_t best = 0;
    double best_distance = std::abs(values_[0] - w);
    for (size_t i = 1; i < values_.size(); ++i) {
        double distance = std::abs(values_[i] - w);
        if (distance < best_distance) {
            best = i;
            best_distance = distance;
        }
    }
    return best;
}

} // namespace cohortcea
