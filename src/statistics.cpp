#include "statistics.hpp"
#include <cmath>
#include <cstddef>
#include <numeric>

namespace cohortcea {

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

namespace {

// Sum of squared deviations divided by (n - ddof)
double variance(const std::vector<double>& values, double mean_value, size_t ddof) {
    double ss = 0.0;
    for (double v : values) {
        ss += (v - mean_value) * (v - mean_value);
    }
    return ss / static_cast<double>(values.size() - ddof);
}

} // anonymous namespace

double std_dev(const std::vector<double>& values, double mean_value) {
    return values.size() < 2 ? 0.0 : std::sqrt(variance(values, mean_value, 0));
}

double sample_std_dev(const std::vector<double>& values, double mean_value) {
    return values.size() < 2 ? 0.0 : std::sqrt(variance(values, mean_value, 1));
}

double percentile(const std::vector<double>& sorted_values, double p) {
    const size_t n = sorted_values.size();
    if (n == 0) {
        return 0.0;
    }

    // Rank on [0, n - 1]; values between order statistics are interpolated
    const double rank = p / 100.0 * static_cast<double>(n - 1);
    if (rank <= 0.0) {
        return sorted_values.front();
    }
    if (rank >= static_cast<double>(n - 1)) {
        return sorted_values.back();
    }

    const size_t below = static_cast<size_t>(rank);
    const double weight = rank - static_cast<double>(below);
    return sorted_values[below] + weight * (sorted_values[below + 1] - sorted_values[below]);
}

} // namespace cohortcea
