#ifndef COHORTCEA_STATISTICS_HPP
#define COHORTCEA_STATISTICS_HPP

#include <vector>

namespace cohortcea {

// Summary statistics over Monte-Carlo samples

double mean(const std::vector<double>& values);

// Population standard deviation (0 for fewer than two values)
double std_dev(const std::vector<double>& values, double mean_value);

// Sample standard deviation with n - 1 denominator (0 for fewer than two values)
double sample_std_dev(const std::vector<double>& values, double mean_value);

// Percentile p in [0, 100] using linear interpolation between order
// statistics. sorted_values must be ascending.
double percentile(const std::vector<double>& sorted_values, double p);

} // namespace cohortcea

#endif // COHORTCEA_STATISTICS_HPP
