#ifndef COHORTCEA_SENSITIVITY_HPP
#define COHORTCEA_SENSITIVITY_HPP

#include "psa_runner.hpp"
#include <optional>
#include <string>
#include <vector>

namespace cohortcea {

struct SensitivitySettings {
    std::string strategy;           // Strategy compared with the reference
    double low_quantile;
    double high_quantile;
    double wtp;                     // Threshold at which incremental NMB is evaluated

    SensitivitySettings();
};

// Effect of moving one parameter to its low and high quantile
struct TornadoBar {
    std::string parameter;
    double low_value;
    double high_value;
    double low_outcome;             // Incremental NMB with the parameter at low_value
    double high_outcome;
    double range;                   // |high_outcome - low_outcome|
};

// One-way deterministic sensitivity analysis.
//
// The outcome is the incremental NMB of the chosen strategy against the
// reference at the given WTP. Each non-Fixed parameter in turn is set to its
// low and high quantile while every other parameter stays at its mean.
class SensitivityAnalyzer {
public:
    SensitivityAnalyzer(const PsaRunner& runner, const std::string& reference,
                        const SensitivitySettings& settings);

    // Incremental NMB with every parameter at its mean
    double base_outcome() const;

    // Bars sorted by range, widest first; equal ranges keep table order
    std::vector<TornadoBar> tornado() const;

private:
    const PsaRunner& runner_;
    size_t strategy_;
    size_t reference_;
    SensitivitySettings settings_;

    double incremental_nmb(const ParameterValues& values) const;
};

// One axis of a two-way grid. An empty bound falls back to the parameter's
// low or high quantile.
struct TwoWayAxis {
    std::string parameter;
    std::optional<double> min;
    std::optional<double> max;
};

struct TwoWaySettings {
    std::string strategy;           // Strategy compared with the reference
    TwoWayAxis first;
    TwoWayAxis second;
    size_t steps;                   // Evenly spaced points per axis, bounds included
    double low_quantile;
    double high_quantile;
    double wtp;

    TwoWaySettings();
};

// One cell of the two-way grid
struct TwoWayCell {
    double first_value;
    double second_value;
    double incremental_nmb;
    bool cost_effective;            // incremental_nmb >= 0
};

// Two-way deterministic sensitivity analysis.
//
// Both parameters sweep their ranges together while every other parameter
// stays at its mean; the outcome is the same incremental NMB the one-way
// analysis reports.
class TwoWaySensitivityAnalyzer {
public:
    TwoWaySensitivityAnalyzer(const PsaRunner& runner, const std::string& reference,
                              const TwoWaySettings& settings);

    // steps * steps cells; the first parameter varies slowest
    std::vector<TwoWayCell> grid() const;

    // Resolved sweep values of each axis
    const std::vector<double>& first_values() const { return first_values_; }
    const std::vector<double>& second_values() const { return second_values_; }

private:
    const PsaRunner& runner_;
    size_t strategy_;
    size_t reference_;
    TwoWaySettings settings_;
    size_t first_index_;
    size_t second_index_;
    std::vector<double> first_values_;
    std::vector<double> second_values_;

    std::vector<double> sweep(const TwoWayAxis& axis, size_t index) const;
};

} // namespace cohortcea

#endif // COHORTCEA_SENSITIVITY_HPP
