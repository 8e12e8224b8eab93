#ifndef COHORTCEA_MARKOV_SIMULATOR_HPP
#define COHORTCEA_MARKOV_SIMULATOR_HPP

#include "parameter.hpp"
#include "strategy.hpp"
#include <Eigen/Dense>
#include <string>
#include <utility>
#include <vector>

namespace cohortcea {

// Tolerances for the row-stochastic invariant
constexpr double ROW_SUM_TOLERANCE = 1e-9;
constexpr double NEGATIVE_ENTRY_TOLERANCE = 1e-12;

// Cohort mass outside absorbing states below which the simulation stops
constexpr double ABSORBED_MASS_THRESHOLD = 1e-12;

// Share of the cohort in each state
using Occupancy = Eigen::RowVectorXd;

// Receives the cohort occupancy at the start of every simulated cycle.
// alive_mass is the occupancy outside absorbing states.
class CycleObserver {
public:
    virtual ~CycleObserver() = default;
    virtual void observe(int cycle, const Occupancy& occupancy, double alive_mass) = 0;
};

// Full per-cycle occupancy, kept only when detailed output is requested
struct CohortTrace {
    std::string strategy;
    std::vector<std::string> state_names;
    std::vector<Occupancy> occupancy;             // [cycle](state)
    std::vector<double> alive_mass;               // [cycle]

    size_t num_cycles() const { return occupancy.size(); }
};

// Observer that records a CohortTrace
class TraceRecorder : public CycleObserver {
public:
    TraceRecorder(const std::string& strategy, const std::vector<std::string>& state_names);

    void observe(int cycle, const Occupancy& occupancy, double alive_mass) override;

    const CohortTrace& trace() const { return trace_; }
    CohortTrace release() { return std::move(trace_); }

private:
    CohortTrace trace_;
};

// Throws InvalidTransitionError when an entry is negative (beyond
// NEGATIVE_ENTRY_TOLERANCE) or non-finite, or a row does not sum to 1
// within ROW_SUM_TOLERANCE, or the matrix has the wrong dimension.
void validate_transition_matrix(const TransitionMatrix& matrix, size_t expected_states,
                                const std::string& strategy, int cycle);

// Monthly Markov cohort recurrence: occupancy(c+1) = occupancy(c) x P(c).
//
// All matrices for the horizon are built and validated before the first
// cycle is simulated, so an invalid matrix never leaves a partial result.
// The cohort starts with all mass in the arm's initial state. Simulation
// ends after `cycles` cycles or as soon as the mass outside absorbing states
// drops below ABSORBED_MASS_THRESHOLD.
class MarkovCohortSimulator {
public:
    explicit MarkovCohortSimulator(int cycles);

    int cycles() const { return cycles_; }

    // Build and validate P(0) .. P(cycles - 1)
    std::vector<TransitionMatrix> build_matrices(const StrategyArm& arm, const ParameterValues& values) const;

    // Stream the cohort through the observer; returns the number of cycles
    // observed
    int simulate(const StrategyArm& arm, const ParameterValues& values, CycleObserver& observer) const;

    // Simulate and keep the full trace
    CohortTrace trace(const StrategyArm& arm, const ParameterValues& values) const;

private:
    int cycles_;
};

} // namespace cohortcea

#endif // COHORTCEA_MARKOV_SIMULATOR_HPP
