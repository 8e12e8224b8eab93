#include "markov_simulator.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <utility>

namespace cohortcea {

// ============================================================================
// TraceRecorder Implementation
// ============================================================================

TraceRecorder::TraceRecorder(const std::string& strategy, const std::vector<std::string>& state_names) {
    trace_.strategy = strategy;
    trace_.state_names = state_names;
}

void TraceRecorder::observe(int, const Occupancy& occupancy, double alive_mass) {
    trace_.occupancy.push_back(occupancy);
    trace_.alive_mass.push_back(alive_mass);
}

// ============================================================================
// Validation
// ============================================================================

void validate_transition_matrix(const TransitionMatrix& matrix, size_t expected_states,
                                const std::string& strategy, int cycle) {
    const auto n = static_cast<Eigen::Index>(expected_states);
    if (matrix.rows() != n || matrix.cols() != n) {
        std::ostringstream msg;
        msg << "Strategy '" << strategy << "' cycle " << cycle
            << ": transition matrix is " << matrix.rows() << "x" << matrix.cols()
            << ", expected " << expected_states << " states";
        throw InvalidTransitionError(strategy, cycle, 0, msg.str());
    }

    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            double p = matrix(i, j);
            if (!std::isfinite(p) || p < -NEGATIVE_ENTRY_TOLERANCE) {
                std::ostringstream msg;
                msg.precision(12);
                msg << "Strategy '" << strategy << "' cycle " << cycle
                    << " row " << i << ": invalid transition probability "
                    << p << " to state " << j;
                throw InvalidTransitionError(strategy, cycle, static_cast<size_t>(i), msg.str());
            }
        }

        double sum = matrix.row(i).sum();
        if (std::abs(sum - 1.0) > ROW_SUM_TOLERANCE) {
            std::ostringstream msg;
            msg.precision(12);
            msg << "Strategy '" << strategy << "' cycle " << cycle
                << " row " << i << ": transition probabilities sum to " << sum;
            throw InvalidTransitionError(strategy, cycle, static_cast<size_t>(i), msg.str());
        }
    }
}

// ============================================================================
// MarkovCohortSimulator Implementation
// ============================================================================

MarkovCohortSimulator::MarkovCohortSimulator(int cycles) : cycles_(cycles) {
    if (cycles <= 0) {
        throw ValidationError("Number of cycles must be positive, got " + std::to_string(cycles));
    }
}

std::vector<TransitionMatrix> MarkovCohortSimulator::build_matrices(const StrategyArm& arm,
                                                                    const ParameterValues& values) const {
    std::vector<TransitionMatrix> matrices;
    matrices.reserve(static_cast<size_t>(cycles_));
    for (int cycle = 0; cycle < cycles_; ++cycle) {
        TransitionMatrix p = arm.transition(cycle, values);
        validate_transition_matrix(p, arm.num_states(), arm.id, cycle);
        matrices.push_back(std::move(p));
    }
    return matrices;
}

int MarkovCohortSimulator::simulate(const StrategyArm& arm, const ParameterValues& values,
                                    CycleObserver& observer) const {
    const std::vector<TransitionMatrix> matrices = build_matrices(arm, values);
    const size_t n = arm.num_states();

    Occupancy occupancy = Occupancy::Zero(static_cast<Eigen::Index>(n));
    occupancy(static_cast<Eigen::Index>(arm.initial_state)) = 1.0;

    int observed = 0;
    for (int cycle = 0; cycle < cycles_; ++cycle) {
        const TransitionMatrix& p = matrices[static_cast<size_t>(cycle)];

        double alive = 0.0;
        for (size_t i = 0; i < n; ++i) {
            if (!is_absorbing(p, i)) {
                alive += occupancy(static_cast<Eigen::Index>(i));
            }
        }

        // Whole cohort absorbed: remaining cycles accrue nothing
        if (alive < ABSORBED_MASS_THRESHOLD) {
            break;
        }

        observer.observe(cycle, occupancy, alive);
        ++observed;

        occupancy = occupancy * p;
    }

    return observed;
}

CohortTrace MarkovCohortSimulator::trace(const StrategyArm& arm, const ParameterValues& values) const {
    TraceRecorder recorder(arm.id, arm.state_names);
    simulate(arm, values, recorder);
    return recorder.release();
}

} // namespace cohortcea
