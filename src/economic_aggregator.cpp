#include "economic_aggregator.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace cohortcea {

// ============================================================================
// DiscountSchedule / DiscountRates / StrategyOutcome
// ============================================================================

DiscountSchedule::DiscountSchedule(double annual_rate, int cycles_per_year)
    : annual_rate_(annual_rate), cycles_per_year_(cycles_per_year) {
    if (!std::isfinite(annual_rate) || annual_rate <= -1.0) {
        throw ValidationError("Discount rate must be greater than -1");
    }
    if (cycles_per_year <= 0) {
        throw ValidationError("Cycles per year must be positive");
    }
}

double DiscountSchedule::factor(int cycle) const {
    return std::pow(1.0 + annual_rate_, -static_cast<double>(cycle) / cycles_per_year_);
}

DiscountRates::DiscountRates() : costs(0.0), outcomes(0.0) {}

DiscountRates::DiscountRates(double cost_rate, double outcome_rate)
    : costs(cost_rate), outcomes(outcome_rate) {}

StrategyOutcome::StrategyOutcome()
    : cost(0.0), qalys(0.0), life_years(0.0), health_system_cost(0.0), societal_cost(0.0) {}

StrategyOutcome::StrategyOutcome(double c, double q, double ly)
    : cost(c), qalys(q), life_years(ly), health_system_cost(c), societal_cost(0.0) {}

double StrategyOutcome::cost_under(Perspective perspective) const {
    if (perspective == Perspective::Societal) {
        return health_system_cost + societal_cost;
    }
    return health_system_cost;
}

Perspective parse_perspective(const std::string& name) {
    if (name == "health_system") return Perspective::HealthSystem;
    if (name == "societal") return Perspective::Societal;
    throw ValidationError("Unknown perspective '" + name + "' (expected health_system or societal)");
}

std::string perspective_name(Perspective perspective) {
    return perspective == Perspective::Societal ? "societal" : "health_system";
}

// ============================================================================
// Accumulation
// ============================================================================

namespace {

void reject_negative(double value, const char* what, const StrategyArm& arm, size_t state, int cycle) {
    if (value < 0.0 || !std::isfinite(value)) {
        std::ostringstream msg;
        msg << "Strategy '" << arm.id << "' cycle " << cycle;
        if (state < arm.num_states()) {
            msg << " state " << arm.state_names[state];
        }
        msg << ": invalid " << what << " " << value;
        throw std::runtime_error(msg.str());
    }
}

// Contribution of one cycle to the outcome
void accumulate_cycle(StrategyOutcome& outcome, int cycle, const Occupancy& occupancy,
                      double alive_mass, const StrategyArm& arm, const ParameterValues& values,
                      const DiscountSchedule& cost_discount, const DiscountSchedule& outcome_discount,
                      Perspective perspective) {
    double cycle_cost = 0.0;
    double cycle_societal = 0.0;
    double cycle_utility = 0.0;

    for (size_t s = 0; s < arm.num_states(); ++s) {
        const double occ = occupancy(static_cast<Eigen::Index>(s));
        if (occ == 0.0) continue;

        const double cost = arm.cost(s, cycle, values);
        reject_negative(cost, "cost", arm, s, cycle);
        const double utility = arm.utility(s, cycle, values);
        reject_negative(utility, "utility", arm, s, cycle);

        cycle_cost += occ * cost;
        cycle_utility += occ * utility;

        if (arm.societal_cost) {
            const double societal = arm.societal_cost(s, cycle, values);
            reject_negative(societal, "societal cost", arm, s, cycle);
            cycle_societal += occ * societal;
        }
    }

    // Charged once, at the cycle it occurs
    const double one_time = arm.one_time_cost(cycle, values);
    reject_negative(one_time, "one-time cost", arm, arm.num_states(), cycle);
    cycle_cost += one_time;

    const double df_cost = cost_discount.factor(cycle);
    outcome.health_system_cost += df_cost * cycle_cost;
    outcome.societal_cost += df_cost * cycle_societal;
    outcome.cost = outcome.cost_under(perspective);
    outcome.qalys += outcome_discount.factor(cycle) * cycle_utility / CYCLES_PER_YEAR;
    outcome.life_years += alive_mass / CYCLES_PER_YEAR;
}

} // anonymous namespace

CohortAccumulator::CohortAccumulator(const StrategyArm& arm, const ParameterValues& values,
                                     const DiscountSchedule& cost_discount,
                                     const DiscountSchedule& outcome_discount,
                                     Perspective perspective)
    : arm_(arm), values_(values), cost_discount_(cost_discount), outcome_discount_(outcome_discount),
      perspective_(perspective) {}

void CohortAccumulator::observe(int cycle, const Occupancy& occupancy, double alive_mass) {
    accumulate_cycle(outcome_, cycle, occupancy, alive_mass, arm_, values_,
                     cost_discount_, outcome_discount_, perspective_);
}

StrategyOutcome aggregate_trace(const CohortTrace& trace, const StrategyArm& arm,
                                const ParameterValues& values,
                                const DiscountSchedule& cost_discount,
                                const DiscountSchedule& outcome_discount,
                                Perspective perspective) {
    StrategyOutcome outcome;
    for (size_t c = 0; c < trace.num_cycles(); ++c) {
        accumulate_cycle(outcome, static_cast<int>(c), trace.occupancy[c], trace.alive_mass[c],
                         arm, values, cost_discount, outcome_discount, perspective);
    }
    return outcome;
}

// ============================================================================
// EconomicAggregator Implementation
// ============================================================================

EconomicAggregator::EconomicAggregator(const MarkovCohortSimulator& simulator, const DiscountRates& rates,
                                       Perspective perspective)
    : simulator_(simulator),
      rates_(rates),
      perspective_(perspective),
      cost_discount_(rates.costs),
      outcome_discount_(rates.outcomes) {}

StrategyOutcome EconomicAggregator::evaluate(const StrategyArm& arm, const ParameterValues& values) const {
    CohortAccumulator accumulator(arm, values, cost_discount_, outcome_discount_, perspective_);
    simulator_.simulate(arm, values, accumulator);
    return accumulator.outcome();
}

std::vector<StrategyOutcome> EconomicAggregator::evaluate_all(const StrategyRegistry& registry,
                                                              const ParameterValues& values) const {
    std::vector<StrategyOutcome> outcomes;
    outcomes.reserve(registry.size());
    for (const auto& arm : registry.arms()) {
        outcomes.push_back(evaluate(arm, values));
    }
    return outcomes;
}

} // namespace cohortcea
