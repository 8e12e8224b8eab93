#ifndef COHORTCEA_ECONOMIC_AGGREGATOR_HPP
#define COHORTCEA_ECONOMIC_AGGREGATOR_HPP

#include "markov_simulator.hpp"
#include "parameter.hpp"
#include "strategy.hpp"
#include <string>
#include <vector>

namespace cohortcea {

constexpr int CYCLES_PER_YEAR = 12;

// Discount factors for monthly cycles from an annual rate.
// factor(c) = (1 + r)^(-c / cycles_per_year); cycle 0 is undiscounted.
class DiscountSchedule {
public:
    explicit DiscountSchedule(double annual_rate, int cycles_per_year = CYCLES_PER_YEAR);

    double factor(int cycle) const;
    double annual_rate() const { return annual_rate_; }

private:
    double annual_rate_;
    int cycles_per_year_;
};

// Annual discount rates of one jurisdiction
struct DiscountRates {
    double costs;
    double outcomes;

    DiscountRates();
    DiscountRates(double cost_rate, double outcome_rate);
};

// Whose costs an analysis counts
enum class Perspective {
    HealthSystem,   // Costs borne by the health system (default)
    Societal        // Health-system costs plus productivity, informal care and travel
};

// Parse "health_system" / "societal"; throws ValidationError otherwise
Perspective parse_perspective(const std::string& name);
std::string perspective_name(Perspective perspective);

// Discounted totals for one strategy under one parameter realization
struct StrategyOutcome {
    double cost;                // Discounted cost under the run perspective
    double qalys;               // Discounted QALYs
    double life_years;          // Undiscounted years alive
    double health_system_cost;  // Discounted health-system cost
    double societal_cost;       // Discounted cost falling outside the health system

    StrategyOutcome();
    StrategyOutcome(double c, double q, double ly = 0.0);

    double cost_under(Perspective perspective) const;
};

// Streaming accumulator: folds each cycle's occupancy into running totals so
// no trace has to be kept.
//
//   health  = sum_c df_cost(c) * (sum_s occ[s] * cost(s, c) + one_time(c))
//   society = sum_c df_cost(c) * sum_s occ[s] * societal_cost(s, c)
//   qalys   = sum_c df_out(c)  * sum_s occ[s] * utility(s, c) / 12
//
// Both cost components are always accumulated; cost is health under the
// health-system perspective and health + society under the societal one.
// A negative state cost, utility or one-time cost throws std::runtime_error.
class CohortAccumulator : public CycleObserver {
public:
    CohortAccumulator(const StrategyArm& arm, const ParameterValues& values,
                      const DiscountSchedule& cost_discount,
                      const DiscountSchedule& outcome_discount,
                      Perspective perspective = Perspective::HealthSystem);

    void observe(int cycle, const Occupancy& occupancy, double alive_mass) override;

    const StrategyOutcome& outcome() const { return outcome_; }

private:
    const StrategyArm& arm_;
    const ParameterValues& values_;
    const DiscountSchedule& cost_discount_;
    const DiscountSchedule& outcome_discount_;
    Perspective perspective_;
    StrategyOutcome outcome_;
};

// Aggregate a stored trace; gives the same totals as CohortAccumulator
StrategyOutcome aggregate_trace(const CohortTrace& trace, const StrategyArm& arm,
                                const ParameterValues& values,
                                const DiscountSchedule& cost_discount,
                                const DiscountSchedule& outcome_discount,
                                Perspective perspective = Perspective::HealthSystem);

// Simulates strategies and returns their discounted outcomes
class EconomicAggregator {
public:
    EconomicAggregator(const MarkovCohortSimulator& simulator, const DiscountRates& rates,
                       Perspective perspective = Perspective::HealthSystem);

    StrategyOutcome evaluate(const StrategyArm& arm, const ParameterValues& values) const;

    // One outcome per strategy, in registry order
    std::vector<StrategyOutcome> evaluate_all(const StrategyRegistry& registry,
                                              const ParameterValues& values) const;

    const MarkovCohortSimulator& simulator() const { return simulator_; }
    const DiscountRates& rates() const { return rates_; }
    Perspective perspective() const { return perspective_; }

private:
    const MarkovCohortSimulator& simulator_;
    DiscountRates rates_;
    Perspective perspective_;
    DiscountSchedule cost_discount_;
    DiscountSchedule outcome_discount_;
};

} // namespace cohortcea

#endif // COHORTCEA_ECONOMIC_AGGREGATOR_HPP
