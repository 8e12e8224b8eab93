#ifndef COHORTCEA_SCENARIO_ANALYSIS_HPP
#define COHORTCEA_SCENARIO_ANALYSIS_HPP

#include "decision_metrics.hpp"
#include "economic_aggregator.hpp"
#include "parameter.hpp"
#include "strategy.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cohortcea {

// Name of the row set produced from the unmodified base case
constexpr const char* BASE_CASE_SCENARIO = "base_case";

// A named deterministic variant of the base case. Every override left empty
// keeps the run's own setting.
struct ScenarioDefinition {
    std::string name;
    std::string description;
    std::optional<DiscountRates> rates;
    std::optional<int> cycles;
    std::optional<Perspective> perspective;
    std::optional<double> wtp;
    std::vector<std::pair<std::string, double>> parameters;    // Values fixed for the scenario
};

// One strategy under one scenario
struct ScenarioRow {
    std::string scenario;
    std::string strategy;
    Perspective perspective;
    int cycles;
    double wtp;
    double cost;
    double qalys;
    double delta_cost;
    double delta_qalys;
    std::optional<double> icer;
    IncrementalStatus status;
    double incremental_nmb;     // Against the reference at the scenario WTP
    double inmb_change;         // Against the same strategy in the base case
    bool optimal;               // Highest NMB in the scenario
};

// Deterministic scenario analysis.
//
// Each scenario starts from every parameter at its mean and the run's
// discount rates, horizon, perspective and policy WTP, applies its overrides
// and evaluates every strategy once.
class ScenarioAnalyzer {
public:
    ScenarioAnalyzer(const StrategyRegistry& registry, const ParameterTable& table,
                     const EconomicAggregator& base, const std::string& reference, double policy_wtp);

    // Throws ValidationError on an unknown parameter, a non-finite value,
    // a non-positive horizon, a negative WTP or a discount rate <= -1
    void validate(const ScenarioDefinition& scenario) const;

    // Validate each scenario and reject duplicate names or reuse of the base
    // case name
    void validate(const std::vector<ScenarioDefinition>& scenarios) const;

    // Rows in registry order; inmb_change is left at zero
    std::vector<ScenarioRow> evaluate(const ScenarioDefinition& scenario) const;

    // The base case followed by each scenario in order
    std::vector<ScenarioRow> run(const std::vector<ScenarioDefinition>& scenarios) const;

private:
    const StrategyRegistry& registry_;
    const ParameterTable& table_;
    const EconomicAggregator& base_;
    std::string reference_;
    double policy_wtp_;
};

} // namespace cohortcea

#endif // COHORTCEA_SCENARIO_ANALYSIS_HPP
