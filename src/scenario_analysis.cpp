#include "scenario_analysis.hpp"
#include "errors.hpp"
#include "markov_simulator.hpp"
#include <cmath>
#include <set>

namespace cohortcea {

ScenarioAnalyzer::ScenarioAnalyzer(const StrategyRegistry& registry, const ParameterTable& table,
                                   const EconomicAggregator& base, const std::string& reference,
                                   double policy_wtp)
    : registry_(registry), table_(table), base_(base), reference_(reference), policy_wtp_(policy_wtp) {
    registry_.index_of(reference_);
}

void ScenarioAnalyzer::validate(const ScenarioDefinition& scenario) const {
    const std::string prefix = "Scenario '" + scenario.name + "': ";
    if (scenario.name.empty()) {
        throw ValidationError("Scenario name must not be empty");
    }
    if (scenario.cycles && *scenario.cycles <= 0) {
        throw ValidationError(prefix + "cycles must be positive");
    }
    if (scenario.wtp && !(*scenario.wtp >= 0.0)) {
        throw ValidationError(prefix + "wtp must be non-negative");
    }
    if (scenario.rates && (!(scenario.rates->costs > -1.0) || !(scenario.rates->outcomes > -1.0))) {
        throw ValidationError(prefix + "discount rates must be greater than -1");
    }
    for (const auto& entry : scenario.parameters) {
        if (!table_.contains(entry.first)) {
            throw ValidationError(prefix + "unknown parameter '" + entry.first + "'");
        }
        if (!std::isfinite(entry.second)) {
            throw ValidationError(prefix + "value for '" + entry.first + "' is not finite");
        }
    }
}

std::vector<ScenarioRow> ScenarioAnalyzer::evaluate(const ScenarioDefinition& scenario) const {
    validate(scenario);

    ParameterValues values = ParameterValues::base_case(table_);
    for (const auto& entry : scenario.parameters) {
        values.set(entry.first, entry.second);
    }

    const int cycles = scenario.cycles.value_or(base_.simulator().cycles());
    const Perspective perspective = scenario.perspective.value_or(base_.perspective());
    const double wtp = scenario.wtp.value_or(policy_wtp_);

    MarkovCohortSimulator simulator(cycles);
    EconomicAggregator aggregator(simulator, scenario.rates.value_or(base_.rates()), perspective);
    const auto outcomes = aggregator.evaluate_all(registry_, values);

    DecisionMetricsCalculator metrics(registry_.ids(), reference_);
    const auto incremental = metrics.incremental_results(outcomes);
    const size_t best = DecisionMetricsCalculator::optimal_strategy(outcomes, wtp);
    const double reference_nmb = DecisionMetricsCalculator::net_monetary_benefit(outcomes[metrics.reference()], wtp);

    std::vector<ScenarioRow> rows;
    rows.reserve(outcomes.size());
    for (size_t s = 0; s < outcomes.size(); ++s) {
        ScenarioRow row;
        row.scenario = scenario.name;
        row.strategy = incremental[s].strategy;
        row.perspective = perspective;
        row.cycles = cycles;
        row.wtp = wtp;
        row.cost = incremental[s].cost;
        row.qalys = incremental[s].qalys;
        row.delta_cost = incremental[s].delta_cost;
        row.delta_qalys = incremental[s].delta_qalys;
        row.icer = incremental[s].icer;
        row.status = incremental[s].status;
        row.incremental_nmb = DecisionMetricsCalculator::net_monetary_benefit(outcomes[s], wtp) - reference_nmb;
        row.inmb_change = 0.0;
        row.optimal = s == best;
        rows.push_back(std::move(row));
    }
    return rows;
}

void ScenarioAnalyzer::validate(const std::vector<ScenarioDefinition>& scenarios) const {
    std::set<std::string> names = {BASE_CASE_SCENARIO};
    for (const auto& scenario : scenarios) {
        if (!names.insert(scenario.name).second) {
            throw ValidationError("Duplicate scenario name '" + scenario.name + "'");
        }
        validate(scenario);
    }
}

std::vector<ScenarioRow> ScenarioAnalyzer::run(const std::vector<ScenarioDefinition>& scenarios) const {
    validate(scenarios);

    ScenarioDefinition base_case;
    base_case.name = BASE_CASE_SCENARIO;
    base_case.description = "Base case";
    std::vector<ScenarioRow> rows = evaluate(base_case);

    for (const auto& scenario : scenarios) {
        auto scenario_rows = evaluate(scenario);
        for (size_t s = 0; s < scenario_rows.size(); ++s) {
            scenario_rows[s].inmb_change = scenario_rows[s].incremental_nmb - rows[s].incremental_nmb;
        }
        rows.insert(rows.end(), scenario_rows.begin(), scenario_rows.end());
    }
    return rows;
}

} // namespace cohortcea
