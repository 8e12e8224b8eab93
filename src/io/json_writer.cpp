#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace cohortcea {
namespace io {

namespace {

json number_or_null(double value) {
    return std::isfinite(value) ? json(value) : json(nullptr);
}

json number_or_null(const std::optional<double>& value) {
    return value ? number_or_null(*value) : json(nullptr);
}

json run_section(const AnalysisResults& results, const RunConfig& config) {
    json run;
    run["run_id"] = results.run_id;
    run["jurisdiction"] = config.jurisdiction;
    run["reference_strategy"] = results.reference;
    run["seed"] = config.psa.seed;
    run["iterations_requested"] = results.psa.requested;
    run["iterations_completed"] = results.psa.draws.size();
    run["iterations_failed"] = results.psa.failures.size();
    run["iterations_resumed"] = results.psa.resumed;
    run["cancelled"] = results.psa.cancelled;
    run["error_policy"] = error_policy_name(config.psa.error_policy);
    run["evppi_method"] = evppi_method_name(config.voi.evppi_method);
    run["cycles"] = config.model.cycles;
    run["discount_rate_costs"] = config.rates().costs;
    run["discount_rate_outcomes"] = config.rates().outcomes;
    run["policy_wtp"] = results.policy_wtp;
    run["perspective"] = perspective_name(results.perspective);
    return run;
}

json deterministic_section(const AnalysisResults& results) {
    json rows = json::array();
    for (size_t s = 0; s < results.strategies.size(); ++s) {
        const IncrementalResult& inc = results.incremental.at(s);
        const FrontierEntry& frontier = results.frontier.at(s);
        json row;
        row["strategy"] = results.strategies[s];
        row["cost"] = number_or_null(results.deterministic[s].cost);
        row["qalys"] = number_or_null(results.deterministic[s].qalys);
        row["life_years"] = number_or_null(results.deterministic[s].life_years);
        row["health_system_cost"] = number_or_null(results.deterministic[s].health_system_cost);
        row["societal_cost"] = number_or_null(results.deterministic[s].societal_cost);
        row["delta_cost"] = number_or_null(inc.delta_cost);
        row["delta_qalys"] = number_or_null(inc.delta_qalys);
        row["icer"] = number_or_null(inc.icer);
        row["status"] = incremental_status_name(inc.status);
        row["frontier_status"] = frontier_status_name(frontier.status);
        row["nmb_at_policy_wtp"] = number_or_null(
            DecisionMetricsCalculator::net_monetary_benefit(results.deterministic[s], results.policy_wtp));
        for (const auto& headroom : results.headroom) {
            if (headroom.strategy == results.strategies[s]) {
                row["price_headroom"] = number_or_null(headroom.headroom);
            }
        }
        rows.push_back(row);
    }
    return rows;
}

json psa_section(const AnalysisResults& results) {
    json rows = json::array();
    for (const auto& summary : results.summary) {
        json row;
        row["strategy"] = summary.strategy;
        row["mean_cost"] = number_or_null(summary.mean_cost);
        row["sd_cost"] = number_or_null(summary.sd_cost);
        row["cost_p025"] = number_or_null(summary.cost_p025);
        row["cost_p975"] = number_or_null(summary.cost_p975);
        row["mean_qalys"] = number_or_null(summary.mean_qalys);
        row["sd_qalys"] = number_or_null(summary.sd_qalys);
        row["qalys_p025"] = number_or_null(summary.qalys_p025);
        row["qalys_p975"] = number_or_null(summary.qalys_p975);
        rows.push_back(row);
    }
    return rows;
}

} // anonymous namespace

void write_summary_json(std::ostream& os, const AnalysisResults& results,
                        const RunConfig& config, bool pretty_print) {
    json j;
    j["run"] = run_section(results, config);
    j["deterministic"] = deterministic_section(results);
    j["psa_summary"] = psa_section(results);

    // Decision at the grid point nearest the policy threshold
    if (results.has_draws() && !results.ceac.empty()) {
        const size_t w = results.grid.nearest_index(results.policy_wtp);
        json at_policy;
        at_policy["wtp"] = results.grid[w];
        at_policy["optimal_strategy"] = results.strategies.at(results.ceaf.at(w).strategy);
        at_policy["probability_cost_effective"] = number_or_null(results.ceaf.at(w).probability);
        at_policy["evpi"] = number_or_null(results.evpi.at(w).evpi);
        at_policy["evpi_low_precision"] = results.evpi.at(w).low_precision;
        at_policy["population_evpi"] = number_or_null(results.evpi.at(w).population_evpi);
        j["at_policy_wtp"] = at_policy;
    } else {
        j["at_policy_wtp"] = nullptr;
    }

    if (results.has_tornado) {
        j["sensitivity_base_outcome"] = number_or_null(results.tornado_base);
    }
    if (results.has_budget_impact && !results.budget_impact.empty()) {
        j["cumulative_budget_impact"] = number_or_null(results.budget_impact.back().cumulative_impact);
    }

    os << j.dump(pretty_print ? 2 : -1) << "\n";
}

void write_summary_json(const std::string& filepath, const AnalysisResults& results,
                        const RunConfig& config, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_summary_json(file, results, config, pretty_print);
}

} // namespace io
} // namespace cohortcea
