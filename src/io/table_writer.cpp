#include "table_writer.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cohortcea {
namespace io {

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        return NA;
    }
    std::ostringstream ss;
    ss << std::setprecision(TABLE_PRECISION) << value;
    return ss.str();
}

std::string format_number(const std::optional<double>& value) {
    return value ? format_number(*value) : std::string(NA);
}

std::ofstream open_output_file(const std::string& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    return file;
}

namespace {

const char* flag(bool value) {
    return value ? "true" : "false";
}

} // anonymous namespace

// ============================================================================
// Deterministic tables
// ============================================================================

void write_deterministic_csv(std::ostream& os, const std::vector<std::string>& strategies,
                             const std::vector<StrategyOutcome>& outcomes) {
    if (strategies.size() != outcomes.size()) {
        throw std::invalid_argument("Outcomes do not match the strategy list");
    }
    os << "strategy,cost,qalys,life_years\n";
    for (size_t s = 0; s < strategies.size(); ++s) {
        os << strategies[s] << ','
           << format_number(outcomes[s].cost) << ','
           << format_number(outcomes[s].qalys) << ','
           << format_number(outcomes[s].life_years) << '\n';
    }
}

void write_incremental_csv(std::ostream& os, const std::vector<IncrementalResult>& rows) {
    os << "strategy,cost,qalys,delta_cost,delta_qalys,icer,status\n";
    for (const auto& row : rows) {
        os << row.strategy << ','
           << format_number(row.cost) << ','
           << format_number(row.qalys) << ','
           << format_number(row.delta_cost) << ','
           << format_number(row.delta_qalys) << ','
           << format_number(row.icer) << ','
           << incremental_status_name(row.status) << '\n';
    }
}

void write_frontier_csv(std::ostream& os, const std::vector<FrontierEntry>& entries) {
    os << "strategy,cost,qalys,status,icer\n";
    for (const auto& entry : entries) {
        os << entry.strategy << ','
           << format_number(entry.cost) << ','
           << format_number(entry.qalys) << ','
           << frontier_status_name(entry.status) << ','
           << format_number(entry.icer) << '\n';
    }
}

// ============================================================================
// Probabilistic tables
// ============================================================================

void write_ceac_csv(std::ostream& os, const std::vector<std::string>& strategies,
                    const std::vector<CeacPoint>& points) {
    os << "wtp,strategy,probability\n";
    for (const auto& point : points) {
        for (size_t s = 0; s < point.probability.size(); ++s) {
            os << format_number(point.wtp) << ','
               << strategies.at(s) << ','
               << format_number(point.probability[s]) << '\n';
        }
    }
}

void write_ceaf_csv(std::ostream& os, const std::vector<std::string>& strategies,
                    const std::vector<CeafPoint>& points) {
    os << "wtp,strategy,expected_nmb,probability\n";
    for (const auto& point : points) {
        os << format_number(point.wtp) << ','
           << strategies.at(point.strategy) << ','
           << format_number(point.expected_nmb) << ','
           << format_number(point.probability) << '\n';
    }
}

void write_expected_nmb_csv(std::ostream& os, const std::vector<std::string>& strategies,
                            const WTPGrid& grid, const std::vector<std::vector<double>>& nmb) {
    if (nmb.size() != grid.size()) {
        throw std::invalid_argument("Expected NMB table does not match the WTP grid");
    }
    os << "wtp,strategy,expected_nmb\n";
    for (size_t w = 0; w < grid.size(); ++w) {
        for (size_t s = 0; s < nmb[w].size(); ++s) {
            os << format_number(grid[w]) << ','
               << strategies.at(s) << ','
               << format_number(nmb[w][s]) << '\n';
        }
    }
}

void write_ce_plane_csv(std::ostream& os, const std::vector<std::string>& strategies,
                        const std::vector<CePlanePoint>& points) {
    os << "iteration,strategy,delta_qalys,delta_cost\n";
    for (const auto& point : points) {
        os << point.iteration << ','
           << strategies.at(point.strategy) << ','
           << format_number(point.delta_qalys) << ','
           << format_number(point.delta_cost) << '\n';
    }
}

void write_evpi_csv(std::ostream& os, const std::vector<std::string>& strategies,
                    const std::vector<EvpiPoint>& points) {
    os << "wtp,evpi,standard_error,cv,low_precision,population_evpi,optimal_strategy\n";
    for (const auto& point : points) {
        os << format_number(point.wtp) << ','
           << format_number(point.evpi) << ','
           << format_number(point.standard_error) << ','
           << format_number(point.cv) << ','
           << flag(point.low_precision) << ','
           << format_number(point.population_evpi) << ','
           << strategies.at(point.optimal_strategy) << '\n';
    }
}

void write_evppi_csv(std::ostream& os, const std::vector<EvppiPoint>& points) {
    os << "group,wtp,evppi,low_precision,population_evppi\n";
    for (const auto& point : points) {
        os << point.group << ','
           << format_number(point.wtp) << ','
           << format_number(point.evppi) << ','
           << flag(point.low_precision) << ','
           << format_number(point.population_evppi) << '\n';
    }
}

// ============================================================================
// Budget impact, snapshot, sensitivity
// ============================================================================

void write_budget_impact_csv(std::ostream& os, const std::vector<std::string>& strategies,
                             const std::vector<BudgetImpactRow>& rows) {
    os << "year,eligible_population";
    for (const auto& name : strategies) {
        os << ',' << name << "_cost";
    }
    os << ",total_cost,baseline_cost,budget_impact,cumulative_impact\n";

    for (const auto& row : rows) {
        if (row.strategy_cost.size() != strategies.size()) {
            throw std::invalid_argument("Budget impact row does not match the strategy list");
        }
        os << row.year << ',' << format_number(row.eligible_population);
        for (double cost : row.strategy_cost) {
            os << ',' << format_number(cost);
        }
        os << ',' << format_number(row.total_cost)
           << ',' << format_number(row.baseline_cost)
           << ',' << format_number(row.budget_impact)
           << ',' << format_number(row.cumulative_impact) << '\n';
    }
}

void write_parameter_snapshot_csv(std::ostream& os, const std::vector<SnapshotRow>& rows) {
    os << "iteration,seed,parameter,value\n";
    for (const auto& row : rows) {
        os << row.iteration << ','
           << row.seed << ','
           << row.parameter << ','
           << format_number(row.value) << '\n';
    }
}

void write_tornado_csv(std::ostream& os, const std::vector<TornadoBar>& bars) {
    os << "parameter,low_value,high_value,low_outcome,high_outcome,range\n";
    for (const auto& bar : bars) {
        os << bar.parameter << ','
           << format_number(bar.low_value) << ','
           << format_number(bar.high_value) << ','
           << format_number(bar.low_outcome) << ','
           << format_number(bar.high_outcome) << ','
           << format_number(bar.range) << '\n';
    }
}

// ============================================================================
// Perspective, scenario and two-way tables
// ============================================================================

void write_perspective_csv(std::ostream& os, const std::vector<PerspectiveComparison>& rows) {
    os << "strategy,qalys,health_system_cost,societal_cost,total_societal_cost,"
          "health_system_inmb,societal_inmb,health_system_probability,societal_probability\n";
    for (const auto& row : rows) {
        os << row.strategy << ','
           << format_number(row.qalys) << ','
           << format_number(row.health_system_cost) << ','
           << format_number(row.societal_cost) << ','
           << format_number(row.health_system_cost + row.societal_cost) << ','
           << format_number(row.health_system_inmb) << ','
           << format_number(row.societal_inmb) << ','
           << format_number(row.health_system_probability) << ','
           << format_number(row.societal_probability) << '\n';
    }
}

void write_scenarios_csv(std::ostream& os, const std::vector<ScenarioRow>& rows) {
    os << "scenario,strategy,perspective,cycles,wtp,cost,qalys,delta_cost,delta_qalys,"
          "icer,status,incremental_nmb,inmb_change,optimal\n";
    for (const auto& row : rows) {
        os << row.scenario << ','
           << row.strategy << ','
           << perspective_name(row.perspective) << ','
           << row.cycles << ','
           << format_number(row.wtp) << ','
           << format_number(row.cost) << ','
           << format_number(row.qalys) << ','
           << format_number(row.delta_cost) << ','
           << format_number(row.delta_qalys) << ','
           << format_number(row.icer) << ','
           << incremental_status_name(row.status) << ','
           << format_number(row.incremental_nmb) << ','
           << format_number(row.inmb_change) << ','
           << flag(row.optimal) << '\n';
    }
}

void write_two_way_csv(std::ostream& os, const TwoWaySettings& settings,
                       const std::vector<TwoWayCell>& cells) {
    os << settings.first.parameter << ',' << settings.second.parameter << ",incremental_nmb,cost_effective\n";
    for (const auto& cell : cells) {
        os << format_number(cell.first_value) << ','
           << format_number(cell.second_value) << ','
           << format_number(cell.incremental_nmb) << ','
           << flag(cell.cost_effective) << '\n';
    }
}

} // namespace io
} // namespace cohortcea
