#ifndef COHORTCEA_IO_TABLE_WRITER_HPP
#define COHORTCEA_IO_TABLE_WRITER_HPP

#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "../budget_impact.hpp"
#include "../decision_metrics.hpp"
#include "../economic_aggregator.hpp"
#include "../parameter_sampler.hpp"
#include "../scenario_analysis.hpp"
#include "../sensitivity.hpp"
#include "../value_of_information.hpp"
#include "../wtp_grid.hpp"

namespace cohortcea {
namespace io {

// Significant digits of every number in the result tables
constexpr int TABLE_PRECISION = 10;

// Text for a value that is undefined
constexpr const char* NA = "NA";

// Number as written to the tables; non-finite values become NA
std::string format_number(double value);
std::string format_number(const std::optional<double>& value);

// Open a file for writing; throws std::runtime_error when it cannot be created
std::ofstream open_output_file(const std::string& filepath);

// strategy,cost,qalys,life_years
void write_deterministic_csv(std::ostream& os, const std::vector<std::string>& strategies,
                             const std::vector<StrategyOutcome>& outcomes);

// strategy,cost,qalys,delta_cost,delta_qalys,icer,status
void write_incremental_csv(std::ostream& os, const std::vector<IncrementalResult>& rows);

// strategy,cost,qalys,status,icer
void write_frontier_csv(std::ostream& os, const std::vector<FrontierEntry>& entries);

// wtp,strategy,probability
void write_ceac_csv(std::ostream& os, const std::vector<std::string>& strategies,
                    const std::vector<CeacPoint>& points);

// wtp,strategy,expected_nmb,probability
void write_ceaf_csv(std::ostream& os, const std::vector<std::string>& strategies,
                    const std::vector<CeafPoint>& points);

// wtp,strategy,expected_nmb
void write_expected_nmb_csv(std::ostream& os, const std::vector<std::string>& strategies,
                            const WTPGrid& grid, const std::vector<std::vector<double>>& nmb);

// iteration,strategy,delta_qalys,delta_cost
void write_ce_plane_csv(std::ostream& os, const std::vector<std::string>& strategies,
                        const std::vector<CePlanePoint>& points);

// wtp,evpi,standard_error,cv,low_precision,population_evpi,optimal_strategy
void write_evpi_csv(std::ostream& os, const std::vector<std::string>& strategies,
                    const std::vector<EvpiPoint>& points);

// group,wtp,evppi,low_precision,population_evppi
void write_evppi_csv(std::ostream& os, const std::vector<EvppiPoint>& points);

// year,eligible_population,<strategy>_cost...,total_cost,baseline_cost,budget_impact,cumulative_impact
void write_budget_impact_csv(std::ostream& os, const std::vector<std::string>& strategies,
                             const std::vector<BudgetImpactRow>& rows);

// iteration,seed,parameter,value
void write_parameter_snapshot_csv(std::ostream& os, const std::vector<SnapshotRow>& rows);

// parameter,low_value,high_value,low_outcome,high_outcome,range
void write_tornado_csv(std::ostream& os, const std::vector<TornadoBar>& bars);

// strategy,qalys,health_system_cost,societal_cost,total_societal_cost,
// health_system_inmb,societal_inmb,health_system_probability,societal_probability
void write_perspective_csv(std::ostream& os, const std::vector<PerspectiveComparison>& rows);

// scenario,strategy,perspective,cycles,wtp,cost,qalys,delta_cost,delta_qalys,
// icer,status,incremental_nmb,inmb_change,optimal
void write_scenarios_csv(std::ostream& os, const std::vector<ScenarioRow>& rows);

// <first parameter>,<second parameter>,incremental_nmb,cost_effective
void write_two_way_csv(std::ostream& os, const TwoWaySettings& settings,
                       const std::vector<TwoWayCell>& cells);

} // namespace io
} // namespace cohortcea

#endif // COHORTCEA_IO_TABLE_WRITER_HPP
