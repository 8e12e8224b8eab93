#ifndef COHORTCEA_ANALYSIS_HPP
#define COHORTCEA_ANALYSIS_HPP

#include "budget_impact.hpp"
#include "decision_metrics.hpp"
#include "economic_aggregator.hpp"
#include "life_table.hpp"
#include "markov_simulator.hpp"
#include "parameter.hpp"
#include "psa_runner.hpp"
#include "run_config.hpp"
#include "scenario_analysis.hpp"
#include "sensitivity.hpp"
#include "strategy.hpp"
#include "value_of_information.hpp"
#include "wtp_grid.hpp"
#include <string>
#include <vector>

namespace cohortcea {

// Everything one run produces
struct AnalysisResults {
    std::string run_id;
    std::vector<std::string> strategies;
    std::string reference;
    WTPGrid grid;
    double policy_wtp;

    // Deterministic (every parameter at its mean)
    std::vector<StrategyOutcome> deterministic;
    std::vector<IncrementalResult> incremental;
    std::vector<FrontierEntry> frontier;
    std::vector<PriceHeadroom> headroom;
    Perspective perspective;
    std::vector<PerspectiveComparison> perspectives;    // Filled after the PSA

    // Probabilistic; empty when no draw completed
    PsaResult psa;
    std::vector<SnapshotRow> snapshot;
    std::vector<CeacPoint> ceac;
    std::vector<CeafPoint> ceaf;
    std::vector<std::vector<double>> expected_nmb;
    std::vector<CePlanePoint> ce_plane;
    std::vector<OutcomeSummary> summary;
    std::vector<EvpiPoint> evpi;
    std::vector<EvppiPoint> evppi;

    bool has_budget_impact;
    std::vector<BudgetImpactRow> budget_impact;

    bool has_tornado;
    double tornado_base;
    std::vector<TornadoBar> tornado;

    bool has_two_way;
    std::vector<TwoWayCell> two_way;

    // Base case first; empty when no scenario is configured
    std::vector<ScenarioRow> scenarios;

    explicit AnalysisResults(const WTPGrid& wtp_grid);

    bool has_draws() const { return !psa.draws.empty(); }
};

// A configured analysis: inputs loaded, registry built and validated.
//
// Loading happens entirely in the constructor, so every configuration or
// input error surfaces (as ValidationError) before any simulation starts.
// Holds internal references between its members and is not copyable.
class CeaAnalysis {
public:
    explicit CeaAnalysis(const RunConfig& config);

    CeaAnalysis(const CeaAnalysis&) = delete;
    CeaAnalysis& operator=(const CeaAnalysis&) = delete;

    AnalysisResults run(const CancellationToken* cancel = nullptr) const;

    const RunConfig& config() const { return config_; }
    const ParameterTable& table() const { return table_; }
    const StrategyRegistry& registry() const { return registry_; }
    const PsaRunner& runner() const { return runner_; }

private:
    RunConfig config_;
    ParameterTable table_;
    LifeTable life_table_;
    StrategyRegistry registry_;
    AdoptionCurve adoption_;
    MarkovCohortSimulator simulator_;
    EconomicAggregator aggregator_;
    PsaRunner runner_;
};

/**
 * @brief Write every result table (and summary.json) into a directory
 *
 * The directory is created when missing. Parquet copies of the draws and the
 * parameter snapshot are written when write_parquet is set.
 *
 * @throws ValidationError if write_parquet is set in a build without Arrow;
 *         nothing is written in that case
 * @throws std::runtime_error if a file cannot be written
 */
void write_results(const std::string& directory, const AnalysisResults& results,
                   const RunConfig& config, bool write_parquet);

} // namespace cohortcea

#endif // COHORTCEA_ANALYSIS_HPP
