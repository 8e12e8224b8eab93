#ifndef COHORTCEA_DECISION_METRICS_HPP
#define COHORTCEA_DECISION_METRICS_HPP

#include "economic_aggregator.hpp"
#include "simulation_draw.hpp"
#include "wtp_grid.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cohortcea {

// |delta QALY| below this makes an ICER undefined
constexpr double QALY_EPSILON = 1e-9;

enum class IncrementalStatus {
    Reference,                  // The reference strategy itself
    Dominated,                  // Costs more, no more effective than reference
    Dominant,                   // Costs no more, at least as effective
    Comparable,                 // Trade-off: ICER defined
    UndefinedZeroDenominator    // Same QALYs and same cost
};

enum class FrontierStatus {
    Frontier,
    Dominated,                  // Another strategy costs no more and is no less effective
    ExtendedlyDominated         // Lies above the line joining two frontier neighbours
};

const char* incremental_status_name(IncrementalStatus status);
const char* frontier_status_name(FrontierStatus status);

// One row of the incremental analysis against the reference strategy
struct IncrementalResult {
    std::string strategy;
    double cost;
    double qalys;
    double delta_cost;
    double delta_qalys;
    std::optional<double> icer;     // Empty whenever the ratio is not meaningful
    IncrementalStatus status;
};

// One row of the efficiency frontier (registry order)
struct FrontierEntry {
    std::string strategy;
    double cost;
    double qalys;
    FrontierStatus status;
    std::optional<double> icer;     // vs the previous frontier point; empty off-frontier
};

// Share of draws in which each strategy is optimal, at one WTP
struct CeacPoint {
    double wtp;
    std::vector<double> probability;    // Per strategy; sums to 1
};

// Strategy with the highest expected NMB at one WTP
struct CeafPoint {
    double wtp;
    size_t strategy;
    double expected_nmb;
    double probability;                 // Its CEAC value at this WTP
};

// Incremental cost and effect of a draw against the reference
struct CePlanePoint {
    size_t iteration;
    size_t strategy;
    double delta_qalys;
    double delta_cost;
};

// Distribution of a strategy's outcomes across draws
struct OutcomeSummary {
    std::string strategy;
    double mean_cost;
    double sd_cost;
    double cost_p025;
    double cost_p975;
    double mean_qalys;
    double sd_qalys;
    double qalys_p025;
    double qalys_p975;
};

// Extra per-patient cost a strategy could carry and remain cost-effective
// against the reference at the given WTP (value-based price headroom)
struct PriceHeadroom {
    std::string strategy;
    double wtp;
    double delta_qalys;
    double delta_cost;
    double headroom;                    // max(0, wtp * dQALY - dCost)
};

// One strategy's costs and net benefit under both perspectives, at one WTP.
// Incremental NMB is against the reference; the probabilities are the share
// of draws in which the strategy is optimal (NaN when there are no draws).
struct PerspectiveComparison {
    std::string strategy;
    double qalys;
    double health_system_cost;
    double societal_cost;               // Costs outside the health system only
    double health_system_inmb;
    double societal_inmb;
    double health_system_probability;
    double societal_probability;
};

// Deterministic and probabilistic decision metrics.
//
// Results are derived wholesale from their inputs; nothing is cached or
// mutated between calls. Strategy indices follow the order of the names
// passed in (registry order); that order resolves every exact tie.
class DecisionMetricsCalculator {
public:
    DecisionMetricsCalculator(std::vector<std::string> strategies, const std::string& reference);

    const std::vector<std::string>& strategies() const { return strategies_; }
    size_t reference() const { return reference_; }

    // --- Deterministic ---

    std::vector<IncrementalResult> incremental_results(const std::vector<StrategyOutcome>& outcomes) const;

    // Remove strongly dominated strategies, order the rest by QALYs (cost on
    // ties) and drop extendedly dominated points until the frontier ICERs are
    // non-decreasing. Exact duplicates keep the lowest index on the frontier.
    std::vector<FrontierEntry> efficiency_frontier(const std::vector<StrategyOutcome>& outcomes) const;

    std::vector<PriceHeadroom> price_headroom(const std::vector<StrategyOutcome>& outcomes, double wtp) const;

    // Deterministic outcomes re-costed under each perspective; draws may be
    // empty
    std::vector<PerspectiveComparison> perspective_comparison(const std::vector<StrategyOutcome>& outcomes,
                                                              const std::vector<SimulationDraw>& draws,
                                                              double wtp) const;

    // --- Probabilistic ---

    static double net_monetary_benefit(const StrategyOutcome& outcome, double wtp);

    // argmax NMB; the lowest index wins exact ties
    static size_t optimal_strategy(const std::vector<StrategyOutcome>& outcomes, double wtp);

    // Same, with costs counted under the given perspective
    static size_t optimal_strategy(const std::vector<StrategyOutcome>& outcomes, double wtp,
                                   Perspective perspective);

    std::vector<CeacPoint> ceac(const std::vector<SimulationDraw>& draws, const WTPGrid& grid) const;
    std::vector<CeafPoint> ceaf(const std::vector<SimulationDraw>& draws, const WTPGrid& grid) const;

    // Mean NMB per [wtp][strategy]
    std::vector<std::vector<double>> expected_nmb(const std::vector<SimulationDraw>& draws,
                                                  const WTPGrid& grid) const;

    // One point per draw and non-reference strategy
    std::vector<CePlanePoint> ce_plane(const std::vector<SimulationDraw>& draws) const;

    std::vector<OutcomeSummary> summary_statistics(const std::vector<SimulationDraw>& draws) const;

private:
    std::vector<std::string> strategies_;
    size_t reference_;

    void check_outcomes(const std::vector<StrategyOutcome>& outcomes) const;
    void check_draws(const std::vector<SimulationDraw>& draws) const;
};

} // namespace cohortcea

#endif // COHORTCEA_DECISION_METRICS_HPP
