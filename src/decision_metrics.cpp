#include "decision_metrics.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cohortcea {

const char* incremental_status_name(IncrementalStatus status) {
    switch (status) {
        case IncrementalStatus::Reference: return "reference";
        case IncrementalStatus::Dominated: return "dominated";
        case IncrementalStatus::Dominant: return "dominant";
        case IncrementalStatus::Comparable: return "comparable";
        case IncrementalStatus::UndefinedZeroDenominator: return "undefined_zero_denominator";
        default: return "unknown";
    }
}

const char* frontier_status_name(FrontierStatus status) {
    switch (status) {
        case FrontierStatus::Frontier: return "frontier";
        case FrontierStatus::Dominated: return "dominated";
        case FrontierStatus::ExtendedlyDominated: return "extendedly_dominated";
        default: return "unknown";
    }
}

DecisionMetricsCalculator::DecisionMetricsCalculator(std::vector<std::string> strategies,
                                                     const std::string& reference)
    : strategies_(std::move(strategies)), reference_(0) {
    if (strategies_.empty()) {
        throw ValidationError("Decision metrics need at least one strategy");
    }
    auto it = std::find(strategies_.begin(), strategies_.end(), reference);
    if (it == strategies_.end()) {
        throw ValidationError("Reference strategy '" + reference + "' is not among the strategies");
    }
    reference_ = static_cast<size_t>(it - strategies_.begin());
}

void DecisionMetricsCalculator::check_outcomes(const std::vector<StrategyOutcome>& outcomes) const {
    if (outcomes.size() != strategies_.size()) {
        throw std::invalid_argument("Expected " + std::to_string(strategies_.size()) +
                                    " strategy outcomes, got " + std::to_string(outcomes.size()));
    }
}

void DecisionMetricsCalculator::check_draws(const std::vector<SimulationDraw>& draws) const {
    if (draws.empty()) {
        throw std::invalid_argument("Probabilistic metrics need at least one draw");
    }
    for (const auto& draw : draws) {
        check_outcomes(draw.outcomes);
    }
}

// ============================================================================
// Deterministic Metrics
// ============================================================================

std::vector<IncrementalResult> DecisionMetricsCalculator::incremental_results(
    const std::vector<StrategyOutcome>& outcomes) const {
    check_outcomes(outcomes);
    const StrategyOutcome& ref = outcomes[reference_];

    std::vector<IncrementalResult> results;
    results.reserve(outcomes.size());
    for (size_t s = 0; s < outcomes.size(); ++s) {
        IncrementalResult r;
        r.strategy = strategies_[s];
        r.cost = outcomes[s].cost;
        r.qalys = outcomes[s].qalys;
        r.delta_cost = outcomes[s].cost - ref.cost;
        r.delta_qalys = outcomes[s].qalys - ref.qalys;

        if (s == reference_) {
            r.status = IncrementalStatus::Reference;
        } else if (std::abs(r.delta_qalys) < QALY_EPSILON) {
            // Same effect: only cost decides, ratio undefined
            if (r.delta_cost > 0.0) {
                r.status = IncrementalStatus::Dominated;
            } else if (r.delta_cost < 0.0) {
                r.status = IncrementalStatus::Dominant;
            } else {
                r.status = IncrementalStatus::UndefinedZeroDenominator;
            }
        } else if (r.delta_qalys > 0.0) {
            if (r.delta_cost <= 0.0) {
                r.status = IncrementalStatus::Dominant;
            } else {
                r.status = IncrementalStatus::Comparable;
                r.icer = r.delta_cost / r.delta_qalys;
            }
        } else {
            if (r.delta_cost >= 0.0) {
                r.status = IncrementalStatus::Dominated;
            } else {
                // Cheaper and less effective: ICER is savings per QALY forgone
                r.status = IncrementalStatus::Comparable;
                r.icer = r.delta_cost / r.delta_qalys;
            }
        }
        results.push_back(std::move(r));
    }
    return results;
}

std::vector<FrontierEntry> DecisionMetricsCalculator::efficiency_frontier(
    const std::vector<StrategyOutcome>& outcomes) const {
    check_outcomes(outcomes);
    const size_t n = outcomes.size();

    std::vector<FrontierEntry> entries(n);
    for (size_t s = 0; s < n; ++s) {
        entries[s].strategy = strategies_[s];
        entries[s].cost = outcomes[s].cost;
        entries[s].qalys = outcomes[s].qalys;
        entries[s].status = FrontierStatus::Frontier;
    }

    // Strong dominance
    for (size_t i = 0; i < n; ++i) {
        const double ci = outcomes[i].cost;
        const double qi = outcomes[i].qalys;
        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            const double cj = outcomes[j].cost;
            const double qj = outcomes[j].qalys;
            bool dominates = cj <= ci && qj >= qi && (cj < ci || qj > qi);
            bool earlier_duplicate = cj == ci && qj == qi && j < i;
            if (dominates || earlier_duplicate) {
                entries[i].status = FrontierStatus::Dominated;
                break;
            }
        }
    }

    std::vector<size_t> frontier;
    for (size_t s = 0; s < n; ++s) {
        if (entries[s].status == FrontierStatus::Frontier) {
            frontier.push_back(s);
        }
    }
    std::sort(frontier.begin(), frontier.end(), [&outcomes](size_t a, size_t b) {
        if (outcomes[a].qalys != outcomes[b].qalys) return outcomes[a].qalys < outcomes[b].qalys;
        if (outcomes[a].cost != outcomes[b].cost) return outcomes[a].cost < outcomes[b].cost;
        return a < b;
    });

    // Without strong dominance both cost and QALYs strictly increase along
    // the sorted list, so every ratio below is finite and positive
    auto ratio = [&outcomes](size_t from, size_t to) {
        return (outcomes[to].cost - outcomes[from].cost) / (outcomes[to].qalys - outcomes[from].qalys);
    };

    // Extended dominance: drop the first point whose ICER exceeds the next one
    bool removed = true;
    while (removed) {
        removed = false;
        for (size_t k = 1; k + 1 < frontier.size(); ++k) {
            if (ratio(frontier[k - 1], frontier[k]) > ratio(frontier[k], frontier[k + 1])) {
                entries[frontier[k]].status = FrontierStatus::ExtendedlyDominated;
                frontier.erase(frontier.begin() + static_cast<std::ptrdiff_t>(k));
                removed = true;
                break;
            }
        }
    }

    for (size_t k = 1; k < frontier.size(); ++k) {
        entries[frontier[k]].icer = ratio(frontier[k - 1], frontier[k]);
    }
    return entries;
}

std::vector<PriceHeadroom> DecisionMetricsCalculator::price_headroom(
    const std::vector<StrategyOutcome>& outcomes, double wtp) const {
    check_outcomes(outcomes);
    const StrategyOutcome& ref = outcomes[reference_];

    std::vector<PriceHeadroom> rows;
    for (size_t s = 0; s < outcomes.size(); ++s) {
        if (s == reference_) continue;
        PriceHeadroom row;
        row.strategy = strategies_[s];
        row.wtp = wtp;
        row.delta_qalys = outcomes[s].qalys - ref.qalys;
        row.delta_cost = outcomes[s].cost - ref.cost;
        row.headroom = std::max(0.0, wtp * row.delta_qalys - row.delta_cost);
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<PerspectiveComparison> DecisionMetricsCalculator::perspective_comparison(
    const std::vector<StrategyOutcome>& outcomes, const std::vector<SimulationDraw>& draws,
    double wtp) const {
    check_outcomes(outcomes);
    for (const auto& draw : draws) {
        check_outcomes(draw.outcomes);
    }

    const Perspective perspectives[] = {Perspective::HealthSystem, Perspective::Societal};
    std::vector<std::vector<size_t>> wins(2, std::vector<size_t>(strategies_.size(), 0));
    for (const auto& draw : draws) {
        for (size_t p = 0; p < 2; ++p) {
            ++wins[p][optimal_strategy(draw.outcomes, wtp, perspectives[p])];
        }
    }

    const StrategyOutcome& ref = outcomes[reference_];
    const double n = static_cast<double>(draws.size());
    auto inmb = [&](const StrategyOutcome& outcome, Perspective perspective) {
        return wtp * (outcome.qalys - ref.qalys) -
               (outcome.cost_under(perspective) - ref.cost_under(perspective));
    };

    std::vector<PerspectiveComparison> rows;
    rows.reserve(outcomes.size());
    for (size_t s = 0; s < outcomes.size(); ++s) {
        PerspectiveComparison row;
        row.strategy = strategies_[s];
        row.qalys = outcomes[s].qalys;
        row.health_system_cost = outcomes[s].health_system_cost;
        row.societal_cost = outcomes[s].societal_cost;
        row.health_system_inmb = inmb(outcomes[s], Perspective::HealthSystem);
        row.societal_inmb = inmb(outcomes[s], Perspective::Societal);
        row.health_system_probability = draws.empty() ? std::nan("") : static_cast<double>(wins[0][s]) / n;
        row.societal_probability = draws.empty() ? std::nan("") : static_cast<double>(wins[1][s]) / n;
        rows.push_back(std::move(row));
    }
    return rows;
}

// ============================================================================
// Probabilistic Metrics
// ============================================================================

double DecisionMetricsCalculator::net_monetary_benefit(const StrategyOutcome& outcome, double wtp) {
    return wtp * outcome.qalys - outcome.cost;
}

size_t DecisionMetricsCalculator::optimal_strategy(const std::vector<StrategyOutcome>& outcomes, double wtp) {
    if (outcomes.empty()) {
        throw std::invalid_argument("No strategy outcomes");
    }
    size_t best = 0;
    double best_nmb = net_monetary_benefit(outcomes[0], wtp);
    for (size_t s = 1; s < outcomes.size(); ++s) {
        double nmb = net_monetary_benefit(outcomes[s], wtp);
        if (nmb > best_nmb) {
            best = s;
            best_nmb = nmb;
        }
    }
    return best;
}

size_t DecisionMetricsCalculator::optimal_strategy(const std::vector<StrategyOutcome>& outcomes, double wtp,
                                                   Perspective perspective) {
    if (outcomes.empty()) {
        throw std::invalid_argument("No strategy outcomes");
    }
    size_t best = 0;
    double best_nmb = wtp * outcomes[0].qalys - outcomes[0].cost_under(perspective);
    for (size_t s = 1; s < outcomes.size(); ++s) {
        double nmb = wtp * outcomes[s].qalys - outcomes[s].cost_under(perspective);
        if (nmb > best_nmb) {
            best = s;
            best_nmb = nmb;
        }
    }
    return best;
}

std::vector<CeacPoint> DecisionMetricsCalculator::ceac(const std::vector<SimulationDraw>& draws,
                                                      const WTPGrid& grid) const {
    check_draws(draws);
    const double n = static_cast<double>(draws.size());

    std::vector<CeacPoint> curve;
    curve.reserve(grid.size());
    for (double w : grid.values()) {
        std::vector<size_t> counts(strategies_.size(), 0);
        for (const auto& draw : draws) {
            ++counts[optimal_strategy(draw.outcomes, w)];
        }

        CeacPoint point;
        point.wtp = w;
        point.probability.reserve(counts.size());
        for (size_t count : counts) {
            point.probability.push_back(static_cast<double>(count) / n);
        }
        curve.push_back(std::move(point));
    }
    return curve;
}

std::vector<std::vector<double>> DecisionMetricsCalculator::expected_nmb(
    const std::vector<SimulationDraw>& draws, const WTPGrid& grid) const {
    check_draws(draws);
    const double n = static_cast<double>(draws.size());

    std::vector<std::vector<double>> table;
    table.reserve(grid.size());
    for (double w : grid.values()) {
        std::vector<double> sums(strategies_.size(), 0.0);
        for (const auto& draw : draws) {
            for (size_t s = 0; s < strategies_.size(); ++s) {
                sums[s] += net_monetary_benefit(draw.outcomes[s], w);
            }
        }
        for (double& v : sums) {
            v /= n;
        }
        table.push_back(std::move(sums));
    }
    return table;
}

std::vector<CeafPoint> DecisionMetricsCalculator::ceaf(const std::vector<SimulationDraw>& draws,
                                                      const WTPGrid& grid) const {
    const auto curve = ceac(draws, grid);
    const auto enmb = expected_nmb(draws, grid);

    std::vector<CeafPoint> frontier;
    frontier.reserve(grid.size());
    for (size_t k = 0; k < grid.size(); ++k) {
        size_t best = 0;
        for (size_t s = 1; s < strategies_.size(); ++s) {
            if (enmb[k][s] > enmb[k][best]) {
                best = s;
            }
        }
        frontier.push_back(CeafPoint{grid[k], best, enmb[k][best], curve[k].probability[best]});
    }
    return frontier;
}

std::vector<CePlanePoint> DecisionMetricsCalculator::ce_plane(const std::vector<SimulationDraw>& draws) const {
    check_draws(draws);

    std::vector<CePlanePoint> points;
    points.reserve(draws.size() * (strategies_.size() - 1));
    for (const auto& draw : draws) {
        const StrategyOutcome& ref = draw.outcomes[reference_];
        for (size_t s = 0; s < strategies_.size(); ++s) {
            if (s == reference_) continue;
            points.push_back(CePlanePoint{draw.iteration, s,
                                          draw.outcomes[s].qalys - ref.qalys,
                                          draw.outcomes[s].cost - ref.cost});
        }
    }
    return points;
}

std::vector<OutcomeSummary> DecisionMetricsCalculator::summary_statistics(
    const std::vector<SimulationDraw>& draws) const {
    check_draws(draws);

    std::vector<OutcomeSummary> rows;
    rows.reserve(strategies_.size());
    for (size_t s = 0; s < strategies_.size(); ++s) {
        std::vector<double> costs = strategy_costs(draws, s);
        std::vector<double> qalys = strategy_qalys(draws, s);

        OutcomeSummary row;
        row.strategy = strategies_[s];
        row.mean_cost = mean(costs);
        row.sd_cost = sample_std_dev(costs, row.mean_cost);
        row.mean_qalys = mean(qalys);
        row.sd_qalys = sample_std_dev(qalys, row.mean_qalys);

        std::sort(costs.begin(), costs.end());
        std::sort(qalys.begin(), qalys.end());
        row.cost_p025 = percentile(costs, 2.5);
        row.cost_p975 = percentile(costs, 97.5);
        row.qalys_p025 = percentile(qalys, 2.5);
        row.qalys_p975 = percentile(qalys, 97.5);
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace cohortcea
