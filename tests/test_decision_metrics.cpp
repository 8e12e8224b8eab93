#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <stdexcept>
#include "decision_metrics.hpp"
#include "errors.hpp"
#include "wtp_grid.hpp"

using namespace cohortcea;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

SimulationDraw create_draw(size_t iteration, std::vector<StrategyOutcome> outcomes) {
    return SimulationDraw(iteration, iteration, {}, std::move(outcomes));
}

// A is optimal at w = 50,000 in the first `a_wins` draws, B in the rest
std::vector<SimulationDraw> create_split_draws(size_t total, size_t a_wins) {
    std::vector<SimulationDraw> draws;
    for (size_t i = 0; i < total; ++i) {
        if (i < a_wins) {
            draws.push_back(create_draw(i, {StrategyOutcome(1000.0, 5.0), StrategyOutcome(2000.0, 5.0)}));
        } else {
            draws.push_back(create_draw(i, {StrategyOutcome(2000.0, 5.0), StrategyOutcome(1000.0, 5.0)}));
        }
    }
    return draws;
}

} // anonymous namespace

// ============================================================================
// WTPGrid
// ============================================================================

TEST_CASE("WTP grid construction", "[wtp]") {
    SECTION("Range includes the upper bound") {
        WTPGrid grid = WTPGrid::range(0.0, 100000.0, 1000.0);
        REQUIRE(grid.size() == 101);
        REQUIRE(grid[0] == 0.0);
        REQUIRE(grid[100] == 100000.0);
    }

    SECTION("Range with a step that does not divide the span") {
        WTPGrid grid = WTPGrid::range(0.0, 25000.0, 10000.0);
        REQUIRE(grid.values() == std::vector<double>{0.0, 10000.0, 20000.0});
    }

    SECTION("Explicit values are sorted and de-duplicated") {
        WTPGrid grid = WTPGrid::from_values({50000.0, 20000.0, 50000.0, 0.0});
        REQUIRE(grid.values() == std::vector<double>{0.0, 20000.0, 50000.0});
        REQUIRE(grid.nearest_index(45000.0) == 2);
        REQUIRE(grid.nearest_index(1.0) == 0);
    }

    SECTION("Invalid grids") {
        REQUIRE_THROWS_AS(WTPGrid::range(0.0, 100.0, 0.0), ValidationError);
        REQUIRE_THROWS_AS(WTPGrid::range(100.0, 0.0, 10.0), ValidationError);
        REQUIRE_THROWS_AS(WTPGrid::range(-10.0, 100.0, 10.0), ValidationError);
        REQUIRE_THROWS_AS(WTPGrid::from_values({}), ValidationError);
        REQUIRE_THROWS_AS(WTPGrid::from_values({-1.0}), ValidationError);
    }
}

// ============================================================================
// Incremental analysis
// ============================================================================

TEST_CASE("ICER against the reference", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B", "C"}, "B");
    std::vector<StrategyOutcome> outcomes = {
        StrategyOutcome(1000.0, 5.0),
        StrategyOutcome(800.0, 4.5),
        StrategyOutcome(1200.0, 4.0)
    };

    auto rows = calc.incremental_results(outcomes);

    REQUIRE(rows.size() == 3);
    REQUIRE(rows[1].status == IncrementalStatus::Reference);
    REQUIRE_FALSE(rows[1].icer.has_value());

    SECTION("More costly and more effective has an ICER") {
        REQUIRE(rows[0].status == IncrementalStatus::Comparable);
        REQUIRE(rows[0].delta_cost == 200.0);
        REQUIRE(rows[0].delta_qalys == 0.5);
        REQUIRE(rows[0].icer.has_value());
        REQUIRE_THAT(*rows[0].icer, WithinAbs(400.0, 1e-9));
    }

    SECTION("More costly and less effective is dominated") {
        REQUIRE(rows[2].status == IncrementalStatus::Dominated);
        REQUIRE_FALSE(rows[2].icer.has_value());
    }
}

TEST_CASE("Edge cases of the incremental analysis", "[metrics]") {
    DecisionMetricsCalculator calc({"Ref", "X"}, "Ref");

    SECTION("Cheaper and more effective is dominant") {
        auto rows = calc.incremental_results({StrategyOutcome(1000.0, 4.0), StrategyOutcome(900.0, 4.2)});
        REQUIRE(rows[1].status == IncrementalStatus::Dominant);
        REQUIRE_FALSE(rows[1].icer.has_value());
    }

    SECTION("Equal outcomes leave the ratio undefined") {
        auto rows = calc.incremental_results({StrategyOutcome(1000.0, 4.0), StrategyOutcome(1000.0, 4.0)});
        REQUIRE(rows[1].status == IncrementalStatus::UndefinedZeroDenominator);
        REQUIRE_FALSE(rows[1].icer.has_value());
    }

    SECTION("Same QALYs but dearer is dominated") {
        auto rows = calc.incremental_results({StrategyOutcome(1000.0, 4.0), StrategyOutcome(1100.0, 4.0)});
        REQUIRE(rows[1].status == IncrementalStatus::Dominated);
    }

    SECTION("Cheaper and less effective has an ICER") {
        auto rows = calc.incremental_results({StrategyOutcome(1000.0, 4.0), StrategyOutcome(500.0, 3.0)});
        REQUIRE(rows[1].status == IncrementalStatus::Comparable);
        REQUIRE_THAT(*rows[1].icer, WithinAbs(500.0, 1e-9));
    }

    SECTION("Wrong number of outcomes") {
        REQUIRE_THROWS_AS(calc.incremental_results({StrategyOutcome(1.0, 1.0)}), std::invalid_argument);
    }

    SECTION("Unknown reference") {
        REQUIRE_THROWS_AS(DecisionMetricsCalculator({"A"}, "B"), ValidationError);
    }
}

// ============================================================================
// Efficiency frontier
// ============================================================================

TEST_CASE("Efficiency frontier", "[metrics]") {
    SECTION("Dominated strategy is excluded") {
        DecisionMetricsCalculator calc({"A", "B", "C"}, "B");
        auto frontier = calc.efficiency_frontier({
            StrategyOutcome(1000.0, 5.0), StrategyOutcome(800.0, 4.5), StrategyOutcome(1200.0, 4.0)});

        REQUIRE(frontier[0].status == FrontierStatus::Frontier);
        REQUIRE(frontier[1].status == FrontierStatus::Frontier);
        REQUIRE(frontier[2].status == FrontierStatus::Dominated);
        REQUIRE_FALSE(frontier[1].icer.has_value());
        REQUIRE_THAT(*frontier[0].icer, WithinAbs(400.0, 1e-9));
    }

    SECTION("Extended dominance") {
        // B -> C costs 10000/QALY, C -> D only 2000/QALY, so C is removed
        DecisionMetricsCalculator calc({"B", "C", "D"}, "B");
        auto frontier = calc.efficiency_frontier({
            StrategyOutcome(0.0, 1.0), StrategyOutcome(10000.0, 2.0), StrategyOutcome(12000.0, 3.0)});

        REQUIRE(frontier[1].status == FrontierStatus::ExtendedlyDominated);
        REQUIRE(frontier[2].status == FrontierStatus::Frontier);
        REQUIRE_THAT(*frontier[2].icer, WithinAbs(6000.0, 1e-9));
    }

    SECTION("Exact duplicates keep the earlier strategy") {
        DecisionMetricsCalculator calc({"A", "B"}, "A");
        auto frontier = calc.efficiency_frontier({StrategyOutcome(500.0, 3.0), StrategyOutcome(500.0, 3.0)});
        REQUIRE(frontier[0].status == FrontierStatus::Frontier);
        REQUIRE(frontier[1].status == FrontierStatus::Dominated);
    }

    SECTION("Recomputing the frontier of frontier points changes nothing") {
        DecisionMetricsCalculator calc({"A", "B", "C", "D", "E"}, "A");
        std::vector<StrategyOutcome> outcomes = {
            StrategyOutcome(0.0, 1.0), StrategyOutcome(3000.0, 1.5), StrategyOutcome(4000.0, 2.5),
            StrategyOutcome(9000.0, 3.0), StrategyOutcome(5000.0, 2.0)};
        auto first = calc.efficiency_frontier(outcomes);

        std::vector<std::string> names;
        std::vector<StrategyOutcome> kept;
        for (size_t s = 0; s < first.size(); ++s) {
            if (first[s].status == FrontierStatus::Frontier) {
                names.push_back(first[s].strategy);
                kept.push_back(outcomes[s]);
            }
        }
        DecisionMetricsCalculator again(names, names.front());
        auto second = again.efficiency_frontier(kept);

        size_t k = 0;
        for (const auto& entry : first) {
            if (entry.status != FrontierStatus::Frontier) continue;
            REQUIRE(second[k].status == FrontierStatus::Frontier);
            REQUIRE(second[k].icer.has_value() == entry.icer.has_value());
            ++k;
        }

        // ICERs along the frontier are non-decreasing
        double previous = 0.0;
        for (const auto& entry : second) {
            if (entry.icer) {
                REQUIRE(*entry.icer >= previous);
                previous = *entry.icer;
            }
        }
    }
}

TEST_CASE("Price headroom", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B"}, "B");
    auto rows = calc.price_headroom({StrategyOutcome(1000.0, 5.0), StrategyOutcome(800.0, 4.5)}, 50000.0);

    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0].strategy == "A");
    REQUIRE_THAT(rows[0].headroom, WithinAbs(24800.0, 1e-9));

    auto none = calc.price_headroom({StrategyOutcome(1000.0, 4.0), StrategyOutcome(800.0, 4.5)}, 50000.0);
    REQUIRE(none[0].headroom == 0.0);
}

TEST_CASE("Perspective comparison", "[metrics]") {
    auto outcome = [](double health_system, double societal, double qalys) {
        StrategyOutcome o(health_system, qalys);
        o.societal_cost = societal;
        return o;
    };
    DecisionMetricsCalculator calc({"A", "B"}, "A");
    std::vector<StrategyOutcome> deterministic = {outcome(1000.0, 2000.0, 5.0), outcome(1500.0, 500.0, 5.5)};

    SECTION("Deterministic rows under both perspectives") {
        auto rows = calc.perspective_comparison(deterministic, {}, 2000.0);
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[0].health_system_inmb == 0.0);
        REQUIRE(rows[0].societal_inmb == 0.0);
        REQUIRE(rows[1].strategy == "B");
        REQUIRE(rows[1].health_system_cost == 1500.0);
        REQUIRE(rows[1].societal_cost == 500.0);
        REQUIRE_THAT(rows[1].health_system_inmb, WithinAbs(500.0, 1e-6));
        REQUIRE_THAT(rows[1].societal_inmb, WithinAbs(2000.0, 1e-6));
        REQUIRE(std::isnan(rows[1].health_system_probability));
        REQUIRE(std::isnan(rows[1].societal_probability));
    }

    SECTION("Probabilities count optimal draws per perspective") {
        std::vector<SimulationDraw> draws = {
            create_draw(0, deterministic),
            // Tied under the health system (lowest index wins), B under society
            create_draw(1, {outcome(1000.0, 2000.0, 5.0), outcome(2000.0, 500.0, 5.5)})};

        auto rows = calc.perspective_comparison(deterministic, draws, 2000.0);
        REQUIRE(rows[0].health_system_probability == 0.5);
        REQUIRE(rows[1].health_system_probability == 0.5);
        REQUIRE(rows[0].societal_probability == 0.0);
        REQUIRE(rows[1].societal_probability == 1.0);
    }

    SECTION("Outcome count must match the strategies") {
        REQUIRE_THROWS_AS(calc.perspective_comparison({deterministic[0]}, {}, 50000.0), std::invalid_argument);
    }
}

// ============================================================================
// Probabilistic metrics
// ============================================================================

TEST_CASE("CEAC counts optimal draws", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B"}, "A");
    auto draws = create_split_draws(1000, 650);
    WTPGrid grid = WTPGrid::from_values({50000.0});

    auto curve = calc.ceac(draws, grid);

    REQUIRE(curve.size() == 1);
    REQUIRE_THAT(curve[0].probability[0], WithinAbs(0.65, 1e-12));
    REQUIRE_THAT(curve[0].probability[1], WithinAbs(0.35, 1e-12));
}

TEST_CASE("CEAC sums to one at every WTP", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B", "C"}, "A");
    std::vector<SimulationDraw> draws;
    for (size_t i = 0; i < 50; ++i) {
        double x = static_cast<double>(i);
        draws.push_back(create_draw(i, {StrategyOutcome(1000.0 + 10.0 * x, 4.0 + 0.01 * x),
                                        StrategyOutcome(1500.0, 4.2),
                                        StrategyOutcome(3000.0 - 20.0 * x, 4.3 - 0.005 * x)}));
    }
    WTPGrid grid = WTPGrid::range(0.0, 100000.0, 5000.0);

    for (const auto& point : calc.ceac(draws, grid)) {
        double total = 0.0;
        for (double p : point.probability) {
            REQUIRE(p >= 0.0);
            REQUIRE(p <= 1.0);
            total += p;
        }
        REQUIRE_THAT(total, WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("NMB ties go to the lowest strategy index", "[metrics]") {
    std::vector<StrategyOutcome> tied = {StrategyOutcome(100.0, 1.0), StrategyOutcome(100.0, 1.0)};
    REQUIRE(DecisionMetricsCalculator::optimal_strategy(tied, 50000.0) == 0);
    REQUIRE(DecisionMetricsCalculator::net_monetary_benefit(StrategyOutcome(100.0, 1.0), 50000.0) == 49900.0);
}

TEST_CASE("A single draw gives a degenerate CEAC", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B"}, "A");
    auto draws = create_split_draws(1, 0);
    auto curve = calc.ceac(draws, WTPGrid::range(0.0, 100000.0, 50000.0));

    for (const auto& point : curve) {
        REQUIRE(point.probability[0] == 0.0);
        REQUIRE(point.probability[1] == 1.0);
    }
    REQUIRE_THROWS_AS(calc.ceac({}, WTPGrid::from_values({0.0})), std::invalid_argument);
}

TEST_CASE("CEAF follows the highest expected NMB", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B"}, "A");
    // B wins 60% of draws at w = 0 but loses heavily in the rest
    std::vector<SimulationDraw> draws;
    for (size_t i = 0; i < 10; ++i) {
        if (i < 6) {
            draws.push_back(create_draw(i, {StrategyOutcome(1000.0, 1.0), StrategyOutcome(900.0, 1.0)}));
        } else {
            draws.push_back(create_draw(i, {StrategyOutcome(1000.0, 1.0), StrategyOutcome(5000.0, 1.0)}));
        }
    }
    WTPGrid grid = WTPGrid::from_values({0.0});

    auto ceac = calc.ceac(draws, grid);
    auto ceaf = calc.ceaf(draws, grid);
    auto enmb = calc.expected_nmb(draws, grid);

    REQUIRE_THAT(ceac[0].probability[1], WithinAbs(0.6, 1e-12));
    REQUIRE(ceaf[0].strategy == 0);
    REQUIRE_THAT(ceaf[0].expected_nmb, WithinAbs(-1000.0, 1e-9));
    REQUIRE_THAT(ceaf[0].probability, WithinAbs(0.4, 1e-12));
    REQUIRE_THAT(enmb[0][1], WithinAbs(-(6 * 900.0 + 4 * 5000.0) / 10.0, 1e-9));
}

TEST_CASE("CE plane and summary statistics", "[metrics]") {
    DecisionMetricsCalculator calc({"A", "B"}, "B");
    std::vector<SimulationDraw> draws = {
        create_draw(0, {StrategyOutcome(1000.0, 5.0), StrategyOutcome(800.0, 4.5)}),
        create_draw(1, {StrategyOutcome(1200.0, 5.5), StrategyOutcome(800.0, 4.5)}),
        create_draw(2, {StrategyOutcome(1400.0, 6.0), StrategyOutcome(800.0, 4.5)})
    };

    auto plane = calc.ce_plane(draws);
    REQUIRE(plane.size() == 3);
    REQUIRE(plane[1].iteration == 1);
    REQUIRE(plane[1].strategy == 0);
    REQUIRE_THAT(plane[1].delta_cost, WithinAbs(400.0, 1e-9));
    REQUIRE_THAT(plane[1].delta_qalys, WithinAbs(1.0, 1e-12));

    auto summary = calc.summary_statistics(draws);
    REQUIRE(summary.size() == 2);
    REQUIRE_THAT(summary[0].mean_cost, WithinAbs(1200.0, 1e-9));
    REQUIRE_THAT(summary[0].sd_cost, WithinAbs(200.0, 1e-9));
    REQUIRE_THAT(summary[0].cost_p025, WithinAbs(1010.0, 1e-9));
    REQUIRE_THAT(summary[0].cost_p975, WithinAbs(1390.0, 1e-9));
    REQUIRE(summary[1].sd_qalys == 0.0);
}
