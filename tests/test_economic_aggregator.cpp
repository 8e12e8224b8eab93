#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include "economic_aggregator.hpp"
#include "errors.hpp"

using namespace cohortcea;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

// Well and Sick swap 10% of their mass every month; nobody dies, so every
// cycle accrues the same cost and utility.
StrategyArm create_well_sick_arm(double monthly_cost, double utility, double course_cost = 0.0) {
    StrategyArm arm("well_sick");
    arm.state_names = {"Well", "Sick"};
    arm.initial_state = 0;
    arm.transition = [](int, const ParameterValues&) {
        TransitionMatrix p = zero_transitions(2);
        p(0, 0) = 0.9;
        p(0, 1) = 0.1;
        p(1, 0) = 0.1;
        p(1, 1) = 0.9;
        return p;
    };
    arm.cost = [monthly_cost](size_t, int, const ParameterValues&) { return monthly_cost; };
    arm.utility = [utility](size_t, int, const ParameterValues&) { return utility; };
    arm.one_time_cost = [course_cost](int cycle, const ParameterValues&) {
        return cycle == 0 ? course_cost : 0.0;
    };
    return arm;
}

ParameterValues empty_values() {
    static ParameterTable table;
    return ParameterValues::base_case(table);
}

} // anonymous namespace

// ============================================================================
// DiscountSchedule
// ============================================================================

TEST_CASE("Discount factors", "[aggregator]") {
    DiscountSchedule schedule(0.05);

    REQUIRE(schedule.factor(0) == 1.0);
    REQUIRE_THAT(schedule.factor(12), WithinRel(1.0 / 1.05, 1e-12));
    REQUIRE_THAT(schedule.factor(6), WithinRel(std::pow(1.05, -0.5), 1e-12));
    REQUIRE(DiscountSchedule(0.0).factor(60) == 1.0);
    REQUIRE_THROWS_AS(DiscountSchedule(-1.0), ValidationError);
}

// ============================================================================
// Aggregation
// ============================================================================

TEST_CASE("Undiscounted constant accrual", "[aggregator]") {
    MarkovCohortSimulator simulator(12);
    EconomicAggregator aggregator(simulator, DiscountRates(0.0, 0.0));

    StrategyOutcome outcome = aggregator.evaluate(create_well_sick_arm(100.0, 1.0), empty_values());

    REQUIRE_THAT(outcome.cost, WithinAbs(1200.0, 1e-9));
    REQUIRE_THAT(outcome.qalys, WithinAbs(1.0, 1e-12));
    REQUIRE_THAT(outcome.life_years, WithinAbs(1.0, 1e-12));
}

TEST_CASE("Discounted accrual and one-time costs", "[aggregator]") {
    MarkovCohortSimulator simulator(24);
    EconomicAggregator aggregator(simulator, DiscountRates(0.05, 0.03));

    StrategyOutcome outcome = aggregator.evaluate(create_well_sick_arm(100.0, 0.6, 5000.0), empty_values());

    double expected_cost = 5000.0;
    double expected_qalys = 0.0;
    for (int c = 0; c < 24; ++c) {
        expected_cost += 100.0 * std::pow(1.05, -c / 12.0);
        expected_qalys += 0.6 / 12.0 * std::pow(1.03, -c / 12.0);
    }

    REQUIRE_THAT(outcome.cost, WithinRel(expected_cost, 1e-12));
    REQUIRE_THAT(outcome.qalys, WithinRel(expected_qalys, 1e-12));
    REQUIRE_THAT(outcome.life_years, WithinAbs(2.0, 1e-12));
}

TEST_CASE("Streaming accumulator matches trace aggregation", "[aggregator]") {
    MarkovCohortSimulator simulator(36);
    DiscountSchedule costs(0.05);
    DiscountSchedule outcomes(0.05);
    ParameterValues values = empty_values();

    StrategyArm arm = create_well_sick_arm(0.0, 0.0, 750.0);
    arm.cost = [](size_t state, int cycle, const ParameterValues&) { return state == 0 ? 50.0 : 400.0 + cycle; };
    arm.utility = [](size_t state, int, const ParameterValues&) { return state == 0 ? 0.9 : 0.5; };

    CohortAccumulator accumulator(arm, values, costs, outcomes);
    simulator.simulate(arm, values, accumulator);
    StrategyOutcome from_trace = aggregate_trace(simulator.trace(arm, values), arm, values, costs, outcomes);

    REQUIRE_THAT(accumulator.outcome().cost, WithinRel(from_trace.cost, 1e-14));
    REQUIRE_THAT(accumulator.outcome().qalys, WithinRel(from_trace.qalys, 1e-14));
    REQUIRE_THAT(accumulator.outcome().life_years, WithinRel(from_trace.life_years, 1e-14));
}

TEST_CASE("Negative costs fail the evaluation", "[aggregator]") {
    MarkovCohortSimulator simulator(12);
    EconomicAggregator aggregator(simulator, DiscountRates(0.0, 0.0));

    REQUIRE_THROWS_AS(aggregator.evaluate(create_well_sick_arm(-1.0, 1.0), empty_values()),
                      std::runtime_error);
    REQUIRE_THROWS_AS(aggregator.evaluate(create_well_sick_arm(1.0, 1.0, -10.0), empty_values()),
                      std::runtime_error);
}

TEST_CASE("Outcomes are returned in registry order", "[aggregator]") {
    MarkovCohortSimulator simulator(12);
    EconomicAggregator aggregator(simulator, DiscountRates(0.0, 0.0));

    StrategyRegistry registry;
    StrategyArm cheap = create_well_sick_arm(10.0, 0.5);
    cheap.id = "cheap";
    StrategyArm dear = create_well_sick_arm(20.0, 0.8);
    dear.id = "dear";
    registry.add(dear);
    registry.add(cheap);

    auto outcomes = aggregator.evaluate_all(registry, empty_values());

    REQUIRE(outcomes.size() == 2);
    REQUIRE_THAT(outcomes[0].cost, WithinAbs(240.0, 1e-9));
    REQUIRE_THAT(outcomes[1].cost, WithinAbs(120.0, 1e-9));
}

// ============================================================================
// Perspective
// ============================================================================

TEST_CASE("Societal costs count only under the societal perspective", "[aggregator]") {
    MarkovCohortSimulator simulator(12);
    StrategyArm arm = create_well_sick_arm(100.0, 1.0, 500.0);
    arm.societal_cost = [](size_t, int, const ParameterValues&) { return 40.0; };

    EconomicAggregator health_system(simulator, DiscountRates(0.0, 0.0));
    EconomicAggregator societal(simulator, DiscountRates(0.0, 0.0), Perspective::Societal);

    StrategyOutcome hs = health_system.evaluate(arm, empty_values());
    StrategyOutcome soc = societal.evaluate(arm, empty_values());

    SECTION("Both components are always accumulated") {
        REQUIRE_THAT(hs.health_system_cost, WithinAbs(1700.0, 1e-9));
        REQUIRE_THAT(hs.societal_cost, WithinAbs(480.0, 1e-9));
        REQUIRE_THAT(soc.health_system_cost, WithinAbs(hs.health_system_cost, 1e-9));
        REQUIRE_THAT(soc.societal_cost, WithinAbs(hs.societal_cost, 1e-9));
    }

    SECTION("Cost follows the perspective") {
        REQUIRE_THAT(hs.cost, WithinAbs(1700.0, 1e-9));
        REQUIRE_THAT(soc.cost, WithinAbs(2180.0, 1e-9));
        REQUIRE(hs.cost_under(Perspective::Societal) == soc.cost);
        REQUIRE(soc.qalys == hs.qalys);
    }

    SECTION("An arm without societal costs is unchanged") {
        StrategyArm plain = create_well_sick_arm(100.0, 1.0, 500.0);
        StrategyOutcome outcome = societal.evaluate(plain, empty_values());
        REQUIRE(outcome.societal_cost == 0.0);
        REQUIRE_THAT(outcome.cost, WithinAbs(1700.0, 1e-9));
    }

    SECTION("Negative societal costs fail the evaluation") {
        arm.societal_cost = [](size_t, int, const ParameterValues&) { return -5.0; };
        REQUIRE_THROWS_AS(health_system.evaluate(arm, empty_values()), std::runtime_error);
    }
}

TEST_CASE("Perspective names", "[aggregator]") {
    REQUIRE(parse_perspective("health_system") == Perspective::HealthSystem);
    REQUIRE(parse_perspective("societal") == Perspective::Societal);
    REQUIRE(perspective_name(Perspective::Societal) == "societal");
    REQUIRE(perspective_name(Perspective::HealthSystem) == "health_system");
    REQUIRE_THROWS_AS(parse_perspective("payer"), ValidationError);
}
