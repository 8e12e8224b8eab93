#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include "errors.hpp"
#include "logger.hpp"
#include "value_of_information.hpp"

using namespace cohortcea;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

// A is optimal in the first `a_wins` draws, B in the rest (equal QALYs)
std::vector<SimulationDraw> create_split_draws(size_t total, size_t a_wins) {
    std::vector<SimulationDraw> draws;
    for (size_t i = 0; i < total; ++i) {
        double a_cost = i < a_wins ? 1000.0 : 2000.0;
        double b_cost = i < a_wins ? 2000.0 : 1000.0;
        draws.push_back(SimulationDraw(i, i, {}, {StrategyOutcome(a_cost, 5.0), StrategyOutcome(b_cost, 5.0)}));
    }
    return draws;
}

ParameterTable create_driver_table() {
    ParameterTable table;
    table.add(Parameter("x", Distribution::beta(1.0, 1.0)));
    table.add(Parameter("noise", Distribution::beta(1.0, 1.0)));
    table.add(Parameter("constant", Distribution::fixed(3.0)));
    table.add(Parameter("x_shifted", Distribution::beta(1.0, 1.0)));
    return table;
}

// B's cost is driven by x alone; noise and constant are irrelevant.
// x_shifted tracks x to within 1e-10.
std::vector<SimulationDraw> create_driven_draws(size_t n) {
    std::vector<SimulationDraw> draws;
    for (size_t i = 0; i < n; ++i) {
        double x = static_cast<double>(i) / static_cast<double>(n - 1);
        double noise = std::fmod(static_cast<double>(i) * 0.6180339887498949, 1.0);
        double b_cost = 900.0 + 2000.0 * (x - 0.5);
        draws.push_back(SimulationDraw(i, i, {x, noise, 3.0, x + 1e-10 * noise},
                                       {StrategyOutcome(1000.0, 1.0), StrategyOutcome(b_cost, 1.0)}));
    }
    return draws;
}

ParameterGroup group_of(const std::string& name, std::vector<std::string> parameters) {
    ParameterGroup group;
    group.name = name;
    group.parameters = std::move(parameters);
    return group;
}

} // anonymous namespace

// ============================================================================
// EVPI
// ============================================================================

TEST_CASE("EVPI is the mean opportunity loss", "[voi]") {
    VoiSettings settings;
    settings.population = 100.0;
    ValueOfInformationEngine engine(settings);

    auto points = engine.evpi(create_split_draws(1000, 650), WTPGrid::from_values({20000.0, 50000.0}));

    REQUIRE(points.size() == 2);
    for (const auto& point : points) {
        REQUIRE_THAT(point.evpi, WithinAbs(350.0, 1e-9));
        REQUIRE_THAT(point.population_evpi, WithinAbs(35000.0, 1e-6));
        REQUIRE(point.optimal_strategy == 0);
        REQUIRE(point.cv.has_value());
        REQUIRE_FALSE(point.low_precision);
    }
}

TEST_CASE("EVPI is never negative", "[voi]") {
    ValueOfInformationEngine engine{VoiSettings()};
    std::vector<SimulationDraw> draws;
    for (size_t i = 0; i < 100; ++i) {
        double x = std::fmod(static_cast<double>(i) * 0.37, 1.0);
        draws.push_back(SimulationDraw(i, i, {}, {StrategyOutcome(1000.0 + 500.0 * x, 4.0 + x),
                                                  StrategyOutcome(1400.0, 4.4 - 0.2 * x),
                                                  StrategyOutcome(800.0 * x, 3.9)}));
    }

    for (const auto& point : engine.evpi(draws, WTPGrid::range(0.0, 100000.0, 10000.0))) {
        REQUIRE(point.evpi >= 0.0);
        REQUIRE(point.standard_error >= 0.0);
    }
}

TEST_CASE("EVPI without decision uncertainty is zero", "[voi]") {
    ValueOfInformationEngine engine{VoiSettings()};
    auto points = engine.evpi(create_split_draws(10, 10), WTPGrid::from_values({50000.0}));

    REQUIRE(points[0].evpi == 0.0);
    REQUIRE_FALSE(points[0].cv.has_value());
    REQUIRE_FALSE(points[0].low_precision);
}

TEST_CASE("A single draw flags EVPI as low precision", "[voi]") {
    ValueOfInformationEngine engine{VoiSettings()};
    auto points = engine.evpi(create_split_draws(1, 0), WTPGrid::from_values({0.0, 50000.0}));

    for (const auto& point : points) {
        REQUIRE(point.evpi == 0.0);
        REQUIRE(point.low_precision);
    }
    REQUIRE_THROWS_AS(engine.evpi({}, WTPGrid::from_values({0.0})), std::invalid_argument);
}

TEST_CASE("VOI settings are validated", "[voi]") {
    VoiSettings settings;
    settings.population = -1.0;
    REQUIRE_THROWS_AS(ValueOfInformationEngine(settings), ValidationError);
    REQUIRE(parse_evppi_method("nested") == EvppiMethod::Nested);
    REQUIRE_THROWS_AS(parse_evppi_method("gp"), ValidationError);
}

// ============================================================================
// EVPPI (regression)
// ============================================================================

TEST_CASE("Least squares recovers an exact fit", "[voi]") {
    Eigen::MatrixXd design(5, 2);
    Eigen::MatrixXd y(5, 2);
    for (int i = 0; i < 5; ++i) {
        double x = static_cast<double>(i);
        design(i, 0) = 1.0;
        design(i, 1) = x;
        y(i, 0) = 2.0 + 3.0 * x;
        y(i, 1) = -1.0 + 0.5 * x;
    }
    LeastSquaresFit fit = least_squares(design, y);
    REQUIRE(fit.full_rank());
    REQUIRE_THAT(fit.coefficients(0, 0), WithinAbs(2.0, 1e-9));
    REQUIRE_THAT(fit.coefficients(1, 0), WithinAbs(3.0, 1e-9));
    REQUIRE_THAT(fit.coefficients(0, 1), WithinAbs(-1.0, 1e-9));
    REQUIRE_THAT(fit.coefficients(1, 1), WithinAbs(0.5, 1e-9));
}

TEST_CASE("Least squares reports rank deficiency", "[voi]") {
    Eigen::MatrixXd collinear(3, 2);
    collinear << 1.0, 2.0,
                 2.0, 4.0,
                 3.0, 6.0;
    Eigen::MatrixXd y(3, 1);
    y << 1.0, 2.0, 3.0;

    LeastSquaresFit fit = least_squares(collinear, y);
    REQUIRE(fit.rank == 1);
    REQUIRE_FALSE(fit.full_rank());

    REQUIRE_THROWS_AS(least_squares(collinear, Eigen::MatrixXd(2, 1)), std::invalid_argument);
}

TEST_CASE("Regression EVPPI", "[voi]") {
    ValueOfInformationEngine engine{VoiSettings()};
    ParameterTable table = create_driver_table();
    auto draws = create_driven_draws(200);
    WTPGrid grid = WTPGrid::from_values({50000.0});

    const double evpi = engine.evpi(draws, grid)[0].evpi;
    REQUIRE(evpi > 0.0);

    SECTION("The parameter that drives the decision carries all of EVPI") {
        auto points = engine.evppi_regression(draws, table, group_of("driver", {"x"}), grid);
        REQUIRE(points.size() == 1);
        REQUIRE(points[0].group == "driver");
        REQUIRE_THAT(points[0].evppi, WithinRel(evpi, 1e-6));
        REQUIRE_FALSE(points[0].low_precision);
    }

    SECTION("An irrelevant parameter carries little") {
        auto points = engine.evppi_regression(draws, table, group_of("noise", {"noise"}), grid);
        REQUIRE(points[0].evppi >= 0.0);
        REQUIRE(points[0].evppi < 0.2 * evpi);
    }

    SECTION("A constant parameter makes the fit singular") {
        auto points = engine.evppi_regression(draws, table, group_of("fixed", {"x", "constant"}), grid);
        REQUIRE(points[0].evppi == 0.0);
        REQUIRE(points[0].low_precision);
    }

    SECTION("Nearly collinear group parameters make the fit singular") {
        auto points = engine.evppi_regression(draws, table, group_of("tracking", {"x", "x_shifted"}), grid);
        REQUIRE(points[0].evppi == 0.0);
        REQUIRE(points[0].low_precision);
    }

    SECTION("Few draws are flagged") {
        auto few = create_driven_draws(6);
        auto points = engine.evppi_regression(few, table, group_of("driver", {"x"}), grid);
        REQUIRE(points[0].low_precision);
    }

    SECTION("Unknown parameter in the group") {
        REQUIRE_THROWS_AS(engine.evppi_regression(draws, table, group_of("bad", {"missing"}), grid),
                          ValidationError);
        REQUIRE_THROWS_AS(engine.evppi_regression(draws, table, group_of("empty", {}), grid),
                          ValidationError);
    }
}

// ============================================================================
// EVPPI (nested)
// ============================================================================

TEST_CASE("Nested EVPPI", "[voi]") {
    LoggerConfig quiet;
    quiet.enable_console = false;
    Logger::get_instance().configure(quiet);

    ParameterTable table;
    table.add(Parameter("p_response", Distribution::beta(5.0, 5.0)));
    table.add(Parameter("c_extra", Distribution::gamma(4.0, 50.0)));

    auto make_arm = [](const std::string& id, bool treated) {
        StrategyArm arm(id);
        arm.state_names = {"Well", "Sick"};
        arm.initial_state = 1;
        arm.transition = [treated](int, const ParameterValues& v) {
            TransitionMatrix p = zero_transitions(2);
            double response = treated ? v[0] : 0.2;
            p(0, 0) = 0.95;
            p(0, 1) = 0.05;
            p(1, 0) = response;
            p(1, 1) = 1.0 - response;
            return p;
        };
        arm.cost = [treated](size_t, int, const ParameterValues& v) { return treated ? 100.0 + v[1] : 100.0; };
        arm.utility = [](size_t state, int, const ParameterValues&) { return state == 0 ? 0.9 : 0.5; };
        arm.one_time_cost = [](int, const ParameterValues&) { return 0.0; };
        return arm;
    };

    StrategyRegistry registry;
    registry.add(make_arm("Usual", false));
    registry.add(make_arm("New", true));
    MarkovCohortSimulator simulator(12);
    EconomicAggregator aggregator(simulator, DiscountRates(0.0, 0.0));
    PsaRunner runner(registry, table, aggregator);

    VoiSettings settings;
    settings.evppi_method = EvppiMethod::Nested;
    settings.nested_outer = 8;
    settings.nested_inner = 4;
    ValueOfInformationEngine engine(settings);
    WTPGrid grid = WTPGrid::from_values({0.0, 20000.0, 50000.0});

    auto first = engine.evppi({}, runner, group_of("response", {"p_response"}), grid, 42);
    auto second = engine.evppi_nested(runner, group_of("response", {"p_response"}), grid, 42);

    REQUIRE(first.size() == 3);
    for (size_t k = 0; k < first.size(); ++k) {
        REQUIRE(first[k].evppi >= 0.0);
        REQUIRE(first[k].evppi == second[k].evppi);
        REQUIRE_FALSE(first[k].low_precision);
    }

    REQUIRE_THROWS_AS(engine.evppi_nested(runner, group_of("bad", {"missing"}), grid, 42), ValidationError);
}
