#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <sstream>
#include "errors.hpp"
#include "parameter.hpp"
#include "parameter_sampler.hpp"

using namespace cohortcea;
using Catch::Matchers::WithinAbs;

namespace {

const char* PARAMETER_CSV =
    "parameter_name,owning_strategy,distribution_type,param1,param2,jurisdiction,correlation_group\n"
    "p_remission,shared,Beta,30,70,,\n"
    "c_drug,IV_Ketamine,Gamma,100,5,AU,\n"
    "c_drug,IV_Ketamine,Gamma,100,4,,\n"
    "u_depressed,shared,Fixed,0.55,,all,\n"
    "c_nz_only,shared,Fixed,12,,NZ,\n";

ParameterTable make_table() {
    ParameterTable table;
    table.add(Parameter("p", Distribution::beta(2.0, 8.0)));
    table.add(Parameter("c", "A", Distribution::gamma(4.0, 250.0)));
    table.add(Parameter("fixed", Distribution::fixed(0.7)));
    return table;
}

} // anonymous namespace

// ============================================================================
// ParameterTable
// ============================================================================

TEST_CASE("ParameterTable lookup", "[parameter]") {
    ParameterTable table = make_table();

    REQUIRE(table.size() == 3);
    REQUIRE(table.index_of("c") == 1);
    REQUIRE(table.get("c").owner == "A");
    REQUIRE(table.get("p").owner == SHARED_OWNER);
    REQUIRE(table.contains("fixed"));
    REQUIRE_FALSE(table.contains("missing"));
    REQUIRE_THROWS_AS(table.index_of("missing"), ValidationError);
    REQUIRE_THROWS_AS(table.add(Parameter("p", Distribution::fixed(1.0))), ValidationError);
}

TEST_CASE("ParameterTable loads one jurisdiction from CSV", "[parameter]") {
    SECTION("AU: specific row overrides the all-jurisdiction row") {
        std::istringstream is(PARAMETER_CSV);
        ParameterTable table = ParameterTable::load_from_csv(is, "AU");

        REQUIRE(table.size() == 3);
        REQUIRE(table.parameters()[0].name == "p_remission");
        REQUIRE(table.parameters()[1].name == "c_drug");
        REQUIRE(table.get("c_drug").jurisdiction == "AU");
        REQUIRE_THAT(table.get("c_drug").distribution.mean(), WithinAbs(500.0, 1e-9));
        REQUIRE_FALSE(table.contains("c_nz_only"));
    }

    SECTION("NZ: falls back to the all-jurisdiction row") {
        std::istringstream is(PARAMETER_CSV);
        ParameterTable table = ParameterTable::load_from_csv(is, "NZ");

        REQUIRE(table.size() == 4);
        REQUIRE_THAT(table.get("c_drug").distribution.mean(), WithinAbs(400.0, 1e-9));
        REQUIRE(table.contains("c_nz_only"));
    }

    SECTION("Invalid distribution names the parameter") {
        std::istringstream is(
            "parameter_name,owning_strategy,distribution_type,param1,param2,jurisdiction\n"
            "p_bad,shared,Beta,0,5,\n");
        try {
            ParameterTable::load_from_csv(is, "AU");
            FAIL("Expected DistributionError");
        } catch (const DistributionError& e) {
            REQUIRE(std::string(e.what()).find("p_bad") != std::string::npos);
        }
    }

    SECTION("Duplicate rows are rejected") {
        std::istringstream is(
            "parameter_name,owning_strategy,distribution_type,param1,param2,jurisdiction\n"
            "p,shared,Fixed,1,,\n"
            "p,shared,Fixed,2,,\n");
        REQUIRE_THROWS_AS(ParameterTable::load_from_csv(is, "AU"), ValidationError);
    }

    SECTION("Missing required column") {
        std::istringstream is("parameter_name,distribution_type,param1\np,Fixed,1\n");
        REQUIRE_THROWS_AS(ParameterTable::load_from_csv(is, "AU"), ValidationError);
    }
}

// ============================================================================
// ParameterValues
// ============================================================================

TEST_CASE("ParameterValues base case and updates", "[parameter]") {
    ParameterTable table = make_table();
    ParameterValues values = ParameterValues::base_case(table);

    REQUIRE(values.size() == 3);
    REQUIRE_THAT(values.get("p"), WithinAbs(0.2, 1e-12));
    REQUIRE_THAT(values[1], WithinAbs(1000.0, 1e-9));
    REQUIRE_THAT(values.get("fixed"), WithinAbs(0.7, 1e-12));

    values.set("p", 0.4);
    REQUIRE(values.get("p") == 0.4);
    values.set(2, 0.9);
    REQUIRE(values[2] == 0.9);
    REQUIRE_THROWS_AS(values.set("missing", 1.0), ValidationError);
    REQUIRE_THROWS_AS(ParameterValues(table, {1.0}), std::invalid_argument);
}

// ============================================================================
// ParameterSampler
// ============================================================================

TEST_CASE("Open uniform stays inside (0, 1)", "[sampler]") {
    RandomEngine rng(7);
    for (int i = 0; i < 10000; ++i) {
        double u = open_uniform(rng);
        REQUIRE(u > 0.0);
        REQUIRE(u < 1.0);
    }
}

TEST_CASE("Sampler is reproducible per iteration seed", "[sampler]") {
    ParameterTable table = make_table();
    ParameterSampler sampler(table);

    ParameterValues a = sampler.sample_iteration(42, 3);
    ParameterValues b = sampler.sample_iteration(42, 3);
    ParameterValues c = sampler.sample_iteration(42, 4);

    REQUIRE(a.values() == b.values());
    REQUIRE(a.values() != c.values());
    REQUIRE(iteration_seed(42, 3) == 45);

    RandomEngine rng(45);
    REQUIRE(sampler.sample(rng).values() == a.values());
}

TEST_CASE("Sampled values respect support", "[sampler]") {
    ParameterTable table = make_table();
    ParameterSampler sampler(table);

    for (size_t i = 0; i < 500; ++i) {
        ParameterValues v = sampler.sample_iteration(1, i);
        REQUIRE(v.get("p") >= 0.0);
        REQUIRE(v.get("p") <= 1.0);
        REQUIRE(v.get("c") >= 0.0);
        REQUIRE(v.get("fixed") == 0.7);
    }
}

TEST_CASE("Fixed parameters consume no random numbers", "[sampler]") {
    ParameterTable with_fixed;
    with_fixed.add(Parameter("fixed", Distribution::fixed(1.0)));
    with_fixed.add(Parameter("p", Distribution::beta(2.0, 2.0)));

    ParameterTable without_fixed;
    without_fixed.add(Parameter("p", Distribution::beta(2.0, 2.0)));

    ParameterValues a = ParameterSampler(with_fixed).sample_iteration(9, 0);
    ParameterValues b = ParameterSampler(without_fixed).sample_iteration(9, 0);
    REQUIRE(a.get("p") == b.get("p"));
}

TEST_CASE("Correlation groups share one uniform", "[sampler]") {
    ParameterTable table;
    table.add(Parameter("x", "shared", Distribution::beta(2.0, 5.0), "", "g"));
    table.add(Parameter("y", "shared", Distribution::gamma(2.0, 10.0), "", "g"));
    table.add(Parameter("z", Distribution::beta(2.0, 5.0)));
    ParameterSampler sampler(table);

    RandomEngine rng(11);
    double u_shared = open_uniform(rng);
    double u_z = open_uniform(rng);

    ParameterValues v = sampler.sample_iteration(11, 0);
    REQUIRE(v.get("x") == table.get("x").distribution.quantile(u_shared));
    REQUIRE(v.get("y") == table.get("y").distribution.quantile(u_shared));
    REQUIRE(v.get("z") == table.get("z").distribution.quantile(u_z));
}
