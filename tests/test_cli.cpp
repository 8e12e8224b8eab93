#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

#ifndef COHORTCEA_BINARY
#define COHORTCEA_BINARY "./cohortcea"
#endif

#ifndef COHORTCEA_DATA_DIR
#define COHORTCEA_DATA_DIR "../data"
#endif

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    if (!stream) {
        return "";
    }
    std::ostringstream ss;
    ss << stream.rdbuf();
    return ss.str();
}

CommandResult run_command(const std::string& args) {
    CommandResult result;

    std::string stdout_file = "/tmp/cohortcea_test_stdout.txt";
    std::string stderr_file = "/tmp/cohortcea_test_stderr.txt";

    std::string full_cmd = std::string(COHORTCEA_BINARY) + " " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    result.exit_code = WEXITSTATUS(status);
    return result;
}

std::string data_file(const std::string& name) {
    return std::string(COHORTCEA_DATA_DIR) + "/" + name;
}

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--config") != std::string::npos);
    REQUIRE(result.stderr_output.find("--iterations") != std::string::npos);
    REQUIRE(result.stderr_output.find("--resume") != std::string::npos);
    REQUIRE(result.stderr_output.find("--perspective") != std::string::npos);
}

TEST_CASE("CLI configuration errors exit with 2", "[cli]") {
    SECTION("Missing --config") {
        auto result = run_command("");
        REQUIRE(result.exit_code == 2);
        REQUIRE(result.stderr_output.find("--config is required") != std::string::npos);
    }

    SECTION("Unknown option") {
        auto result = run_command("--config " + data_file("config.json") + " --bogus");
        REQUIRE(result.exit_code == 2);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Negative iteration count") {
        auto result = run_command("--config " + data_file("config.json") + " --iterations -5");
        REQUIRE(result.exit_code == 2);
    }

    SECTION("Unknown perspective") {
        auto result = run_command("--config " + data_file("config.json") + " --perspective patient");
        REQUIRE(result.exit_code == 2);
        REQUIRE(result.stderr_output.find("Unknown perspective 'patient'") != std::string::npos);
    }

    SECTION("Config file that does not exist") {
        auto result = run_command("--config /tmp/cohortcea_no_such_config.json");
        REQUIRE(result.exit_code == 2);
    }

    SECTION("Reference strategy that is not defined") {
        const std::string path = "/tmp/cohortcea_test_bad_reference.json";
        {
            std::ofstream file(path);
            file << R"({
                "inputs": {
                    "parameters": ")" << data_file("parameters.csv") << R"(",
                    "strategies": ")" << data_file("strategies.csv") << R"(",
                    "state_values": ")" << data_file("state_values.csv") << R"(",
                    "life_table": ")" << data_file("life_table.csv") << R"("
                },
                "jurisdiction": "AU",
                "discount_rates": {"AU": {"costs": 0.05, "outcomes": 0.05}},
                "reference_strategy": "Placebo",
                "logging": {"console": false}
            })";
        }
        auto result = run_command("--config " + path + " --output /tmp/cohortcea_test_bad_out");
        REQUIRE(result.exit_code == 2);
        REQUIRE(result.stderr_output.find("Placebo") != std::string::npos);
        std::filesystem::remove(path);
    }
}

TEST_CASE("CLI full run writes every table", "[cli]") {
    const std::string out = "/tmp/cohortcea_test_cli_out";
    std::filesystem::remove_all(out);

    auto result = run_command("--config " + data_file("config.json") +
                              " --iterations 40 --seed 7 --output " + out);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Output written to") != std::string::npos);

    for (const char* name : {"deterministic_results.csv", "incremental_results.csv", "frontier.csv",
                             "psa_draws.csv", "parameter_snapshot.csv", "ceac.csv", "ceaf.csv",
                             "expected_nmb.csv", "ce_plane.csv", "evpi.csv", "evppi.csv",
                             "budget_impact.csv", "tornado.csv", "perspective_comparison.csv",
                             "two_way_dsa.csv", "scenarios.csv", "summary.json"}) {
        INFO(name);
        REQUIRE(std::filesystem::exists(std::filesystem::path(out) / name));
    }

    std::string incremental = read_file(out + "/incremental_results.csv");
    REQUIRE(incremental.find("ECT,") != std::string::npos);
    REQUIRE(incremental.find("reference") != std::string::npos);

    std::string scenarios = read_file(out + "/scenarios.csv");
    REQUIRE(scenarios.find("\nbase_case,ECT,health_system,120,") != std::string::npos);
    REQUIRE(scenarios.find("\nsocietal,IV_Ketamine,societal,120,") != std::string::npos);

    // Same seed, same draws
    const std::string again = "/tmp/cohortcea_test_cli_out_again";
    std::filesystem::remove_all(again);
    auto second = run_command("--config " + data_file("config.json") +
                              " --iterations 40 --seed 7 --output " + again);
    REQUIRE(second.exit_code == 0);
    REQUIRE(read_file(out + "/psa_draws.csv") == read_file(again + "/psa_draws.csv"));
    REQUIRE(read_file(out + "/evpi.csv") == read_file(again + "/evpi.csv"));

    std::filesystem::remove_all(out);
    std::filesystem::remove_all(again);
}

TEST_CASE("CLI perspective override", "[cli]") {
    const std::string out = "/tmp/cohortcea_test_cli_societal";
    std::filesystem::remove_all(out);

    auto result = run_command("--config " + data_file("config.json") +
                              " --iterations 20 --seed 3 --perspective societal --output " + out);
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("societal perspective") != std::string::npos);

    std::string scenarios = read_file(out + "/scenarios.csv");
    REQUIRE(scenarios.find("\nbase_case,ECT,societal,120,") != std::string::npos);

    std::filesystem::remove_all(out);
}
