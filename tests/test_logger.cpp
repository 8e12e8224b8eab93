/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace cohortcea;

namespace {

// Parse a flat JSON log line of string values
std::map<std::string, std::string> parse_json_log(const std::string& line) {
    std::map<std::string, std::string> result;

    size_t pos = 1;  // Skip opening {
    while (pos < line.size() - 1) {
        size_t key_start = line.find('"', pos);
        if (key_start == std::string::npos) break;
        size_t key_end = line.find('"', key_start + 1);
        std::string key = line.substr(key_start + 1, key_end - key_start - 1);

        size_t val_start = line.find('"', key_end + 1);
        if (val_start == std::string::npos) break;
        size_t val_end = line.find('"', val_start + 1);
        std::string value = line.substr(val_start + 1, val_end - val_start - 1);

        result[key] = value;
        pos = val_end + 1;
    }

    return result;
}

// Route the logger to a fresh file at the given level
void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }

    SECTION("Log level filtering") {
        const std::string path = "test_level_filter.log";
        log_to_file(path, LogLevel::WARN);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        RunContext ctx("seed_1", "psa");
        logger.log_batch_complete(ctx, 10, 100, 0);     // DEBUG
        logger.log_run_start(ctx, 100, 1, 3);           // INFO
        logger.log_cancelled(ctx, 10, 100);             // WARN

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(parse_json_log(lines[0])["event"] == "cancelled");

        std::filesystem::remove(path);
    }
}

TEST_CASE("Logger Run Events", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_run_events.log";

    SECTION("Configuration loaded") {
        log_to_file(path);
        std::map<std::string, std::string> settings;
        settings["jurisdiction"] = "AU";
        settings["iterations"] = "1000";

        logger.log_config_loaded(RunContext("AU_seed_42", "config"), "data/config.json", settings);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "config_loaded");
        REQUIRE(fields["level"] == "INFO");
        REQUIRE(fields["run_id"] == "AU_seed_42");
        REQUIRE(fields["phase"] == "config");
        REQUIRE(fields["config_path"] == "data/config.json");
        REQUIRE(fields["config.jurisdiction"] == "AU");
        REQUIRE(fields["config.iterations"] == "1000");
    }

    SECTION("Batch progress") {
        log_to_file(path);
        logger.log_batch_complete(RunContext("seed_42", "psa"), 256, 1000, 2);

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "batch_complete");
        REQUIRE(fields["level"] == "DEBUG");
        REQUIRE(fields["completed"] == "256");
        REQUIRE(fields["failed"] == "2");
        REQUIRE(std::stod(fields["progress_pct"]) == 25.6);
    }

    SECTION("Failed iteration carries its identity") {
        log_to_file(path);
        logger.log_iteration_failed(RunContext("seed_42", "psa"), 17, 59, "invalid cost -1");

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "iteration_failed");
        REQUIRE(fields["level"] == "WARN");
        REQUIRE(fields["iteration"] == "17");
        REQUIRE(fields["seed"] == "59");
        REQUIRE(fields["error_message"] == "invalid cost -1");
    }

    SECTION("Numerical flags") {
        log_to_file(path);
        RunContext ctx("AU_seed_42", "voi");
        ctx.strategy = "IV_Ketamine";
        logger.log_numerical_flag(ctx, "evpi", "low precision at wtp 50000");

        auto fields = parse_json_log(read_lines(path).at(0));
        REQUIRE(fields["event"] == "numerical_flag");
        REQUIRE(fields["metric"] == "evpi");
        REQUIRE(fields["strategy"] == "IV_Ketamine");
    }

    SECTION("Messages are escaped") {
        log_to_file(path);
        logger.log_error(RunContext("run", "output"), "bad value in \"config\"");

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("\\\"config\\\"") != std::string::npos);
    }

    SECTION("Plain text output") {
        std::filesystem::remove(path);
        LoggerConfig config;
        config.enable_console = false;
        config.enable_file = true;
        config.enable_json = false;
        config.log_file_path = path;
        logger.configure(config);

        logger.log_run_complete(RunContext("seed_42", "psa"), 1000, 0, 12.5);

        auto lines = read_lines(path);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("[INFO] Run complete") != std::string::npos);
        REQUIRE(lines[0].find("draws=1000") != std::string::npos);
    }

    std::filesystem::remove(path);

    LoggerConfig quiet;
    quiet.enable_console = false;
    logger.configure(quiet);
}
