#ifndef COHORTCEA_RUN_CONFIG_HPP
#define COHORTCEA_RUN_CONFIG_HPP

#include "budget_impact.hpp"
#include "economic_aggregator.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "psa_runner.hpp"
#include "scenario_analysis.hpp"
#include "sensitivity.hpp"
#include "strategy.hpp"
#include "value_of_information.hpp"
#include "wtp_grid.hpp"
#include <map>
#include <string>
#include <vector>

namespace cohortcea {

/**
 * @brief Exception thrown when the run configuration cannot be parsed
 */
class ConfigParseError : public ValidationError {
public:
    explicit ConfigParseError(const std::string& message)
        : ValidationError(message) {}
};

// Input tables of a run
struct InputPaths {
    std::string parameters;
    std::string strategies;
    std::string state_values;
    std::string life_table;
    std::string adoption;           // Optional; empty disables budget impact
};

struct WTPSettings {
    double min;
    double max;
    double step;
    std::vector<double> values;     // Explicit grid; overrides min/max/step when set
    double policy;                  // Policy-relevant threshold w*

    WTPSettings();
};

struct OutputSettings {
    std::string directory;
    bool parquet;                   // Also write draws and snapshot as Parquet

    OutputSettings();
};

// Complete, immutable description of an analysis run
struct RunConfig {
    std::string config_path;
    InputPaths inputs;
    std::string jurisdiction;
    std::map<std::string, DiscountRates> discount_rates;
    Perspective perspective;
    PsaSettings psa;
    ModelSettings model;
    std::string reference_strategy;
    WTPSettings wtp;
    VoiSettings voi;
    std::vector<ParameterGroup> evppi_groups;
    BudgetImpactSettings budget_impact;
    bool sensitivity_enabled;
    SensitivitySettings sensitivity;
    bool two_way_enabled;
    TwoWaySettings two_way;
    std::vector<ScenarioDefinition> scenarios;
    OutputSettings output;
    LoggerConfig logging;

    RunConfig();

    // Discount rates of the selected jurisdiction
    DiscountRates rates() const;

    WTPGrid wtp_grid() const;
};

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Relative paths are resolved against the directory of config_path (when
 * given). ${VAR} references in string values are expanded.
 *
 * @throws ConfigParseError on invalid JSON, wrong types or missing fields
 * @throws ValidationError on out-of-domain values (e.g. unknown jurisdiction)
 */
RunConfig parse_run_config_from_string(const std::string& json_string,
                                       const std::string& config_path = "");

/**
 * @brief Parses a run configuration from a JSON file
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths, and every path when config_file_path is empty, are
 * returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace cohortcea

#endif // COHORTCEA_RUN_CONFIG_HPP
