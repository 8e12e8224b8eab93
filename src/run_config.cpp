#include "run_config.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace cohortcea {

// ============================================================================
// Defaults
// ============================================================================

WTPSettings::WTPSettings()
    : min(0.0), max(100000.0), step(1000.0), policy(50000.0) {}

OutputSettings::OutputSettings()
    : directory("out"), parquet(false) {}

RunConfig::RunConfig()
    : perspective(Perspective::HealthSystem), sensitivity_enabled(false), two_way_enabled(false) {}

DiscountRates RunConfig::rates() const {
    auto it = discount_rates.find(jurisdiction);
    if (it == discount_rates.end()) {
        throw ValidationError("Unknown jurisdiction '" + jurisdiction + "': no discount rates configured");
    }
    return it->second;
}

WTPGrid RunConfig::wtp_grid() const {
    if (!wtp.values.empty()) {
        return WTPGrid::from_values(wtp.values);
    }
    return WTPGrid::range(wtp.min, wtp.max, wtp.step);
}

// ============================================================================
// Path helpers
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated ${ in '" + value + "'");
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            // A lone '$' is kept as is
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";
        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    if (path.empty() || config_file_path.empty()) {
        return path;
    }

    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

// ============================================================================
// JSON field helpers
// ============================================================================

namespace {

const json& require_field(const json& j, const std::string& key, const std::string& context) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigParseError("Missing required field: " + context + key);
    }
    return j.at(key);
}

std::string read_path(const json& j, const std::string& key, const std::string& config_path) {
    return resolve_relative_path(expand_environment_variables(j.at(key).get<std::string>()),
                                 config_path);
}

size_t read_count(const json& j, const std::string& key, const std::string& context) {
    const json& value = j.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw ConfigParseError(context + key + " must be a non-negative integer");
    }
    return value.get<size_t>();
}

DiscountRates parse_discount_rates(const json& j, const std::string& jurisdiction) {
    const std::string context = "discount_rates." + jurisdiction + ".";
    DiscountRates rates;
    rates.costs = require_field(j, "costs", context).get<double>();
    rates.outcomes = require_field(j, "outcomes", context).get<double>();
    if (!(rates.costs > -1.0) || !(rates.outcomes > -1.0)) {
        throw ValidationError("Discount rates for " + jurisdiction + " must be greater than -1");
    }
    return rates;
}

void parse_psa(const json& j, PsaSettings& psa, const std::string& config_path) {
    if (j.contains("iterations")) psa.iterations = read_count(j, "iterations", "psa.");
    if (j.contains("seed")) {
        if (!j["seed"].is_number_integer() || j["seed"].get<long long>() < 0) {
            throw ConfigParseError("psa.seed must be a non-negative integer");
        }
        psa.seed = j["seed"].get<uint64_t>();
    }
    if (j.contains("batch_size")) psa.batch_size = read_count(j, "batch_size", "psa.");
    if (j.contains("error_policy")) {
        psa.error_policy = parse_error_policy(j["error_policy"].get<std::string>());
    }
    if (j.contains("max_failure_fraction")) {
        psa.max_failure_fraction = j["max_failure_fraction"].get<double>();
    }
    if (j.contains("checkpoint")) psa.checkpoint_path = read_path(j, "checkpoint", config_path);
    if (j.contains("resume")) psa.resume = j["resume"].get<bool>();
}

void parse_model(const json& j, ModelSettings& model) {
    if (j.contains("cycles")) model.cycles = j["cycles"].get<int>();
    if (j.contains("start_age")) model.start_age = j["start_age"].get<double>();
    if (j.contains("relapse_tunnel_months")) {
        model.relapse_tunnel_months = j["relapse_tunnel_months"].get<int>();
    }
    if (model.cycles <= 0) {
        throw ValidationError("model.cycles must be positive");
    }
    if (!(model.start_age >= 0.0) || model.start_age > 120.0) {
        throw ValidationError("model.start_age must be in [0, 120]");
    }
    if (model.relapse_tunnel_months < 0) {
        throw ValidationError("model.relapse_tunnel_months must be non-negative");
    }
}

void parse_wtp(const json& j, WTPSettings& wtp) {
    if (j.contains("min")) wtp.min = j["min"].get<double>();
    if (j.contains("max")) wtp.max = j["max"].get<double>();
    if (j.contains("step")) wtp.step = j["step"].get<double>();
    if (j.contains("values")) wtp.values = j["values"].get<std::vector<double>>();
    if (j.contains("policy")) wtp.policy = j["policy"].get<double>();
    if (!(wtp.policy >= 0.0)) {
        throw ValidationError("wtp.policy must be non-negative");
    }
}

void parse_voi(const json& j, RunConfig& config) {
    VoiSettings& voi = config.voi;
    if (j.contains("population")) voi.population = j["population"].get<double>();
    if (j.contains("evpi_cv_threshold")) voi.evpi_cv_threshold = j["evpi_cv_threshold"].get<double>();
    if (j.contains("evppi_method")) {
        voi.evppi_method = parse_evppi_method(j["evppi_method"].get<std::string>());
    }
    if (j.contains("nested_outer")) voi.nested_outer = read_count(j, "nested_outer", "voi.");
    if (j.contains("nested_inner")) voi.nested_inner = read_count(j, "nested_inner", "voi.");

    if (j.contains("evppi_groups")) {
        const json& groups = j["evppi_groups"];
        if (!groups.is_object()) {
            throw ConfigParseError("voi.evppi_groups must be an object of name -> parameter list");
        }
        for (auto it = groups.begin(); it != groups.end(); ++it) {
            ParameterGroup group;
            group.name = it.key();
            group.parameters = it.value().get<std::vector<std::string>>();
            if (group.parameters.empty()) {
                throw ValidationError("EVPPI group '" + group.name + "' has no parameters");
            }
            config.evppi_groups.push_back(group);
        }
    }
    if (!(voi.population >= 0.0)) {
        throw ValidationError("voi.population must be non-negative");
    }
}

void parse_budget_impact(const json& j, BudgetImpactSettings& bi) {
    if (j.contains("population")) bi.population = j["population"].get<double>();
    if (j.contains("growth_rate")) bi.growth_rate = j["growth_rate"].get<double>();
    if (j.contains("years")) bi.years = j["years"].get<int>();
    if (j.contains("baseline")) {
        bi.baseline = j["baseline"].get<std::map<std::string, double>>();
    }
}

void parse_sensitivity(const json& j, RunConfig& config) {
    SensitivitySettings& sa = config.sensitivity;
    sa.strategy = require_field(j, "strategy", "sensitivity.").get<std::string>();
    if (j.contains("low_quantile")) sa.low_quantile = j["low_quantile"].get<double>();
    if (j.contains("high_quantile")) sa.high_quantile = j["high_quantile"].get<double>();
    config.sensitivity_enabled = true;
}

TwoWayAxis parse_two_way_axis(const json& j, const std::string& context) {
    TwoWayAxis axis;
    axis.parameter = require_field(j, "name", context).get<std::string>();
    if (j.contains("min")) axis.min = j["min"].get<double>();
    if (j.contains("max")) axis.max = j["max"].get<double>();
    return axis;
}

void parse_two_way(const json& j, RunConfig& config) {
    TwoWaySettings& tw = config.two_way;
    tw.strategy = require_field(j, "strategy", "two_way.").get<std::string>();
    const json& parameters = require_field(j, "parameters", "two_way.");
    if (!parameters.is_array() || parameters.size() != 2) {
        throw ConfigParseError("two_way.parameters must list exactly two parameters");
    }
    tw.first = parse_two_way_axis(parameters[0], "two_way.parameters[0].");
    tw.second = parse_two_way_axis(parameters[1], "two_way.parameters[1].");
    if (j.contains("steps")) tw.steps = read_count(j, "steps", "two_way.");
    if (j.contains("low_quantile")) tw.low_quantile = j["low_quantile"].get<double>();
    if (j.contains("high_quantile")) tw.high_quantile = j["high_quantile"].get<double>();
    config.two_way_enabled = true;
}

ScenarioDefinition parse_scenario(const json& j, size_t position) {
    const std::string context = "scenarios[" + std::to_string(position) + "].";
    ScenarioDefinition scenario;
    scenario.name = require_field(j, "name", context).get<std::string>();
    if (j.contains("description")) scenario.description = j["description"].get<std::string>();
    if (j.contains("discount_rates")) {
        const json& rates = j["discount_rates"];
        const std::string rates_context = context + "discount_rates.";
        scenario.rates = DiscountRates(require_field(rates, "costs", rates_context).get<double>(),
                                       require_field(rates, "outcomes", rates_context).get<double>());
    }
    if (j.contains("cycles")) scenario.cycles = j["cycles"].get<int>();
    if (j.contains("perspective")) {
        scenario.perspective = parse_perspective(j["perspective"].get<std::string>());
    }
    if (j.contains("wtp")) scenario.wtp = j["wtp"].get<double>();
    if (j.contains("parameters")) {
        const json& parameters = j["parameters"];
        if (!parameters.is_object()) {
            throw ConfigParseError(context + "parameters must be an object of name -> value");
        }
        for (auto it = parameters.begin(); it != parameters.end(); ++it) {
            scenario.parameters.emplace_back(it.key(), it.value().get<double>());
        }
    }
    return scenario;
}

void parse_scenarios(const json& j, RunConfig& config) {
    if (!j.is_array()) {
        throw ConfigParseError("scenarios must be an array of scenario objects");
    }
    for (size_t i = 0; i < j.size(); ++i) {
        config.scenarios.push_back(parse_scenario(j[i], i));
    }
}

void parse_logging(const json& j, LoggerConfig& logging, const std::string& config_path) {
    if (j.contains("level")) {
        std::string level = j["level"].get<std::string>();
        if (level != "DEBUG" && level != "INFO" && level != "WARN" && level != "ERROR") {
            throw ConfigParseError("logging.level must be DEBUG, INFO, WARN or ERROR, got '" + level + "'");
        }
        logging.min_level = string_to_level(level);
    }
    if (j.contains("json")) logging.enable_json = j["json"].get<bool>();
    if (j.contains("console")) logging.enable_console = j["console"].get<bool>();
    if (j.contains("file")) {
        std::string file = read_path(j, "file", config_path);
        logging.enable_file = !file.empty();
        if (logging.enable_file) {
            logging.log_file_path = file;
        }
    }
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

RunConfig parse_run_config_from_string(const std::string& json_string, const std::string& config_path) {
    RunConfig config;
    config.config_path = config_path;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Run configuration must be a JSON object");
        }

        // Inputs (required, adoption optional)
        const json& inputs = require_field(j, "inputs", "");
        require_field(inputs, "parameters", "inputs.");
        require_field(inputs, "strategies", "inputs.");
        require_field(inputs, "state_values", "inputs.");
        require_field(inputs, "life_table", "inputs.");
        config.inputs.parameters = read_path(inputs, "parameters", config_path);
        config.inputs.strategies = read_path(inputs, "strategies", config_path);
        config.inputs.state_values = read_path(inputs, "state_values", config_path);
        config.inputs.life_table = read_path(inputs, "life_table", config_path);
        if (inputs.contains("adoption")) {
            config.inputs.adoption = read_path(inputs, "adoption", config_path);
        }

        // Jurisdiction and its discount rates (required)
        config.jurisdiction = require_field(j, "jurisdiction", "").get<std::string>();
        const json& rates = require_field(j, "discount_rates", "");
        if (!rates.is_object()) {
            throw ConfigParseError("discount_rates must be an object keyed by jurisdiction");
        }
        for (auto it = rates.begin(); it != rates.end(); ++it) {
            config.discount_rates[it.key()] = parse_discount_rates(it.value(), it.key());
        }
        config.rates();  // throws on an unknown jurisdiction

        config.reference_strategy = require_field(j, "reference_strategy", "").get<std::string>();
        if (config.reference_strategy.empty()) {
            throw ValidationError("reference_strategy must not be empty");
        }

        // Optional sections
        if (j.contains("perspective")) {
            config.perspective = parse_perspective(j["perspective"].get<std::string>());
        }
        if (j.contains("psa")) parse_psa(j["psa"], config.psa, config_path);
        if (j.contains("model")) parse_model(j["model"], config.model);
        if (j.contains("wtp")) parse_wtp(j["wtp"], config.wtp);
        if (j.contains("voi")) parse_voi(j["voi"], config);
        if (j.contains("budget_impact")) parse_budget_impact(j["budget_impact"], config.budget_impact);
        if (j.contains("sensitivity")) parse_sensitivity(j["sensitivity"], config);
        config.sensitivity.wtp = config.wtp.policy;
        if (j.contains("two_way")) parse_two_way(j["two_way"], config);
        config.two_way.wtp = config.wtp.policy;
        if (j.contains("scenarios")) parse_scenarios(j["scenarios"], config);

        config.output.directory = resolve_relative_path(config.output.directory, config_path);
        if (j.contains("output")) {
            const json& output = j["output"];
            if (output.contains("directory")) {
                config.output.directory = read_path(output, "directory", config_path);
            }
            if (output.contains("parquet")) config.output.parquet = output["parquet"].get<bool>();
        }
        if (j.contains("logging")) parse_logging(j["logging"], config.logging, config_path);

        // Fail on an invalid grid now rather than after the PSA
        config.wtp_grid();

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Cannot open config file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return parse_run_config_from_string(buffer.str(), file_path);
}

} // namespace cohortcea
