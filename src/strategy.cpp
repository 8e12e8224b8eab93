#include "strategy.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace cohortcea {

// ============================================================================
// StrategyArm / StrategyRegistry Implementation
// ============================================================================

StrategyArm::StrategyArm() : initial_state(0) {}

StrategyArm::StrategyArm(std::string arm_id) : id(std::move(arm_id)), initial_state(0) {}

StrategyRegistry::StrategyRegistry() = default;

void StrategyRegistry::add(StrategyArm arm) {
    if (arm.id.empty()) {
        throw ValidationError("Strategy id must not be empty");
    }
    if (index_.count(arm.id) > 0) {
        throw ValidationError("Duplicate strategy: " + arm.id);
    }
    index_[arm.id] = arms_.size();
    arms_.push_back(std::move(arm));
}

void StrategyRegistry::validate(const ParameterTable& table, const std::string& reference) const {
    if (arms_.empty()) {
        throw ValidationError("No strategies registered");
    }

    for (const auto& arm : arms_) {
        const std::string prefix = "Strategy '" + arm.id + "': ";
        if (arm.state_names.empty()) {
            throw ValidationError(prefix + "no health states defined");
        }
        if (arm.initial_state >= arm.num_states()) {
            throw ValidationError(prefix + "initial state out of range");
        }
        if (!arm.transition) {
            throw ValidationError(prefix + "missing transition definition");
        }
        if (!arm.cost) {
            throw ValidationError(prefix + "missing cost definition");
        }
        if (!arm.utility) {
            throw ValidationError(prefix + "missing utility definition");
        }
        if (!arm.one_time_cost) {
            throw ValidationError(prefix + "missing one-time cost definition");
        }
        for (const auto& name : arm.required_parameters) {
            if (!table.contains(name)) {
                throw ValidationError(prefix + "requires unknown parameter '" + name + "'");
            }
        }
    }

    if (reference.empty()) {
        throw ValidationError("Reference strategy not set");
    }
    if (!contains(reference)) {
        throw ValidationError("Reference strategy '" + reference + "' is not registered");
    }
}

const StrategyArm& StrategyRegistry::get(size_t index) const {
    if (index >= arms_.size()) {
        throw std::out_of_range("Strategy index out of range");
    }
    return arms_[index];
}

const StrategyArm& StrategyRegistry::get(const std::string& id) const {
    return arms_[index_of(id)];
}

size_t StrategyRegistry::index_of(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        throw ValidationError("Unknown strategy: " + id);
    }
    return it->second;
}

bool StrategyRegistry::contains(const std::string& id) const {
    return index_.count(id) > 0;
}

std::vector<std::string> StrategyRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(arms_.size());
    for (const auto& arm : arms_) {
        result.push_back(arm.id);
    }
    return result;
}

// ============================================================================
// Depression Model Implementation
// ============================================================================

ModelSettings::ModelSettings()
    : cycles(120), start_age(40.0), relapse_tunnel_months(6) {}

ValueRef::ValueRef() : literal(0.0), parameter_index(-1) {}

ValueRef ValueRef::constant(double value) {
    ValueRef ref;
    ref.literal = value;
    return ref;
}

ValueRef ValueRef::parse(const std::string& cell, const ParameterTable& table,
                         const std::string& context) {
    const std::string text = CsvReader::trim(cell);
    if (text.empty()) {
        throw ValidationError(context + ": empty value");
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != nullptr && *end == '\0') {
        return constant(value);
    }

    if (!table.contains(text)) {
        throw ValidationError(context + ": '" + text + "' is neither a number nor a known parameter");
    }
    ValueRef ref;
    ref.parameter_index = static_cast<int>(table.index_of(text));
    ref.parameter_name = text;
    return ref;
}

double ValueRef::resolve(const ParameterValues& values) const {
    if (parameter_index < 0) {
        return literal;
    }
    return values[static_cast<size_t>(parameter_index)];
}

DepressionArmSpec::DepressionArmSpec()
    : mortality_multiplier(ValueRef::constant(1.0)),
      state_cost(DEPRESSION_NUM_STATES, ValueRef::constant(0.0)),
      state_utility(DEPRESSION_NUM_STATES, ValueRef::constant(0.0)),
      state_societal_cost(DEPRESSION_NUM_STATES, ValueRef::constant(0.0)) {}

const char* depression_state_name(size_t state) {
    switch (state) {
        case Depressed: return "Depressed";
        case Remission: return "Remission";
        case Death: return "Death";
        default: return "Unknown";
    }
}

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int parse_state(const std::string& name) {
    const std::string key = to_lower(CsvReader::trim(name));
    for (size_t s = 0; s < DEPRESSION_NUM_STATES; ++s) {
        if (key == to_lower(depression_state_name(s))) {
            return static_cast<int>(s);
        }
    }
    return -1;
}

void require_probability(const ValueRef& ref, const std::string& context) {
    if (ref.is_literal() && !(ref.literal >= 0.0 && ref.literal <= 1.0)) {
        throw ValidationError(context + ": probability must be in [0, 1], got " + std::to_string(ref.literal));
    }
}

void require_non_negative(const ValueRef& ref, const std::string& context) {
    if (ref.is_literal() && !(ref.literal >= 0.0)) {
        throw ValidationError(context + ": value must be non-negative, got " + std::to_string(ref.literal));
    }
}

void collect_parameter(const ValueRef& ref, std::vector<std::string>& names) {
    if (ref.is_literal()) return;
    if (std::find(names.begin(), names.end(), ref.parameter_name) == names.end()) {
        names.push_back(ref.parameter_name);
    }
}

std::string cell_or_empty(const std::vector<std::string>& row, int col) {
    if (col < 0 || static_cast<size_t>(col) >= row.size()) {
        return "";
    }
    return row[static_cast<size_t>(col)];
}

} // anonymous namespace

StrategyArm make_depression_arm(const DepressionArmSpec& spec,
                                const LifeTable& life_table,
                                const ModelSettings& settings) {
    StrategyArm arm(spec.id);
    for (size_t s = 0; s < DEPRESSION_NUM_STATES; ++s) {
        arm.state_names.push_back(depression_state_name(s));
    }
    arm.initial_state = Depressed;

    collect_parameter(spec.acute_remission, arm.required_parameters);
    collect_parameter(spec.monthly_remission, arm.required_parameters);
    collect_parameter(spec.relapse_early, arm.required_parameters);
    collect_parameter(spec.relapse_late, arm.required_parameters);
    collect_parameter(spec.one_time_cost, arm.required_parameters);
    collect_parameter(spec.mortality_multiplier, arm.required_parameters);
    for (size_t s = 0; s < DEPRESSION_NUM_STATES; ++s) {
        collect_parameter(spec.state_cost[s], arm.required_parameters);
        collect_parameter(spec.state_utility[s], arm.required_parameters);
        collect_parameter(spec.state_societal_cost[s], arm.required_parameters);
    }

    arm.transition = [spec, life_table, settings](int cycle, const ParameterValues& values) {
        const double age = settings.start_age + cycle / 12.0;
        const double death = life_table.monthly_probability(age, spec.mortality_multiplier.resolve(values));

        // First cycle is the acute treatment course
        const double remission = cycle == 0
            ? spec.acute_remission.resolve(values)
            : spec.monthly_remission.resolve(values);

        // Relapse hazard is higher inside the post-treatment tunnel
        const double relapse = cycle < settings.relapse_tunnel_months
            ? spec.relapse_early.resolve(values)
            : spec.relapse_late.resolve(values);

        // Death competes with every other move: non-death moves scaled by (1 - d)
        const double survive = 1.0 - death;

        TransitionMatrix p = zero_transitions(DEPRESSION_NUM_STATES);
        p(Depressed, Depressed) = survive * (1.0 - remission);
        p(Depressed, Remission) = survive * remission;
        p(Depressed, Death) = death;

        p(Remission, Depressed) = survive * relapse;
        p(Remission, Remission) = survive * (1.0 - relapse);
        p(Remission, Death) = death;

        p(Death, Death) = 1.0;
        return p;
    };

    const std::vector<ValueRef> costs = spec.state_cost;
    arm.cost = [costs](size_t state, int, const ParameterValues& values) {
        return costs.at(state).resolve(values);
    };

    const std::vector<ValueRef> utilities = spec.state_utility;
    arm.utility = [utilities](size_t state, int, const ParameterValues& values) {
        return utilities.at(state).resolve(values);
    };

    const std::vector<ValueRef> societal = spec.state_societal_cost;
    arm.societal_cost = [societal](size_t state, int, const ParameterValues& values) {
        return societal.at(state).resolve(values);
    };

    const ValueRef course_cost = spec.one_time_cost;
    arm.one_time_cost = [course_cost](int cycle, const ParameterValues& values) {
        return cycle == 0 ? course_cost.resolve(values) : 0.0;
    };

    return arm;
}

std::vector<DepressionArmSpec> load_depression_specs(std::istream& strategies,
                                                     std::istream& state_values,
                                                     const ParameterTable& table) {
    std::vector<DepressionArmSpec> specs;
    std::unordered_map<std::string, size_t> by_id;

    // --- strategies.csv ---
    {
        CsvReader reader(strategies);
        reader.read_header();
        const size_t id_col = reader.require_column("strategy");
        const size_t acute_col = reader.require_column("acute_remission");
        const size_t monthly_col = reader.require_column("monthly_remission");
        const size_t early_col = reader.require_column("relapse_early");
        const size_t late_col = reader.require_column("relapse_late");
        const size_t course_col = reader.require_column("one_time_cost");
        const int multiplier_col = reader.column("mortality_multiplier");

        while (reader.has_more()) {
            auto row = reader.read_row();
            if (row.empty()) continue;

            const std::string line = "strategies.csv line " + std::to_string(reader.line_number());
            if (row.size() <= std::max({id_col, acute_col, monthly_col, early_col, late_col, course_col})) {
                throw ValidationError(line + ": too few columns");
            }

            DepressionArmSpec spec;
            spec.id = row[id_col];
            if (spec.id.empty()) {
                throw ValidationError(line + ": strategy id must not be empty");
            }
            if (by_id.count(spec.id) > 0) {
                throw ValidationError(line + ": duplicate strategy '" + spec.id + "'");
            }

            const std::string context = line + " (" + spec.id + ")";
            spec.acute_remission = ValueRef::parse(row[acute_col], table, context + " acute_remission");
            spec.monthly_remission = ValueRef::parse(row[monthly_col], table, context + " monthly_remission");
            spec.relapse_early = ValueRef::parse(row[early_col], table, context + " relapse_early");
            spec.relapse_late = ValueRef::parse(row[late_col], table, context + " relapse_late");
            spec.one_time_cost = ValueRef::parse(row[course_col], table, context + " one_time_cost");

            const std::string multiplier = cell_or_empty(row, multiplier_col);
            if (!multiplier.empty()) {
                spec.mortality_multiplier = ValueRef::parse(multiplier, table, context + " mortality_multiplier");
            }

            require_probability(spec.acute_remission, context + " acute_remission");
            require_probability(spec.monthly_remission, context + " monthly_remission");
            require_probability(spec.relapse_early, context + " relapse_early");
            require_probability(spec.relapse_late, context + " relapse_late");
            require_non_negative(spec.one_time_cost, context + " one_time_cost");
            require_non_negative(spec.mortality_multiplier, context + " mortality_multiplier");

            by_id[spec.id] = specs.size();
            specs.push_back(std::move(spec));
        }
    }

    if (specs.empty()) {
        throw ValidationError("strategies.csv defines no strategies");
    }

    // --- state_values.csv ---
    std::vector<std::vector<bool>> seen(specs.size(), std::vector<bool>(DEPRESSION_NUM_STATES, false));
    {
        CsvReader reader(state_values);
        reader.read_header();
        const size_t id_col = reader.require_column("strategy");
        const size_t state_col = reader.require_column("state");
        const size_t cost_col = reader.require_column("cost");
        const size_t utility_col = reader.require_column("utility");
        const int societal_col = reader.column("societal_cost");

        while (reader.has_more()) {
            auto row = reader.read_row();
            if (row.empty()) continue;

            const std::string line = "state_values.csv line " + std::to_string(reader.line_number());
            if (row.size() <= std::max({id_col, state_col, cost_col, utility_col})) {
                throw ValidationError(line + ": too few columns");
            }

            auto it = by_id.find(row[id_col]);
            if (it == by_id.end()) {
                throw ValidationError(line + ": unknown strategy '" + row[id_col] + "'");
            }
            int state = parse_state(row[state_col]);
            if (state < 0) {
                throw ValidationError(line + ": unknown health state '" + row[state_col] + "'");
            }
            const size_t s = static_cast<size_t>(state);
            if (seen[it->second][s]) {
                throw ValidationError(line + ": duplicate values for " + row[id_col] + "/" + row[state_col]);
            }
            seen[it->second][s] = true;

            DepressionArmSpec& spec = specs[it->second];
            const std::string context = line + " (" + spec.id + "/" + depression_state_name(s) + ")";
            spec.state_cost[s] = ValueRef::parse(row[cost_col], table, context + " cost");
            spec.state_utility[s] = ValueRef::parse(row[utility_col], table, context + " utility");
            require_non_negative(spec.state_cost[s], context + " cost");
            require_non_negative(spec.state_utility[s], context + " utility");

            const std::string societal = cell_or_empty(row, societal_col);
            if (!CsvReader::trim(societal).empty()) {
                spec.state_societal_cost[s] = ValueRef::parse(societal, table, context + " societal_cost");
                require_non_negative(spec.state_societal_cost[s], context + " societal_cost");
            }
        }
    }

    // Death defaults to zero cost and utility; living states must be given
    for (size_t i = 0; i < specs.size(); ++i) {
        for (size_t s : {static_cast<size_t>(Depressed), static_cast<size_t>(Remission)}) {
            if (!seen[i][s]) {
                throw ValidationError("Strategy '" + specs[i].id + "': no cost/utility for state " +
                                      depression_state_name(s));
            }
        }
    }

    return specs;
}

StrategyRegistry load_depression_registry(const std::string& strategies_path,
                                          const std::string& state_values_path,
                                          const ParameterTable& table,
                                          const LifeTable& life_table,
                                          const ModelSettings& settings) {
    std::ifstream strategies(strategies_path);
    if (!strategies.is_open()) {
        throw ValidationError("Cannot open strategy file: " + strategies_path);
    }
    std::ifstream state_values(state_values_path);
    if (!state_values.is_open()) {
        throw ValidationError("Cannot open state values file: " + state_values_path);
    }

    StrategyRegistry registry;
    for (const auto& spec : load_depression_specs(strategies, state_values, table)) {
        registry.add(make_depression_arm(spec, life_table, settings));
    }
    return registry;
}

} // namespace cohortcea
