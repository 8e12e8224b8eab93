#ifndef COHORTCEA_STRATEGY_HPP
#define COHORTCEA_STRATEGY_HPP

#include "life_table.hpp"
#include "parameter.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <functional>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cohortcea {

// Monthly transition probabilities of an n-state model. Entry (i, j) is the
// probability of moving from state i to state j.
using TransitionMatrix = Eigen::MatrixXd;

// All-zero n x n matrix, filled in by the strategy
inline TransitionMatrix zero_transitions(size_t num_states) {
    const auto n = static_cast<Eigen::Index>(num_states);
    return TransitionMatrix::Zero(n, n);
}

// True when the state keeps all of its mass (P[i][i] == 1)
inline bool is_absorbing(const TransitionMatrix& p, size_t state) {
    const auto i = static_cast<Eigen::Index>(state);
    return p(i, i) == 1.0;
}

// Signatures of the functions a strategy supplies to the simulator
using TransitionFn = std::function<TransitionMatrix(int cycle, const ParameterValues& values)>;
using StateValueFn = std::function<double(size_t state, int cycle, const ParameterValues& values)>;
using OneTimeCostFn = std::function<double(int cycle, const ParameterValues& values)>;

// One competing treatment strategy.
//
// cost() returns the cost of one cycle spent in a state; utility() returns
// the annual utility weight of a state (the aggregator converts it to a
// monthly QALY contribution). one_time_cost() is charged once at the cycle it
// returns non-zero for, on top of the state costs. societal_cost() is
// optional: the per-cycle cost of a state that falls outside the health
// system, counted only under the societal perspective.
struct StrategyArm {
    std::string id;
    std::vector<std::string> state_names;
    std::vector<std::string> required_parameters;
    size_t initial_state;

    TransitionFn transition;
    StateValueFn cost;
    StateValueFn utility;
    OneTimeCostFn one_time_cost;
    StateValueFn societal_cost;     // Empty means no societal costs

    StrategyArm();
    explicit StrategyArm(std::string arm_id);

    size_t num_states() const { return state_names.size(); }
};

// Explicit, typed set of strategies built once at configuration time.
// Strategies keep their insertion order; that order is the strategy index
// used everywhere else (outcomes, CEAC tie-breaks, output rows).
class StrategyRegistry {
public:
    StrategyRegistry();

    // Add a strategy; throws ValidationError on a duplicate or empty id
    void add(StrategyArm arm);

    // Check every strategy is complete against the parameter table and that
    // the reference strategy exists. Throws ValidationError naming the first
    // problem found.
    void validate(const ParameterTable& table, const std::string& reference) const;

    const StrategyArm& get(size_t index) const;
    const StrategyArm& get(const std::string& id) const;
    size_t index_of(const std::string& id) const;
    bool contains(const std::string& id) const;

    size_t size() const { return arms_.size(); }
    bool empty() const { return arms_.empty(); }

    const std::vector<StrategyArm>& arms() const { return arms_; }
    std::vector<std::string> ids() const;

private:
    std::vector<StrategyArm> arms_;
    std::unordered_map<std::string, size_t> index_;
};

// ============================================================================
// Table-driven depression model
// ============================================================================

// Health states of the default model
enum DepressionState : size_t {
    Depressed = 0,
    Remission = 1,
    Death = 2
};

constexpr size_t DEPRESSION_NUM_STATES = 3;

// Model structure shared by every strategy of a run
struct ModelSettings {
    int cycles;                     // Monthly cycles in the horizon
    double start_age;               // Cohort age at cycle 0
    int relapse_tunnel_months;      // Cycles using the early relapse rate

    ModelSettings();
};

// A strategy-table cell: a numeric literal or a reference to a parameter
struct ValueRef {
    double literal;
    int parameter_index;            // -1 for a literal
    std::string parameter_name;

    ValueRef();
    static ValueRef constant(double value);

    // Parse a cell; anything that is not a number must name a parameter
    static ValueRef parse(const std::string& cell, const ParameterTable& table,
                          const std::string& context);

    bool is_literal() const { return parameter_index < 0; }
    double resolve(const ParameterValues& values) const;
};

// One row of strategies.csv after parsing
struct DepressionArmSpec {
    std::string id;
    ValueRef acute_remission;       // Probability of remission in cycle 0
    ValueRef monthly_remission;     // Monthly remission probability after cycle 0
    ValueRef relapse_early;         // Monthly relapse inside the tunnel
    ValueRef relapse_late;          // Monthly relapse after the tunnel
    ValueRef one_time_cost;         // Treatment course cost charged at cycle 0
    ValueRef mortality_multiplier;  // Excess mortality ratio on the life table

    // Per-cycle cost, annual utility and per-cycle societal cost, indexed by
    // DepressionState
    std::vector<ValueRef> state_cost;
    std::vector<ValueRef> state_utility;
    std::vector<ValueRef> state_societal_cost;

    DepressionArmSpec();
};

// Name of a depression model state ("Depressed", "Remission", "Death")
const char* depression_state_name(size_t state);

// Build the arm for one strategy of the depression model. The life table is
// copied into the arm so the registry owns everything it needs.
StrategyArm make_depression_arm(const DepressionArmSpec& spec,
                                const LifeTable& life_table,
                                const ModelSettings& settings);

// Parse strategies.csv and state_values.csv into arm specifications,
// resolving parameter references against the table. Literal probabilities
// must lie in [0, 1]; literal costs, utilities and multipliers must be
// non-negative. The societal_cost column of state_values.csv is optional and
// an empty cell means zero.
std::vector<DepressionArmSpec> load_depression_specs(std::istream& strategies,
                                                     std::istream& state_values,
                                                     const ParameterTable& table);

// Load both tables from disk and build a registry in strategies.csv order
StrategyRegistry load_depression_registry(const std::string& strategies_path,
                                          const std::string& state_values_path,
                                          const ParameterTable& table,
                                          const LifeTable& life_table,
                                          const ModelSettings& settings);

} // namespace cohortcea

#endif // COHORTCEA_STRATEGY_HPP
