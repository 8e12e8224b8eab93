#ifndef COHORTCEA_PARAMETER_HPP
#define COHORTCEA_PARAMETER_HPP

#include "distribution.hpp"
#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cohortcea {

// Owner tag for parameters that are not specific to one strategy
constexpr const char* SHARED_OWNER = "shared";

// An uncertain model input. The realized value for an iteration is held in
// ParameterValues, never on the Parameter, so a ParameterTable can be shared
// read-only across worker threads.
struct Parameter {
    std::string name;
    std::string owner;              // Owning strategy or "shared"
    std::string jurisdiction;       // Empty = applies to every jurisdiction
    Distribution distribution;
    std::string correlation_group;  // Empty = independent draw

    Parameter(std::string n, Distribution dist);
    Parameter(std::string n, std::string own, Distribution dist,
              std::string juris = "", std::string group = "");

    bool is_correlated() const { return !correlation_group.empty(); }
};

// Ordered, name-unique set of parameters for one jurisdiction
class ParameterTable {
public:
    ParameterTable();

    // Add a parameter; throws ValidationError on a duplicate name
    void add(const Parameter& parameter);

    const Parameter& get(size_t index) const;
    const Parameter& get(const std::string& name) const;

    bool contains(const std::string& name) const;

    // Index of a parameter by name; throws ValidationError when missing
    size_t index_of(const std::string& name) const;

    size_t size() const { return parameters_.size(); }
    bool empty() const { return parameters_.empty(); }

    const std::vector<Parameter>& parameters() const { return parameters_; }

    // Load from CSV with columns:
    //   parameter_name,owning_strategy,distribution_type,param1,param2,jurisdiction[,correlation_group]
    // Rows whose jurisdiction is empty or "all" apply everywhere; a row for the
    // requested jurisdiction overrides an all-jurisdiction row with the same
    // name. Rows for other jurisdictions are skipped.
    static ParameterTable load_from_csv(const std::string& filepath, const std::string& jurisdiction);
    static ParameterTable load_from_csv(std::istream& is, const std::string& jurisdiction);

private:
    std::vector<Parameter> parameters_;
    std::unordered_map<std::string, size_t> index_;
};

// One realization of every parameter in a table
class ParameterValues {
public:
    ParameterValues(const ParameterTable& table, std::vector<double> values);

    // Every parameter at its distribution mean (the deterministic base case)
    static ParameterValues base_case(const ParameterTable& table);

    double operator[](size_t index) const { return values_[index]; }
    double get(const std::string& name) const;

    void set(size_t index, double value);
    void set(const std::string& name, double value);

    size_t size() const { return values_.size(); }

    const std::vector<double>& values() const { return values_; }
    const ParameterTable& table() const { return *table_; }

private:
    const ParameterTable* table_;
    std::vector<double> values_;
};

} // namespace cohortcea

#endif // COHORTCEA_PARAMETER_HPP
