#include "parameter.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

namespace cohortcea {

// ============================================================================
// Parameter Implementation
// ============================================================================

Parameter::Parameter(std::string n, Distribution dist)
    : name(std::move(n)), owner(SHARED_OWNER), distribution(std::move(dist)) {}

Parameter::Parameter(std::string n, std::string own, Distribution dist,
                     std::string juris, std::string group)
    : name(std::move(n)),
      owner(own.empty() ? std::string(SHARED_OWNER) : std::move(own)),
      jurisdiction(std::move(juris)),
      distribution(std::move(dist)),
      correlation_group(std::move(group)) {}

// ============================================================================
// ParameterTable Implementation
// ============================================================================

ParameterTable::ParameterTable() = default;

void ParameterTable::add(const Parameter& parameter) {
    if (parameter.name.empty()) {
        throw ValidationError("Parameter name must not be empty");
    }
    if (index_.count(parameter.name) > 0) {
        throw ValidationError("Duplicate parameter: " + parameter.name);
    }
    index_[parameter.name] = parameters_.size();
    parameters_.push_back(parameter);
}

const Parameter& ParameterTable::get(size_t index) const {
    if (index >= parameters_.size()) {
        throw std::out_of_range("Parameter index out of range");
    }
    return parameters_[index];
}

const Parameter& ParameterTable::get(const std::string& name) const {
    return parameters_[index_of(name)];
}

bool ParameterTable::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

size_t ParameterTable::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw ValidationError("Unknown parameter: " + name);
    }
    return it->second;
}

ParameterTable ParameterTable::load_from_csv(const std::string& filepath, const std::string& jurisdiction) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ValidationError("Cannot open parameter file: " + filepath);
    }
    return load_from_csv(file, jurisdiction);
}

ParameterTable ParameterTable::load_from_csv(std::istream& is, const std::string& jurisdiction) {
    CsvReader reader(is);
    reader.read_header();

    const size_t name_col = reader.require_column("parameter_name");
    const size_t owner_col = reader.require_column("owning_strategy");
    const size_t type_col = reader.require_column("distribution_type");
    const size_t p1_col = reader.require_column("param1");
    const int p2_col = reader.column("param2");
    const int juris_col = reader.column("jurisdiction");
    const int group_col = reader.column("correlation_group");

    // Rows kept in first-seen order; jurisdiction-specific rows replace
    // all-jurisdiction rows in place so declaration order stays stable.
    std::vector<Parameter> rows;
    std::vector<bool> specific;
    std::unordered_map<std::string, size_t> seen;

    auto cell = [](const std::vector<std::string>& row, int col) -> std::string {
        if (col < 0 || static_cast<size_t>(col) >= row.size()) {
            return "";
        }
        return row[static_cast<size_t>(col)];
    };

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) continue;

        const std::string context = "parameters.csv line " + std::to_string(reader.line_number());
        if (row.size() <= std::max({name_col, owner_col, type_col, p1_col})) {
            throw ValidationError(context + ": too few columns");
        }

        const std::string name = row[name_col];
        std::string row_juris = cell(row, juris_col);
        std::string juris_key = row_juris;
        std::transform(juris_key.begin(), juris_key.end(), juris_key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        bool applies_everywhere = juris_key.empty() || juris_key == "all";

        if (!applies_everywhere && row_juris != jurisdiction) {
            continue;
        }

        double p1 = parse_double(row[p1_col], context + " param1");
        std::string p2_text = cell(row, p2_col);
        double p2 = p2_text.empty() ? 0.0 : parse_double(p2_text, context + " param2");

        Distribution dist = Distribution::fixed(0.0);
        try {
            dist = Distribution::from_row(row[type_col], p1, p2);
        } catch (const DistributionError& e) {
            throw DistributionError("Parameter '" + name + "' (" + context + "): " + e.what());
        }

        Parameter parameter(name, row[owner_col], dist,
                            applies_everywhere ? "" : row_juris, cell(row, group_col));

        auto it = seen.find(name);
        if (it == seen.end()) {
            seen[name] = rows.size();
            rows.push_back(std::move(parameter));
            specific.push_back(!applies_everywhere);
        } else if (!applies_everywhere && !specific[it->second]) {
            rows[it->second] = std::move(parameter);
            specific[it->second] = true;
        } else if (applies_everywhere == !specific[it->second]) {
            throw ValidationError("Duplicate parameter: " + name + " (" + context + ")");
        }
        // An all-jurisdiction row after a specific row is shadowed
    }

    ParameterTable table;
    for (const auto& p : rows) {
        table.add(p);
    }
    return table;
}

// ============================================================================
// ParameterValues Implementation
// ============================================================================

ParameterValues::ParameterValues(const ParameterTable& table, std::vector<double> values)
    : table_(&table), values_(std::move(values)) {
    if (values_.size() != table.size()) {
        throw std::invalid_argument("ParameterValues size does not match parameter table");
    }
}

ParameterValues ParameterValues::base_case(const ParameterTable& table) {
    std::vector<double> values;
    values.reserve(table.size());
    for (const auto& p : table.parameters()) {
        values.push_back(p.distribution.mean());
    }
    return ParameterValues(table, std::move(values));
}

double ParameterValues::get(const std::string& name) const {
    return values_[table_->index_of(name)];
}

void ParameterValues::set(size_t index, double value) {
    if (index >= values_.size()) {
        throw std::out_of_range("Parameter index out of range");
    }
    values_[index] = value;
}

void ParameterValues::set(const std::string& name, double value) {
    values_[table_->index_of(name)] = value;
}

} // namespace cohortcea
