#include "life_table.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace cohortcea {

LifeTable::LifeTable() {
    rates_.fill(0.0);
}

LifeTable LifeTable::constant(double qx) {
    LifeTable table;
    for (size_t age = 0; age <= MAX_AGE; ++age) {
        table.set_qx(age, qx);
    }
    return table;
}

void LifeTable::set_qx(size_t age, double qx) {
    if (age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " + std::to_string(MAX_AGE));
    }
    if (!(qx >= 0.0 && qx <= 1.0)) {
        throw ValidationError("qx must be between 0.0 and 1.0 (age " + std::to_string(age) + ")");
    }
    rates_[age] = qx;
}

double LifeTable::get_qx(size_t age) const {
    if (age > MAX_AGE) {
        throw std::out_of_range("Age " + std::to_string(age) + " exceeds maximum age " + std::to_string(MAX_AGE));
    }
    return rates_[age];
}

double LifeTable::monthly_probability(double age, double multiplier) const {
    const double clamped = std::min(std::max(age, 0.0), static_cast<double>(MAX_AGE));
    const double qx = rates_[static_cast<size_t>(clamped)];

    // Constant force within the year of age
    const double monthly = 1.0 - std::pow(1.0 - qx, 1.0 / 12.0);
    return std::min(monthly * multiplier, 1.0);
}

LifeTable LifeTable::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ValidationError("Cannot open life table file: " + filepath);
    }
    return load_from_csv(file);
}

LifeTable LifeTable::load_from_csv(std::istream& is) {
    CsvReader reader(is);
    reader.read_header();
    const size_t age_col = reader.require_column("age");
    const size_t qx_col = reader.require_column("qx");

    LifeTable table;
    std::array<bool, NUM_AGES> seen{};
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        const std::string context = "life table line " + std::to_string(reader.line_number());
        if (row.size() <= std::max(age_col, qx_col)) {
            throw ValidationError(context + ": too few columns");
        }

        const long age = parse_int(row[age_col], context + " age");
        if (age < 0 || age > static_cast<long>(MAX_AGE)) {
            throw ValidationError(context + ": age " + std::to_string(age) + " outside 0-" + std::to_string(MAX_AGE));
        }
        if (seen[static_cast<size_t>(age)]) {
            throw ValidationError(context + ": duplicate age " + std::to_string(age));
        }
        seen[static_cast<size_t>(age)] = true;
        table.set_qx(static_cast<size_t>(age), parse_double(row[qx_col], context + " qx"));
    }

    // Every age must be given; a gap would read as zero mortality
    for (size_t age = 0; age <= MAX_AGE; ++age) {
        if (!seen[age]) {
            throw ValidationError("Life table is missing age " + std::to_string(age) +
                                  " (ages 0-" + std::to_string(MAX_AGE) + " are required)");
        }
    }
    return table;
}

} // namespace cohortcea
