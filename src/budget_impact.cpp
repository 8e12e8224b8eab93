#include "budget_impact.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cohortcea {

// ============================================================================
// AdoptionCurve Implementation
// ============================================================================

AdoptionCurve::AdoptionCurve() = default;

void AdoptionCurve::set_share(const std::string& strategy, int year, double share) {
    if (strategy.empty()) {
        throw ValidationError("Adoption share needs a strategy");
    }
    if (year < 1) {
        throw ValidationError("Adoption year must be at least 1, got " + std::to_string(year));
    }
    shares_[strategy][year] = share;
}

double AdoptionCurve::share(const std::string& strategy, int year) const {
    auto it = shares_.find(strategy);
    if (it == shares_.end()) {
        return 0.0;
    }
    auto year_it = it->second.find(year);
    return year_it == it->second.end() ? 0.0 : year_it->second;
}

void AdoptionCurve::add_sigmoid(const std::string& strategy, int years, double max_share,
                                double inflection, double steepness) {
    if (!(max_share >= 0.0 && max_share <= 1.0)) {
        throw ValidationError("Sigmoid maximum share must be in [0, 1]");
    }
    for (int year = 1; year <= years; ++year) {
        set_share(strategy, year, max_share / (1.0 + std::exp(-steepness * (year - inflection))));
    }
}

int AdoptionCurve::last_year() const {
    int last = 0;
    for (const auto& [strategy, by_year] : shares_) {
        if (!by_year.empty()) {
            last = std::max(last, by_year.rbegin()->first);
        }
    }
    return last;
}

std::vector<std::string> AdoptionCurve::strategies() const {
    std::vector<std::string> names;
    for (const auto& [strategy, by_year] : shares_) {
        names.push_back(strategy);
    }
    return names;
}

void AdoptionCurve::validate() const {
    std::map<int, double> totals;
    for (const auto& [strategy, by_year] : shares_) {
        for (const auto& [year, share] : by_year) {
            if (!(share >= 0.0 && share <= 1.0)) {
                std::ostringstream msg;
                msg << "Adoption share for " << strategy << " in year " << year
                    << " is outside [0, 1]: " << share;
                throw AdoptionOverflowError(year, share, msg.str());
            }
            totals[year] += share;
        }
    }
    for (const auto& [year, total] : totals) {
        if (total > 1.0 + ADOPTION_SHARE_TOLERANCE) {
            std::ostringstream msg;
            msg << "Adoption shares in year " << year << " sum to " << total << " (must not exceed 1)";
            throw AdoptionOverflowError(year, total, msg.str());
        }
    }
}

AdoptionCurve AdoptionCurve::load_from_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ValidationError("Cannot open adoption file: " + filepath);
    }
    return load_from_csv(file);
}

AdoptionCurve AdoptionCurve::load_from_csv(std::istream& is) {
    AdoptionCurve curve;
    CsvReader reader(is);
    reader.read_header();
    const size_t year_col = reader.require_column("year");
    const size_t strategy_col = reader.require_column("strategy");
    const size_t share_col = reader.require_column("share");

    std::set<std::pair<std::string, long>> seen;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        const std::string context = "adoption.csv line " + std::to_string(reader.line_number());
        if (row.size() <= std::max({year_col, strategy_col, share_col})) {
            throw ValidationError(context + ": too few columns");
        }
        long year = parse_int(row[year_col], context + " year");
        double share = parse_double(row[share_col], context + " share");
        if (!seen.insert({row[strategy_col], year}).second) {
            throw ValidationError(context + ": duplicate share for " + row[strategy_col] +
                                  " in year " + std::to_string(year));
        }
        curve.set_share(row[strategy_col], static_cast<int>(year), share);
    }
    return curve;
}

// ============================================================================
// BudgetImpactProjector Implementation
// ============================================================================

BudgetImpactSettings::BudgetImpactSettings()
    : population(0.0), growth_rate(0.0), years(0) {}

BudgetImpactProjector::BudgetImpactProjector(std::vector<std::string> strategies,
                                             const std::string& reference,
                                             const BudgetImpactSettings& settings)
    : strategies_(std::move(strategies)), reference_(reference), settings_(settings) {
    if (std::find(strategies_.begin(), strategies_.end(), reference_) == strategies_.end()) {
        throw ValidationError("Budget impact reference '" + reference_ + "' is not a strategy");
    }
    if (!(settings_.population >= 0.0)) {
        throw ValidationError("Eligible population must be non-negative");
    }
    if (!(settings_.growth_rate > -1.0)) {
        throw ValidationError("Population growth rate must be greater than -1");
    }
    if (settings_.years < 0) {
        throw ValidationError("Budget impact years must be non-negative");
    }
}

double BudgetImpactProjector::eligible_population(int year) const {
    return settings_.population * std::pow(1.0 + settings_.growth_rate, year - 1);
}

std::vector<BudgetImpactRow> BudgetImpactProjector::project(const AdoptionCurve& adoption,
                                                            const std::vector<double>& per_patient_cost) const {
    if (per_patient_cost.size() != strategies_.size()) {
        throw std::invalid_argument("Per-patient costs do not match the strategy list");
    }

    // --- Validation before any projection ---
    adoption.validate();
    for (const auto& name : adoption.strategies()) {
        if (std::find(strategies_.begin(), strategies_.end(), name) == strategies_.end()) {
            throw ValidationError("Adoption curve references unknown strategy '" + name + "'");
        }
    }

    std::map<std::string, double> baseline = settings_.baseline;
    if (baseline.empty()) {
        baseline[reference_] = 1.0;
    }
    double baseline_total = 0.0;
    for (const auto& [name, share] : baseline) {
        if (std::find(strategies_.begin(), strategies_.end(), name) == strategies_.end()) {
            throw ValidationError("Baseline mix references unknown strategy '" + name + "'");
        }
        if (!(share >= 0.0 && share <= 1.0)) {
            throw AdoptionOverflowError(0, share, "Baseline share for " + name + " is outside [0, 1]");
        }
        baseline_total += share;
    }
    if (baseline_total > 1.0 + ADOPTION_SHARE_TOLERANCE) {
        std::ostringstream msg;
        msg << "Baseline shares sum to " << baseline_total << " (must not exceed 1)";
        throw AdoptionOverflowError(0, baseline_total, msg.str());
    }

    // Per-patient cost of the baseline mix
    double baseline_per_patient = 0.0;
    for (size_t s = 0; s < strategies_.size(); ++s) {
        auto it = baseline.find(strategies_[s]);
        if (it != baseline.end()) {
            baseline_per_patient += it->second * per_patient_cost[s];
        }
    }

    const int years = settings_.years > 0 ? settings_.years : adoption.last_year();

    std::vector<BudgetImpactRow> rows;
    rows.reserve(static_cast<size_t>(std::max(years, 0)));
    double cumulative = 0.0;
    for (int year = 1; year <= years; ++year) {
        BudgetImpactRow row;
        row.year = year;
        row.eligible_population = eligible_population(year);
        row.total_cost = 0.0;
        for (size_t s = 0; s < strategies_.size(); ++s) {
            double cost = row.eligible_population * adoption.share(strategies_[s], year) * per_patient_cost[s];
            row.strategy_cost.push_back(cost);
            row.total_cost += cost;
        }
        row.baseline_cost = row.eligible_population * baseline_per_patient;
        row.budget_impact = row.total_cost - row.baseline_cost;
        cumulative += row.budget_impact;
        row.cumulative_impact = cumulative;
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace cohortcea
