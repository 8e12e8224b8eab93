#ifndef COHORTCEA_BUDGET_IMPACT_HPP
#define COHORTCEA_BUDGET_IMPACT_HPP

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace cohortcea {

// Tolerance on the per-year share total
constexpr double ADOPTION_SHARE_TOLERANCE = 1e-9;

// Market share of each strategy in each projection year (1-based years).
// A strategy without a share for a year has share 0 in that year.
class AdoptionCurve {
public:
    AdoptionCurve();

    void set_share(const std::string& strategy, int year, double share);
    double share(const std::string& strategy, int year) const;

    // Logistic uptake: max_share / (1 + exp(-steepness * (year - inflection)))
    // for years 1..years
    void add_sigmoid(const std::string& strategy, int years, double max_share,
                     double inflection, double steepness);

    // Last year with any share set (0 when empty)
    int last_year() const;

    std::vector<std::string> strategies() const;
    bool empty() const { return shares_.empty(); }

    // Throws AdoptionOverflowError when a share is outside [0, 1] or the
    // shares of a year sum above 1
    void validate() const;

    // Load from CSV with columns year,strategy,share
    static AdoptionCurve load_from_csv(const std::string& filepath);
    static AdoptionCurve load_from_csv(std::istream& is);

private:
    std::map<std::string, std::map<int, double>> shares_;
};

struct BudgetImpactSettings {
    double population;                          // Eligible population in year 1
    double growth_rate;                         // Annual growth of the eligible population
    int years;                                  // Projection horizon; 0 = last adoption year
    std::map<std::string, double> baseline;     // Pre-adoption mix; empty = 100% reference

    BudgetImpactSettings();
};

struct BudgetImpactRow {
    int year;
    double eligible_population;
    std::vector<double> strategy_cost;          // Population cost per strategy
    double total_cost;
    double baseline_cost;
    double budget_impact;                       // total_cost - baseline_cost
    double cumulative_impact;
};

// Population-level budget trajectory from per-patient costs and adoption
class BudgetImpactProjector {
public:
    BudgetImpactProjector(std::vector<std::string> strategies, const std::string& reference,
                          const BudgetImpactSettings& settings);

    // base * (1 + growth)^(year - 1)
    double eligible_population(int year) const;

    // per_patient_cost is indexed like the strategy list. The adoption curve
    // and baseline mix are validated before any year is projected.
    std::vector<BudgetImpactRow> project(const AdoptionCurve& adoption,
                                         const std::vector<double>& per_patient_cost) const;

    const std::vector<std::string>& strategies() const { return strategies_; }

private:
    std::vector<std::string> strategies_;
    std::string reference_;
    BudgetImpactSettings settings_;
};

} // namespace cohortcea

#endif // COHORTCEA_BUDGET_IMPACT_HPP
