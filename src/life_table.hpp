#ifndef COHORTCEA_LIFE_TABLE_HPP
#define COHORTCEA_LIFE_TABLE_HPP

#include <array>
#include <cstddef>
#include <istream>
#include <string>

namespace cohortcea {

// LifeTable: general-population annual mortality qx by age (0-120)
// qx = probability of death within one year for a person aged x
class LifeTable {
public:
    static constexpr size_t MAX_AGE = 120;
    static constexpr size_t NUM_AGES = MAX_AGE + 1;  // 0 to 120 inclusive

    LifeTable();

    // Constant qx at every age
    static LifeTable constant(double qx);

    void set_qx(size_t age, double qx);
    double get_qx(size_t age) const;

    // Monthly death probability at a (fractional) age with an excess
    // mortality multiplier applied: 1 - (1 - qx)^(1/12), scaled and capped
    // at 1. Ages above MAX_AGE use the MAX_AGE rate.
    double monthly_probability(double age, double multiplier = 1.0) const;

    // Load from CSV: expects columns age,qx with exactly one row for every
    // age 0-MAX_AGE. Throws ValidationError on a missing or duplicate age.
    static LifeTable load_from_csv(const std::string& filepath);
    static LifeTable load_from_csv(std::istream& is);

private:
    std::array<double, NUM_AGES> rates_;
};

} // namespace cohortcea

#endif // COHORTCEA_LIFE_TABLE_HPP
