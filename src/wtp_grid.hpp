#ifndef COHORTCEA_WTP_GRID_HPP
#define COHORTCEA_WTP_GRID_HPP

#include <cstddef>
#include <vector>

namespace cohortcea {

// Ascending willingness-to-pay thresholds (currency per QALY)
class WTPGrid {
public:
    // lower, lower + step, ... up to upper. Upper is included when it is
    // reached within 1e-9 * step. Throws ValidationError when step <= 0,
    // upper < lower or lower < 0.
    static WTPGrid range(double lower, double upper, double step);

    // Explicit thresholds; sorted and de-duplicated. Throws ValidationError
    // when empty or any value is negative or non-finite.
    static WTPGrid from_values(std::vector<double> values);

    size_t size() const { return values_.size(); }
    double operator[](size_t index) const { return values_[index]; }
    const std::vector<double>& values() const { return values_; }

    // Index of the grid point closest to w
    size_t nearest_index(double w) const;

private:
    explicit WTPGrid(std::vector<double> values);

    std::vector<double> values_;
};

} // namespace cohortcea

#endif // COHORTCEA_WTP_GRID_HPP
