#ifndef COHORTCEA_DISTRIBUTION_HPP
#define COHORTCEA_DISTRIBUTION_HPP

#include <string>
#include <variant>

namespace cohortcea {

// Degenerate distribution: always returns value
struct FixedDist {
    double value;
};

// Beta(alpha, beta) on [0, 1], used for probabilities and utilities
struct BetaDist {
    double alpha;
    double beta;
};

// Gamma(shape, scale) on [0, inf), used for costs
struct GammaDist {
    double shape;
    double scale;
};

// LogNormal(mu, sigma) where mu/sigma are on the log scale
struct LogNormalDist {
    double mu;
    double sigma;
};

enum class DistributionType {
    Fixed,
    Beta,
    Gamma,
    LogNormal
};

// Closed set of parameter distributions. Immutable once constructed;
// construction validates the distribution's own parameters and throws
// DistributionError when they are out of domain.
class Distribution {
public:
    using Variant = std::variant<FixedDist, BetaDist, GammaDist, LogNormalDist>;

    static Distribution fixed(double value);
    static Distribution beta(double alpha, double beta);
    static Distribution gamma(double shape, double scale);
    static Distribution lognormal(double mu, double sigma);

    // Build from a parameter-table row: type name (case-insensitive
    // "fixed", "beta", "gamma", "lognormal") and its two numeric arguments.
    // param2 is ignored for Fixed.
    static Distribution from_row(const std::string& type_name, double param1, double param2);

    // Moment-matched Beta from a mean and standard error
    static Distribution beta_from_moments(double mean, double se);

    // Moment-matched Gamma from a mean and standard error
    static Distribution gamma_from_moments(double mean, double se);

    DistributionType type() const;
    std::string type_name() const;

    // Inverse CDF at u. u must lie strictly inside (0, 1); Fixed ignores u.
    double quantile(double u) const;

    double mean() const;

    // Fixed distributions consume no random numbers when sampled
    bool is_fixed() const { return type() == DistributionType::Fixed; }

    const Variant& variant() const { return dist_; }

    bool operator==(const Distribution& other) const;

private:
    explicit Distribution(Variant dist);

    Variant dist_;
};

} // namespace cohortcea

#endif // COHORTCEA_DISTRIBUTION_HPP
