#include "distribution.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

#include <boost/math/distributions/beta.hpp>
#include <boost/math/distributions/gamma.hpp>
#include <boost/math/distributions/lognormal.hpp>

namespace cohortcea {

namespace {

template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void require_finite(double v, const char* what) {
    if (!std::isfinite(v)) {
        throw DistributionError(std::string(what) + " must be finite");
    }
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Distribution::Distribution(Variant dist) : dist_(std::move(dist)) {}

Distribution Distribution::fixed(double value) {
    require_finite(value, "Fixed value");
    return Distribution(FixedDist{value});
}

Distribution Distribution::beta(double alpha, double beta) {
    require_finite(alpha, "Beta alpha");
    require_finite(beta, "Beta beta");
    if (alpha <= 0.0 || beta <= 0.0) {
        std::ostringstream msg;
        msg << "Beta requires alpha > 0 and beta > 0 (got alpha=" << alpha
            << ", beta=" << beta << ")";
        throw DistributionError(msg.str());
    }
    return Distribution(BetaDist{alpha, beta});
}

Distribution Distribution::gamma(double shape, double scale) {
    require_finite(shape, "Gamma shape");
    require_finite(scale, "Gamma scale");
    if (shape <= 0.0 || scale <= 0.0) {
        std::ostringstream msg;
        msg << "Gamma requires shape > 0 and scale > 0 (got shape=" << shape
            << ", scale=" << scale << ")";
        throw DistributionError(msg.str());
    }
    return Distribution(GammaDist{shape, scale});
}

Distribution Distribution::lognormal(double mu, double sigma) {
    require_finite(mu, "LogNormal mu");
    require_finite(sigma, "LogNormal sigma");
    if (sigma < 0.0) {
        std::ostringstream msg;
        msg << "LogNormal requires sigma >= 0 (got sigma=" << sigma << ")";
        throw DistributionError(msg.str());
    }
    return Distribution(LogNormalDist{mu, sigma});
}

Distribution Distribution::from_row(const std::string& type_name, double param1, double param2) {
    const std::string t = lower(type_name);
    if (t == "fixed" || t == "constant") {
        return fixed(param1);
    }
    if (t == "beta") {
        return beta(param1, param2);
    }
    if (t == "gamma") {
        return gamma(param1, param2);
    }
    if (t == "lognormal" || t == "log_normal" || t == "log-normal") {
        return lognormal(param1, param2);
    }
    throw DistributionError("Unknown distribution type: '" + type_name + "'");
}

Distribution Distribution::beta_from_moments(double mean, double se) {
    if (mean <= 0.0 || mean >= 1.0 || se <= 0.0) {
        throw DistributionError("Beta moments require 0 < mean < 1 and se > 0");
    }
    double var = se * se;
    double common = mean * (1.0 - mean) / var - 1.0;
    if (common <= 0.0) {
        throw DistributionError("Beta moments: variance too large for mean");
    }
    return beta(mean * common, (1.0 - mean) * common);
}

Distribution Distribution::gamma_from_moments(double mean, double se) {
    if (mean <= 0.0 || se <= 0.0) {
        throw DistributionError("Gamma moments require mean > 0 and se > 0");
    }
    double var = se * se;
    return gamma(mean * mean / var, var / mean);
}

// ============================================================================
// Accessors
// ============================================================================

DistributionType Distribution::type() const {
    return std::visit(overloaded{
        [](const FixedDist&) { return DistributionType::Fixed; },
        [](const BetaDist&) { return DistributionType::Beta; },
        [](const GammaDist&) { return DistributionType::Gamma; },
        [](const LogNormalDist&) { return DistributionType::LogNormal; }
    }, dist_);
}

std::string Distribution::type_name() const {
    switch (type()) {
        case DistributionType::Fixed: return "Fixed";
        case DistributionType::Beta: return "Beta";
        case DistributionType::Gamma: return "Gamma";
        case DistributionType::LogNormal: return "LogNormal";
    }
    return "Unknown";
}

double Distribution::quantile(double u) const {
    if (is_fixed()) {
        return std::get<FixedDist>(dist_).value;
    }
    if (!(u > 0.0 && u < 1.0)) {
        throw std::out_of_range("Distribution quantile requires u in (0, 1)");
    }
    return std::visit(overloaded{
        [](const FixedDist& d) { return d.value; },
        [u](const BetaDist& d) {
            boost::math::beta_distribution<double> dist(d.alpha, d.beta);
            return boost::math::quantile(dist, u);
        },
        [u](const GammaDist& d) {
            boost::math::gamma_distribution<double> dist(d.shape, d.scale);
            return boost::math::quantile(dist, u);
        },
        [u](const LogNormalDist& d) {
            if (d.sigma == 0.0) {
                return std::exp(d.mu);
            }
            boost::math::lognormal_distribution<double> dist(d.mu, d.sigma);
            return boost::math::quantile(dist, u);
        }
    }, dist_);
}

double Distribution::mean() const {
    return std::visit(overloaded{
        [](const FixedDist& d) { return d.value; },
        [](const BetaDist& d) { return d.alpha / (d.alpha + d.beta); },
        [](const GammaDist& d) { return d.shape * d.scale; },
        [](const LogNormalDist& d) { return std::exp(d.mu + 0.5 * d.sigma * d.sigma); }
    }, dist_);
}

bool Distribution::operator==(const Distribution& other) const {
    if (type() != other.type()) {
        return false;
    }
    return std::visit(overloaded{
        [&other](const FixedDist& d) {
            return d.value == std::get<FixedDist>(other.dist_).value;
        },
        [&other](const BetaDist& d) {
            const auto& o = std::get<BetaDist>(other.dist_);
            return d.alpha == o.alpha && d.beta == o.beta;
        },
        [&other](const GammaDist& d) {
            const auto& o = std::get<GammaDist>(other.dist_);
            return d.shape == o.shape && d.scale == o.scale;
        },
        [&other](const LogNormalDist& d) {
            const auto& o = std::get<LogNormalDist>(other.dist_);
            return d.mu == o.mu && d.sigma == o.sigma;
        }
    }, dist_);
}

} // namespace cohortcea
