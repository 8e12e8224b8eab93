#ifndef COHORTCEA_VALUE_OF_INFORMATION_HPP
#define COHORTCEA_VALUE_OF_INFORMATION_HPP

#include "parameter.hpp"
#include "psa_runner.hpp"
#include "simulation_draw.hpp"
#include "wtp_grid.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cohortcea {

enum class EvppiMethod {
    Regression,     // Quadratic OLS metamodel fitted on the PSA draws
    Nested          // Two-level Monte-Carlo re-simulation
};

// Parse "regression" / "nested"; throws ValidationError otherwise
EvppiMethod parse_evppi_method(const std::string& name);
const char* evppi_method_name(EvppiMethod method);

// Parameters whose uncertainty is resolved together for EVPPI
struct ParameterGroup {
    std::string name;
    std::vector<std::string> parameters;
};

struct VoiSettings {
    double population;              // Eligible population for population EVPI
    double evpi_cv_threshold;       // CV above which EVPI is flagged
    EvppiMethod evppi_method;
    size_t nested_outer;            // Outer samples of the group (nested method)
    size_t nested_inner;            // Inner samples of the rest (nested method)

    VoiSettings();
};

struct EvpiPoint {
    double wtp;
    double evpi;
    double standard_error;          // Of the mean opportunity loss
    std::optional<double> cv;       // standard_error / evpi; empty when evpi == 0
    bool low_precision;
    double population_evpi;
    size_t optimal_strategy;        // Highest expected NMB at this WTP
};

struct EvppiPoint {
    std::string group;
    double wtp;
    double evppi;
    bool low_precision;
    double population_evppi;
};

// Expected value of perfect and partial perfect information.
//
// Both quantities are computed as a mean opportunity loss against the
// strategy with the highest expected NMB, so every estimate is >= 0 by
// construction.
class ValueOfInformationEngine {
public:
    explicit ValueOfInformationEngine(const VoiSettings& settings);

    const VoiSettings& settings() const { return settings_; }

    // EVPI(w) = E[max_s NMB] - max_s E[NMB], from the PSA draws alone.
    // Flagged low_precision when fewer than two draws, or when EVPI > 0 and
    // its coefficient of variation exceeds the configured threshold.
    std::vector<EvpiPoint> evpi(const std::vector<SimulationDraw>& draws, const WTPGrid& grid) const;

    // Regression EVPPI: per strategy, cost and QALYs are regressed on
    // [1, x_j, x_j^2] for every parameter x_j of the group; EVPPI is the
    // value of choosing on the fitted NMB. Flagged low_precision when the
    // draws number at most twice the basis size or the design matrix is rank
    // deficient (a Fixed parameter, or two group parameters that move
    // together); a rank-deficient fit reports EVPPI 0.
    std::vector<EvppiPoint> evppi_regression(const std::vector<SimulationDraw>& draws,
                                             const ParameterTable& table,
                                             const ParameterGroup& group,
                                             const WTPGrid& grid) const;

    // Nested EVPPI: for each outer sample of the group, the remaining
    // parameters are re-sampled nested_inner times and every strategy is
    // re-evaluated. Outer sample o draws from its own generator seeded with
    // iteration_seed(seed, o). Flagged low_precision when either loop has
    // fewer than two samples.
    std::vector<EvppiPoint> evppi_nested(const PsaRunner& runner,
                                         const ParameterGroup& group,
                                         const WTPGrid& grid,
                                         uint64_t seed) const;

    // Dispatch on the configured method
    std::vector<EvppiPoint> evppi(const std::vector<SimulationDraw>& draws,
                                  const PsaRunner& runner,
                                  const ParameterGroup& group,
                                  const WTPGrid& grid,
                                  uint64_t seed) const;

private:
    VoiSettings settings_;
};

// Pivots below this fraction of the largest one count as rank deficient
constexpr double LEAST_SQUARES_RANK_TOLERANCE = 1e-8;

// Least-squares fit of X B = Y by column-pivoting Householder QR, one
// coefficient column per response column
struct LeastSquaresFit {
    Eigen::MatrixXd coefficients;   // p x k
    Eigen::Index rank;              // Numerical rank of X

    bool full_rank() const { return rank == coefficients.rows(); }
};

LeastSquaresFit least_squares(const Eigen::MatrixXd& design, const Eigen::MatrixXd& responses);

} // namespace cohortcea

#endif // COHORTCEA_VALUE_OF_INFORMATION_HPP
