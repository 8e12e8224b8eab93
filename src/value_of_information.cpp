#include "value_of_information.hpp"
#include "errors.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace cohortcea {

EvppiMethod parse_evppi_method(const std::string& name) {
    if (name == "regression") return EvppiMethod::Regression;
    if (name == "nested") return EvppiMethod::Nested;
    throw ValidationError("Unknown EVPPI method '" + name + "' (expected regression or nested)");
}

const char* evppi_method_name(EvppiMethod method) {
    return method == EvppiMethod::Nested ? "nested" : "regression";
}

VoiSettings::VoiSettings()
    : population(0.0),
      evpi_cv_threshold(0.1),
      evppi_method(EvppiMethod::Regression),
      nested_outer(100),
      nested_inner(100) {}

ValueOfInformationEngine::ValueOfInformationEngine(const VoiSettings& settings)
    : settings_(settings) {
    if (!(settings.population >= 0.0)) {
        throw ValidationError("VOI population must be non-negative");
    }
    if (!(settings.evpi_cv_threshold > 0.0)) {
        throw ValidationError("EVPI CV threshold must be positive");
    }
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

// Mean opportunity loss of always choosing the strategy with the highest
// mean value, where value[i][s] is the value of strategy s in sample i
struct LossSummary {
    double mean_loss;
    double sd_loss;
    size_t best;
};

LossSummary opportunity_loss(const std::vector<std::vector<double>>& value) {
    const size_t n = value.size();
    const size_t num_strategies = value.front().size();

    std::vector<double> means(num_strategies, 0.0);
    for (const auto& row : value) {
        for (size_t s = 0; s < num_strategies; ++s) {
            means[s] += row[s];
        }
    }
    size_t best = 0;
    for (size_t s = 0; s < num_strategies; ++s) {
        means[s] /= static_cast<double>(n);
        if (means[s] > means[best]) {
            best = s;
        }
    }

    std::vector<double> losses;
    losses.reserve(n);
    for (const auto& row : value) {
        double row_max = *std::max_element(row.begin(), row.end());
        losses.push_back(row_max - row[best]);
    }

    LossSummary summary;
    summary.mean_loss = mean(losses);
    summary.sd_loss = sample_std_dev(losses, summary.mean_loss);
    summary.best = best;
    return summary;
}

std::vector<std::vector<double>> nmb_matrix(const std::vector<std::vector<double>>& costs,
                                            const std::vector<std::vector<double>>& qalys,
                                            double wtp) {
    std::vector<std::vector<double>> nmb(costs.size());
    for (size_t i = 0; i < costs.size(); ++i) {
        nmb[i].resize(costs[i].size());
        for (size_t s = 0; s < costs[i].size(); ++s) {
            nmb[i][s] = wtp * qalys[i][s] - costs[i][s];
        }
    }
    return nmb;
}

std::vector<size_t> group_indices(const ParameterTable& table, const ParameterGroup& group) {
    if (group.parameters.empty()) {
        throw ValidationError("EVPPI group '" + group.name + "' lists no parameters");
    }
    std::vector<size_t> indices;
    for (const auto& name : group.parameters) {
        if (!table.contains(name)) {
            throw ValidationError("EVPPI group '" + group.name + "' references unknown parameter '" + name + "'");
        }
        indices.push_back(table.index_of(name));
    }
    return indices;
}

} // anonymous namespace

LeastSquaresFit least_squares(const Eigen::MatrixXd& design, const Eigen::MatrixXd& responses) {
    if (design.rows() == 0 || design.rows() != responses.rows()) {
        throw std::invalid_argument("least_squares: design matrix and response differ in length");
    }
    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
    qr.setThreshold(LEAST_SQUARES_RANK_TOLERANCE);

    LeastSquaresFit fit;
    fit.rank = qr.rank();
    fit.coefficients = qr.solve(responses);
    return fit;
}

// ============================================================================
// EVPI
// ============================================================================

std::vector<EvpiPoint> ValueOfInformationEngine::evpi(const std::vector<SimulationDraw>& draws,
                                                      const WTPGrid& grid) const {
    if (draws.empty()) {
        throw std::invalid_argument("EVPI needs at least one draw");
    }

    const size_t n = draws.size();
    const size_t num_strategies = draws.front().outcomes.size();
    std::vector<std::vector<double>> costs(n, std::vector<double>(num_strategies));
    std::vector<std::vector<double>> qalys(n, std::vector<double>(num_strategies));
    for (size_t i = 0; i < n; ++i) {
        for (size_t s = 0; s < num_strategies; ++s) {
            costs[i][s] = draws[i].outcomes.at(s).cost;
            qalys[i][s] = draws[i].outcomes.at(s).qalys;
        }
    }

    std::vector<EvpiPoint> points;
    points.reserve(grid.size());
    for (double w : grid.values()) {
        LossSummary loss = opportunity_loss(nmb_matrix(costs, qalys, w));

        EvpiPoint point;
        point.wtp = w;
        point.evpi = loss.mean_loss;
        point.standard_error = loss.sd_loss / std::sqrt(static_cast<double>(n));
        if (point.evpi > 0.0) {
            point.cv = point.standard_error / point.evpi;
        }
        point.low_precision = n < 2 || (point.cv.has_value() && *point.cv > settings_.evpi_cv_threshold);
        point.population_evpi = point.evpi * settings_.population;
        point.optimal_strategy = loss.best;
        points.push_back(point);
    }
    return points;
}

// ============================================================================
// EVPPI
// ============================================================================

std::vector<EvppiPoint> ValueOfInformationEngine::evppi_regression(const std::vector<SimulationDraw>& draws,
                                                                   const ParameterTable& table,
                                                                   const ParameterGroup& group,
                                                                   const WTPGrid& grid) const {
    if (draws.empty()) {
        throw std::invalid_argument("EVPPI needs at least one draw");
    }
    const std::vector<size_t> indices = group_indices(table, group);
    const size_t n = draws.size();
    const size_t num_strategies = draws.front().outcomes.size();
    const size_t basis_size = 1 + 2 * indices.size();

    // Standardized regressors: centred and scaled group parameters
    const auto rows = static_cast<Eigen::Index>(n);
    Eigen::MatrixXd design(rows, static_cast<Eigen::Index>(basis_size));
    design.col(0).setOnes();
    for (size_t j = 0; j < indices.size(); ++j) {
        std::vector<double> x;
        x.reserve(n);
        for (const auto& draw : draws) {
            x.push_back(draw.parameters.at(indices[j]));
        }
        const double centre = mean(x);
        const double sd = std_dev(x, centre);
        const double spread = sd > 0.0 ? sd : 1.0;

        const auto col = static_cast<Eigen::Index>(1 + 2 * j);
        for (Eigen::Index i = 0; i < rows; ++i) {
            const double z = (x[static_cast<size_t>(i)] - centre) / spread;
            design(i, col) = z;
            design(i, col + 1) = z * z;
        }
    }

    // Responses: cost of strategy s in column s, QALYs in column S + s
    const auto strategies = static_cast<Eigen::Index>(num_strategies);
    Eigen::MatrixXd responses(rows, 2 * strategies);
    for (Eigen::Index i = 0; i < rows; ++i) {
        const auto& outcomes = draws[static_cast<size_t>(i)].outcomes;
        for (Eigen::Index s = 0; s < strategies; ++s) {
            responses(i, s) = outcomes.at(static_cast<size_t>(s)).cost;
            responses(i, strategies + s) = outcomes.at(static_cast<size_t>(s)).qalys;
        }
    }

    const LeastSquaresFit fit = least_squares(design, responses);
    const bool singular = !fit.full_rank();

    std::vector<std::vector<double>> fitted_costs(n, std::vector<double>(num_strategies, 0.0));
    std::vector<std::vector<double>> fitted_qalys(n, std::vector<double>(num_strategies, 0.0));
    if (!singular) {
        const Eigen::MatrixXd fitted = design * fit.coefficients;
        for (Eigen::Index i = 0; i < rows; ++i) {
            for (Eigen::Index s = 0; s < strategies; ++s) {
                fitted_costs[static_cast<size_t>(i)][static_cast<size_t>(s)] = fitted(i, s);
                fitted_qalys[static_cast<size_t>(i)][static_cast<size_t>(s)] = fitted(i, strategies + s);
            }
        }
    }

    const bool low_precision = singular || n <= 2 * basis_size;

    std::vector<EvppiPoint> points;
    points.reserve(grid.size());
    for (double w : grid.values()) {
        EvppiPoint point;
        point.group = group.name;
        point.wtp = w;
        // A singular fit carries no information about the group
        point.evppi = singular ? 0.0 : opportunity_loss(nmb_matrix(fitted_costs, fitted_qalys, w)).mean_loss;
        point.low_precision = low_precision;
        point.population_evppi = point.evppi * settings_.population;
        points.push_back(point);
    }
    return points;
}

std::vector<EvppiPoint> ValueOfInformationEngine::evppi_nested(const PsaRunner& runner,
                                                               const ParameterGroup& group,
                                                               const WTPGrid& grid,
                                                               uint64_t seed) const {
    const size_t outer = settings_.nested_outer;
    const size_t inner = settings_.nested_inner;
    if (outer == 0 || inner == 0) {
        throw ValidationError("Nested EVPPI needs at least one outer and one inner sample");
    }
    const std::vector<size_t> indices = group_indices(runner.table(), group);
    const size_t num_strategies = runner.registry().size();

    // Per outer sample: inner-mean cost and QALYs of every strategy
    std::vector<std::vector<double>> mean_costs(outer, std::vector<double>(num_strategies, 0.0));
    std::vector<std::vector<double>> mean_qalys(outer, std::vector<double>(num_strategies, 0.0));
    std::vector<std::string> errors(outer);
    std::vector<char> failed(outer, 0);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 1)
#endif
    for (long k = 0; k < static_cast<long>(outer); ++k) {
        const size_t o = static_cast<size_t>(k);
        try {
            RandomEngine rng(iteration_seed(seed, o));
            const ParameterValues fixed = runner.sampler().sample(rng);
            for (size_t j = 0; j < inner; ++j) {
                ParameterValues values = runner.sampler().sample(rng);
                for (size_t idx : indices) {
                    values.set(idx, fixed[idx]);
                }
                const auto outcomes = runner.evaluate(values);
                for (size_t s = 0; s < num_strategies; ++s) {
                    mean_costs[o][s] += outcomes[s].cost / static_cast<double>(inner);
                    mean_qalys[o][s] += outcomes[s].qalys / static_cast<double>(inner);
                }
            }
        } catch (const std::exception& e) {
            failed[o] = 1;
            errors[o] = e.what();
        }
    }

    for (size_t o = 0; o < outer; ++o) {
        if (failed[o]) {
            throw std::runtime_error("Nested EVPPI for group '" + group.name + "' failed at outer sample " +
                                     std::to_string(o) + ": " + errors[o]);
        }
    }

    const bool low_precision = outer < 2 || inner < 2;

    std::vector<EvppiPoint> points;
    points.reserve(grid.size());
    for (double w : grid.values()) {
        EvppiPoint point;
        point.group = group.name;
        point.wtp = w;
        point.evppi = opportunity_loss(nmb_matrix(mean_costs, mean_qalys, w)).mean_loss;
        point.low_precision = low_precision;
        point.population_evppi = point.evppi * settings_.population;
        points.push_back(point);
    }
    return points;
}

std::vector<EvppiPoint> ValueOfInformationEngine::evppi(const std::vector<SimulationDraw>& draws,
                                                        const PsaRunner& runner,
                                                        const ParameterGroup& group,
                                                        const WTPGrid& grid,
                                                        uint64_t seed) const {
    if (settings_.evppi_method == EvppiMethod::Nested) {
        return evppi_nested(runner, group, grid, seed);
    }
    return evppi_regression(draws, runner.table(), group, grid);
}

} // namespace cohortcea
