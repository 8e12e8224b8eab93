#include "sensitivity.hpp"
#include "decision_metrics.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace cohortcea {

namespace {

void check_quantiles(double low, double high) {
    if (!(low > 0.0 && low < high && high < 1.0)) {
        throw ValidationError("Sensitivity quantiles must satisfy 0 < low < high < 1");
    }
}

double incremental_nmb_of(const PsaRunner& runner, size_t strategy, size_t reference,
                          const ParameterValues& values, double wtp) {
    const auto outcomes = runner.evaluate(values);
    return DecisionMetricsCalculator::net_monetary_benefit(outcomes[strategy], wtp) -
           DecisionMetricsCalculator::net_monetary_benefit(outcomes[reference], wtp);
}

} // anonymous namespace

SensitivitySettings::SensitivitySettings()
    : low_quantile(0.025), high_quantile(0.975), wtp(0.0) {}

TwoWaySettings::TwoWaySettings()
    : steps(21), low_quantile(0.025), high_quantile(0.975), wtp(0.0) {}

SensitivityAnalyzer::SensitivityAnalyzer(const PsaRunner& runner, const std::string& reference,
                                         const SensitivitySettings& settings)
    : runner_(runner), strategy_(0), reference_(0), settings_(settings) {
    const StrategyRegistry& registry = runner.registry();
    reference_ = registry.index_of(reference);
    strategy_ = registry.index_of(settings.strategy);
    if (strategy_ == reference_) {
        throw ValidationError("Sensitivity strategy must differ from the reference strategy");
    }
    check_quantiles(settings.low_quantile, settings.high_quantile);
}

double SensitivityAnalyzer::incremental_nmb(const ParameterValues& values) const {
    return incremental_nmb_of(runner_, strategy_, reference_, values, settings_.wtp);
}

double SensitivityAnalyzer::base_outcome() const {
    return incremental_nmb(ParameterValues::base_case(runner_.table()));
}

std::vector<TornadoBar> SensitivityAnalyzer::tornado() const {
    const ParameterTable& table = runner_.table();
    const ParameterValues base = ParameterValues::base_case(table);

    std::vector<TornadoBar> bars;
    for (size_t i = 0; i < table.size(); ++i) {
        const Parameter& parameter = table.get(i);
        if (parameter.distribution.is_fixed()) continue;

        TornadoBar bar;
        bar.parameter = parameter.name;
        bar.low_value = parameter.distribution.quantile(settings_.low_quantile);
        bar.high_value = parameter.distribution.quantile(settings_.high_quantile);

        ParameterValues values = base;
        values.set(i, bar.low_value);
        bar.low_outcome = incremental_nmb(values);
        values.set(i, bar.high_value);
        bar.high_outcome = incremental_nmb(values);
        bar.range = std::abs(bar.high_outcome - bar.low_outcome);
        bars.push_back(bar);
    }

    std::stable_sort(bars.begin(), bars.end(), [](const TornadoBar& a, const TornadoBar& b) {
        return a.range > b.range;
    });
    return bars;
}

// ============================================================================
// Two-way analysis
// ============================================================================

TwoWaySensitivityAnalyzer::TwoWaySensitivityAnalyzer(const PsaRunner& runner, const std::string& reference,
                                                     const TwoWaySettings& settings)
    : runner_(runner), strategy_(0), reference_(0), settings_(settings),
      first_index_(0), second_index_(0) {
    const StrategyRegistry& registry = runner.registry();
    const ParameterTable& table = runner.table();
    reference_ = registry.index_of(reference);
    strategy_ = registry.index_of(settings.strategy);
    if (strategy_ == reference_) {
        throw ValidationError("Two-way strategy must differ from the reference strategy");
    }
    check_quantiles(settings.low_quantile, settings.high_quantile);
    if (settings.steps < 2) {
        throw ValidationError("Two-way analysis needs at least 2 steps per axis");
    }
    for (const TwoWayAxis* axis : {&settings.first, &settings.second}) {
        if (!table.contains(axis->parameter)) {
            throw ValidationError("Two-way analysis references unknown parameter '" + axis->parameter + "'");
        }
    }
    if (settings.first.parameter == settings.second.parameter) {
        throw ValidationError("Two-way analysis needs two different parameters");
    }

    first_index_ = table.index_of(settings.first.parameter);
    second_index_ = table.index_of(settings.second.parameter);
    first_values_ = sweep(settings.first, first_index_);
    second_values_ = sweep(settings.second, second_index_);
}

std::vector<double> TwoWaySensitivityAnalyzer::sweep(const TwoWayAxis& axis, size_t index) const {
    const Distribution& distribution = runner_.table().get(index).distribution;
    const double lo = axis.min ? *axis.min : distribution.quantile(settings_.low_quantile);
    const double hi = axis.max ? *axis.max : distribution.quantile(settings_.high_quantile);
    if (!std::isfinite(lo) || !std::isfinite(hi) || !(lo < hi)) {
        throw ValidationError("Two-way range for '" + axis.parameter + "' must satisfy min < max");
    }

    std::vector<double> values;
    values.reserve(settings_.steps);
    const double step = (hi - lo) / static_cast<double>(settings_.steps - 1);
    for (size_t k = 0; k + 1 < settings_.steps; ++k) {
        values.push_back(lo + step * static_cast<double>(k));
    }
    values.push_back(hi);
    return values;
}

std::vector<TwoWayCell> TwoWaySensitivityAnalyzer::grid() const {
    ParameterValues values = ParameterValues::base_case(runner_.table());

    std::vector<TwoWayCell> cells;
    cells.reserve(first_values_.size() * second_values_.size());
    for (double x : first_values_) {
        values.set(first_index_, x);
        for (double y : second_values_) {
            values.set(second_index_, y);
            TwoWayCell cell;
            cell.first_value = x;
            cell.second_value = y;
            cell.incremental_nmb = incremental_nmb_of(runner_, strategy_, reference_, values, settings_.wtp);
            cell.cost_effective = cell.incremental_nmb >= 0.0;
            cells.push_back(cell);
        }
    }
    return cells;
}

} // namespace cohortcea
