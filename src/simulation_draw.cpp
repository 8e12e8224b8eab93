#include "simulation_draw.hpp"
#include <stdexcept>
#include <utility>

namespace cohortcea {

SimulationDraw::SimulationDraw() : iteration(0), seed(0) {}

SimulationDraw::SimulationDraw(size_t iter, uint64_t s, std::vector<double> params,
                               std::vector<StrategyOutcome> outs)
    : iteration(iter), seed(s), parameters(std::move(params)), outcomes(std::move(outs)) {}

DrawLayout::DrawLayout() : perspective(Perspective::HealthSystem) {}

bool DrawLayout::operator==(const DrawLayout& other) const {
    return parameter_names == other.parameter_names && strategies == other.strategies;
}

DrawLayout make_draw_layout(const ParameterTable& table, const std::vector<std::string>& strategies,
                            Perspective perspective) {
    DrawLayout layout;
    layout.perspective = perspective;
    layout.parameter_names.reserve(table.size());
    for (const auto& p : table.parameters()) {
        layout.parameter_names.push_back(p.name);
    }
    layout.strategies = strategies;
    return layout;
}

std::vector<SnapshotRow> parameter_snapshot(const std::vector<SimulationDraw>& draws,
                                            const DrawLayout& layout) {
    std::vector<SnapshotRow> rows;
    rows.reserve(draws.size() * layout.parameter_names.size());
    for (const auto& draw : draws) {
        if (draw.parameters.size() != layout.parameter_names.size()) {
            throw std::invalid_argument("Draw " + std::to_string(draw.iteration) +
                                        " does not match the parameter layout");
        }
        for (size_t p = 0; p < draw.parameters.size(); ++p) {
            rows.push_back(SnapshotRow{draw.iteration, draw.seed, layout.parameter_names[p], draw.parameters[p]});
        }
    }
    return rows;
}

std::vector<double> strategy_costs(const std::vector<SimulationDraw>& draws, size_t strategy) {
    std::vector<double> values;
    values.reserve(draws.size());
    for (const auto& draw : draws) {
        values.push_back(draw.outcomes.at(strategy).cost);
    }
    return values;
}

std::vector<double> strategy_qalys(const std::vector<SimulationDraw>& draws, size_t strategy) {
    std::vector<double> values;
    values.reserve(draws.size());
    for (const auto& draw : draws) {
        values.push_back(draw.outcomes.at(strategy).qalys);
    }
    return values;
}

} // namespace cohortcea
