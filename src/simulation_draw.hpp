#ifndef COHORTCEA_SIMULATION_DRAW_HPP
#define COHORTCEA_SIMULATION_DRAW_HPP

#include "economic_aggregator.hpp"
#include "parameter_sampler.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cohortcea {

// Result of one PSA iteration
struct SimulationDraw {
    size_t iteration;
    uint64_t seed;
    std::vector<double> parameters;         // Realized values, parameter table order
    std::vector<StrategyOutcome> outcomes;  // One per strategy, registry order

    SimulationDraw();
    SimulationDraw(size_t iter, uint64_t s, std::vector<double> params,
                   std::vector<StrategyOutcome> outs);
};

// Column layout shared by every draw of a run. The perspective does not
// change the columns; it decides which cost a loaded draw reports as cost.
struct DrawLayout {
    std::vector<std::string> parameter_names;
    std::vector<std::string> strategies;
    Perspective perspective;

    DrawLayout();

    bool operator==(const DrawLayout& other) const;
    bool operator!=(const DrawLayout& other) const { return !(*this == other); }
};

// Layout for a parameter table and strategy list
DrawLayout make_draw_layout(const ParameterTable& table, const std::vector<std::string>& strategies,
                            Perspective perspective = Perspective::HealthSystem);

// One snapshot row per (iteration, parameter), in draw order
std::vector<SnapshotRow> parameter_snapshot(const std::vector<SimulationDraw>& draws,
                                            const DrawLayout& layout);

// Per-draw values for one strategy
std::vector<double> strategy_costs(const std::vector<SimulationDraw>& draws, size_t strategy);
std::vector<double> strategy_qalys(const std::vector<SimulationDraw>& draws, size_t strategy);

} // namespace cohortcea

#endif // COHORTCEA_SIMULATION_DRAW_HPP
