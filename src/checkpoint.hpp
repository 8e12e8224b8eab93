#ifndef COHORTCEA_CHECKPOINT_HPP
#define COHORTCEA_CHECKPOINT_HPP

#include "simulation_draw.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace cohortcea {

// Significant digits that let a double survive a text round trip exactly
constexpr int CHECKPOINT_PRECISION = 17;

// How merge_draws treats a seed present on both sides
enum class MergePolicy {
    Reject,         // Overlap is an error (ResumeConflictError)
    MergeBySeed     // Keep the existing draw, drop the incoming one
};

// Draw table, one row per draw:
//   iteration,seed,<parameter>...,
//   <strategy>_health_system_cost,<strategy>_societal_cost,<strategy>_qalys,<strategy>_life_years...
void write_draws_csv(std::ostream& os, const DrawLayout& layout,
                     const std::vector<SimulationDraw>& draws, int precision);

// Read a draw table written by write_draws_csv. The header must match the
// expected layout exactly, otherwise ResumeConflictError is thrown. Each
// outcome's cost is rebuilt for the expected layout's perspective.
std::vector<SimulationDraw> read_draws_csv(std::istream& is, const DrawLayout& expected);

// Write the full draw collection, replacing any previous checkpoint via a
// temporary file so a crash never leaves a truncated checkpoint behind
void write_checkpoint(const std::string& path, const DrawLayout& layout,
                      const std::vector<SimulationDraw>& draws);

// Append draws to an existing checkpoint, or create it with a header when the
// file does not exist yet. Rows keep the order they are appended in.
void append_checkpoint(const std::string& path, const DrawLayout& layout,
                       const std::vector<SimulationDraw>& draws);

// Load every draw of a checkpoint, in file order
std::vector<SimulationDraw> load_checkpoint(const std::string& path, const DrawLayout& expected);

// Check draws loaded for a resume belong to this run: every seed equals
// base_seed + iteration, iterations are below the requested count and no
// seed appears twice. Throws ResumeConflictError otherwise.
void validate_resumed_draws(const std::vector<SimulationDraw>& draws, uint64_t base_seed,
                            size_t iterations);

// Union of two draw collections ordered by iteration
std::vector<SimulationDraw> merge_draws(const std::vector<SimulationDraw>& existing,
                                        const std::vector<SimulationDraw>& incoming,
                                        MergePolicy policy);

} // namespace cohortcea

#endif // COHORTCEA_CHECKPOINT_HPP
