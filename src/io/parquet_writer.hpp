#ifndef COHORTCEA_PARQUET_WRITER_HPP
#define COHORTCEA_PARQUET_WRITER_HPP

#include "../parameter_sampler.hpp"
#include "../simulation_draw.hpp"
#include <string>
#include <vector>

namespace cohortcea {

class ParquetWriter {
public:
    // True when built with Apache Arrow; the writers throw otherwise
    static bool available();

    /**
     * Write the PSA draw collection to a Parquet file.
     *
     * Output schema:
     *   - iteration: uint64
     *   - seed: uint64
     *   - <parameter>: float64, one column per parameter
     *   - <strategy>_cost (run perspective), <strategy>_health_system_cost,
     *     <strategy>_societal_cost, <strategy>_qalys, <strategy>_life_years: float64
     *
     * @param layout Column layout of the draws
     * @param draws Draws ordered by iteration
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if file cannot be written
     */
    static void write_draws(const DrawLayout& layout, const std::vector<SimulationDraw>& draws,
                            const std::string& filepath);

    /**
     * Write the parameter snapshot to a Parquet file.
     *
     * Output schema:
     *   - iteration: uint64
     *   - seed: uint64
     *   - parameter: utf8
     *   - value: float64
     *
     * @throws std::runtime_error if file cannot be written
     */
    static void write_snapshot(const std::vector<SnapshotRow>& rows, const std::string& filepath);
};

} // namespace cohortcea

#endif // COHORTCEA_PARQUET_WRITER_HPP
