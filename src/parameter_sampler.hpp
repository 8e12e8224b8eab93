#ifndef COHORTCEA_PARAMETER_SAMPLER_HPP
#define COHORTCEA_PARAMETER_SAMPLER_HPP

#include "parameter.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace cohortcea {

// Generator type used for every Monte-Carlo draw. Each iteration owns its
// own instance seeded from the iteration's seed.
using RandomEngine = std::mt19937_64;

// Seed for iteration i of a run with the given base seed
inline uint64_t iteration_seed(uint64_t base_seed, size_t iteration) {
    return base_seed + static_cast<uint64_t>(iteration);
}

// Uniform in the open interval (0, 1) from 53 random bits. Unlike
// std::uniform_real_distribution the result is identical on every
// standard library.
double open_uniform(RandomEngine& rng);

// Draws one realization of every parameter in a table.
//
// Parameters are visited in table order. Each non-Fixed parameter consumes
// one uniform from the generator and maps it through its inverse CDF.
// Parameters sharing a correlation group consume a single uniform (drawn
// when the first member is reached) so their draws are perfectly rank
// correlated.
class ParameterSampler {
public:
    explicit ParameterSampler(const ParameterTable& table);

    ParameterValues sample(RandomEngine& rng) const;

    // Sample using the seed for an iteration
    ParameterValues sample_iteration(uint64_t base_seed, size_t iteration) const;

    const ParameterTable& table() const { return table_; }

private:
    const ParameterTable& table_;
    // For each parameter: index into the per-call uniform cache of its
    // correlation group, or -1 when independent
    std::vector<int> group_slot_;
    size_t num_groups_;
};

// One row of the parameter-snapshot audit artifact
struct SnapshotRow {
    size_t iteration;
    uint64_t seed;
    std::string parameter;
    double value;
};

} // namespace cohortcea

#endif // COHORTCEA_PARAMETER_SAMPLER_HPP
