#include "parameter_sampler.hpp"
#include <unordered_map>
#include <utility>

namespace cohortcea {

double open_uniform(RandomEngine& rng) {
    // 53 high bits, centred in their bucket so 0 and 1 are never produced
    constexpr double scale = 1.0 / 9007199254740992.0;  // 2^-53
    return (static_cast<double>(rng() >> 11) + 0.5) * scale;
}

ParameterSampler::ParameterSampler(const ParameterTable& table)
    : table_(table), num_groups_(0) {
    std::unordered_map<std::string, int> groups;
    group_slot_.reserve(table.size());

    for (const auto& p : table.parameters()) {
        if (!p.is_correlated() || p.distribution.is_fixed()) {
            group_slot_.push_back(-1);
            continue;
        }
        auto it = groups.find(p.correlation_group);
        if (it == groups.end()) {
            int slot = static_cast<int>(num_groups_++);
            groups[p.correlation_group] = slot;
            group_slot_.push_back(slot);
        } else {
            group_slot_.push_back(it->second);
        }
    }
}

ParameterValues ParameterSampler::sample(RandomEngine& rng) const {
    std::vector<double> values(table_.size(), 0.0);
    std::vector<double> group_u(num_groups_, -1.0);

    for (size_t i = 0; i < table_.size(); ++i) {
        const Distribution& dist = table_.get(i).distribution;
        if (dist.is_fixed()) {
            values[i] = dist.quantile(0.5);
            continue;
        }

        double u;
        int slot = group_slot_[i];
        if (slot >= 0) {
            if (group_u[static_cast<size_t>(slot)] < 0.0) {
                group_u[static_cast<size_t>(slot)] = open_uniform(rng);
            }
            u = group_u[static_cast<size_t>(slot)];
        } else {
            u = open_uniform(rng);
        }

        values[i] = dist.quantile(u);
    }

    return ParameterValues(table_, std::move(values));
}

ParameterValues ParameterSampler::sample_iteration(uint64_t base_seed, size_t iteration) const {
    RandomEngine rng(iteration_seed(base_seed, iteration));
    return sample(rng);
}

} // namespace cohortcea
