#ifndef COHORTCEA_PSA_RUNNER_HPP
#define COHORTCEA_PSA_RUNNER_HPP

#include "economic_aggregator.hpp"
#include "parameter_sampler.hpp"
#include "simulation_draw.hpp"
#include "strategy.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cohortcea {

// What to do when an iteration throws
enum class ErrorPolicy {
    Abort,  // Rethrow as IterationFailedError (default)
    Skip    // Record the failure and continue
};

// Parse "abort" / "skip"; throws ValidationError otherwise
ErrorPolicy parse_error_policy(const std::string& name);
std::string error_policy_name(ErrorPolicy policy);

// Configuration of one probabilistic sensitivity analysis
struct PsaSettings {
    size_t iterations;              // Requested iteration count
    uint64_t seed;                  // Base seed; iteration i uses seed + i
    size_t batch_size;              // Iterations per parallel batch
    ErrorPolicy error_policy;
    double max_failure_fraction;    // Skip policy: abort above this failed share
    std::string checkpoint_path;    // Empty = no checkpointing
    bool resume;                    // Load checkpoint_path before running

    PsaSettings();
};

// Cooperative cancellation flag, checked between batches
class CancellationToken {
public:
    CancellationToken();

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_;
};

// An iteration skipped under ErrorPolicy::Skip
struct FailedIteration {
    size_t iteration;
    uint64_t seed;
    std::string message;
};

// Outcome of a PSA run
struct PsaResult {
    DrawLayout layout;
    std::vector<SimulationDraw> draws;      // Ordered by iteration once run() returns
    std::vector<FailedIteration> failures;  // Ordered by iteration
    size_t requested;                       // Iterations requested
    size_t resumed;                         // Draws loaded from a checkpoint
    bool cancelled;                         // Stopped early by a CancellationToken
    double execution_time_ms;

    PsaResult();
};

// Invoked after every batch with the collection so far. On a resumed run
// the new draws follow the resumed ones until the run ends.
using BatchCallback = std::function<void(const PsaResult& progress)>;

// Runs the Monte-Carlo loop: sample parameters, evaluate every strategy,
// collect draws.
//
// Iterations are processed in batches. Inside a batch they run in parallel
// (OpenMP when available) and write into pre-sized slots; the slots are
// appended to the collection in iteration order once the batch ends, and
// only that batch is appended to the checkpoint file. Shared
// state (registry, parameter table, aggregator) is read-only, so results do
// not depend on thread scheduling. Checkpoints and log events happen only at
// batch boundaries.
class PsaRunner {
public:
    PsaRunner(const StrategyRegistry& registry, const ParameterTable& table,
              const EconomicAggregator& aggregator);

    // Outcomes of every strategy for one parameter realization
    std::vector<StrategyOutcome> evaluate(const ParameterValues& values) const;

    // Every parameter at its mean
    std::vector<StrategyOutcome> run_deterministic() const;

    // Sample and evaluate a single iteration
    SimulationDraw run_iteration(uint64_t base_seed, size_t iteration) const;

    PsaResult run(const PsaSettings& settings,
                  const CancellationToken* cancel = nullptr,
                  const BatchCallback& on_batch = BatchCallback()) const;

    DrawLayout layout() const;

    const StrategyRegistry& registry() const { return registry_; }
    const ParameterTable& table() const { return table_; }
    const ParameterSampler& sampler() const { return sampler_; }

private:
    const StrategyRegistry& registry_;
    const ParameterTable& table_;
    const EconomicAggregator& aggregator_;
    ParameterSampler sampler_;
};

} // namespace cohortcea

#endif // COHORTCEA_PSA_RUNNER_HPP
