#include "psa_runner.hpp"
#include "checkpoint.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace cohortcea {

// ============================================================================
// Settings / Result Implementation
// ============================================================================

ErrorPolicy parse_error_policy(const std::string& name) {
    if (name == "abort") return ErrorPolicy::Abort;
    if (name == "skip") return ErrorPolicy::Skip;
    throw ValidationError("Unknown error policy '" + name + "' (expected abort or skip)");
}

std::string error_policy_name(ErrorPolicy policy) {
    return policy == ErrorPolicy::Skip ? "skip" : "abort";
}

PsaSettings::PsaSettings()
    : iterations(1000),
      seed(42),
      batch_size(256),
      error_policy(ErrorPolicy::Abort),
      max_failure_fraction(0.05),
      resume(false) {}

CancellationToken::CancellationToken() : cancelled_(false) {}

PsaResult::PsaResult()
    : requested(0), resumed(0), cancelled(false), execution_time_ms(0.0) {}

// ============================================================================
// PsaRunner Implementation
// ============================================================================

PsaRunner::PsaRunner(const StrategyRegistry& registry, const ParameterTable& table,
                     const EconomicAggregator& aggregator)
    : registry_(registry), table_(table), aggregator_(aggregator), sampler_(table) {}

std::vector<StrategyOutcome> PsaRunner::evaluate(const ParameterValues& values) const {
    return aggregator_.evaluate_all(registry_, values);
}

std::vector<StrategyOutcome> PsaRunner::run_deterministic() const {
    return evaluate(ParameterValues::base_case(table_));
}

SimulationDraw PsaRunner::run_iteration(uint64_t base_seed, size_t iteration) const {
    const uint64_t seed = iteration_seed(base_seed, iteration);
    ParameterValues values = sampler_.sample_iteration(base_seed, iteration);
    std::vector<StrategyOutcome> outcomes = evaluate(values);
    return SimulationDraw(iteration, seed, values.values(), std::move(outcomes));
}

DrawLayout PsaRunner::layout() const {
    return make_draw_layout(table_, registry_.ids(), aggregator_.perspective());
}

PsaResult PsaRunner::run(const PsaSettings& settings,
                         const CancellationToken* cancel,
                         const BatchCallback& on_batch) const {
    if (settings.iterations == 0) {
        throw ValidationError("PSA iteration count must be at least 1");
    }
    if (settings.batch_size == 0) {
        throw ValidationError("PSA batch size must be at least 1");
    }
    if (!(settings.max_failure_fraction >= 0.0 && settings.max_failure_fraction <= 1.0)) {
        throw ValidationError("max_failure_fraction must be in [0, 1]");
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    Logger& logger = Logger::get_instance();
    RunContext ctx("seed_" + std::to_string(settings.seed), "psa");

    PsaResult result;
    result.layout = layout();
    result.requested = settings.iterations;

    // Resume: keep checkpointed draws, run only the missing iterations
    std::vector<bool> done(settings.iterations, false);
    bool checkpoint_open = false;
    if (settings.resume) {
        if (settings.checkpoint_path.empty()) {
            throw ValidationError("Resume requested but no checkpoint path configured");
        }
        std::ifstream probe(settings.checkpoint_path);
        if (probe.is_open()) {
            probe.close();
            std::vector<SimulationDraw> loaded = load_checkpoint(settings.checkpoint_path, result.layout);
            validate_resumed_draws(loaded, settings.seed, settings.iterations);
            result.draws = merge_draws({}, loaded, MergePolicy::Reject);
            result.resumed = result.draws.size();
            checkpoint_open = true;
            for (const auto& draw : result.draws) {
                done[draw.iteration] = true;
            }
            logger.log_resume(ctx, settings.checkpoint_path, result.resumed);
        } else {
            logger.log_warning(ctx, "Checkpoint " + settings.checkpoint_path + " not found, starting a fresh run");
        }
    }

    std::vector<size_t> pending;
    pending.reserve(settings.iterations);
    for (size_t i = 0; i < settings.iterations; ++i) {
        if (!done[i]) pending.push_back(i);
    }

    logger.log_run_start(ctx, settings.iterations, settings.seed, registry_.size());

    size_t attempted = 0;
    for (size_t batch_start = 0; batch_start < pending.size(); batch_start += settings.batch_size) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            result.cancelled = true;
            logger.log_cancelled(ctx, result.draws.size(), settings.iterations);
            break;
        }

        const size_t batch_end = std::min(batch_start + settings.batch_size, pending.size());
        const size_t batch_count = batch_end - batch_start;

        // Pre-sized slots: each iteration writes only its own entry
        std::vector<SimulationDraw> slots(batch_count);
        std::vector<std::string> errors(batch_count);
        std::vector<char> failed(batch_count, 0);

#ifdef HAVE_OPENMP
        #pragma omp parallel for schedule(dynamic, 1)
        for (long k = 0; k < static_cast<long>(batch_count); ++k) {
            const size_t slot = static_cast<size_t>(k);
            try {
                slots[slot] = run_iteration(settings.seed, pending[batch_start + slot]);
            } catch (const std::exception& e) {
                // Exceptions must not leave the parallel region; handled below
                failed[slot] = 1;
                errors[slot] = e.what();
            }
        }
#else
        for (size_t slot = 0; slot < batch_count; ++slot) {
            try {
                slots[slot] = run_iteration(settings.seed, pending[batch_start + slot]);
            } catch (const std::exception& e) {
                failed[slot] = 1;
                errors[slot] = e.what();
            }
        }
#endif

        // Fold the batch in iteration order
        std::vector<SimulationDraw> completed;
        completed.reserve(batch_count);
        for (size_t slot = 0; slot < batch_count; ++slot) {
            const size_t iteration = pending[batch_start + slot];
            const uint64_t seed = iteration_seed(settings.seed, iteration);
            ++attempted;

            if (failed[slot]) {
                std::ostringstream msg;
                msg << "Iteration " << iteration << " (seed " << seed << ") failed: " << errors[slot];
                if (settings.error_policy == ErrorPolicy::Abort) {
                    logger.log_error(ctx, msg.str());
                    throw IterationFailedError(iteration, seed, msg.str());
                }
                logger.log_iteration_failed(ctx, iteration, seed, errors[slot]);
                result.failures.push_back(FailedIteration{iteration, seed, errors[slot]});
                continue;
            }
            completed.push_back(std::move(slots[slot]));
        }
        // Only the new batch reaches the checkpoint; a fresh run replaces
        // whatever file was there before
        if (!settings.checkpoint_path.empty()) {
            if (checkpoint_open) {
                append_checkpoint(settings.checkpoint_path, result.layout, completed);
            } else {
                write_checkpoint(settings.checkpoint_path, result.layout, completed);
                checkpoint_open = true;
            }
            logger.log_checkpoint_written(ctx, settings.checkpoint_path, result.draws.size() + completed.size());
        }
        result.draws.insert(result.draws.end(),
                            std::make_move_iterator(completed.begin()),
                            std::make_move_iterator(completed.end()));

        logger.log_batch_complete(ctx, result.draws.size(), settings.iterations, result.failures.size());
        if (on_batch) {
            on_batch(result);
        }
    }

    // Pending iterations interleave with resumed ones; fresh runs are already
    // in iteration order
    if (result.resumed > 0) {
        std::sort(result.draws.begin(), result.draws.end(),
                  [](const SimulationDraw& a, const SimulationDraw& b) { return a.iteration < b.iteration; });
    }

    // Skip policy: too many failures invalidates the run
    if (!result.failures.empty() && attempted > 0) {
        const double failed_fraction = static_cast<double>(result.failures.size()) / static_cast<double>(attempted);
        if (failed_fraction > settings.max_failure_fraction) {
            const FailedIteration& first = result.failures.front();
            std::ostringstream msg;
            msg << result.failures.size() << " of " << attempted << " iterations failed (fraction "
                << failed_fraction << " exceeds " << settings.max_failure_fraction
                << "); first failure at iteration " << first.iteration << ": " << first.message;
            logger.log_error(ctx, msg.str());
            throw IterationFailedError(first.iteration, first.seed, msg.str());
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    logger.log_run_complete(ctx, result.draws.size(), result.failures.size(), result.execution_time_ms);
    return result;
}

} // namespace cohortcea
