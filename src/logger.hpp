/**
 * @file logger.hpp
 * @brief Structured run log: one JSON object (or plain-text line) per event
 *
 * Every record carries the run id and phase of its RunContext. Events are
 * emitted at configuration time and at PSA batch boundaries only, never from
 * inside the cohort cycle loop.
 */

#ifndef COHORTCEA_LOGGER_HPP
#define COHORTCEA_LOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace cohortcea {

// Severity, lowest first; records below LoggerConfig::min_level are dropped
enum class LogLevel {
    DEBUG,   ///< Per-batch progress, checkpoint writes
    INFO,    ///< Configuration loaded, run start and completion
    WARN,    ///< Skipped iterations, low-precision estimates, cancellation
    ERROR    ///< Fatal run or configuration errors
};

std::string level_to_string(LogLevel level);

// Case-insensitive; unrecognised names map to INFO
LogLevel string_to_level(const std::string& name);

/**
 * @brief Run context for logging
 */
struct RunContext {
    std::string run_id;              ///< Identifier of the analysis run
    std::string phase;               ///< Current phase (config, deterministic, psa, voi, output)
    size_t iteration;                ///< Current PSA iteration (when relevant)
    std::string strategy;            ///< Strategy being evaluated (when relevant)

    RunContext();
    explicit RunContext(const std::string& id, const std::string& run_phase = "");
};

// Filled from the "logging" block of the run configuration
struct LoggerConfig {
    LogLevel min_level;
    bool enable_console;             ///< Records go to stderr
    bool enable_file;                ///< Records are appended to log_file_path
    std::string log_file_path;
    bool enable_json;                ///< JSON lines; plain text otherwise

    LoggerConfig();
};

/**
 * @brief Process-wide structured logger
 *
 * Writes are serialised by an internal mutex, so worker threads may log
 * directly.
 *
 *   @code
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(run_config.logging);
 *
 *   RunContext ctx("AU_seed_42", "psa");
 *   logger.log_run_start(ctx, 1000, 42, 4);
 *   logger.log_batch_complete(ctx, 256, 1000, 0);
 *   @endcode
 */
class Logger {
public:
    static Logger& get_instance();

    // Replaces the configuration; an unopenable log file disables file output
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a loaded run configuration
     *
     * @param ctx Run context
     * @param config_path Path of the configuration file
     * @param settings Selected settings to record (jurisdiction, iterations, ...)
     */
    void log_config_loaded(
        const RunContext& ctx,
        const std::string& config_path,
        const std::map<std::string, std::string>& settings
    );

    /**
     * @brief Log PSA run start
     *
     * @param ctx Run context
     * @param iterations Requested iteration count
     * @param seed Base seed
     * @param num_strategies Number of strategies evaluated per iteration
     */
    void log_run_start(
        const RunContext& ctx,
        size_t iterations,
        uint64_t seed,
        size_t num_strategies
    );

    /**
     * @brief Log completion of a PSA batch
     *
     * @param ctx Run context
     * @param completed Iterations completed so far (including resumed ones)
     * @param total Requested iteration count
     * @param failed Iterations skipped so far
     */
    void log_batch_complete(
        const RunContext& ctx,
        size_t completed,
        size_t total,
        size_t failed
    );

    /**
     * @brief Log a failed PSA iteration
     */
    void log_iteration_failed(
        const RunContext& ctx,
        size_t iteration,
        uint64_t seed,
        const std::string& error_message
    );

    void log_checkpoint_written(const RunContext& ctx, const std::string& path, size_t draws);

    void log_resume(const RunContext& ctx, const std::string& path, size_t draws_loaded);

    void log_cancelled(const RunContext& ctx, size_t completed, size_t total);

    /**
     * @brief Log a numerically undefined or imprecise result
     *
     * @param ctx Run context
     * @param metric Metric name (e.g. "icer", "evpi")
     * @param detail What was flagged
     */
    void log_numerical_flag(
        const RunContext& ctx,
        const std::string& metric,
        const std::string& detail
    );

    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void log_error(const RunContext& ctx, const std::string& error_message);

    /**
     * @brief Log run completion
     *
     * @param ctx Run context
     * @param draws Draws in the final collection
     * @param failed Iterations skipped
     * @param elapsed_ms Wall-clock time of the run
     */
    void log_run_complete(
        const RunContext& ctx,
        size_t draws,
        size_t failed,
        double elapsed_ms
    );

    void flush();

    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    using Fields = std::map<std::string, std::string>;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex mutex_;

    // Event name plus the context fields every record carries
    static Fields event_fields(const std::string& event, const RunContext& ctx);

    void log(LogLevel level, const std::string& message, const Fields& fields);
    std::string format_record(LogLevel level, const std::string& message, const Fields& fields) const;
    void write_output(const std::string& output);
};

} // namespace cohortcea

#endif // COHORTCEA_LOGGER_HPP
