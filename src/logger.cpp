/**
 * @file logger.cpp
 * @brief Implementation of structured run logger
 */

#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cohortcea {

namespace {

// UTC, ISO 8601 with milliseconds
std::string utc_timestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string percent(size_t part, size_t whole) {
    return std::to_string(whole > 0 ? 100.0 * static_cast<double>(part) / static_cast<double>(whole) : 100.0);
}

} // anonymous namespace

std::string level_to_string(LogLevel level) {
    static const char* const names[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    const auto index = static_cast<size_t>(level);
    return index < 4 ? names[index] : "UNKNOWN";
}

LogLevel string_to_level(const std::string& name) {
    std::string upper;
    for (char c : name) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (LogLevel level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN, LogLevel::ERROR}) {
        if (upper == level_to_string(level)) {
            return level;
        }
    }
    return LogLevel::INFO;
}

RunContext::RunContext() : iteration(0) {}

RunContext::RunContext(const std::string& id, const std::string& run_phase)
    : run_id(id), phase(run_phase), iteration(0) {}

LoggerConfig::LoggerConfig()
    : min_level(LogLevel::INFO),
      enable_console(true),
      enable_file(false),
      log_file_path("cohortcea.log"),
      enable_json(true) {}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
            file_stream_.reset();
        }
    }
}

Logger::Fields Logger::event_fields(const std::string& event, const RunContext& ctx) {
    Fields fields;
    fields["event"] = event;
    fields["run_id"] = ctx.run_id;
    if (!ctx.phase.empty()) fields["phase"] = ctx.phase;
    if (!ctx.strategy.empty()) fields["strategy"] = ctx.strategy;
    if (ctx.iteration > 0) fields["iteration"] = std::to_string(ctx.iteration);
    return fields;
}

// ============================================================================
// Run events
// ============================================================================

void Logger::log_config_loaded(const RunContext& ctx, const std::string& config_path,
                               const std::map<std::string, std::string>& settings) {
    Fields fields = event_fields("config_loaded", ctx);
    fields["config_path"] = config_path;
    for (const auto& [key, value] : settings) {
        fields["config." + key] = value;
    }
    log(LogLevel::INFO, "Configuration loaded", fields);
}

void Logger::log_run_start(const RunContext& ctx, size_t iterations, uint64_t seed, size_t num_strategies) {
    Fields fields = event_fields("run_start", ctx);
    fields["iterations"] = std::to_string(iterations);
    fields["seed"] = std::to_string(seed);
    fields["strategies"] = std::to_string(num_strategies);
    log(LogLevel::INFO, "Starting PSA run", fields);
}

void Logger::log_batch_complete(const RunContext& ctx, size_t completed, size_t total, size_t failed) {
    Fields fields = event_fields("batch_complete", ctx);
    fields["completed"] = std::to_string(completed);
    fields["total"] = std::to_string(total);
    fields["failed"] = std::to_string(failed);
    fields["progress_pct"] = percent(completed, total);
    log(LogLevel::DEBUG, "PSA batch complete", fields);
}

void Logger::log_iteration_failed(const RunContext& ctx, size_t iteration, uint64_t seed,
                                  const std::string& error_message) {
    Fields fields = event_fields("iteration_failed", ctx);
    fields["iteration"] = std::to_string(iteration);
    fields["seed"] = std::to_string(seed);
    fields["error_message"] = error_message;
    log(LogLevel::WARN, "PSA iteration failed", fields);
}

void Logger::log_checkpoint_written(const RunContext& ctx, const std::string& path, size_t draws) {
    Fields fields = event_fields("checkpoint_written", ctx);
    fields["path"] = path;
    fields["draws"] = std::to_string(draws);
    log(LogLevel::DEBUG, "Checkpoint written", fields);
}

void Logger::log_resume(const RunContext& ctx, const std::string& path, size_t draws_loaded) {
    Fields fields = event_fields("resume", ctx);
    fields["path"] = path;
    fields["draws_loaded"] = std::to_string(draws_loaded);
    log(LogLevel::INFO, "Resuming from checkpoint", fields);
}

void Logger::log_cancelled(const RunContext& ctx, size_t completed, size_t total) {
    Fields fields = event_fields("cancelled", ctx);
    fields["completed"] = std::to_string(completed);
    fields["total"] = std::to_string(total);
    log(LogLevel::WARN, "PSA run cancelled", fields);
}

void Logger::log_numerical_flag(const RunContext& ctx, const std::string& metric, const std::string& detail) {
    Fields fields = event_fields("numerical_flag", ctx);
    fields["metric"] = metric;
    fields["detail"] = detail;
    log(LogLevel::WARN, "Numerically undefined or imprecise result", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    log(LogLevel::WARN, warning_message, event_fields("warning", ctx));
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    Fields fields = event_fields("error", ctx);
    fields["error_message"] = error_message;
    log(LogLevel::ERROR, "Run error", fields);
}

void Logger::log_run_complete(const RunContext& ctx, size_t draws, size_t failed, double elapsed_ms) {
    Fields fields = event_fields("run_complete", ctx);
    fields["draws"] = std::to_string(draws);
    fields["failed"] = std::to_string(failed);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);
    log(LogLevel::INFO, "Run complete", fields);
}

// ============================================================================
// Output
// ============================================================================

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const Fields& fields) {
    if (level < config_.min_level) {
        return;
    }
    const std::string record = format_record(level, message, fields);

    std::lock_guard<std::mutex> lock(mutex_);
    write_output(record);
}

std::string Logger::format_record(LogLevel level, const std::string& message, const Fields& fields) const {
    if (config_.enable_json) {
        nlohmann::json record(fields);
        record["timestamp"] = utc_timestamp();
        record["level"] = level_to_string(level);
        record["message"] = message;
        // Invalid UTF-8 is replaced, not thrown
        return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream oss;
    oss << utc_timestamp() << " [" << level_to_string(level) << "] " << message;
    if (!fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : fields) {
            oss << separator << key << '=' << value;
            separator = ", ";
        }
        oss << '}';
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << '\n';
    }
    if (config_.enable_file && file_stream_) {
        *file_stream_ << output << '\n';
    }
}

} // namespace cohortcea
