#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include "analysis.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "run_config.hpp"

namespace {

constexpr int EXIT_RUN_ERROR = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_CANCELLED = 130;

struct CLIArgs {
    std::string config_path;
    std::string output_dir;
    std::string checkpoint_path;
    std::string perspective;
    bool has_iterations = false;
    size_t iterations = 0;
    bool has_seed = false;
    uint64_t seed = 0;
    bool resume = false;
    bool help = false;
};

cohortcea::CancellationToken* g_cancel = nullptr;

extern "C" void handle_interrupt(int /* signal */) {
    if (g_cancel != nullptr) {
        g_cancel->cancel();
    }
}

void print_usage(const char* program_name) {
    std::cerr << "cohortcea v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <path> [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <path>        JSON run configuration (required)\n";
    std::cerr << "  --iterations <count>   PSA iterations (overrides psa.iterations)\n";
    std::cerr << "  --seed <value>         Base random seed (overrides psa.seed)\n";
    std::cerr << "  --output <dir>         Output directory (overrides output.directory)\n";
    std::cerr << "  --checkpoint <path>    Checkpoint file (overrides psa.checkpoint)\n";
    std::cerr << "  --resume               Resume from the checkpoint file\n";
    std::cerr << "  --perspective <name>   health_system or societal (overrides perspective)\n";
    std::cerr << "  --help                 Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 run error, 2 configuration error, 130 interrupted\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config data/config.json --iterations 1000 --output out\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--iterations" && i + 1 < argc) {
                std::string value = argv[++i];
                if (value.empty() || value[0] == '-') {
                    std::cerr << "Error: --iterations must be a positive integer\n\n";
                    return false;
                }
                args.iterations = static_cast<size_t>(std::stoull(value));
                args.has_iterations = true;
            } else if (arg == "--seed" && i + 1 < argc) {
                std::string value = argv[++i];
                if (value.empty() || value[0] == '-') {
                    std::cerr << "Error: --seed must be a non-negative integer\n\n";
                    return false;
                }
                args.seed = std::stoull(value);
                args.has_seed = true;
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_dir = argv[++i];
            } else if (arg == "--checkpoint" && i + 1 < argc) {
                args.checkpoint_path = argv[++i];
            } else if (arg == "--perspective" && i + 1 < argc) {
                args.perspective = argv[++i];
            } else if (arg == "--resume") {
                args.resume = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            // std::stoull: invalid_argument or out_of_range
            std::cerr << "Error: Invalid numeric value for " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

void apply_overrides(const CLIArgs& args, cohortcea::RunConfig& config) {
    if (args.has_iterations) config.psa.iterations = args.iterations;
    if (args.has_seed) config.psa.seed = args.seed;
    if (!args.output_dir.empty()) config.output.directory = args.output_dir;
    if (!args.checkpoint_path.empty()) config.psa.checkpoint_path = args.checkpoint_path;
    if (args.resume) config.psa.resume = true;
    if (!args.perspective.empty()) config.perspective = cohortcea::parse_perspective(args.perspective);
}

void print_summary(const cohortcea::AnalysisResults& results) {
    std::cerr << "\nDeterministic results (reference " << results.reference << ", "
              << cohortcea::perspective_name(results.perspective) << " perspective):\n";
    for (size_t s = 0; s < results.strategies.size(); ++s) {
        const auto& row = results.incremental[s];
        std::cerr << "  " << std::left << std::setw(20) << row.strategy
                  << " cost " << std::setw(12) << row.cost
                  << " QALYs " << std::setw(10) << row.qalys
                  << " ICER ";
        if (row.icer) {
            std::cerr << *row.icer;
        } else {
            std::cerr << "NA";
        }
        std::cerr << " (" << cohortcea::incremental_status_name(row.status) << ")\n";
    }
    std::cerr << "\nPSA: " << results.psa.draws.size() << " of " << results.psa.requested
              << " iterations completed";
    if (!results.psa.failures.empty()) {
        std::cerr << ", " << results.psa.failures.size() << " skipped";
    }
    if (results.psa.cancelled) {
        std::cerr << " (cancelled)";
    }
    std::cerr << "\n  Execution: " << results.psa.execution_time_ms << " ms\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_CONFIG_ERROR;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n\n";
        print_usage(argv[0]);
        return EXIT_CONFIG_ERROR;
    }

    cohortcea::Logger& logger = cohortcea::Logger::get_instance();
    cohortcea::RunContext ctx("cohortcea", "config");

    // --- Configuration and inputs: every failure here is a configuration error ---
    cohortcea::RunConfig config;
    try {
        config = cohortcea::parse_run_config_from_file(args.config_path);
        apply_overrides(args, config);
        logger.configure(config.logging);
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }

    // Interrupts stop the PSA at the next batch boundary
    cohortcea::CancellationToken cancel;
    g_cancel = &cancel;
    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);

    try {
        cohortcea::CeaAnalysis analysis(config);

        cohortcea::AnalysisResults results = analysis.run(&cancel);
        cohortcea::write_results(config.output.directory, results, config, config.output.parquet);

        print_summary(results);
        std::cerr << "\nOutput written to: " << config.output.directory << "\n";

        logger.log_run_complete(cohortcea::RunContext(results.run_id, "output"),
                                results.psa.draws.size(), results.psa.failures.size(),
                                results.psa.execution_time_ms);
        logger.flush();
        return results.psa.cancelled ? EXIT_CANCELLED : 0;
    } catch (const cohortcea::ValidationError& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    } catch (const std::exception& e) {
        ctx.phase = "run";
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_RUN_ERROR;
    }
}
