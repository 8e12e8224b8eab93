#include "analysis.hpp"
#include "checkpoint.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/table_writer.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cohortcea {

AnalysisResults::AnalysisResults(const WTPGrid& wtp_grid)
    : grid(wtp_grid), policy_wtp(0.0), perspective(Perspective::HealthSystem), has_budget_impact(false),
      has_tornado(false), tornado_base(0.0), has_two_way(false) {}

// ============================================================================
// Loading
// ============================================================================

namespace {

AdoptionCurve load_adoption(const std::string& path) {
    if (path.empty()) {
        return AdoptionCurve();
    }
    return AdoptionCurve::load_from_csv(path);
}

std::string run_id_for(const RunConfig& config) {
    return config.jurisdiction + "_seed_" + std::to_string(config.psa.seed);
}

void require_parquet() {
    if (!ParquetWriter::available()) {
        throw ValidationError("Parquet output requested but this build has no Apache Arrow support");
    }
}

std::string format_wtp(double wtp) {
    std::ostringstream ss;
    ss << wtp;
    return ss.str();
}

} // anonymous namespace

CeaAnalysis::CeaAnalysis(const RunConfig& config)
    : config_(config),
      table_(ParameterTable::load_from_csv(config.inputs.parameters, config.jurisdiction)),
      life_table_(LifeTable::load_from_csv(config.inputs.life_table)),
      registry_(load_depression_registry(config.inputs.strategies, config.inputs.state_values,
                                         table_, life_table_, config.model)),
      adoption_(load_adoption(config.inputs.adoption)),
      simulator_(config.model.cycles),
      aggregator_(simulator_, config.rates(), config.perspective),
      runner_(registry_, table_, aggregator_) {
    registry_.validate(table_, config_.reference_strategy);

    // Everything the later phases look up by name is checked here; the
    // analyzer and projector constructors validate their settings
    for (const auto& group : config_.evppi_groups) {
        for (const auto& name : group.parameters) {
            if (!table_.contains(name)) {
                throw ValidationError("EVPPI group '" + group.name + "' references unknown parameter '" + name + "'");
            }
        }
    }
    if (config_.output.parquet) {
        require_parquet();
    }
    if (config_.sensitivity_enabled) {
        SensitivityAnalyzer check(runner_, config_.reference_strategy, config_.sensitivity);
    }
    if (config_.two_way_enabled) {
        TwoWaySensitivityAnalyzer check(runner_, config_.reference_strategy, config_.two_way);
    }
    if (!config_.scenarios.empty()) {
        ScenarioAnalyzer(registry_, table_, aggregator_, config_.reference_strategy, config_.wtp.policy)
            .validate(config_.scenarios);
    }
    if (!adoption_.empty()) {
        adoption_.validate();
        BudgetImpactProjector check(registry_.ids(), config_.reference_strategy, config_.budget_impact);
    }

    std::map<std::string, std::string> settings;
    settings["jurisdiction"] = config_.jurisdiction;
    settings["reference_strategy"] = config_.reference_strategy;
    settings["strategies"] = std::to_string(registry_.size());
    settings["parameters"] = std::to_string(table_.size());
    settings["iterations"] = std::to_string(config_.psa.iterations);
    settings["seed"] = std::to_string(config_.psa.seed);
    settings["perspective"] = perspective_name(config_.perspective);
    settings["evppi_method"] = evppi_method_name(config_.voi.evppi_method);
    settings["error_policy"] = error_policy_name(config_.psa.error_policy);
    Logger::get_instance().log_config_loaded(RunContext(run_id_for(config_), "config"),
                                             config_.config_path, settings);
}

// ============================================================================
// Run
// ============================================================================

AnalysisResults CeaAnalysis::run(const CancellationToken* cancel) const {
    Logger& logger = Logger::get_instance();
    AnalysisResults results(config_.wtp_grid());
    results.run_id = run_id_for(config_);
    results.strategies = registry_.ids();
    results.reference = config_.reference_strategy;
    results.policy_wtp = config_.wtp.policy;
    results.perspective = config_.perspective;

    DecisionMetricsCalculator metrics(results.strategies, results.reference);

    // --- Deterministic ---
    RunContext ctx(results.run_id, "deterministic");
    results.deterministic = runner_.run_deterministic();
    results.incremental = metrics.incremental_results(results.deterministic);
    results.frontier = metrics.efficiency_frontier(results.deterministic);
    results.headroom = metrics.price_headroom(results.deterministic, results.policy_wtp);

    for (const auto& row : results.incremental) {
        if (row.status == IncrementalStatus::UndefinedZeroDenominator) {
            RunContext strategy_ctx = ctx;
            strategy_ctx.strategy = row.strategy;
            logger.log_numerical_flag(strategy_ctx, "icer",
                                      "same cost and QALYs as " + results.reference);
        }
    }

    // --- Probabilistic ---
    results.psa = runner_.run(config_.psa, cancel);
    ctx.phase = "metrics";
    if (!results.has_draws()) {
        logger.log_warning(ctx, "No PSA draws completed; probabilistic outputs are empty");
    } else {
        const auto& draws = results.psa.draws;
        results.snapshot = parameter_snapshot(draws, results.psa.layout);
        results.ceac = metrics.ceac(draws, results.grid);
        results.ceaf = metrics.ceaf(draws, results.grid);
        results.expected_nmb = metrics.expected_nmb(draws, results.grid);
        results.ce_plane = metrics.ce_plane(draws);
        results.summary = metrics.summary_statistics(draws);

        // --- Value of information ---
        ctx.phase = "voi";
        ValueOfInformationEngine voi(config_.voi);
        results.evpi = voi.evpi(draws, results.grid);
        for (const auto& point : results.evpi) {
            if (point.low_precision) {
                logger.log_numerical_flag(ctx, "evpi", "low precision at wtp " + format_wtp(point.wtp));
            }
        }
        for (const auto& group : config_.evppi_groups) {
            auto points = voi.evppi(draws, runner_, group, results.grid, config_.psa.seed);
            for (const auto& point : points) {
                if (point.low_precision) {
                    logger.log_numerical_flag(ctx, "evppi",
                                              "group " + group.name + " low precision at wtp " + format_wtp(point.wtp));
                }
            }
            results.evppi.insert(results.evppi.end(), points.begin(), points.end());
        }
    }

    results.perspectives = metrics.perspective_comparison(results.deterministic, results.psa.draws,
                                                          results.policy_wtp);

    // --- Budget impact (deterministic per-patient cost) ---
    if (!adoption_.empty()) {
        std::vector<double> per_patient_cost;
        for (const auto& outcome : results.deterministic) {
            per_patient_cost.push_back(outcome.cost);
        }
        BudgetImpactProjector projector(results.strategies, results.reference, config_.budget_impact);
        results.budget_impact = projector.project(adoption_, per_patient_cost);
        results.has_budget_impact = true;
    }

    // --- One-way sensitivity ---
    if (config_.sensitivity_enabled) {
        SensitivityAnalyzer analyzer(runner_, results.reference, config_.sensitivity);
        results.tornado_base = analyzer.base_outcome();
        results.tornado = analyzer.tornado();
        results.has_tornado = true;
    }

    // --- Two-way sensitivity ---
    if (config_.two_way_enabled) {
        TwoWaySensitivityAnalyzer analyzer(runner_, results.reference, config_.two_way);
        results.two_way = analyzer.grid();
        results.has_two_way = true;
    }

    // --- Scenarios ---
    if (!config_.scenarios.empty()) {
        ctx.phase = "scenarios";
        ScenarioAnalyzer analyzer(registry_, table_, aggregator_, results.reference, results.policy_wtp);
        results.scenarios = analyzer.run(config_.scenarios);
        for (const auto& row : results.scenarios) {
            if (row.status == IncrementalStatus::UndefinedZeroDenominator) {
                RunContext strategy_ctx = ctx;
                strategy_ctx.strategy = row.strategy;
                logger.log_numerical_flag(strategy_ctx, "icer", "scenario " + row.scenario +
                                          ": same cost and QALYs as " + results.reference);
            }
        }
    }

    return results;
}

// ============================================================================
// Output
// ============================================================================

void write_results(const std::string& directory, const AnalysisResults& results,
                   const RunConfig& config, bool write_parquet) {
    // Checked before the first file so a failure leaves no partial output
    if (write_parquet) {
        require_parquet();
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + directory + ": " + ec.message());
    }
    auto path = [&directory](const std::string& name) {
        return (fs::path(directory) / name).string();
    };

    {
        auto file = io::open_output_file(path("deterministic_results.csv"));
        io::write_deterministic_csv(file, results.strategies, results.deterministic);
    }
    {
        auto file = io::open_output_file(path("incremental_results.csv"));
        io::write_incremental_csv(file, results.incremental);
    }
    {
        auto file = io::open_output_file(path("frontier.csv"));
        io::write_frontier_csv(file, results.frontier);
    }
    if (!results.perspectives.empty()) {
        auto file = io::open_output_file(path("perspective_comparison.csv"));
        io::write_perspective_csv(file, results.perspectives);
    }

    if (results.has_draws()) {
        {
            auto file = io::open_output_file(path("psa_draws.csv"));
            write_draws_csv(file, results.psa.layout, results.psa.draws, CHECKPOINT_PRECISION);
        }
        {
            auto file = io::open_output_file(path("parameter_snapshot.csv"));
            io::write_parameter_snapshot_csv(file, results.snapshot);
        }
        {
            auto file = io::open_output_file(path("ceac.csv"));
            io::write_ceac_csv(file, results.strategies, results.ceac);
        }
        {
            auto file = io::open_output_file(path("ceaf.csv"));
            io::write_ceaf_csv(file, results.strategies, results.ceaf);
        }
        {
            auto file = io::open_output_file(path("expected_nmb.csv"));
            io::write_expected_nmb_csv(file, results.strategies, results.grid, results.expected_nmb);
        }
        {
            auto file = io::open_output_file(path("ce_plane.csv"));
            io::write_ce_plane_csv(file, results.strategies, results.ce_plane);
        }
        {
            auto file = io::open_output_file(path("evpi.csv"));
            io::write_evpi_csv(file, results.strategies, results.evpi);
        }
        if (!config.evppi_groups.empty()) {
            auto file = io::open_output_file(path("evppi.csv"));
            io::write_evppi_csv(file, results.evppi);
        }
        if (write_parquet) {
            ParquetWriter::write_draws(results.psa.layout, results.psa.draws, path("psa_draws.parquet"));
            ParquetWriter::write_snapshot(results.snapshot, path("parameter_snapshot.parquet"));
        }
    }

    if (results.has_budget_impact) {
        auto file = io::open_output_file(path("budget_impact.csv"));
        io::write_budget_impact_csv(file, results.strategies, results.budget_impact);
    }
    if (results.has_tornado) {
        auto file = io::open_output_file(path("tornado.csv"));
        io::write_tornado_csv(file, results.tornado);
    }
    if (results.has_two_way) {
        auto file = io::open_output_file(path("two_way_dsa.csv"));
        io::write_two_way_csv(file, config.two_way, results.two_way);
    }
    if (!results.scenarios.empty()) {
        auto file = io::open_output_file(path("scenarios.csv"));
        io::write_scenarios_csv(file, results.scenarios);
    }

    io::write_summary_json(path("summary.json"), results, config);
}

} // namespace cohortcea
