#include "checkpoint.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cohortcea {

namespace {

const char* const OUTCOME_SUFFIXES[] = {"_health_system_cost", "_societal_cost", "_qalys", "_life_years"};

std::vector<std::string> draw_header(const DrawLayout& layout) {
    std::vector<std::string> header = {"iteration", "seed"};
    for (const auto& name : layout.parameter_names) {
        header.push_back(name);
    }
    for (const auto& strategy : layout.strategies) {
        for (const char* suffix : OUTCOME_SUFFIXES) {
            header.push_back(strategy + suffix);
        }
    }
    return header;
}

uint64_t parse_seed(const std::string& cell, const std::string& context) {
    size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(cell, &consumed);
    } catch (const std::exception&) {
        throw ValidationError(context + ": expected a seed, got '" + cell + "'");
    }
    if (consumed != cell.size()) {
        throw ValidationError(context + ": expected a seed, got '" + cell + "'");
    }
    return static_cast<uint64_t>(value);
}

std::vector<SimulationDraw> sorted_by_iteration(std::vector<SimulationDraw> draws) {
    std::stable_sort(draws.begin(), draws.end(),
                     [](const SimulationDraw& a, const SimulationDraw& b) {
                         return a.iteration < b.iteration;
                     });
    return draws;
}

void reject_duplicate_seeds(const std::vector<SimulationDraw>& draws, const char* source) {
    std::set<uint64_t> seeds;
    for (const auto& draw : draws) {
        if (!seeds.insert(draw.seed).second) {
            throw ResumeConflictError(draw.seed, std::string("Duplicate seed ") + std::to_string(draw.seed) +
                                      " in " + source + " draws");
        }
    }
}

void write_draw_rows(std::ostream& os, const std::vector<SimulationDraw>& draws, int precision) {
    os.precision(precision);
    for (const auto& draw : draws) {
        os << draw.iteration << ',' << draw.seed;
        for (double value : draw.parameters) {
            os << ',' << value;
        }
        for (const auto& outcome : draw.outcomes) {
            os << ',' << outcome.health_system_cost << ',' << outcome.societal_cost
               << ',' << outcome.qalys << ',' << outcome.life_years;
        }
        os << '\n';
    }
}

} // anonymous namespace

void write_draws_csv(std::ostream& os, const DrawLayout& layout,
                     const std::vector<SimulationDraw>& draws, int precision) {
    const auto header = draw_header(layout);
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) os << ',';
        os << header[i];
    }
    os << '\n';
    write_draw_rows(os, draws, precision);
}

std::vector<SimulationDraw> read_draws_csv(std::istream& is, const DrawLayout& expected) {
    CsvReader reader(is);
    const auto header = reader.read_header();
    if (header != draw_header(expected)) {
        throw ResumeConflictError(0, "Checkpoint columns do not match the configured parameters and strategies");
    }

    const size_t num_params = expected.parameter_names.size();
    const size_t num_strategies = expected.strategies.size();

    std::vector<SimulationDraw> draws;
    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) continue;

        const std::string context = "checkpoint line " + std::to_string(reader.line_number());
        if (row.size() != header.size()) {
            throw ValidationError(context + ": expected " + std::to_string(header.size()) +
                                  " columns, got " + std::to_string(row.size()));
        }

        SimulationDraw draw;
        long iteration = parse_int(row[0], context + " iteration");
        if (iteration < 0) {
            throw ValidationError(context + ": negative iteration");
        }
        draw.iteration = static_cast<size_t>(iteration);
        draw.seed = parse_seed(row[1], context + " seed");

        size_t col = 2;
        draw.parameters.reserve(num_params);
        for (size_t p = 0; p < num_params; ++p) {
            draw.parameters.push_back(parse_double(row[col++], context));
        }
        draw.outcomes.reserve(num_strategies);
        for (size_t s = 0; s < num_strategies; ++s) {
            StrategyOutcome outcome;
            outcome.health_system_cost = parse_double(row[col++], context);
            outcome.societal_cost = parse_double(row[col++], context);
            outcome.qalys = parse_double(row[col++], context);
            outcome.life_years = parse_double(row[col++], context);
            outcome.cost = outcome.cost_under(expected.perspective);
            draw.outcomes.push_back(outcome);
        }
        draws.push_back(std::move(draw));
    }
    return draws;
}

void write_checkpoint(const std::string& path, const DrawLayout& layout,
                      const std::vector<SimulationDraw>& draws) {
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream file(tmp_path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open checkpoint file for writing: " + tmp_path);
        }
        write_draws_csv(file, layout, draws, CHECKPOINT_PRECISION);
        if (!file) {
            throw std::runtime_error("Failed writing checkpoint file: " + tmp_path);
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        throw std::runtime_error("Cannot move checkpoint into place: " + path);
    }
}

void append_checkpoint(const std::string& path, const DrawLayout& layout,
                       const std::vector<SimulationDraw>& draws) {
    if (!std::ifstream(path).is_open()) {
        write_checkpoint(path, layout, draws);
        return;
    }

    // One write per batch
    std::ostringstream rows;
    write_draw_rows(rows, draws, CHECKPOINT_PRECISION);

    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open checkpoint file for appending: " + path);
    }
    file << rows.str();
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed appending to checkpoint file: " + path);
    }
}

std::vector<SimulationDraw> load_checkpoint(const std::string& path, const DrawLayout& expected) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open checkpoint file: " + path);
    }
    return read_draws_csv(file, expected);
}

void validate_resumed_draws(const std::vector<SimulationDraw>& draws, uint64_t base_seed,
                            size_t iterations) {
    for (const auto& draw : draws) {
        if (draw.seed != iteration_seed(base_seed, draw.iteration)) {
            std::ostringstream msg;
            msg << "Checkpoint draw for iteration " << draw.iteration << " has seed " << draw.seed
                << ", expected " << iteration_seed(base_seed, draw.iteration)
                << " (checkpoint belongs to a different seed)";
            throw ResumeConflictError(draw.seed, msg.str());
        }
        if (draw.iteration >= iterations) {
            std::ostringstream msg;
            msg << "Checkpoint draw for iteration " << draw.iteration
                << " is beyond the requested " << iterations << " iterations";
            throw ResumeConflictError(draw.seed, msg.str());
        }
    }
    reject_duplicate_seeds(draws, "checkpoint");
}

std::vector<SimulationDraw> merge_draws(const std::vector<SimulationDraw>& existing,
                                        const std::vector<SimulationDraw>& incoming,
                                        MergePolicy policy) {
    reject_duplicate_seeds(existing, "existing");
    reject_duplicate_seeds(incoming, "incoming");

    std::set<uint64_t> present;
    for (const auto& draw : existing) {
        present.insert(draw.seed);
    }

    std::vector<SimulationDraw> merged = existing;
    for (const auto& draw : incoming) {
        if (present.count(draw.seed) > 0) {
            if (policy == MergePolicy::Reject) {
                throw ResumeConflictError(draw.seed, "Seed " + std::to_string(draw.seed) +
                                          " is already present (iteration " +
                                          std::to_string(draw.iteration) + ")");
            }
            continue;
        }
        merged.push_back(draw);
    }
    return sorted_by_iteration(std::move(merged));
}

} // namespace cohortcea
