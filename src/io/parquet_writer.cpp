#include "parquet_writer.hpp"
#include <memory>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace cohortcea {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& filepath) {
    std::shared_ptr<arrow::io::FileOutputStream> outfile;
    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_draws(const DrawLayout& layout, const std::vector<SimulationDraw>& draws,
                                const std::string& filepath) {
    if (draws.empty()) {
        throw std::runtime_error("No draws to write to " + filepath);
    }

    const size_t n_params = layout.parameter_names.size();
    const size_t n_strategies = layout.strategies.size();

    std::vector<std::shared_ptr<arrow::Field>> fields;
    fields.push_back(arrow::field("iteration", arrow::uint64()));
    fields.push_back(arrow::field("seed", arrow::uint64()));
    for (const auto& name : layout.parameter_names) {
        fields.push_back(arrow::field(name, arrow::float64()));
    }
    for (const auto& name : layout.strategies) {
        fields.push_back(arrow::field(name + "_cost", arrow::float64()));
        fields.push_back(arrow::field(name + "_health_system_cost", arrow::float64()));
        fields.push_back(arrow::field(name + "_societal_cost", arrow::float64()));
        fields.push_back(arrow::field(name + "_qalys", arrow::float64()));
        fields.push_back(arrow::field(name + "_life_years", arrow::float64()));
    }

    arrow::UInt64Builder iteration_builder;
    arrow::UInt64Builder seed_builder;
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> value_builders;
    const size_t per_strategy = 5;
    for (size_t c = 0; c < n_params + per_strategy * n_strategies; ++c) {
        value_builders.push_back(std::make_unique<arrow::DoubleBuilder>());
    }

    check(iteration_builder.Reserve(draws.size()), "reserve iteration column");
    check(seed_builder.Reserve(draws.size()), "reserve seed column");
    for (auto& builder : value_builders) {
        check(builder->Reserve(draws.size()), "reserve value column");
    }

    for (const auto& draw : draws) {
        if (draw.parameters.size() != n_params || draw.outcomes.size() != n_strategies) {
            throw std::runtime_error("Draw for iteration " + std::to_string(draw.iteration) +
                                     " does not match the layout");
        }
        check(iteration_builder.Append(draw.iteration), "append iteration");
        check(seed_builder.Append(draw.seed), "append seed");
        for (size_t p = 0; p < n_params; ++p) {
            check(value_builders[p]->Append(draw.parameters[p]), "append parameter value");
        }
        for (size_t s = 0; s < n_strategies; ++s) {
            const size_t base = n_params + per_strategy * s;
            const StrategyOutcome& outcome = draw.outcomes[s];
            check(value_builders[base]->Append(outcome.cost), "append cost");
            check(value_builders[base + 1]->Append(outcome.health_system_cost), "append health-system cost");
            check(value_builders[base + 2]->Append(outcome.societal_cost), "append societal cost");
            check(value_builders[base + 3]->Append(outcome.qalys), "append qalys");
            check(value_builders[base + 4]->Append(outcome.life_years), "append life years");
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> columns;
    columns.push_back(finish(iteration_builder, "iteration"));
    columns.push_back(finish(seed_builder, "seed"));
    for (size_t c = 0; c < value_builders.size(); ++c) {
        columns.push_back(finish(*value_builders[c], fields[c + 2]->name()));
    }

    write_table(arrow::Table::Make(arrow::schema(fields), columns), filepath);
}

void ParquetWriter::write_snapshot(const std::vector<SnapshotRow>& rows, const std::string& filepath) {
    auto schema = arrow::schema({
        arrow::field("iteration", arrow::uint64()),
        arrow::field("seed", arrow::uint64()),
        arrow::field("parameter", arrow::utf8()),
        arrow::field("value", arrow::float64())
    });

    arrow::UInt64Builder iteration_builder;
    arrow::UInt64Builder seed_builder;
    arrow::StringBuilder parameter_builder;
    arrow::DoubleBuilder value_builder;

    check(iteration_builder.Reserve(rows.size()), "reserve iteration column");
    check(seed_builder.Reserve(rows.size()), "reserve seed column");
    check(parameter_builder.Reserve(rows.size()), "reserve parameter column");
    check(value_builder.Reserve(rows.size()), "reserve value column");

    for (const auto& row : rows) {
        check(iteration_builder.Append(row.iteration), "append iteration");
        check(seed_builder.Append(row.seed), "append seed");
        check(parameter_builder.Append(row.parameter), "append parameter");
        check(value_builder.Append(row.value), "append value");
    }

    auto table = arrow::Table::Make(schema, {
        finish(iteration_builder, "iteration"),
        finish(seed_builder, "seed"),
        finish(parameter_builder, "parameter"),
        finish(value_builder, "value")
    });
    write_table(table, filepath);
}

bool ParquetWriter::available() {
    return true;
}

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_draws(const DrawLayout& /* layout */, const std::vector<SimulationDraw>& /* draws */,
                                const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

void ParquetWriter::write_snapshot(const std::vector<SnapshotRow>& /* rows */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace cohortcea
