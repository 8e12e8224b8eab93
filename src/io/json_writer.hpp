#ifndef COHORTCEA_IO_JSON_WRITER_HPP
#define COHORTCEA_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../analysis.hpp"
#include "../run_config.hpp"

namespace cohortcea {
namespace io {

// Write the run summary to JSON format.
// The output includes run metadata, deterministic results at the policy WTP,
// PSA summary statistics and EVPI at the policy WTP. Undefined values are null.
void write_summary_json(std::ostream& os, const AnalysisResults& results,
                        const RunConfig& config, bool pretty_print = true);

// Write the run summary to a JSON file
void write_summary_json(const std::string& filepath, const AnalysisResults& results,
                        const RunConfig& config, bool pretty_print = true);

} // namespace io
} // namespace cohortcea

#endif // COHORTCEA_IO_JSON_WRITER_HPP
