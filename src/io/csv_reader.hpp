#ifndef COHORTCEA_CSV_READER_HPP
#define COHORTCEA_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

namespace cohortcea {

// Minimal CSV reader for the model's input tables.
// Cells are trimmed; double-quoted cells may contain the delimiter.
// Blank lines and lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more();

    // Read the first row as a header and remember its column positions
    // (lower-cased). Returns the header cells.
    const std::vector<std::string>& read_header();

    // Column index for a header name, or -1 when absent
    int column(const std::string& name) const;

    // Column index for a header name; throws ValidationError when absent
    size_t require_column(const std::string& name) const;

    // Current 1-based line number (for error messages)
    size_t line_number() const { return line_number_; }

    static std::string trim(const std::string& s);

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;
    std::vector<std::string> header_;
    std::unordered_map<std::string, size_t> columns_;

    bool skip_ignorable_lines();
    std::vector<std::string> split(const std::string& line) const;
};

// Parse a double cell, naming the table/column in the error
double parse_double(const std::string& cell, const std::string& context);

// Parse an integer cell, naming the table/column in the error
long parse_int(const std::string& cell, const std::string& context);

} // namespace cohortcea

#endif // COHORTCEA_CSV_READER_HPP
