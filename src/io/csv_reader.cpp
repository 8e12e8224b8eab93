#include "csv_reader.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace cohortcea {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

bool CsvReader::skip_ignorable_lines() {
    while (is_.good() && is_.peek() != EOF) {
        int c = is_.peek();
        if (c == '#' || c == '\n' || c == '\r') {
            std::string discard;
            std::getline(is_, discard);
            ++line_number_;
            continue;
        }
        return true;
    }
    return false;
}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    if (!skip_ignorable_lines()) {
        return row;
    }

    std::string line;
    if (!std::getline(is_, line)) {
        return row;
    }
    ++line_number_;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return split(line);
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == delimiter_ && !in_quotes) {
            row.push_back(trim(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    row.push_back(trim(cell));
    return row;
}

bool CsvReader::has_more() {
    return skip_ignorable_lines();
}

const std::vector<std::string>& CsvReader::read_header() {
    header_ = read_row();
    columns_.clear();
    for (size_t i = 0; i < header_.size(); ++i) {
        std::string key = header_[i];
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        columns_[key] = i;
    }
    return header_;
}

int CsvReader::column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        return -1;
    }
    return static_cast<int>(it->second);
}

size_t CsvReader::require_column(const std::string& name) const {
    auto it = columns_.find(name);
    if (it == columns_.end()) {
        throw ValidationError("CSV header is missing required column '" + name + "'");
    }
    return it->second;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

double parse_double(const std::string& cell, const std::string& context) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(cell, &consumed);
    } catch (const std::exception&) {
        throw ValidationError(context + ": expected a number, got '" + cell + "'");
    }
    if (consumed != cell.size() || !std::isfinite(value)) {
        throw ValidationError(context + ": expected a number, got '" + cell + "'");
    }
    return value;
}

long parse_int(const std::string& cell, const std::string& context) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(cell, &consumed);
    } catch (const std::exception&) {
        throw ValidationError(context + ": expected an integer, got '" + cell + "'");
    }
    if (consumed != cell.size()) {
        throw ValidationError(context + ": expected an integer, got '" + cell + "'");
    }
    return value;
}

} // namespace cohortcea
