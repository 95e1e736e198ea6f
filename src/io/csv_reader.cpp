#include "csv_reader.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace plancalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    if (!skip_ignorable_lines()) {
        return row;
    }

    std::string line;
    std::getline(is_, line);
    ++line_number_;

    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, delimiter_)) {
        row.push_back(trim(cell));
    }
    // "a,b," carries an empty trailing cell
    if (!line.empty() && trim(line).back() == delimiter_) {
        row.emplace_back();
    }

    return row;
}

bool CsvReader::has_more() {
    return skip_ignorable_lines();
}

bool CsvReader::skip_ignorable_lines() {
    while (is_.good() && is_.peek() != EOF) {
        std::streampos pos = is_.tellg();
        std::string line;
        std::getline(is_, line);
        std::string trimmed = trim(line);
        if (!trimmed.empty() && trimmed[0] != '#') {
            // Rewind so read_row() sees the full line
            is_.clear();
            is_.seekg(pos);
            return true;
        }
        ++line_number_;
    }
    return false;
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

} // namespace plancalc
