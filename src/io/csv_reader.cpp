#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace overpay {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter), line_number_(0) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    while (std::getline(is_, line)) {
        ++line_number_;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (skippable(line)) {
            continue;
        }

        std::stringstream ss(line);
        std::string cell;
        while (std::getline(ss, cell, delimiter_)) {
            row.push_back(trim(cell));
        }
        break;
    }

    return row;
}

bool CsvReader::has_more() {
    // Consume blank and comment lines so a trailing newline is not a row
    while (is_.good()) {
        std::streampos pos = is_.tellg();
        std::string line;
        if (!std::getline(is_, line)) {
            return false;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!skippable(line)) {
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

bool CsvReader::skippable(const std::string& line) {
    std::string trimmed = trim(line);
    return trimmed.empty() || trimmed[0] == '#';
}

} // namespace overpay
