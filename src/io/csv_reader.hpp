#ifndef OVERPAY_IO_CSV_READER_HPP
#define OVERPAY_IO_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace overpay {

// Minimal CSV row reader for small input tables (fixed-rate deals).
// Cells are whitespace-trimmed, blank lines and lines starting with '#' are
// skipped, and a trailing '\r' from CRLF files is dropped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-blank, non-comment row; empty when the stream is exhausted
    std::vector<std::string> read_row();
    bool has_more();

    // 1-based line number of the row last returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    static std::string trim(const std::string& s);
    static bool skippable(const std::string& line);
};

} // namespace overpay

#endif // OVERPAY_IO_CSV_READER_HPP
