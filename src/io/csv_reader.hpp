#ifndef PLANCALC_CSV_READER_HPP
#define PLANCALC_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace plancalc {

// Minimal line-oriented CSV reader for small reference tables
// Cells are trimmed; blank lines and lines starting with '#' are skipped.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    // Next non-blank, non-comment row (empty vector at end of input)
    std::vector<std::string> read_row();
    bool has_more();

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    bool skip_ignorable_lines();
    static std::string trim(const std::string& s);
};

} // namespace plancalc

#endif // PLANCALC_CSV_READER_HPP
