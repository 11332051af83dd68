#ifndef RETIRECALC_CSV_READER_HPP
#define RETIRECALC_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace retirecalc {

// Line-oriented CSV reader for assumption tables.
// Lines starting with '#' are skipped; double-quoted cells may contain the delimiter.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more();

    // 1-based number of the last line returned by read_row
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace retirecalc

#endif // RETIRECALC_CSV_READER_HPP
