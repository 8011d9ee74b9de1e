#pragma once

#include "infra/filesystem.h"
#include "infra/span.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prima {

// Numbers in the tables use a ',' as decimal separator
std::optional<double> parse_decimal(std::string_view value);
double parse_decimal_value(std::string_view value);
// Shortest notation that reads back to the same value
std::string format_decimal(double value);

// ';' separated table, the first line contains the header
// Cells are trimmed, empty lines are skipped
class DelimitedTable
{
public:
    explicit DelimitedTable(const fs::path& path);

    // the cells refer to the file contents
    DelimitedTable(const DelimitedTable&)            = delete;
    DelimitedTable& operator=(const DelimitedTable&) = delete;

    const fs::path& path() const noexcept;
    std::span<const std::string_view> header() const noexcept;

    size_t row_count() const noexcept;
    std::span<const std::string_view> row(size_t index) const;
    // Line number in the file of the row, for error reporting
    size_t line_number(size_t index) const;

private:
    fs::path _path;
    std::string _contents;
    std::vector<std::string_view> _header;
    std::vector<std::vector<std::string_view>> _rows;
    std::vector<size_t> _lineNumbers;
};

}
