#include "delimitedtable.h"

#include "prima/constants.h"

#include "infra/exception.h"
#include "infra/string.h"

#include <algorithm>
#include <fmt/format.h>

namespace prima {

using namespace inf;

std::optional<double> parse_decimal(std::string_view value)
{
    std::string valueStr(str::trimmed_view(value));
    if (valueStr.empty()) {
        return {};
    }

    std::replace(valueStr.begin(), valueStr.end(), ',', '.');
    return str::to_double(valueStr);
}

double parse_decimal_value(std::string_view value)
{
    if (auto result = parse_decimal(value); result.has_value()) {
        return *result;
    }

    throw RuntimeError("Invalid numeric value: '{}'", value);
}

std::string format_decimal(double value)
{
    auto result = fmt::format("{}", value);
    std::replace(result.begin(), result.end(), '.', ',');
    return result;
}

static std::vector<std::string_view> split_cells(std::string_view line)
{
    // empty tokens are kept: an empty cell is a missing value
    auto cells = str::split_view(line, constants::TableSeparator);
    for (auto& cell : cells) {
        cell = str::trimmed_view(cell);
    }

    return cells;
}

DelimitedTable::DelimitedTable(const fs::path& path)
: _path(path)
, _contents(file::read_as_text(path))
{
    const auto lines = str::split_view(_contents, '\n');

    size_t lineNr = 0;
    for (auto line : lines) {
        ++lineNr;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (str::trimmed_view(line).empty()) {
            continue;
        }

        auto cells = split_cells(line);
        if (_header.empty()) {
            _header = std::move(cells);
            continue;
        }

        if (cells.size() != _header.size()) {
            throw RuntimeError("Invalid table {} (line {}: expected {} values, got {})", path, lineNr, _header.size(), cells.size());
        }

        _rows.push_back(std::move(cells));
        _lineNumbers.push_back(lineNr);
    }

    if (_header.empty()) {
        throw RuntimeError("Invalid table {}: no header present", path);
    }
}

const fs::path& DelimitedTable::path() const noexcept
{
    return _path;
}

std::span<const std::string_view> DelimitedTable::header() const noexcept
{
    return _header;
}

size_t DelimitedTable::row_count() const noexcept
{
    return _rows.size();
}

std::span<const std::string_view> DelimitedTable::row(size_t index) const
{
    return _rows.at(index);
}

size_t DelimitedTable::line_number(size_t index) const
{
    return _lineNumbers.at(index);
}

}
