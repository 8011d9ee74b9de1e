#include "outputreaders.h"
#include "delimitedtable.h"

#include "infra/exception.h"
#include "infra/string.h"

#include <csv.h>

namespace prima {

using namespace inf;

ZonalStatistics read_zonal_statistics(const fs::path& path)
{
    try {
        DelimitedTable table(path);

        std::vector<std::string> columns;
        for (auto& column : table.header().subspan(1)) {
            columns.emplace_back(column);
        }

        std::vector<ZonalStatistics::Row> rows;
        rows.reserve(table.row_count());
        for (size_t rowIndex = 0; rowIndex < table.row_count(); ++rowIndex) {
            const auto row = table.row(rowIndex);

            std::vector<double> values;
            values.reserve(columns.size());
            for (auto& value : row.subspan(1)) {
                values.push_back(parse_decimal_value(value));
            }

            rows.emplace_back(row[0], std::move(values));
        }

        return ZonalStatistics(std::move(columns), std::move(rows));
    } catch (const std::exception& e) {
        throw RuntimeError("Error reading zonal statistics {} ({})", path, e.what());
    }
}

HourlyLoadTable read_sector_load(const fs::path& path)
{
    try {
        DelimitedTable table(path);
        if (table.row_count() == 0 || table.row(0).front() != "Sector") {
            throw RuntimeError("Missing sector header line");
        }

        const auto countries = table.header().subspan(1);
        const auto sectors   = table.row(0).subspan(1);
        const auto hourCount = table.row_count() - 1;

        std::vector<HourlyLoadTable::Entry> entries;
        for (size_t col = 0; col < countries.size(); ++col) {
            HourlySeries series;
            series.reserve(hourCount);
            for (size_t rowIndex = 1; rowIndex < table.row_count(); ++rowIndex) {
                series.push_back(parse_decimal_value(table.row(rowIndex)[col + 1]));
            }

            entries.emplace_back(Country(countries[col]), sectors[col], std::move(series));
        }

        return HourlyLoadTable(hourCount, std::move(entries));
    } catch (const std::exception& e) {
        throw RuntimeError("Error reading sector load {} ({})", path, e.what());
    }
}

std::vector<YearlySectorLoad> read_yearly_sector_load(const fs::path& path)
{
    try {
        using namespace io;
        CSVReader<3, trim_chars<' ', '\t'>, no_quote_escape<';'>, throw_on_overflow> in(str::from_u8(path.u8string()));
        in.read_header(ignore_no_column, "Country", "Sector", "Load in MWh");

        std::vector<YearlySectorLoad> result;

        char *country, *sector, *load;
        while (in.read_row(country, sector, load)) {
            result.emplace_back(Country(country), Sector(sector), parse_decimal_value(load));
        }

        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error reading yearly sector load {} ({})", path, e.what());
    }
}

HourlyLoadTable read_land_use_load(const fs::path& path)
{
    try {
        DelimitedTable table(path);
        if (table.header().size() < 2) {
            throw RuntimeError("Missing country and land use columns");
        }

        const auto hourCount = table.header().size() - 2;

        std::vector<HourlyLoadTable::Entry> entries;
        entries.reserve(table.row_count());
        for (size_t rowIndex = 0; rowIndex < table.row_count(); ++rowIndex) {
            const auto row = table.row(rowIndex);

            HourlySeries series;
            series.reserve(hourCount);
            for (auto& value : row.subspan(2)) {
                series.push_back(parse_decimal_value(value));
            }

            entries.emplace_back(Country(row[0]), row[1], std::move(series));
        }

        return HourlyLoadTable(hourCount, std::move(entries));
    } catch (const std::exception& e) {
        throw RuntimeError("Error reading land use load {} ({})", path, e.what());
    }
}

SubregionLoadResult read_subregion_load(const fs::path& path)
{
    try {
        DelimitedTable table(path);

        SubregionLoadResult result;
        result.hourCount = table.row_count();

        const auto subregions = table.header().subspan(1);
        for (size_t col = 0; col < subregions.size(); ++col) {
            HourlySeries series;
            series.reserve(table.row_count());
            for (size_t rowIndex = 0; rowIndex < table.row_count(); ++rowIndex) {
                series.push_back(parse_decimal_value(table.row(rowIndex)[col + 1]));
            }

            result.loads.emplace_back(subregions[col], std::move(series));
        }

        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error reading subregion load {} ({})", path, e.what());
    }
}

}
