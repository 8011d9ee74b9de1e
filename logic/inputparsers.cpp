#include "prima/inputparsers.h"
#include "delimitedtable.h"

#include "infra/algo.h"
#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"

#include <unordered_map>

namespace prima {

using namespace inf;

// The hour index column is not part of the data
static bool is_index_column(std::string_view name)
{
    return name.empty() || str::iequals(name, "t") || str::iequals(name, "hour");
}

static size_t first_data_column(const DelimitedTable& table)
{
    return is_index_column(table.header().front()) ? 1 : 0;
}

// One series per data column of the table
static std::vector<HourlySeries> read_columns(const DelimitedTable& table, size_t firstColumn)
{
    const auto columnCount = table.header().size() - firstColumn;

    std::vector<HourlySeries> result(columnCount);
    for (auto& series : result) {
        series.reserve(table.row_count());
    }

    for (size_t rowIndex = 0; rowIndex < table.row_count(); ++rowIndex) {
        const auto row = table.row(rowIndex);
        try {
            for (size_t col = 0; col < columnCount; ++col) {
                result[col].push_back(parse_decimal_value(row[firstColumn + col]));
            }
        } catch (const std::exception& e) {
            throw RuntimeError("line {}: {}", table.line_number(rowIndex), e.what());
        }
    }

    return result;
}

CountryLoadTable parse_country_load(const fs::path& path)
{
    try {
        Log::debug("Parse country load: {}", path);

        DelimitedTable table(path);
        const auto firstColumn = first_data_column(table);
        auto columns           = read_columns(table, firstColumn);

        std::vector<CountryLoadTable::Entry> entries;
        for (size_t col = 0; col < columns.size(); ++col) {
            const auto countryCode = table.header()[firstColumn + col];
            if (countryCode.empty()) {
                throw RuntimeError("Empty country code in header");
            }

            entries.emplace_back(Country(countryCode), std::move(columns[col]));
        }

        return CountryLoadTable(table.row_count(), std::move(entries));
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", path, e.what());
    }
}

LandUseAssumptions parse_landuse_assumptions(const fs::path& path)
{
    try {
        Log::debug("Parse land use assumptions: {}", path);

        DelimitedTable table(path);

        LandUseAssumptions result;
        for (auto& sectorName : table.header().subspan(1)) {
            if (sectorName.empty()) {
                throw RuntimeError("Empty sector name in header");
            }

            result.sectors.emplace_back(sectorName);
        }

        for (size_t rowIndex = 0; rowIndex < table.row_count(); ++rowIndex) {
            const auto row = table.row(rowIndex);
            try {
                auto landUse = str::to_int32(row[0]);
                if (!landUse.has_value()) {
                    throw RuntimeError("Invalid land use category: '{}'", row[0]);
                }

                if (container_contains(result.landUseTypes, LandUseType(*landUse))) {
                    throw RuntimeError("Duplicate land use category: {}", *landUse);
                }

                result.landUseTypes.emplace_back(*landUse);
                for (auto& value : row.subspan(1)) {
                    // no coefficient: the land use type is not used by the sector
                    result.coefficients.push_back(parse_decimal(value).value_or(0.0));
                }
            } catch (const std::exception& e) {
                throw RuntimeError("line {}: {}", table.line_number(rowIndex), e.what());
            }
        }

        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", path, e.what());
    }
}

SectorShares parse_sector_shares(const fs::path& path, std::string_view defaultKey)
{
    try {
        Log::debug("Parse sector shares: {}", path);

        DelimitedTable table(path);

        std::vector<Sector> sectors;
        for (auto& sectorName : table.header().subspan(1)) {
            sectors.emplace_back(sectorName);
        }

        std::unordered_map<std::string, std::vector<std::optional<double>>> rows;
        for (size_t rowIndex = 0; rowIndex < table.row_count(); ++rowIndex) {
            const auto row = table.row(rowIndex);
            try {
                std::vector<std::optional<double>> shares;
                for (auto& value : row.subspan(1)) {
                    if (value.empty()) {
                        shares.emplace_back();
                    } else {
                        shares.emplace_back(parse_decimal_value(value));
                    }
                }

                if (!rows.emplace(std::string(row[0]), std::move(shares)).second) {
                    throw RuntimeError("Duplicate sector shares for '{}'", row[0]);
                }
            } catch (const std::exception& e) {
                throw RuntimeError("line {}: {}", table.line_number(rowIndex), e.what());
            }
        }

        SectorShares result(std::move(sectors), std::move(rows), defaultKey);
        if (!result.has_default_row()) {
            Log::warn("No default sector shares ('{}') present in {}", defaultKey, path);
        }

        return result;
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", path, e.what());
    }
}

SectoralProfiles parse_sectoral_profiles(const fs::path& path)
{
    try {
        Log::debug("Parse sectoral profiles: {}", path);

        DelimitedTable table(path);
        const auto firstColumn = first_data_column(table);
        auto columns           = read_columns(table, firstColumn);

        std::vector<SectoralProfiles::Profile> profiles;
        for (size_t col = 0; col < columns.size(); ++col) {
            const auto name = table.header()[firstColumn + col];
            if (name.empty()) {
                throw RuntimeError("Empty profile name in header");
            }

            if (auto pos = name.find('.'); pos != std::string_view::npos) {
                profiles.emplace_back(Country(name.substr(0, pos)), Sector(name.substr(pos + 1)), std::move(columns[col]));
            } else {
                profiles.emplace_back(std::nullopt, Sector(name), std::move(columns[col]));
            }
        }

        return SectoralProfiles(table.row_count(), std::move(profiles));
    } catch (const std::exception& e) {
        throw RuntimeError("Error parsing {} ({})", path, e.what());
    }
}

}
