#include "outputwriters.h"
#include "delimitedtable.h"
#include "primaconfig.h"

#include "infra/exception.h"
#include "infra/string.h"

#include <fmt/core.h>
#include <numeric>
#include <sstream>

namespace prima {

using namespace inf;
using namespace std::string_view_literals;

static void create_output_directory(const fs::path& path)
{
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
}

static void throw_if_not_open(const file::Handle& fp, const fs::path& path)
{
    if (!fp.is_open()) {
        throw RuntimeError("Failed to create output file: {}", path);
    }
}

static std::string join_values(const HourlySeries& values)
{
    return str::join(values, ";"sv, [](double value) {
        return format_decimal(value);
    });
}

fs::path metadata_path(const fs::path& tablePath)
{
    auto result = tablePath;
    result.replace_extension(".json");
    return result;
}

void write_metadata(const fs::path& tablePath, const OutputMetadata& meta)
{
    toml::array inputs;
    for (auto& input : meta.inputs) {
        inputs.push_back(str::from_u8(input.generic_u8string()));
    }

    toml::table root;
    root.insert("title", meta.title);
    root.insert("filename", str::from_u8(tablePath.filename().u8string()));
    root.insert("version", std::string(PRIMA_VERSION));
    root.insert("parameters", meta.parameters);
    root.insert("inputs", std::move(inputs));

    std::stringstream json;
    json << toml::json_formatter(root) << '\n';
    file::write_as_text(metadata_path(tablePath), json.str());
}

void write_zonal_statistics(const ZonalStatistics& stats, std::string_view indexName, const fs::path& path)
{
    create_output_directory(path);
    file::Handle fp(path, "wt");
    throw_if_not_open(fp, path);

    fmt::print(fp, "{};{}\n", indexName, str::join(stats.columns(), ";"sv));
    for (const auto& row : stats.rows()) {
        fmt::print(fp, "{};{}\n", row.region, join_values(row.values));
    }
}

void write_sector_load(const HourlyLoadTable& sectorLoad, const fs::path& path)
{
    create_output_directory(path);
    file::Handle fp(path, "wt");
    throw_if_not_open(fp, path);

    const auto entries = sectorLoad.entries();

    fmt::print(fp, "Country;{}\n", str::join(entries, ";"sv, [](const HourlyLoadTable::Entry& entry) {
                   return std::string(entry.country.iso_code());
               }));
    fmt::print(fp, "Sector;{}\n", str::join(entries, ";"sv, [](const HourlyLoadTable::Entry& entry) {
                   return entry.key;
               }));

    for (size_t hour = 0; hour < sectorLoad.hour_count(); ++hour) {
        fmt::print(fp, "{};{}\n", hour, str::join(entries, ";"sv, [hour](const HourlyLoadTable::Entry& entry) {
                       return format_decimal(entry.series[hour]);
                   }));
    }
}

void write_yearly_sector_load(std::span<const YearlySectorLoad> yearlyLoad, const fs::path& path)
{
    create_output_directory(path);
    file::Handle fp(path, "wt");
    throw_if_not_open(fp, path);

    fmt::print(fp, "Country;Sector;Load in MWh\n");
    for (const auto& load : yearlyLoad) {
        fmt::print(fp, "{};{};{}\n", load.country, load.sector, format_decimal(load.load));
    }
}

void write_land_use_load(const HourlyLoadTable& loadPerUnit, const fs::path& path)
{
    create_output_directory(path);
    file::Handle fp(path, "wt");
    throw_if_not_open(fp, path);

    std::vector<size_t> hours(loadPerUnit.hour_count());
    std::iota(hours.begin(), hours.end(), size_t(0));

    fmt::print(fp, "Country;Land use;{}\n", str::join(hours, ";"sv, [](size_t hour) {
                   return std::to_string(hour);
               }));
    for (const auto& entry : loadPerUnit.entries()) {
        fmt::print(fp, "{};{};{}\n", entry.country, entry.key, join_values(entry.series));
    }
}

void write_subregion_load(const SubregionLoadResult& subregionLoad, const fs::path& path)
{
    create_output_directory(path);
    file::Handle fp(path, "wt");
    throw_if_not_open(fp, path);

    fmt::print(fp, "t;{}\n", str::join(subregionLoad.loads, ";"sv, [](const SubregionLoad& load) {
                   return load.subregion;
               }));

    for (size_t hour = 0; hour < subregionLoad.hourCount; ++hour) {
        fmt::print(fp, "{};{}\n", hour, str::join(subregionLoad.loads, ";"sv, [hour](const SubregionLoad& load) {
                       return format_decimal(load.series[hour]);
                   }));
    }
}

void write_sites(std::span<const Site> sites, const fs::path& path)
{
    create_output_directory(path);
    file::Handle fp(path, "wt");
    throw_if_not_open(fp, path);

    fmt::print(fp, "Name;Index_shapefile;Area_m2;Longitude;Latitude;slacknode;syncarea;ctrarea;primpos;primneg;secpos;secneg;terpos;terneg\n");
    for (const auto& site : sites) {
        fmt::print(fp, "{};{};{};{};{};{};1;1;0;0;0;0;0;0\n",
                   site.name,
                   site.index,
                   format_decimal(site.area),
                   format_decimal(site.longitude),
                   format_decimal(site.latitude),
                   site.slackNode ? 1 : 0);
    }
}

}
