#include "prima/runconfigurationparser.h"
#include "prima/runconfiguration.h"

#include "infra/algo.h"
#include "infra/cast.h"
#include "infra/exception.h"
#include "infra/string.h"

#include <cassert>
#include <toml++/toml.h>

namespace prima {

using namespace inf;
using namespace std::string_view_literals;

struct NamedSection
{
    NamedSection(std::string_view theName, toml::node_view<const toml::node> theSection)
    : name(theName)
    , section(theSection)
    {
    }

    std::string name;
    toml::node_view<const toml::node> section;
};

static fs::path read_path(const NamedSection& ns, std::string_view name, const fs::path& basePath)
{
    assert(ns.section.is_table());
    auto nodeValue = ns.section[name];

    if (!nodeValue) {
        throw RuntimeError("'{0:}' key not present in '{1:}' section (e.g. {0:} = \"/some/path\")", name, ns.name);
    }

    if (auto pathValue = nodeValue.value<std::string_view>(); pathValue.has_value()) {
        auto result = fs::u8path(*pathValue);
        if (result.is_relative()) {
            result = basePath / result;
            if (fs::exists(result)) {
                result = fs::canonical(result);
            }
        }

        return result;
    } else {
        throw RuntimeError("Invalid path value for '{0:}' key in '{1:}' section (e.g. {0:} = \"/some/path\")", name, ns.name);
    }
}

static fs::path read_optional_path(const NamedSection& ns, std::string_view name, const fs::path& basePath)
{
    if (!ns.section[name]) {
        return {};
    }

    return read_path(ns, name, basePath);
}

static date::year parse_year(toml::node_view<const toml::node> nodeValue)
{
    assert(nodeValue);

    if (!nodeValue.is_integer()) {
        if (nodeValue.is_string()) {
            throw RuntimeError("Invalid year present in 'input' section, year values should not be quoted (e.g. year = 2015)");
        }

        throw RuntimeError("Invalid year present in 'input' section ({})", nodeValue.value_or<std::string_view>(""sv));
    }

    auto yearInt = nodeValue.value<int64_t>();
    if (!yearInt.has_value()) {
        throw RuntimeError("Invalid year present in 'input' section ({})", nodeValue.value_or<std::string_view>(""sv));
    }

    date::year result(truncate<int32_t>(*yearInt));
    if (!fits_in_type<int32_t>(*yearInt) || !result.ok()) {
        throw RuntimeError("Invalid year value present in 'input' section ({})", *yearInt);
    }

    return result;
}

static date::year read_year(toml::node_view<const toml::node> nodeValue)
{
    if (!nodeValue) {
        throw RuntimeError("No year present in 'input' section (e.g. year = 2015)");
    }

    return parse_year(nodeValue);
}

static std::string read_string(const NamedSection& ns, std::string_view name)
{
    assert(ns.section.is_table());
    auto nodeValue = ns.section[name];

    if (!nodeValue) {
        throw RuntimeError("'{}' key not present in {} section", name, ns.name);
    }

    if (!nodeValue.is_string()) {
        throw RuntimeError("'{0:}' key value in '{1:}' section should be a quoted string (e.g. {0:} = \"value\")", name, ns.name);
    }

    assert(nodeValue.value<std::string>().has_value());
    return nodeValue.value<std::string>().value();
}

static std::string read_optional_string(const NamedSection& ns, std::string_view name, std::string_view defaultValue)
{
    if (!ns.section[name]) {
        return std::string(defaultValue);
    }

    return read_string(ns, name);
}

static std::vector<Sector> read_sectors(const NamedSection& ns, std::string_view name)
{
    auto nodeValue = ns.section[name];
    if (!nodeValue) {
        throw RuntimeError("'{0:}' key not present in '{1:}' section (e.g. {0:} = [\"COM\", \"IND\", \"RES\"])", name, ns.name);
    }

    const auto* sectorArray = nodeValue.as_array();
    if (sectorArray == nullptr) {
        throw RuntimeError("'{0:}' key value in '{1:}' section should be a list of sector names (e.g. {0:} = [\"COM\", \"IND\", \"RES\"])", name, ns.name);
    }

    std::vector<Sector> result;
    for (auto& sectorNode : *sectorArray) {
        auto sectorName = sectorNode.value<std::string_view>();
        if (!sectorName.has_value() || str::trimmed_view(*sectorName).empty()) {
            throw RuntimeError("Invalid sector name in '{}' key of '{}' section", name, ns.name);
        }

        if (Sector sector(str::trimmed_view(*sectorName)); !container_contains(result, sector)) {
            result.push_back(sector);
        }
    }

    if (result.empty()) {
        throw RuntimeError("No sectors configured in '{}' key of '{}' section", name, ns.name);
    }

    return result;
}

static void throw_on_missing_section(const toml::table& table, std::string_view name)
{
    if (!table.contains(name)) {
        throw RuntimeError("No '{}' section present in configuration", name);
    }
}

RunConfiguration parse_run_configuration(std::string_view configContents, const fs::path& basePath)
{
    try {
        const toml::table table = toml::parse(configContents);

        throw_on_missing_section(table, "input");
        throw_on_missing_section(table, "load");
        throw_on_missing_section(table, "output");

        NamedSection inputSection("input", table["input"]);
        NamedSection loadSection("load", table["load"]);
        NamedSection outputSection("output", table["output"]);

        RunConfiguration::Input input;
        input.regionName         = read_string(inputSection, "region_name");
        input.subregionsName     = read_string(inputSection, "subregions_name");
        input.year               = read_year(inputSection.section["year"]);
        input.landuse            = read_path(inputSection, "landuse", basePath);
        input.population         = read_path(inputSection, "population", basePath);
        input.countries          = read_path(inputSection, "countries", basePath);
        input.countriesField     = read_optional_string(inputSection, "countries_field", input.countriesField);
        input.subregions         = read_path(inputSection, "subregions", basePath);
        input.subregionsField    = read_optional_string(inputSection, "subregions_field", input.subregionsField);
        input.loadTimeseries     = read_path(inputSection, "load_timeseries", basePath);
        input.sectorShares       = read_path(inputSection, "sector_shares", basePath);
        input.sectoralProfiles   = read_path(inputSection, "sectoral_profiles", basePath);
        input.landuseAssumptions = read_path(inputSection, "landuse_assumptions", basePath);
        input.landMask           = read_optional_path(inputSection, "land_mask", basePath);
        input.eezMask            = read_optional_path(inputSection, "eez_mask", basePath);

        if (input.landMask.empty() != input.eezMask.empty()) {
            throw RuntimeError("The sites table needs both the 'land_mask' and the 'eez_mask' key in the 'input' section");
        }

        RunConfiguration::Load load;
        load.sectors             = read_sectors(loadSection, "sectors");
        load.defaultSectorShares = read_optional_string(loadSection, "default_sector_shares", load.defaultSectorShares);

        const auto outputPath = read_path(outputSection, "path", basePath);

        return RunConfiguration(std::move(input), std::move(load), outputPath);
    } catch (const toml::parse_error& e) {
        if (const auto& errorBegin = e.source().begin; errorBegin) {
            throw RuntimeError("Failed to parse run configuration: {} (line {} column {})", e.description(), errorBegin.line, errorBegin.column);
        }

        throw RuntimeError("Failed to parse run configuration: {}", e.description());
    }
}

RunConfiguration parse_run_configuration_file(const fs::path& config)
{
    if (!fs::is_regular_file(config)) {
        throw RuntimeError("Run configuration does not exist: {}", config);
    }

    return parse_run_configuration(file::read_as_text(config), fs::absolute(config).parent_path());
}

}
