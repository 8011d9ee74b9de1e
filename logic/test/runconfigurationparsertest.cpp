#include "prima/runconfiguration.h"
#include "prima/runconfigurationparser.h"
#include "infra/exception.h"

#include "testprinters.h"

#include <doctest/doctest.h>

namespace prima::test {

using namespace inf;
using namespace date;
using namespace doctest;

TEST_CASE("Parse run configuration")
{
    const auto basePath = fs::u8path("/prima/data");

    SUBCASE("valid file")
    {
        constexpr std::string_view tomlConfig = R"toml(
            [input]
                region_name = "Europe"
                subregions_name = "NUTS"
                year = 2015
                landuse = "rasters/landuse.tif"
                population = "rasters/population.tif"
                countries = "shapes/countries.gpkg"
                subregions = "shapes/subregions.gpkg"
                subregions_field = "NUTS_ID"
                load_timeseries = "load/load_ts_clean.csv"
                sector_shares = "load/sector_shares_clean.csv"
                sectoral_profiles = "load/sectoral_profiles.csv"
                landuse_assumptions = "assumptions/assumptions_landuse.csv"

            [load]
                sectors = ["COM", "IND", " AGR ", "RES", "IND"]

            [output]
                path = "/temp/prima"
        )toml";

        const auto config = parse_run_configuration(tomlConfig, basePath);

        CHECK(config.region_name() == "Europe");
        CHECK(config.subregions_name() == "NUTS");
        CHECK(config.year() == 2015_y);
        CHECK(config.input().landuse == basePath / "rasters" / "landuse.tif");
        CHECK(config.input().population == basePath / "rasters" / "population.tif");
        CHECK(config.input().countries == basePath / "shapes" / "countries.gpkg");
        CHECK(config.input().countriesField == "GID_0");
        CHECK(config.input().subregionsField == "NUTS_ID");
        CHECK(config.input().loadTimeseries == basePath / "load" / "load_ts_clean.csv");
        CHECK(config.input().landuseAssumptions == basePath / "assumptions" / "assumptions_landuse.csv");

        REQUIRE(config.sectors().size() == 4);
        CHECK(config.sectors()[0] == Sector("COM"));
        CHECK(config.sectors()[2] == Sector("AGR"));
        CHECK(config.sectors()[3] == Sector("RES"));
        CHECK(config.default_sector_shares() == "Default");

        CHECK(config.output_path() == fs::u8path("/temp/prima"));
        CHECK(config.paths().country_statistics_path() == fs::u8path("/temp/prima/intermediate/Europe_stats_countries.csv"));
        CHECK(config.paths().country_part_statistics_path() == fs::u8path("/temp/prima/intermediate/NUTS_stats_country_parts.csv"));
        CHECK(config.paths().subregion_load_path() == fs::u8path("/temp/prima/NUTS_load_2015.csv"));
        CHECK(config.paths().log_path() == fs::u8path("/temp/prima/prima.log"));
        CHECK(config.paths().sites_path() == fs::u8path("/temp/prima/NUTS_sites.csv"));
        CHECK(config.input().landMask.empty());
        CHECK(config.input().eezMask.empty());
        CHECK_FALSE(config.max_concurrency().has_value());
    }

    SUBCASE("custom default sector shares")
    {
        constexpr std::string_view tomlConfig = R"toml(
            [input]
                region_name = "Europe"
                subregions_name = "NUTS"
                year = 2015
                landuse = "landuse.tif"
                population = "population.tif"
                countries = "countries.gpkg"
                countries_field = "ISO"
                subregions = "subregions.gpkg"
                load_timeseries = "load.csv"
                sector_shares = "shares.csv"
                sectoral_profiles = "profiles.csv"
                landuse_assumptions = "assumptions.csv"

            [load]
                sectors = ["IND"]
                default_sector_shares = "EU27"

            [output]
                path = "out"
        )toml";

        const auto config = parse_run_configuration(tomlConfig, basePath);
        CHECK(config.default_sector_shares() == "EU27");
        CHECK(config.input().countriesField == "ISO");
        CHECK(config.output_path() == basePath / "out");
    }

    SUBCASE("sites masks")
    {
        constexpr std::string_view tomlConfig = R"toml(
            [input]
                region_name = "Europe"
                subregions_name = "NUTS"
                year = 2015
                landuse = "landuse.tif"
                population = "population.tif"
                countries = "countries.gpkg"
                subregions = "subregions.gpkg"
                load_timeseries = "load.csv"
                sector_shares = "shares.csv"
                sectoral_profiles = "profiles.csv"
                landuse_assumptions = "assumptions.csv"
                land_mask = "masks/land.tif"
                eez_mask = "masks/eez.tif"

            [load]
                sectors = ["IND"]

            [output]
                path = "out"
        )toml";

        const auto config = parse_run_configuration(tomlConfig, basePath);
        CHECK(config.input().landMask == basePath / "masks" / "land.tif");
        CHECK(config.input().eezMask == basePath / "masks" / "eez.tif");

        std::string landMaskOnly(tomlConfig);
        landMaskOnly.erase(landMaskOnly.find("eez_mask"), std::string_view("eez_mask = \"masks/eez.tif\"").size());
        CHECK_THROWS_AS(parse_run_configuration(landMaskOnly, basePath), RuntimeError);
    }

    SUBCASE("invalid configurations")
    {
        constexpr std::string_view missingOutput = R"toml(
            [input]
                region_name = "Europe"
            [load]
                sectors = ["IND"]
        )toml";
        CHECK_THROWS_AS(parse_run_configuration(missingOutput, basePath), RuntimeError);

        constexpr std::string_view quotedYear = R"toml(
            [input]
                region_name = "Europe"
                subregions_name = "NUTS"
                year = "2015"
            [load]
                sectors = ["IND"]
            [output]
                path = "out"
        )toml";
        CHECK_THROWS_WITH_AS(parse_run_configuration(quotedYear, basePath), Contains("should not be quoted"), RuntimeError);

        constexpr std::string_view missingPath = R"toml(
            [input]
                region_name = "Europe"
                subregions_name = "NUTS"
                year = 2015
            [load]
                sectors = ["IND"]
            [output]
                path = "out"
        )toml";
        CHECK_THROWS_WITH_AS(parse_run_configuration(missingPath, basePath), Contains("'landuse' key not present"), RuntimeError);

        constexpr std::string_view invalidToml = R"toml(
            [input
                region_name = "Europe"
        )toml";
        CHECK_THROWS_AS(parse_run_configuration(invalidToml, basePath), RuntimeError);
    }

    SUBCASE("missing file")
    {
        CHECK_THROWS_AS(parse_run_configuration_file(fs::u8path("/does/not/exist.toml")), RuntimeError);
    }
}

}
