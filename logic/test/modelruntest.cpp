#include "prima/modelrun.h"
#include "prima/runconfiguration.h"
#include "prima/runconfigurationparser.h"
#include "outputreaders.h"

#include "infra/test/tempdir.h"

#include "gdx/denserasterio.h"

#include "testdata.h"
#include "testprinters.h"

#include <doctest/doctest.h>
#include <fmt/format.h>
#include <limits>

namespace prima::test {

using namespace inf;
using namespace doctest;

static constexpr std::string_view s_configToml = R"toml(
    [input]
        region_name = "Test"
        subregions_name = "Sub"
        year = 2015
        landuse = "landuse.tif"
        population = "population.tif"
        countries = "countries.geojson"
        subregions = "subregions.geojson"
        subregions_field = "NAME_SHORT"
        load_timeseries = "load.csv"
        sector_shares = "shares.csv"
        sectoral_profiles = "profiles.csv"
        landuse_assumptions = "assumptions.csv"

    [load]
        sectors = ["IND", "RES"]

    [output]
        path = "output"
)toml";

static std::string polygon_feature(std::string_view field, std::string_view id, double x1, double y1, double x2, double y2)
{
    return fmt::format(R"json({{ "type": "Feature", "properties": {{ "{0}": "{1}" }}, "geometry": {{ "type": "Polygon", "coordinates": [ [ [{2}, {3}], [{4}, {3}], [{4}, {5}], [{2}, {5}], [{2}, {3}] ] ] }} }})json",
                       field, id, x1, y1, x2, y2);
}

static std::string feature_collection(std::string_view features)
{
    return fmt::format(R"json({{ "type": "FeatureCollection", "features": [ {} ] }})json", features);
}

static void create_model_inputs(const fs::path& dir)
{
    // A: the two left columns, all type 1
    // B: the third column type 1 and the fourth column type 2
    const GeoMetadata meta(4, 4, 0.0, 0.0, 1.0, std::numeric_limits<double>::quiet_NaN(), "");

    // clang-format off
    gdx::DenseRaster<double> landuse(meta, std::vector<double>{
        1, 1, 1, 2,
        1, 1, 1, 2,
        1, 1, 1, 2,
        1, 1, 1, 2,
    });
    // clang-format on

    gdx::write_raster(landuse, dir / "landuse.tif");
    gdx::write_raster(gdx::DenseRaster<double>(meta, 10.0), dir / "population.tif");

    write_file(dir / "countries.geojson", feature_collection(fmt::format("{}, {}", polygon_feature("GID_0", "A", 0, 0, 2, 4), polygon_feature("GID_0", "B", 2, 0, 4, 4))));
    write_file(dir / "subregions.geojson", feature_collection(fmt::format("{}, {}", polygon_feature("NAME_SHORT", "S1", 0, 0, 3, 4), polygon_feature("NAME_SHORT", "S2", 3, 0, 4, 4))));

    write_file(dir / "load.csv", "t;A;B\n0;100;50\n1;80;40\n");
    write_file(dir / "shares.csv", "Country;IND;RES\nA;0,6;0,4\nDefault;0,4;0,6\n");
    write_file(dir / "profiles.csv", ";IND;RES\n0;1;1\n1;1;1\n");
    write_file(dir / "assumptions.csv", "Landuse;IND\n1;0,8\n2;0,2\n");
}

TEST_CASE("Model run")
{
    TempDir temp("prima_model_run");
    create_model_inputs(temp.path());

    const auto cfg = parse_run_configuration(s_configToml, temp.path());
    const auto& paths = cfg.paths();

    const auto result = disaggregate_load(cfg, nullptr);

    REQUIRE(result.hourCount == 2);
    REQUIRE(result.loads.size() == 2);
    CHECK(result.droppedCountryParts.empty());
    CHECK(result.loads[0].subregion == "S1");
    CHECK(result.loads[1].subregion == "S2");

    // the subregions cover both countries completely
    CHECK(result.loads[0].series[0] + result.loads[1].series[0] == Approx(150.0));
    CHECK(result.loads[0].series[1] + result.loads[1].series[1] == Approx(120.0));

    // S2 is the fourth column of B: 4 inhabitants of 8 and 4 type 2 pixels
    // B: IND 20 spread with weighted count 0.8 * 4 + 0.2 * 4, RES 30 over 80 inhabitants
    CHECK(result.loads[1].series[0] == Approx(4.0 * 0.2 * 20.0 / 4.0 + 40.0 * 30.0 / 80.0));

    CHECK(fs::is_regular_file(paths.country_statistics_path()));
    CHECK(fs::is_regular_file(paths.country_part_statistics_path()));
    CHECK(fs::is_regular_file(paths.sector_load_path()));
    CHECK(fs::is_regular_file(paths.yearly_sector_load_path()));
    CHECK(fs::is_regular_file(paths.land_use_load_path()));
    CHECK(fs::is_regular_file(paths.subregion_load_path()));
    CHECK(fs::is_regular_file(paths.subregion_load_path().replace_extension(".json")));

    const auto countryStats = read_zonal_statistics(paths.country_statistics_path());
    CHECK(countryStats.land_use_count("A", LandUseType(1)) == 8.0);
    CHECK(countryStats.land_use_count("B", LandUseType(2)) == 4.0);

    SUBCASE("second run uses the cached results")
    {
        fs::remove(temp.path() / "landuse.tif");
        fs::remove(temp.path() / "load.csv");

        // the yearly totals are only written, an existing file is left as is
        write_file(paths.yearly_sector_load_path(), "not a table");

        const auto cached = disaggregate_load(cfg, nullptr);
        CHECK(file::read_as_text(paths.yearly_sector_load_path()) == "not a table");
        REQUIRE(cached.loads.size() == result.loads.size());
        for (size_t i = 0; i < result.loads.size(); ++i) {
            CHECK(cached.loads[i].subregion == result.loads[i].subregion);
            CHECK(cached.loads[i].series == result.loads[i].series);
        }
    }

    SUBCASE("sites of the subregions")
    {
        const GeoMetadata meta(4, 4, 0.0, 0.0, 1.0, std::numeric_limits<double>::quiet_NaN(), "");
        gdx::write_raster(gdx::DenseRaster<double>(meta, 1.0), temp.path() / "land.tif");
        gdx::write_raster(gdx::DenseRaster<double>(meta, 0.0), temp.path() / "eez.tif");

        std::string sitesToml(s_configToml);
        const std::string_view lastInput = R"(landuse_assumptions = "assumptions.csv")";
        sitesToml.insert(sitesToml.find(lastInput) + lastInput.size(), "\n        land_mask = \"land.tif\"\n        eez_mask = \"eez.tif\"");

        const auto sitesCfg = parse_run_configuration(sitesToml, temp.path());
        CHECK(run_model(sitesCfg, nullptr) == EXIT_SUCCESS);
        CHECK(fs::is_regular_file(sitesCfg.paths().sites_path()));
        CHECK(fs::is_regular_file(sitesCfg.paths().sites_path().replace_extension(".json")));
    }

    SUBCASE("run model reports errors")
    {
        fs::remove_all(paths.output_path());
        fs::remove(temp.path() / "load.csv");

        CHECK(run_model(cfg, nullptr) == EXIT_FAILURE);
    }
}

}
