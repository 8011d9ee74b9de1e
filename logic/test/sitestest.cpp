#include "prima/region.h"
#include "prima/sites.h"
#include "outputwriters.h"
#include "delimitedtable.h"

#include "infra/test/tempdir.h"

#include "testdata.h"
#include "testprinters.h"

#include <doctest/doctest.h>
#include <limits>

namespace prima::test {

using namespace inf;
using namespace doctest;

// N2 is listed first, N1 is split over two features
static constexpr std::string_view s_sitesGeoJson = R"json({
"type": "FeatureCollection",
"features": [
{ "type": "Feature", "properties": { "NAME_SHORT": "N2" }, "geometry": { "type": "Polygon", "coordinates": [ [ [3.0, 0.0], [4.0, 0.0], [4.0, 1.0], [3.0, 1.0], [3.0, 0.0] ] ] } },
{ "type": "Feature", "properties": { "NAME_SHORT": "N1" }, "geometry": { "type": "Polygon", "coordinates": [ [ [0.0, 0.0], [1.0, 0.0], [1.0, 1.0], [0.0, 1.0], [0.0, 0.0] ] ] } },
{ "type": "Feature", "properties": { "NAME_SHORT": "N3" }, "geometry": { "type": "Polygon", "coordinates": [ [ [1.0, 1.0], [3.0, 1.0], [3.0, 2.0], [1.0, 2.0], [1.0, 1.0] ] ] } },
{ "type": "Feature", "properties": { "NAME_SHORT": "N1" }, "geometry": { "type": "Polygon", "coordinates": [ [ [0.0, 1.0], [1.0, 1.0], [1.0, 2.0], [0.0, 2.0], [0.0, 1.0] ] ] } }
]
})json";

TEST_CASE("Sites")
{
    TempDir tempDir("prima_sites");
    const auto path = tempDir.path() / "subregions.geojson";
    write_file(path, s_sitesGeoJson);

    // the left half is land, the right half is sea
    const GeoMetadata meta(2, 4, 0.0, 0.0, 1.0, std::numeric_limits<double>::quiet_NaN(), "");

    // clang-format off
    gdx::DenseRaster<double> land(meta, std::vector<double>{
        1, 1, 0, 0,
        1, 1, 0, 0,
    });

    gdx::DenseRaster<double> eez(meta, std::vector<double>{
        0, 0, 1, 1,
        0, 0, 1, 1,
    });
    // clang-format on

    const auto regions = read_regions(path, "NAME_SHORT", RegionCountry::None, meta);
    REQUIRE(regions.size() == 3);

    const auto sites = create_sites(regions, path, "NAME_SHORT", land, eez, nullptr);
    REQUIRE(sites.size() == 3);

    // vector order
    CHECK(sites[0].name == "N2_offshore");
    CHECK(sites[0].index == 0);
    CHECK(sites[0].slackNode);
    CHECK(sites[0].longitude == Approx(3.5));
    CHECK(sites[0].latitude == Approx(0.5));

    CHECK(sites[1].name == "N1");
    CHECK(sites[1].index == 1);
    CHECK_FALSE(sites[1].slackNode);
    CHECK(sites[1].longitude == Approx(0.5));
    CHECK(sites[1].latitude == Approx(1.0));

    // one land and one sea pixel
    CHECK(sites[2].name == "N3_offshore");
    CHECK(sites[2].index == 2);
    CHECK_FALSE(sites[2].slackNode);

    // a one degree square at the equator
    CHECK(sites[0].area > 1.2e10);
    CHECK(sites[0].area < 1.25e10);
    CHECK(sites[1].area == Approx(2.0 * sites[0].area).epsilon(0.01));

    SUBCASE("sites table")
    {
        const auto tablePath = tempDir.path() / "sites.csv";
        write_sites(sites, tablePath);

        DelimitedTable table(tablePath);
        REQUIRE(table.header().size() == 14);
        CHECK(table.header()[0] == "Name");
        CHECK(table.header()[5] == "slacknode");

        REQUIRE(table.row_count() == 3);
        CHECK(table.row(0)[0] == "N2_offshore");
        CHECK(table.row(0)[5] == "1");
        CHECK(table.row(1)[0] == "N1");
        CHECK(table.row(1)[1] == "1");
        CHECK(parse_decimal_value(table.row(1)[3]) == Approx(0.5));
        CHECK(table.row(1)[5] == "0");
        CHECK(table.row(1)[6] == "1");
        CHECK(table.row(1)[13] == "0");
    }
}

}
