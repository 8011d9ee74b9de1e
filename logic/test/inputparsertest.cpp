#include "prima/inputparsers.h"
#include "infra/exception.h"
#include "infra/test/tempdir.h"

#include "testdata.h"
#include "testprinters.h"

#include <doctest/doctest.h>

namespace prima::test {

using namespace inf;
using namespace doctest;

TEST_CASE("Input parsers")
{
    TempDir tempDir("prima_input_parsers");

    SUBCASE("country load")
    {
        const auto path = tempDir.path() / "load_ts.csv";
        write_file(path,
                   "t;BE;NL\r\n"
                   "0;10,5;20\r\n"
                   "1;11;21,25\r\n"
                   "\r\n"
                   "2;12;22\r\n");

        const auto load = parse_country_load(path);
        CHECK(load.hour_count() == 3);
        REQUIRE(load.entries().size() == 2);
        CHECK(load.series(Country("BE")) == HourlySeries{10.5, 11.0, 12.0});
        CHECK(load.series(Country("NL")) == HourlySeries{20.0, 21.25, 22.0});
        CHECK(load.find(Country("DE")) == nullptr);
    }

    SUBCASE("country load without index column")
    {
        const auto path = tempDir.path() / "load_ts_noindex.csv";
        write_file(path, "BE;NL\n1;2\n3;4\n");

        const auto load = parse_country_load(path);
        CHECK(load.hour_count() == 2);
        CHECK(load.series(Country("NL")) == HourlySeries{2.0, 4.0});
    }

    SUBCASE("country load with invalid value")
    {
        const auto path = tempDir.path() / "load_ts_invalid.csv";
        write_file(path, "t;BE\n0;1\n1;abc\n");

        CHECK_THROWS_WITH_AS(parse_country_load(path), Contains("line 3"), RuntimeError);
    }

    SUBCASE("land use assumptions")
    {
        const auto path = tempDir.path() / "assumptions.csv";
        write_file(path,
                   "Landuse;IND;COM\n"
                   "1;0,5;\n"
                   "2;0,5;1\n");

        const auto assumptions = parse_landuse_assumptions(path);
        REQUIRE(assumptions.landUseTypes.size() == 2);
        CHECK(assumptions.landUseTypes[1] == LandUseType(2));
        REQUIRE(assumptions.sectors.size() == 2);
        CHECK(assumptions.sectors[1] == Sector("COM"));
        CHECK(assumptions.coefficient(0, 0) == 0.5);
        CHECK(assumptions.coefficient(0, 1) == 0.0);
        CHECK(assumptions.coefficient(1, 1) == 1.0);
    }

    SUBCASE("land use assumptions with duplicate land use")
    {
        const auto path = tempDir.path() / "assumptions_duplicate.csv";
        write_file(path, "Landuse;IND\n1;0,5\n1;0,5\n");

        CHECK_THROWS_AS(parse_landuse_assumptions(path), RuntimeError);
    }

    SUBCASE("sector shares")
    {
        const auto path = tempDir.path() / "shares.csv";
        write_file(path,
                   "Country;IND;COM;RES\n"
                   "BE;0,5;0,3;0,2\n"
                   "NL;0,6;;\n"
                   "Default;0,1;0,2;0,7\n");

        const auto shares = parse_sector_shares(path, "Default");
        CHECK(shares.has_default_row());
        CHECK(shares.share(Country("BE"), Sector("COM")) == 0.3);
        CHECK_FALSE(shares.try_country_share(Country("NL"), Sector("COM")).has_value());
        CHECK(shares.share(Country("NL"), Sector("COM")) == 0.2);
        CHECK(shares.share(Country("FR"), Sector("RES")) == 0.7);
    }

    SUBCASE("sectoral profiles")
    {
        const auto path = tempDir.path() / "profiles.csv";
        write_file(path,
                   ";IND;RES;BE.IND\n"
                   "0;1;1;3\n"
                   "1;3;1;1\n");

        const auto profiles = parse_sectoral_profiles(path);
        CHECK(profiles.hour_count() == 2);
        CHECK(profiles.profile(Country("NL"), Sector("IND"))[1] == Approx(0.75));
        CHECK(profiles.profile(Country("BE"), Sector("IND"))[1] == Approx(0.25));
        CHECK(profiles.profile(Country("BE"), Sector("RES"))[0] == Approx(0.5));
    }

    SUBCASE("missing file")
    {
        CHECK_THROWS_AS(parse_country_load(tempDir.path() / "missing.csv"), RuntimeError);
    }
}

}
