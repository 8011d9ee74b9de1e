#include "prima/countryloaddisaggregation.h"
#include "prima/region.h"
#include "prima/subregionload.h"
#include "infra/exception.h"

#include "testdata.h"
#include "testprinters.h"

#include <doctest/doctest.h>

namespace prima::test {

using namespace inf;
using namespace doctest;

static const SubregionLoad& find_subregion(const SubregionLoadResult& result, std::string_view name)
{
    for (auto& load : result.loads) {
        if (load.subregion == name) {
            return load;
        }
    }

    throw RuntimeError("Subregion not present: {}", name);
}

TEST_CASE("Country part identifiers")
{
    CHECK(CountryPart("BE21", Country("BE")).id() == "BE21_BE");

    auto part = country_part_from_id("BE21_BE");
    CHECK(part.subregion == "BE21");
    CHECK(part.country == Country("BE"));

    part = country_part_from_id("Noord_Brabant_NL");
    CHECK(part.subregion == "Noord_Brabant");
    CHECK(part.country == Country("NL"));

    CHECK_THROWS_AS(country_part_from_id("BE21"), RuntimeError);
    CHECK_THROWS_AS(country_part_from_id("_BE"), RuntimeError);
    CHECK_THROWS_AS(country_part_from_id("BE21_"), RuntimeError);
}

TEST_CASE("Subregion aggregation")
{
    const std::vector<Sector> sectors = {Sector("IND"), Sector("RES")};
    const auto weights                = create_sector_landuse_weights(two_country_assumptions(), sectors);
    const auto loadPerUnit            = load_per_land_use_unit(two_country_sector_load(), weights, two_country_statistics(), nullptr);

    SUBCASE("subregion covering a country and half of another country")
    {
        // S1: all of A and half of B, S2: the other half of B
        const ZonalStatistics partStats({"1", "2", "Population"}, {
                                                                      ZonalStatistics::Row("S1_A", {10.0, 5.0, 1000.0}),
                                                                      ZonalStatistics::Row("S1_B", {2.0, 1.0, 250.0}),
                                                                      ZonalStatistics::Row("S2_B", {2.0, 1.0, 250.0}),
                                                                  });

        const auto result = aggregate_subregion_load(partStats, loadPerUnit, weights.land_use_types(), nullptr);
        REQUIRE(result.hourCount == 1);
        REQUIRE(result.loads.size() == 2);
        CHECK(result.loads[0].subregion == "S1");
        CHECK(result.loads[1].subregion == "S2");
        CHECK(result.droppedCountryParts.empty());

        CHECK(find_subregion(result, "S1").series[0] == Approx(125.0));
        CHECK(find_subregion(result, "S2").series[0] == Approx(25.0));

        // closed system: the subregions contain the total load of the countries
        CHECK(result.loads[0].series[0] + result.loads[1].series[0] == Approx(150.0));
    }

    SUBCASE("equal population results in equal residential load")
    {
        const ZonalStatistics partStats({"1", "2", "Population"}, {
                                                                      ZonalStatistics::Row("S1_A", {0.0, 0.0, 300.0}),
                                                                      ZonalStatistics::Row("S2_A", {0.0, 0.0, 300.0}),
                                                                  });

        const auto result = aggregate_subregion_load(partStats, loadPerUnit, weights.land_use_types(), nullptr);
        REQUIRE(result.loads.size() == 2);
        CHECK(result.loads[0].series[0] == Approx(12.0));
        CHECK(result.loads[0].series[0] == Approx(result.loads[1].series[0]));
    }

    SUBCASE("country parts without load are dropped")
    {
        const ZonalStatistics partStats({"1", "2", "Population"}, {
                                                                      ZonalStatistics::Row("S1_A", {10.0, 5.0, 1000.0}),
                                                                      ZonalStatistics::Row("S1_X", {10.0, 5.0, 1000.0}),
                                                                      ZonalStatistics::Row("S2_X", {1.0, 1.0, 1.0}),
                                                                  });

        const auto result = aggregate_subregion_load(partStats, loadPerUnit, weights.land_use_types(), nullptr);
        REQUIRE(result.loads.size() == 1);
        CHECK(result.loads[0].subregion == "S1");
        CHECK(result.loads[0].series[0] == Approx(100.0));

        REQUIRE(result.droppedCountryParts.size() == 2);
        CHECK(result.droppedCountryParts[0] == "S1_X");
        CHECK(result.droppedCountryParts[1] == "S2_X");
    }

    SUBCASE("invalid country part identifier")
    {
        const ZonalStatistics partStats({"1", "2", "Population"}, {ZonalStatistics::Row("S1", {1.0, 1.0, 1.0})});
        CHECK_THROWS_AS(aggregate_subregion_load(partStats, loadPerUnit, weights.land_use_types(), nullptr), RuntimeError);
    }
}

}
