#pragma once

#include "prima/loadtables.h"
#include "prima/sectorlanduse.h"
#include "prima/zonalstatistics.h"

#include "infra/filesystem.h"

#include <string_view>

namespace prima::test {

// Two countries with one hour of load
// A: load 100, IND 0.6 RES 0.4, 10 pixels of type 1, 5 pixels of type 2, 1000 inhabitants
// B: load 50, IND 0.4 RES 0.6, 4 pixels of type 1, 2 pixels of type 2, 500 inhabitants
// IND weights: type 1 0.8, type 2 0.2
inline LandUseAssumptions two_country_assumptions()
{
    LandUseAssumptions assumptions;
    assumptions.landUseTypes = {LandUseType(1), LandUseType(2)};
    assumptions.sectors      = {Sector("IND")};
    assumptions.coefficients = {8.0, 2.0};
    return assumptions;
}

inline ZonalStatistics two_country_statistics()
{
    return ZonalStatistics({"1", "2", "Population"}, {
                                                         ZonalStatistics::Row("A", {10.0, 5.0, 1000.0}),
                                                         ZonalStatistics::Row("B", {4.0, 2.0, 500.0}),
                                                     });
}

inline HourlyLoadTable two_country_sector_load()
{
    return HourlyLoadTable(1, {
                                  HourlyLoadTable::Entry(Country("A"), "IND", {60.0}),
                                  HourlyLoadTable::Entry(Country("A"), "RES", {40.0}),
                                  HourlyLoadTable::Entry(Country("B"), "IND", {20.0}),
                                  HourlyLoadTable::Entry(Country("B"), "RES", {30.0}),
                              });
}

inline void write_file(const fs::path& path, std::string_view contents)
{
    fs::create_directories(path.parent_path());
    inf::file::write_as_text(path, contents);
}

}
