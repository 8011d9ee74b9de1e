#pragma once

#include "prima/landuse.h"
#include "prima/loadtables.h"
#include "prima/zonalstatistics.h"

#include "infra/progressinfo.h"
#include "infra/span.h"

#include <string>
#include <vector>

namespace prima {

struct SubregionLoad
{
    SubregionLoad() = default;
    SubregionLoad(std::string_view name, HourlySeries s)
    : subregion(name)
    , series(std::move(s))
    {
    }

    std::string subregion;
    HourlySeries series;
};

struct SubregionLoadResult
{
    size_t hourCount = 0;
    std::vector<SubregionLoad> loads; // sorted on subregion name
    std::vector<std::string> droppedCountryParts;
};

using CountryPartProgress = inf::ProgressTracker<std::string>;

// The hourly load of a country part: its pixel counts multiplied by the country load per land use unit
HourlySeries country_part_load(const ZonalStatistics::Row& countryPartStatistics,
                               std::span<const size_t> landUseColumns,
                               size_t populationColumn,
                               const Country& country,
                               std::span<const LandUseType> landUseTypes,
                               const HourlyLoadTable& loadPerUnit);

// Sums the country part loads per subregion
// Country parts of countries without load per land use unit are dropped
SubregionLoadResult aggregate_subregion_load(const ZonalStatistics& countryPartStatistics,
                                             const HourlyLoadTable& loadPerUnit,
                                             std::span<const LandUseType> landUseTypes,
                                             const CountryPartProgress::Callback& progressCb);

}
