#include "prima/subregionload.h"
#include "prima/constants.h"
#include "prima/region.h"

#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/log.h"

#include <algorithm>
#include <map>
#include <stdexcept>

namespace prima {

using namespace inf;

static void add_scaled_series(HourlySeries& result, const HourlySeries& toAdd, double factor)
{
    if (factor == 0.0) {
        return;
    }

    std::transform(result.begin(), result.end(), toAdd.begin(), result.begin(), [factor](double current, double value) {
        return current + value * factor;
    });
}

HourlySeries country_part_load(const ZonalStatistics::Row& countryPartStatistics,
                               std::span<const size_t> landUseColumns,
                               size_t populationColumn,
                               const Country& country,
                               std::span<const LandUseType> landUseTypes,
                               const HourlyLoadTable& loadPerUnit)
{
    if (landUseColumns.size() != landUseTypes.size()) {
        throw std::logic_error("Land use column count mismatch");
    }

    HourlySeries result(loadPerUnit.hour_count(), 0.0);

    add_scaled_series(result, loadPerUnit.series(country, constants::sector::Residential), countryPartStatistics.values[populationColumn]);
    for (size_t lu = 0; lu < landUseTypes.size(); ++lu) {
        add_scaled_series(result, loadPerUnit.series(country, landUseTypes[lu].to_string()), countryPartStatistics.values[landUseColumns[lu]]);
    }

    return result;
}

SubregionLoadResult aggregate_subregion_load(const ZonalStatistics& countryPartStatistics,
                                             const HourlyLoadTable& loadPerUnit,
                                             std::span<const LandUseType> landUseTypes,
                                             const CountryPartProgress::Callback& progressCb)
{
    chrono::ScopedDurationLog d("Aggregate the subregion load");

    std::vector<size_t> landUseColumns;
    for (auto& landUse : landUseTypes) {
        landUseColumns.push_back(countryPartStatistics.required_column_index(landUse.to_string()));
    }
    const auto populationColumn = countryPartStatistics.required_column_index(constants::PopulationColumn);

    SubregionLoadResult result;
    result.hourCount = loadPerUnit.hour_count();

    std::map<std::string, HourlySeries> subregionLoads;

    CountryPartProgress progress(countryPartStatistics.row_count(), progressCb);
    for (const auto& row : countryPartStatistics.rows()) {
        const auto part = country_part_from_id(row.region);

        if (!loadPerUnit.contains(part.country)) {
            Log::warn("Country part {} is dropped: no load available for country {}", row.region, part.country);
            result.droppedCountryParts.push_back(row.region);
        } else {
            auto partLoad = country_part_load(row, landUseColumns, populationColumn, part.country, landUseTypes, loadPerUnit);

            auto& subregionLoad = subregionLoads[part.subregion];
            if (subregionLoad.empty()) {
                subregionLoad = std::move(partLoad);
            } else {
                add_scaled_series(subregionLoad, partLoad, 1.0);
            }
        }

        progress.set_payload(row.region);
        progress.tick();
    }

    result.loads.reserve(subregionLoads.size());
    for (auto& [subregion, series] : subregionLoads) {
        result.loads.emplace_back(subregion, std::move(series));
    }

    if (!result.droppedCountryParts.empty()) {
        Log::warn("{} country parts were dropped, their load is not part of the subregion load", result.droppedCountryParts.size());
    }

    return result;
}

}
