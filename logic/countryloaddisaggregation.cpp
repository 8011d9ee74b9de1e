#include "prima/countryloaddisaggregation.h"
#include "prima/constants.h"

#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/log.h"

#include <algorithm>
#include <numeric>

namespace prima {

using namespace inf;

static std::vector<double> sector_shares_for_country(const Country& country, const SectorShares& shares, std::span<const Sector> sectors)
{
    std::vector<double> result;
    result.reserve(sectors.size());

    bool defaultUsed = false;
    for (auto& sector : sectors) {
        if (!shares.try_country_share(country, sector).has_value()) {
            defaultUsed = true;
        }

        const auto share = shares.share(country, sector);
        if (share < 0.0) {
            throw RuntimeError("Negative share of sector {} for country {}: {}", sector, country, share);
        }

        result.push_back(share);
    }

    if (defaultUsed) {
        Log::debug("Using the default sector shares ('{}') for country {}", shares.default_key(), country);
    }

    return result;
}

HourlyLoadTable disaggregate_country_load(const CountryLoadTable& countryLoad,
                                          const SectorShares& shares,
                                          const SectoralProfiles& profiles,
                                          std::span<const Sector> sectors,
                                          const CountryProgress::Callback& progressCb)
{
    chrono::ScopedDurationLog d("Disaggregate country load over the sectors");

    const auto hourCount = countryLoad.hour_count();
    if (profiles.hour_count() != hourCount) {
        throw RuntimeError("Hour count mismatch between the sectoral profiles ({}) and the load time series ({})", profiles.hour_count(), hourCount);
    }

    std::vector<HourlyLoadTable::Entry> entries;
    entries.reserve(countryLoad.entries().size() * sectors.size());

    CountryProgress progress(countryLoad.entries().size(), progressCb);
    for (const auto& [country, totalLoad] : countryLoad.entries()) {
        const auto sectorShares = sector_shares_for_country(country, shares, sectors);
        const auto shareSum     = std::accumulate(sectorShares.begin(), sectorShares.end(), 0.0);

        std::vector<const HourlySeries*> sectorProfiles;
        for (auto& sector : sectors) {
            sectorProfiles.push_back(&profiles.profile(country, sector));
        }

        std::vector<HourlySeries> sectorLoads(sectors.size(), HourlySeries(hourCount, 0.0));
        for (size_t hour = 0; hour < hourCount; ++hour) {
            double rawSum = 0.0;
            for (size_t i = 0; i < sectors.size(); ++i) {
                rawSum += (*sectorProfiles[i])[hour] * sectorShares[i];
            }

            const auto total = totalLoad[hour];
            if (total == 0.0) {
                continue;
            }

            if (rawSum > 0.0) {
                for (size_t i = 0; i < sectors.size(); ++i) {
                    sectorLoads[i][hour] = (*sectorProfiles[i])[hour] * sectorShares[i] / rawSum * total;
                }
            } else {
                // none of the sector profiles is active in this hour, split the load using the shares
                if (shareSum <= 0.0) {
                    throw RuntimeError("The sector shares of country {} sum to zero, the load cannot be disaggregated", country);
                }

                for (size_t i = 0; i < sectors.size(); ++i) {
                    sectorLoads[i][hour] = sectorShares[i] / shareSum * total;
                }
            }
        }

        for (size_t i = 0; i < sectors.size(); ++i) {
            entries.emplace_back(country, sectors[i].name(), std::move(sectorLoads[i]));
        }

        progress.set_payload(std::string(country.iso_code()));
        progress.tick();
    }

    return HourlyLoadTable(hourCount, std::move(entries));
}

std::vector<YearlySectorLoad> yearly_sector_load(const HourlyLoadTable& sectorLoad)
{
    std::vector<YearlySectorLoad> result;
    result.reserve(sectorLoad.entries().size());

    for (const auto& entry : sectorLoad.entries()) {
        result.emplace_back(entry.country, Sector(entry.key), std::accumulate(entry.series.begin(), entry.series.end(), 0.0));
    }

    return result;
}

static void add_scaled_series(HourlySeries& result, const HourlySeries& toAdd, double factor)
{
    std::transform(result.begin(), result.end(), toAdd.begin(), result.begin(), [factor](double current, double value) {
        return current + value * factor;
    });
}

static bool contains_load(const HourlySeries& series)
{
    return std::any_of(series.begin(), series.end(), [](double v) { return v != 0.0; });
}

HourlyLoadTable load_per_land_use_unit(const HourlyLoadTable& sectorLoad,
                                       const SectorLandUseWeights& weights,
                                       const ZonalStatistics& countryStatistics,
                                       const CountryProgress::Callback& progressCb)
{
    chrono::ScopedDurationLog d("Calculate the load per land use unit");

    const auto landUseTypes = weights.land_use_types();
    const auto sectors      = weights.sectors();
    const auto hourCount    = sectorLoad.hour_count();

    std::vector<size_t> landUseColumns;
    for (auto& landUse : landUseTypes) {
        landUseColumns.push_back(countryStatistics.required_column_index(landUse.to_string()));
    }
    const auto populationColumn = countryStatistics.required_column_index(constants::PopulationColumn);

    std::vector<Country> countries;
    for (const auto& row : countryStatistics.rows()) {
        Country country(row.region);
        if (sectorLoad.contains(country)) {
            countries.push_back(country);
        } else {
            Log::debug("No load available for country {}", country);
        }
    }
    std::sort(countries.begin(), countries.end());

    std::vector<HourlyLoadTable::Entry> entries;
    entries.reserve(countries.size() * (landUseTypes.size() + 1));

    CountryProgress progress(countries.size(), progressCb);
    for (const auto& country : countries) {
        const auto& stats = countryStatistics.row(country.iso_code());

        std::vector<HourlySeries> landUseLoad(landUseTypes.size(), HourlySeries(hourCount, 0.0));
        for (size_t si = 0; si < sectors.size(); ++si) {
            const auto& load = sectorLoad.series(country, sectors[si].name());

            double weightedCount = 0.0;
            for (size_t lu = 0; lu < landUseTypes.size(); ++lu) {
                weightedCount += weights.weight(si, lu) * stats.values[landUseColumns[lu]];
            }

            if (weightedCount == 0.0) {
                if (contains_load(load)) {
                    Log::warn("No land use pixels available for sector {} in country {}, the sector load cannot be allocated", sectors[si], country);
                }
                continue;
            }

            for (size_t lu = 0; lu < landUseTypes.size(); ++lu) {
                if (const auto factor = weights.weight(si, lu) / weightedCount; factor != 0.0) {
                    add_scaled_series(landUseLoad[lu], load, factor);
                }
            }
        }

        for (size_t lu = 0; lu < landUseTypes.size(); ++lu) {
            entries.emplace_back(country, landUseTypes[lu].to_string(), std::move(landUseLoad[lu]));
        }

        HourlySeries residentialLoad(hourCount, 0.0);
        const auto& load      = sectorLoad.series(country, constants::sector::Residential);
        const auto population = stats.values[populationColumn];
        if (population > 0.0) {
            add_scaled_series(residentialLoad, load, 1.0 / population);
        } else if (contains_load(load)) {
            Log::warn("No population available in country {}, the residential load cannot be allocated", country);
        }

        entries.emplace_back(country, constants::sector::Residential, std::move(residentialLoad));

        progress.set_payload(std::string(country.iso_code()));
        progress.tick();
    }

    return HourlyLoadTable(hourCount, std::move(entries));
}

}
