#pragma once

#include "prima/loadtables.h"
#include "prima/sectoralprofiles.h"
#include "prima/sectorlanduse.h"
#include "prima/sectorshares.h"
#include "prima/zonalstatistics.h"

#include "infra/progressinfo.h"
#include "infra/span.h"

#include <vector>

namespace prima {

using CountryProgress = inf::ProgressTracker<std::string>;

// Splits the hourly load of every country over the sectors
// For every hour the sector loads of a country sum to the country load
HourlyLoadTable disaggregate_country_load(const CountryLoadTable& countryLoad,
                                          const SectorShares& shares,
                                          const SectoralProfiles& profiles,
                                          std::span<const Sector> sectors,
                                          const CountryProgress::Callback& progressCb);

std::vector<YearlySectorLoad> yearly_sector_load(const HourlyLoadTable& sectorLoad);

// The hourly load of a single land use pixel or a single inhabitant (RES key) per country
// Only the countries present in the zonal statistics and in the sector load are considered
HourlyLoadTable load_per_land_use_unit(const HourlyLoadTable& sectorLoad,
                                       const SectorLandUseWeights& weights,
                                       const ZonalStatistics& countryStatistics,
                                       const CountryProgress::Callback& progressCb);

}
