#pragma once

#include "prima/loadtables.h"
#include "prima/sectoralprofiles.h"
#include "prima/sectorlanduse.h"
#include "prima/sectorshares.h"

#include "infra/filesystem.h"

#include <string_view>

namespace prima {

// Hourly load per country: one column per country, an optional leading hour column
CountryLoadTable parse_country_load(const fs::path& path);

// Land use category id in the first column, one coefficient column per sector
LandUseAssumptions parse_landuse_assumptions(const fs::path& path);

// Country code (or the default key) in the first column, one share column per sector
SectorShares parse_sector_shares(const fs::path& path, std::string_view defaultKey);

// One profile per column, 'IND' columns are shared by all countries, 'DE.IND' columns only apply to one country
SectoralProfiles parse_sectoral_profiles(const fs::path& path);

}
