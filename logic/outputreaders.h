#pragma once

#include "prima/loadtables.h"
#include "prima/subregionload.h"
#include "prima/zonalstatistics.h"

#include "infra/filesystem.h"

#include <vector>

namespace prima {

// Readers for the tables created by the output writers, used to resume from cached results

ZonalStatistics read_zonal_statistics(const fs::path& path);
HourlyLoadTable read_sector_load(const fs::path& path);
std::vector<YearlySectorLoad> read_yearly_sector_load(const fs::path& path);
HourlyLoadTable read_land_use_load(const fs::path& path);
SubregionLoadResult read_subregion_load(const fs::path& path);

}
