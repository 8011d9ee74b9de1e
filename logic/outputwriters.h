#pragma once

#include "prima/loadtables.h"
#include "prima/sites.h"
#include "prima/subregionload.h"
#include "prima/zonalstatistics.h"

#include "infra/filesystem.h"
#include "infra/span.h"

#include <string>
#include <toml++/toml.h>
#include <vector>

namespace prima {

// Provenance information stored next to every output table
struct OutputMetadata
{
    std::string title;
    toml::table parameters;
    std::vector<fs::path> inputs;
};

// The json sidecar path of an output table
fs::path metadata_path(const fs::path& tablePath);
void write_metadata(const fs::path& tablePath, const OutputMetadata& meta);

void write_zonal_statistics(const ZonalStatistics& stats, std::string_view indexName, const fs::path& path);
void write_sector_load(const HourlyLoadTable& sectorLoad, const fs::path& path);
void write_yearly_sector_load(std::span<const YearlySectorLoad> yearlyLoad, const fs::path& path);
void write_land_use_load(const HourlyLoadTable& loadPerUnit, const fs::path& path);
void write_subregion_load(const SubregionLoadResult& subregionLoad, const fs::path& path);
// The synchronous area, control area and reserve columns are filled with defaults
void write_sites(std::span<const Site> sites, const fs::path& path);

}
