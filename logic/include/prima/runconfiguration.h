#pragma once

#include "prima/modelpaths.h"
#include "prima/sector.h"

#include "infra/filesystem.h"
#include "infra/span.h"

#include <date/date.h>
#include <optional>
#include <string>
#include <vector>

namespace prima {

class RunConfiguration
{
public:
    struct Input
    {
        std::string regionName;
        std::string subregionsName;
        date::year year;

        fs::path landuse;
        fs::path population;
        fs::path countries;
        std::string countriesField = "GID_0";
        fs::path subregions;
        std::string subregionsField = "NAME_SHORT";

        fs::path loadTimeseries;
        fs::path sectorShares;
        fs::path sectoralProfiles;
        fs::path landuseAssumptions;

        // Optional, the sites table is only created when both masks are configured
        fs::path landMask;
        fs::path eezMask;
    };

    struct Load
    {
        std::vector<Sector> sectors;
        std::string defaultSectorShares = "Default";
    };

    RunConfiguration(Input input, Load load, const fs::path& outputPath);

    const Input& input() const noexcept;
    std::string_view region_name() const noexcept;
    std::string_view subregions_name() const noexcept;
    date::year year() const noexcept;

    std::span<const Sector> sectors() const noexcept;
    std::string_view default_sector_shares() const noexcept;

    const ModelPaths& paths() const noexcept;
    const fs::path& output_path() const noexcept;

    void set_max_concurrency(std::optional<int32_t> concurrency) noexcept;
    std::optional<int32_t> max_concurrency() const noexcept;

private:
    Input _input;
    Load _load;
    ModelPaths _paths;
    std::optional<int32_t> _concurrency;
};

}
