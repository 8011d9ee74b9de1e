#pragma once

#include "infra/filesystem.h"

#include <date/date.h>
#include <string>

namespace prima {

// Locations of the intermediate and final output tables
class ModelPaths
{
public:
    ModelPaths() = default;
    ModelPaths(std::string_view regionName, std::string_view subregionsName, date::year year, const fs::path& outputRoot);

    const fs::path& output_path() const noexcept;
    fs::path intermediate_dir() const;
    fs::path log_path() const;

    fs::path country_statistics_path() const;
    fs::path country_part_statistics_path() const;
    fs::path sector_load_path() const;
    fs::path yearly_sector_load_path() const;
    fs::path land_use_load_path() const;
    fs::path subregion_load_path() const;
    fs::path sites_path() const;

private:
    std::string _regionName;
    std::string _subregionsName;
    date::year _year;
    fs::path _outputRoot;
};

}
