#include "prima/modelpaths.h"

#include <fmt/format.h>

namespace prima {

ModelPaths::ModelPaths(std::string_view regionName, std::string_view subregionsName, date::year year, const fs::path& outputRoot)
: _regionName(regionName)
, _subregionsName(subregionsName)
, _year(year)
, _outputRoot(outputRoot)
{
}

const fs::path& ModelPaths::output_path() const noexcept
{
    return _outputRoot;
}

fs::path ModelPaths::intermediate_dir() const
{
    return _outputRoot / "intermediate";
}

fs::path ModelPaths::log_path() const
{
    return _outputRoot / "prima.log";
}

fs::path ModelPaths::country_statistics_path() const
{
    return intermediate_dir() / fs::u8path(fmt::format("{}_stats_countries.csv", _regionName));
}

fs::path ModelPaths::country_part_statistics_path() const
{
    return intermediate_dir() / fs::u8path(fmt::format("{}_stats_country_parts.csv", _subregionsName));
}

fs::path ModelPaths::sector_load_path() const
{
    return intermediate_dir() / fs::u8path(fmt::format("{}_sector_load_{}.csv", _regionName, static_cast<int>(_year)));
}

fs::path ModelPaths::yearly_sector_load_path() const
{
    return intermediate_dir() / fs::u8path(fmt::format("{}_yearly_sector_load_{}.csv", _regionName, static_cast<int>(_year)));
}

fs::path ModelPaths::land_use_load_path() const
{
    return intermediate_dir() / fs::u8path(fmt::format("{}_landuse_load_{}.csv", _regionName, static_cast<int>(_year)));
}

fs::path ModelPaths::subregion_load_path() const
{
    return _outputRoot / fs::u8path(fmt::format("{}_load_{}.csv", _subregionsName, static_cast<int>(_year)));
}

fs::path ModelPaths::sites_path() const
{
    return _outputRoot / fs::u8path(fmt::format("{}_sites.csv", _subregionsName));
}

}
