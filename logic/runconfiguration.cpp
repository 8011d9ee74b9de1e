#include "prima/runconfiguration.h"

namespace prima {

RunConfiguration::RunConfiguration(Input input, Load load, const fs::path& outputPath)
: _input(std::move(input))
, _load(std::move(load))
, _paths(_input.regionName, _input.subregionsName, _input.year, outputPath)
{
}

const RunConfiguration::Input& RunConfiguration::input() const noexcept
{
    return _input;
}

std::string_view RunConfiguration::region_name() const noexcept
{
    return _input.regionName;
}

std::string_view RunConfiguration::subregions_name() const noexcept
{
    return _input.subregionsName;
}

date::year RunConfiguration::year() const noexcept
{
    return _input.year;
}

std::span<const Sector> RunConfiguration::sectors() const noexcept
{
    return _load.sectors;
}

std::string_view RunConfiguration::default_sector_shares() const noexcept
{
    return _load.defaultSectorShares;
}

const ModelPaths& RunConfiguration::paths() const noexcept
{
    return _paths;
}

const fs::path& RunConfiguration::output_path() const noexcept
{
    return _paths.output_path();
}

void RunConfiguration::set_max_concurrency(std::optional<int32_t> concurrency) noexcept
{
    _concurrency = concurrency;
}

std::optional<int32_t> RunConfiguration::max_concurrency() const noexcept
{
    return _concurrency;
}

}
