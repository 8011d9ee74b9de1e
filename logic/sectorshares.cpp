#include "prima/sectorshares.h"

#include "infra/exception.h"

#include <algorithm>

namespace prima {

using namespace inf;

SectorShares::SectorShares(std::vector<Sector> sectors, std::unordered_map<std::string, std::vector<std::optional<double>>> rows, std::string_view defaultKey)
: _sectors(std::move(sectors))
, _rows(std::move(rows))
, _defaultKey(defaultKey)
{
    for (auto& [key, shares] : _rows) {
        if (shares.size() != _sectors.size()) {
            throw RuntimeError("Sector shares of '{}' contain {} values, expected {}", key, shares.size(), _sectors.size());
        }
    }
}

std::span<const Sector> SectorShares::sectors() const noexcept
{
    return _sectors;
}

const std::string& SectorShares::default_key() const noexcept
{
    return _defaultKey;
}

bool SectorShares::has_default_row() const noexcept
{
    return _rows.count(_defaultKey) > 0;
}

std::optional<double> SectorShares::try_share(std::string_view key, const Sector& sector) const noexcept
{
    auto rowIter = _rows.find(std::string(key));
    if (rowIter == _rows.end()) {
        return {};
    }

    auto sectorIter = std::find(_sectors.begin(), _sectors.end(), sector);
    if (sectorIter == _sectors.end()) {
        return {};
    }

    return rowIter->second[std::distance(_sectors.begin(), sectorIter)];
}

std::optional<double> SectorShares::try_country_share(const Country& country, const Sector& sector) const noexcept
{
    return try_share(country.iso_code(), sector);
}

std::optional<double> SectorShares::try_default_share(const Sector& sector) const noexcept
{
    return try_share(_defaultKey, sector);
}

double SectorShares::share(const Country& country, const Sector& sector) const
{
    if (auto share = try_country_share(country, sector); share.has_value()) {
        return *share;
    }

    if (auto share = try_default_share(sector); share.has_value()) {
        return *share;
    }

    throw RuntimeError("No share of sector {} available for country {} and no default share ('{}') present", sector, country, _defaultKey);
}

}
