#include "prima/sectoralprofiles.h"

#include "infra/exception.h"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace prima {

using namespace inf;

SectoralProfiles::SectoralProfiles(size_t hourCount, std::vector<Profile> profiles)
: _hourCount(hourCount)
, _profiles(std::move(profiles))
{
    for (auto& profile : _profiles) {
        const auto name = profile.country.has_value() ? fmt::format("{}.{}", *profile.country, profile.sector) : std::string(profile.sector.name());

        if (profile.values.size() != _hourCount) {
            throw RuntimeError("Sectoral profile {} contains {} values, expected {}", name, profile.values.size(), _hourCount);
        }

        if (std::any_of(profile.values.begin(), profile.values.end(), [](double v) { return v < 0.0 || !std::isfinite(v); })) {
            throw RuntimeError("Sectoral profile {} contains negative or invalid values", name);
        }

        const auto sum = std::accumulate(profile.values.begin(), profile.values.end(), 0.0);
        if (sum == 0.0) {
            throw RuntimeError("Sectoral profile {} sums to zero", name);
        }

        std::transform(profile.values.begin(), profile.values.end(), profile.values.begin(), [sum](double v) {
            return v / sum;
        });
    }
}

size_t SectoralProfiles::hour_count() const noexcept
{
    return _hourCount;
}

const HourlySeries* SectoralProfiles::find(const Country& country, const Sector& sector) const noexcept
{
    const Profile* sharedProfile = nullptr;

    for (auto& profile : _profiles) {
        if (profile.sector != sector) {
            continue;
        }

        if (!profile.country.has_value()) {
            sharedProfile = &profile;
        } else if (*profile.country == country) {
            return &profile.values;
        }
    }

    return sharedProfile != nullptr ? &sharedProfile->values : nullptr;
}

const HourlySeries& SectoralProfiles::profile(const Country& country, const Sector& sector) const
{
    if (const auto* values = find(country, sector); values != nullptr) {
        return *values;
    }

    throw RuntimeError("No sectoral profile available for sector {} (country {})", sector, country);
}

}
