#pragma once

#include "prima/country.h"
#include "prima/loadtables.h"
#include "prima/sector.h"

#include <optional>
#include <vector>

namespace prima {

// Hourly demand shape of the sectors, every profile sums to 1 over the year
class SectoralProfiles
{
public:
    struct Profile
    {
        Profile() = default;
        Profile(std::optional<Country> c, Sector s, HourlySeries v)
        : country(std::move(c))
        , sector(std::move(s))
        , values(std::move(v))
        {
        }

        std::optional<Country> country; // empty: shared by all countries
        Sector sector;
        HourlySeries values;
    };

    SectoralProfiles() = default;
    // The profile values are normalized, profiles summing to zero are rejected
    SectoralProfiles(size_t hourCount, std::vector<Profile> profiles);

    size_t hour_count() const noexcept;

    const HourlySeries* find(const Country& country, const Sector& sector) const noexcept;
    // The country specific profile if present, the shared profile otherwise
    const HourlySeries& profile(const Country& country, const Sector& sector) const;

private:
    size_t _hourCount = 0;
    std::vector<Profile> _profiles;
};

}
