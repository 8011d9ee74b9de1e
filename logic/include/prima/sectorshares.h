#pragma once

#include "prima/country.h"
#include "prima/sector.h"

#include "infra/span.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prima {

// Share of every sector in the electricity demand of a country
// Countries without (complete) shares use the row of the default key
class SectorShares
{
public:
    SectorShares() = default;
    // The rows contain one optional share per sector, an empty share is a missing value
    SectorShares(std::vector<Sector> sectors, std::unordered_map<std::string, std::vector<std::optional<double>>> rows, std::string_view defaultKey);

    std::span<const Sector> sectors() const noexcept;
    const std::string& default_key() const noexcept;
    bool has_default_row() const noexcept;

    std::optional<double> try_country_share(const Country& country, const Sector& sector) const noexcept;
    std::optional<double> try_default_share(const Sector& sector) const noexcept;

    // The country share, the default share when the country share is missing
    // Throws when neither is available
    double share(const Country& country, const Sector& sector) const;

private:
    std::optional<double> try_share(std::string_view key, const Sector& sector) const noexcept;

    std::vector<Sector> _sectors;
    std::unordered_map<std::string, std::vector<std::optional<double>>> _rows;
    std::string _defaultKey;
};

}
