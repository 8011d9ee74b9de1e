#include "prima/sectorlanduse.h"

#include "infra/algo.h"
#include "infra/exception.h"
#include "infra/log.h"
#include "infra/string.h"

#include <algorithm>
#include <cmath>

namespace prima {

using namespace inf;
using namespace std::string_view_literals;

SectorLandUseWeights::SectorLandUseWeights(std::vector<LandUseType> landUseTypes, std::vector<Sector> sectors, std::vector<double> weights)
: _landUseTypes(std::move(landUseTypes))
, _sectors(std::move(sectors))
, _weights(std::move(weights))
{
    if (_weights.size() != _landUseTypes.size() * _sectors.size()) {
        throw RuntimeError("Invalid sector weights: expected {} values, got {}", _landUseTypes.size() * _sectors.size(), _weights.size());
    }
}

std::span<const LandUseType> SectorLandUseWeights::land_use_types() const noexcept
{
    return _landUseTypes;
}

std::span<const Sector> SectorLandUseWeights::sectors() const noexcept
{
    return _sectors;
}

std::vector<Sector> SectorLandUseWeights::disaggregation_sectors() const
{
    auto result = _sectors;
    result.push_back(Sector::residential());
    return result;
}

std::optional<size_t> SectorLandUseWeights::sector_index(const Sector& sector) const noexcept
{
    auto iter = std::find(_sectors.begin(), _sectors.end(), sector);
    if (iter == _sectors.end()) {
        return {};
    }

    return static_cast<size_t>(std::distance(_sectors.begin(), iter));
}

double SectorLandUseWeights::weight(size_t sectorIndex, size_t landUseIndex) const
{
    return _weights.at(sectorIndex * _landUseTypes.size() + landUseIndex);
}

double SectorLandUseWeights::weight(const Sector& sector, LandUseType landUse) const
{
    const auto sectorIndex = sector_index(sector);
    if (!sectorIndex.has_value()) {
        throw RuntimeError("No land use weights available for sector {}", sector);
    }

    auto iter = std::find(_landUseTypes.begin(), _landUseTypes.end(), landUse);
    if (iter == _landUseTypes.end()) {
        throw RuntimeError("No land use weights available for land use type {}", landUse);
    }

    return weight(*sectorIndex, std::distance(_landUseTypes.begin(), iter));
}

SectorLandUseWeights create_sector_landuse_weights(const LandUseAssumptions& assumptions, std::span<const Sector> configuredSectors)
{
    std::vector<Sector> sharedSectors;
    std::vector<Sector> missingSectors;
    for (auto& sector : configuredSectors) {
        if (sector.is_residential()) {
            // spread using the population
            continue;
        }

        if (container_contains(assumptions.sectors, sector)) {
            sharedSectors.push_back(sector);
        } else {
            missingSectors.push_back(sector);
        }
    }

    if (!missingSectors.empty()) {
        Log::warn("The following sectors are not included in the land use assumptions: {}", str::join(missingSectors, ", "sv, [](const Sector& sector) {
                      return std::string(sector.name());
                  }));
    }

    std::sort(sharedSectors.begin(), sharedSectors.end());
    sharedSectors.erase(std::unique(sharedSectors.begin(), sharedSectors.end()), sharedSectors.end());

    const auto landUseCount = assumptions.landUseTypes.size();

    std::vector<Sector> sectors;
    std::vector<double> weights;
    for (auto& sector : sharedSectors) {
        const auto sectorIndex = static_cast<size_t>(std::distance(assumptions.sectors.begin(), std::find(assumptions.sectors.begin(), assumptions.sectors.end(), sector)));

        double columnSum = 0.0;
        for (size_t lu = 0; lu < landUseCount; ++lu) {
            const auto coefficient = assumptions.coefficient(lu, sectorIndex);
            if (coefficient < 0.0 || !std::isfinite(coefficient)) {
                throw RuntimeError("Invalid land use coefficient for sector {} and land use type {}: {}", sector, assumptions.landUseTypes[lu], coefficient);
            }

            columnSum += coefficient;
        }

        if (columnSum == 0.0) {
            Log::warn("The land use coefficients of sector {} sum to zero, the sector is not disaggregated", sector);
            continue;
        }

        sectors.push_back(sector);
        for (size_t lu = 0; lu < landUseCount; ++lu) {
            weights.push_back(assumptions.coefficient(lu, sectorIndex) / columnSum);
        }
    }

    return SectorLandUseWeights(assumptions.landUseTypes, std::move(sectors), std::move(weights));
}

}
