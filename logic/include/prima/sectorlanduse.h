#pragma once

#include "prima/landuse.h"
#include "prima/sector.h"

#include "infra/span.h"

#include <optional>
#include <vector>

namespace prima {

// Raw land use x sector coefficients as present in the assumptions table
struct LandUseAssumptions
{
    std::vector<LandUseType> landUseTypes;
    std::vector<Sector> sectors;
    std::vector<double> coefficients; // row major: one row per land use type, one column per sector

    double coefficient(size_t landUseIndex, size_t sectorIndex) const
    {
        return coefficients.at(landUseIndex * sectors.size() + sectorIndex);
    }
};

// Normalized sector weights, the weights of every sector over the land use types sum to 1
class SectorLandUseWeights
{
public:
    SectorLandUseWeights() = default;
    SectorLandUseWeights(std::vector<LandUseType> landUseTypes, std::vector<Sector> sectors, std::vector<double> weights);

    std::span<const LandUseType> land_use_types() const noexcept;
    // The sectors that are spread using the land use, residential is not part of it
    std::span<const Sector> sectors() const noexcept;
    // The weighted sectors followed by the residential sector
    std::vector<Sector> disaggregation_sectors() const;

    std::optional<size_t> sector_index(const Sector& sector) const noexcept;
    double weight(size_t sectorIndex, size_t landUseIndex) const;
    double weight(const Sector& sector, LandUseType landUse) const;

private:
    std::vector<LandUseType> _landUseTypes;
    std::vector<Sector> _sectors;
    std::vector<double> _weights; // row major: one row per sector
};

SectorLandUseWeights create_sector_landuse_weights(const LandUseAssumptions& assumptions, std::span<const Sector> configuredSectors);

}
