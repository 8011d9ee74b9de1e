#pragma once

#include "prima/country.h"

#include "infra/filesystem.h"
#include "infra/geometadata.h"
#include "infra/progressinfo.h"
#include "infra/span.h"

#include <geos/geom/Geometry.h>
#include <string>
#include <vector>

namespace prima {

class Region
{
public:
    Region(std::string_view id, Country country, geos::geom::Geometry::Ptr geometry);

    Region(Region&&) noexcept = default;
    Region& operator=(Region&&) noexcept = default;

    const std::string& id() const noexcept
    {
        return _id;
    }

    // Empty for regions that are not bound to a single country
    const Country& country() const noexcept
    {
        return _country;
    }

    const geos::geom::Geometry& geometry() const noexcept
    {
        return *_geometry;
    }

private:
    std::string _id;
    Country _country;
    geos::geom::Geometry::Ptr _geometry;
};

// A subregion clipped to one country
struct CountryPart
{
    CountryPart() = default;
    CountryPart(std::string_view sub, Country c)
    : subregion(sub)
    , country(std::move(c))
    {
    }

    std::string id() const;
    bool operator==(const CountryPart& other) const noexcept
    {
        return subregion == other.subregion && country == other.country;
    }

    std::string subregion;
    Country country;
};

// Parses the '<subregion>_<country>' identifier, the country is the part after the last underscore
CountryPart country_part_from_id(std::string_view id);

using RegionProgress = inf::ProgressTracker<std::string>;

enum class RegionCountry
{
    FromId,
    None,
};

// Reads the polygons of the vector, features sharing the same id are merged into one region
// When the vector contains projection information it has to match the raster extent projection
std::vector<Region> read_regions(const fs::path& vectorPath, const std::string& idField, RegionCountry countryMode, const inf::GeoMetadata& rasterExtent);

// Intersects every subregion with every country, empty intersections are omitted
std::vector<Region> create_country_parts(std::span<const Region> subregions, std::span<const Region> countries, const RegionProgress::Callback& progressCb);

}
