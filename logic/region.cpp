#include "prima/region.h"
#include "geometry.h"

#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/gdal.h"
#include "infra/log.h"

#include <geos/geom/Envelope.h>
#include <geos/util/GEOSException.h>

#include <oneapi/tbb/parallel_for_each.h>

#include <algorithm>
#include <mutex>
#include <unordered_map>

namespace prima {

using namespace inf;

Region::Region(std::string_view id, Country country, geos::geom::Geometry::Ptr geometry)
: _id(id)
, _country(std::move(country))
, _geometry(std::move(geometry))
{
    if (!_geometry) {
        throw RuntimeError("Region '{}' has no geometry", id);
    }
}

std::string CountryPart::id() const
{
    return fmt::format("{}_{}", subregion, country);
}

CountryPart country_part_from_id(std::string_view id)
{
    const auto pos = id.rfind('_');
    if (pos == std::string_view::npos || pos == 0 || pos + 1 == id.size()) {
        throw RuntimeError("Invalid country part identifier: '{}' (expected <subregion>_<country>)", id);
    }

    return CountryPart(id.substr(0, pos), Country(id.substr(pos + 1)));
}

std::vector<Region> read_regions(const fs::path& vectorPath, const std::string& idField, RegionCountry countryMode, const GeoMetadata& rasterExtent)
{
    auto ds    = gdal::VectorDataSet::open(vectorPath);
    auto layer = ds.layer(0);

    const auto colId = layer.layer_definition().required_field_index(idField);

    if (auto projection = layer.projection(); projection.has_value() && !rasterExtent.projection.empty()) {
        // the geometries are not warped, the coordinates have to be in the raster coordinate system
        if (projection->epsg_geog_cs() != rasterExtent.geographic_epsg() || projection->epsg_cs() != rasterExtent.projected_epsg()) {
            throw RuntimeError("Projection mismatch between vector {} and the rasters EPSG:{} <-> EPSG:{}",
                               vectorPath,
                               projection->epsg_cs().value_or(projection->epsg_geog_cs().value_or(0)),
                               rasterExtent.projected_epsg().value_or(rasterExtent.geographic_epsg().value_or(0)));
        }
    }

    if (rasterExtent.rows > 0 && rasterExtent.cols > 0) {
        const auto bbox = rasterExtent.bounding_box();
        layer.set_spatial_filter(bbox.topLeft, bbox.bottomRight);
    }

    std::unordered_map<std::string, geos::geom::Geometry::Ptr> geometriesMap;
    for (auto& feature : layer) {
        if (!feature.has_geometry()) {
            continue;
        }

        const auto id = std::string(feature.field_as<std::string_view>(colId));
        if (id.empty()) {
            Log::warn("Ignoring feature without identifier in {}", vectorPath);
            continue;
        }

        geos::geom::Geometry::Ptr geom = geom::gdal_to_geos(feature.geometry());
        if (auto iter = geometriesMap.find(id); iter == geometriesMap.end()) {
            geometriesMap.emplace(id, std::move(geom));
        } else {
            // features sharing an identifier form one region
            iter->second = geom->Union(iter->second.get());
        }
    }

    std::vector<Region> result;
    result.reserve(geometriesMap.size());
    for (auto& [id, geometry] : geometriesMap) {
        result.emplace_back(id, countryMode == RegionCountry::FromId ? Country(id) : Country(), std::move(geometry));
    }

    std::sort(result.begin(), result.end(), [](const Region& lhs, const Region& rhs) {
        return lhs.id() < rhs.id();
    });

    Log::debug("Read {} regions from {}", result.size(), vectorPath);
    return result;
}

static std::vector<Region> intersect_with_countries(const Region& subregion, std::span<const Region> countries)
{
    std::vector<Region> result;

    const auto* subEnvelope = subregion.geometry().getEnvelopeInternal();
    for (const auto& country : countries) {
        if (!subEnvelope->intersects(country.geometry().getEnvelopeInternal())) {
            continue;
        }

        geos::geom::Geometry::Ptr intersection;
        try {
            intersection = subregion.geometry().intersection(&country.geometry());
        } catch (const geos::util::GEOSException& e) {
            throw RuntimeError("Failed to intersect subregion {} with country {}: {}", subregion.id(), country.id(), e.what());
        }

        // shared edges end up as line components next to the overlapping area
        auto polygons = geom::polygonal_part(*intersection);
        if (polygons->isEmpty() || polygons->getArea() <= 0.0) {
            continue;
        }

        CountryPart part(subregion.id(), country.country());
        result.emplace_back(part.id(), country.country(), std::move(polygons));
    }

    return result;
}

std::vector<Region> create_country_parts(std::span<const Region> subregions, std::span<const Region> countries, const RegionProgress::Callback& progressCb)
{
    std::vector<Region> result;

    {
        chrono::DurationRecorder rec;

        std::mutex mut;
        RegionProgress progress(subregions.size(), progressCb);
        tbb::parallel_for_each(subregions.begin(), subregions.end(), [&](const Region& subregion) {
            auto parts = intersect_with_countries(subregion, countries);
            if (parts.empty()) {
                Log::warn("Subregion {} does not intersect with any country", subregion.id());
            }

            progress.set_payload(subregion.id());
            progress.tick();

            std::scoped_lock lock(mut);
            std::move(parts.begin(), parts.end(), std::back_inserter(result));
        });

        Log::debug("Creating {} country parts took: {}", result.size(), rec.elapsed_time_string());
    }

    std::sort(result.begin(), result.end(), [](const Region& lhs, const Region& rhs) {
        return lhs.id() < rhs.id();
    });

    return result;
}

}
