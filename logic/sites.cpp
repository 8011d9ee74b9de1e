#include "prima/sites.h"
#include "prima/constants.h"
#include "prima/zonalstatistics.h"
#include "geometry.h"

#include "infra/chrono.h"
#include "infra/crs.h"
#include "infra/exception.h"
#include "infra/gdal.h"
#include "infra/log.h"

#include <geos/geom/Point.h>

#include <algorithm>
#include <unordered_map>

namespace prima {

using namespace inf;

struct SiteGeometry
{
    int64_t index = 0;
    double area   = 0.0;
    geos::geom::Geometry::Ptr geographic;
};

static std::unordered_map<std::string, SiteGeometry> read_site_geometries(const fs::path& vectorPath, const std::string& idField)
{
    auto ds    = gdal::VectorDataSet::open(vectorPath);
    auto layer = ds.layer(0);

    const auto projection = layer.projection();
    if (!projection.has_value()) {
        throw RuntimeError("Invalid vector {}: no projection information available to calculate the site areas", vectorPath);
    }

    const auto colId      = layer.layer_definition().required_field_index(idField);
    const bool geographic = !projection->epsg_cs().has_value();

    gdal::SpatialReference equalArea(constants::EqualAreaEpsg);
    gdal::SpatialReference wgs84(crs::epsg::WGS84);

    std::unordered_map<std::string, SiteGeometry> result;

    int64_t featureIndex = -1;
    for (auto& feature : layer) {
        ++featureIndex;
        if (!feature.has_geometry()) {
            continue;
        }

        const auto id = std::string(feature.field_as<std::string_view>(colId));
        if (id.empty()) {
            continue;
        }

        auto areaGeometry = feature.geometry().clone();
        areaGeometry.transform_to(equalArea);
        const auto area = geom::gdal_to_geos(areaGeometry)->getArea();

        geos::geom::Geometry::Ptr geographicGeometry;
        if (geographic) {
            geographicGeometry = geom::gdal_to_geos(feature.geometry());
        } else {
            auto gdalGeom = feature.geometry().clone();
            gdalGeom.transform_to(wgs84);
            geographicGeometry = geom::gdal_to_geos(gdalGeom);
        }

        if (auto iter = result.find(id); iter == result.end()) {
            result.emplace(id, SiteGeometry{featureIndex, area, std::move(geographicGeometry)});
        } else {
            iter->second.area += area;
            iter->second.geographic = geographicGeometry->Union(iter->second.geographic.get());
        }
    }

    return result;
}

std::vector<Site> create_sites(std::span<const Region> regions,
                               const fs::path& vectorPath,
                               const std::string& idField,
                               const gdx::DenseRaster<double>& landMask,
                               const gdx::DenseRaster<double>& eezMask,
                               const SitesProgress::Callback& progressCb)
{
    chrono::ScopedDurationLog d("Create sites");

    const std::vector<ZonalRaster> masks = {
        ZonalRaster::continuous(constants::LandColumn, landMask),
        ZonalRaster::continuous(constants::EezColumn, eezMask),
    };

    const auto maskStats  = compute_zonal_statistics(regions, masks, progressCb);
    const auto geometries = read_site_geometries(vectorPath, idField);

    std::vector<Site> result;
    result.reserve(regions.size());

    for (const auto& region : regions) {
        auto iter = geometries.find(region.id());
        if (iter == geometries.end()) {
            throw RuntimeError("Region {} is not present in {}", region.id(), vectorPath);
        }

        const auto& siteGeometry = iter->second;

        Site site;
        site.name  = region.id();
        site.index = siteGeometry.index;
        site.area  = siteGeometry.area;

        if (maskStats.value(region.id(), constants::LandColumn) <= maskStats.value(region.id(), constants::EezColumn)) {
            site.name += "_offshore";
        }

        if (auto centroid = siteGeometry.geographic->getCentroid(); centroid && !centroid->isEmpty()) {
            site.longitude = centroid->getX();
            site.latitude  = centroid->getY();
        }

        result.push_back(std::move(site));
    }

    std::sort(result.begin(), result.end(), [](const Site& lhs, const Site& rhs) {
        return lhs.index < rhs.index;
    });

    if (!result.empty()) {
        result.front().slackNode = true;
    }

    Log::debug("Created {} sites from {}", result.size(), vectorPath);
    return result;
}

}
