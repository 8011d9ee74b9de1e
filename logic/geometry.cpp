#include "geometry.h"

#include "infra/exception.h"

#include <geos/geom/Coordinate.h>
#include <geos/geom/DefaultCoordinateSequenceFactory.h>
#include <geos/geom/Geometry.h>
#include <geos/geom/GeometryFactory.h>
#include <geos/geom/LinearRing.h>
#include <geos/geom/util/PolygonExtracter.h>

#include <memory>
#include <vector>

namespace prima::geom {

using namespace inf;

static std::unique_ptr<geos::geom::LinearRing> gdal_linear_ring_to_geos(const geos::geom::GeometryFactory& factory, gdal::LinearRingCRef ring)
{
    std::vector<geos::geom::Coordinate> coords;
    coords.reserve(ring.point_count());

    for (int i = 0; i < ring.point_count(); ++i) {
        const auto point = ring.point_at(i);
        coords.emplace_back(point.x, point.y);
    }

    return factory.createLinearRing(geos::geom::DefaultCoordinateSequenceFactory::instance()->create(std::move(coords)));
}

static geos::geom::Polygon::Ptr gdal_polygon_to_geos(const geos::geom::GeometryFactory& factory, gdal::PolygonCRef poly)
{
    auto exteriorRing = gdal_linear_ring_to_geos(factory, poly.exterior_ring());

    std::vector<std::unique_ptr<geos::geom::LinearRing>> holes;
    for (int i = 0; i < poly.interior_ring_count(); ++i) {
        holes.push_back(gdal_linear_ring_to_geos(factory, poly.interior_ring(i)));
    }

    return factory.createPolygon(std::move(exteriorRing), std::move(holes));
}

geos::geom::MultiPolygon::Ptr gdal_to_geos(inf::gdal::GeometryCRef geom)
{
    auto factory = geos::geom::GeometryFactory::create();

    std::vector<std::unique_ptr<geos::geom::Geometry>> geometries;
    if (geom.type() == gdal::Geometry::Type::Polygon) {
        geometries.push_back(gdal_polygon_to_geos(*factory, geom.as<gdal::PolygonCRef>()));
    } else if (geom.type() == gdal::Geometry::Type::MultiPolygon) {
        auto multiPoly = geom.as<gdal::MultiPolygonCRef>();
        for (int i = 0; i < multiPoly.size(); ++i) {
            geometries.push_back(gdal_polygon_to_geos(*factory, multiPoly.polygon_at(i)));
        }
    } else {
        throw RuntimeError("Only polygon geometries are supported for regions");
    }

    return factory->createMultiPolygon(std::move(geometries));
}

geos::geom::Polygon::Ptr create_polygon(inf::Point<double> p1, inf::Point<double> p2)
{
    const auto factory = geos::geom::GeometryFactory::getDefaultInstance();
    return factory->createPolygon(factory->createLinearRing(geos::geom::DefaultCoordinateSequenceFactory::instance()->create({
        {p1.x, p1.y},
        {p2.x, p1.y},
        {p2.x, p2.y},
        {p1.x, p2.y},
        {p1.x, p1.y},
    })));
}

geos::geom::MultiPolygon::Ptr polygonal_part(const geos::geom::Geometry& geom)
{
    std::vector<const geos::geom::Polygon*> polygons;
    geos::geom::util::PolygonExtracter::getPolygons(geom, polygons);

    std::vector<std::unique_ptr<geos::geom::Geometry>> geometries;
    geometries.reserve(polygons.size());
    for (const auto* polygon : polygons) {
        geometries.push_back(polygon->clone());
    }

    return geom.getFactory()->createMultiPolygon(std::move(geometries));
}

}
