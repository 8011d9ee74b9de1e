#pragma once

#include "infra/gdalgeometry.h"
#include "infra/point.h"

#include <geos/geom/MultiPolygon.h>
#include <geos/geom/Polygon.h>

namespace prima::geom {

// Conversion of the ogr polygons to geos geometries, geos is used for the
// intersections and the point in polygon tests

geos::geom::MultiPolygon::Ptr gdal_to_geos(inf::gdal::GeometryCRef geom);
geos::geom::Polygon::Ptr create_polygon(inf::Point<double> p1, inf::Point<double> p2);

// The polygons of the geometry, the point and line components of a collection are dropped
geos::geom::MultiPolygon::Ptr polygonal_part(const geos::geom::Geometry& geom);

}
