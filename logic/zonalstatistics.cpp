#include "prima/zonalstatistics.h"
#include "prima/constants.h"

#include "infra/algo.h"
#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/log.h"
#include "infra/math.h"
#include "infra/rect.h"

#include <gdx/rasteriterator.h>

#include <geos/algorithm/locate/IndexedPointInAreaLocator.h>
#include <geos/geom/Coordinate.h>
#include <geos/geom/Envelope.h>
#include <geos/geom/Location.h>

#include <oneapi/tbb/parallel_for_each.h>

#include <algorithm>
#include <cmath>
#include <mutex>

namespace prima {

using namespace inf;

ZonalStatistics::ZonalStatistics(std::vector<std::string> columns, std::vector<Row> rows)
: _columns(std::move(columns))
, _rows(std::move(rows))
{
    for (size_t i = 0; i < _rows.size(); ++i) {
        if (_rows[i].values.size() != _columns.size()) {
            throw RuntimeError("Zonal statistics row '{}' contains {} values, expected {}", _rows[i].region, _rows[i].values.size(), _columns.size());
        }

        if (!_rowIndex.emplace(_rows[i].region, i).second) {
            throw RuntimeError("Duplicate region in zonal statistics: {}", _rows[i].region);
        }
    }
}

std::span<const std::string> ZonalStatistics::columns() const noexcept
{
    return _columns;
}

std::span<const ZonalStatistics::Row> ZonalStatistics::rows() const noexcept
{
    return _rows;
}

size_t ZonalStatistics::row_count() const noexcept
{
    return _rows.size();
}

std::optional<size_t> ZonalStatistics::column_index(std::string_view column) const noexcept
{
    auto iter = std::find(_columns.begin(), _columns.end(), column);
    if (iter == _columns.end()) {
        return {};
    }

    return static_cast<size_t>(std::distance(_columns.begin(), iter));
}

size_t ZonalStatistics::required_column_index(std::string_view column) const
{
    if (auto index = column_index(column); index.has_value()) {
        return *index;
    }

    throw RuntimeError("No '{}' column present in zonal statistics", column);
}

const ZonalStatistics::Row* ZonalStatistics::find_row(std::string_view region) const noexcept
{
    if (auto iter = _rowIndex.find(std::string(region)); iter != _rowIndex.end()) {
        return &_rows[iter->second];
    }

    return nullptr;
}

const ZonalStatistics::Row& ZonalStatistics::row(std::string_view region) const
{
    if (const auto* row = find_row(region); row != nullptr) {
        return *row;
    }

    throw RuntimeError("No zonal statistics available for region '{}'", region);
}

double ZonalStatistics::value(std::string_view region, std::string_view column) const
{
    return row(region).values[required_column_index(column)];
}

double ZonalStatistics::land_use_count(std::string_view region, LandUseType type) const
{
    return value(region, type.to_string());
}

double ZonalStatistics::population(std::string_view region) const
{
    return value(region, constants::PopulationColumn);
}

ZonalRaster::ZonalRaster(Kind kind, std::string_view name, const gdx::DenseRaster<double>& raster, std::vector<LandUseType> categories)
: _kind(kind)
, _name(name)
, _raster(&raster)
, _categories(std::move(categories))
{
}

ZonalRaster ZonalRaster::categorical(const gdx::DenseRaster<double>& raster, std::vector<LandUseType> categories)
{
    return ZonalRaster(Kind::Categorical, "", raster, std::move(categories));
}

ZonalRaster ZonalRaster::continuous(std::string_view name, const gdx::DenseRaster<double>& raster)
{
    return ZonalRaster(Kind::Continuous, name, raster, {});
}

ZonalRaster::Kind ZonalRaster::kind() const noexcept
{
    return _kind;
}

const gdx::DenseRaster<double>& ZonalRaster::raster() const noexcept
{
    return *_raster;
}

std::span<const LandUseType> ZonalRaster::categories() const noexcept
{
    return _categories;
}

std::vector<std::string> ZonalRaster::column_names() const
{
    std::vector<std::string> result;
    if (_kind == Kind::Continuous) {
        result.push_back(_name);
    } else {
        for (auto& category : _categories) {
            result.push_back(category.to_string());
        }
    }

    return result;
}

void throw_on_grid_mismatch(std::span<const ZonalRaster> rasters)
{
    if (rasters.empty()) {
        throw RuntimeError("No rasters provided for the zonal statistics");
    }

    const auto& reference = rasters.front().raster().metadata();
    for (auto& zonalRaster : rasters.subspan(1)) {
        const auto& meta = zonalRaster.raster().metadata();

        if (meta.rows != reference.rows || meta.cols != reference.cols) {
            throw RuntimeError("Raster dimensions mismatch: {}x{} <-> {}x{}", reference.rows, reference.cols, meta.rows, meta.cols);
        }

        if (!math::approx_equal(meta.cellSize.x, reference.cellSize.x, 1e-10) || !math::approx_equal(meta.cellSize.y, reference.cellSize.y, 1e-10)) {
            throw RuntimeError("Raster resolution mismatch: {} <-> {}", reference.cellSize.x, meta.cellSize.x);
        }

        if (!math::approx_equal(meta.xll, reference.xll, 1e-8) || !math::approx_equal(meta.yll, reference.yll, 1e-8)) {
            throw RuntimeError("Raster origin mismatch: ({}, {}) <-> ({}, {})", reference.xll, reference.yll, meta.xll, meta.yll);
        }

        if (!meta.projection.empty() && !reference.projection.empty()) {
            if (meta.projected_epsg() != reference.projected_epsg() || meta.geographic_epsg() != reference.geographic_epsg()) {
                throw RuntimeError("Raster projection mismatch");
            }
        }
    }
}

GeoMetadata create_geometry_intersection_extent(const geos::geom::Geometry& geom, const GeoMetadata& gridExtent)
{
    GeoMetadata geometryExtent = gridExtent;

    const auto* env = geom.getEnvelopeInternal();
    if (env->isNull()) {
        return {};
    }

    Rect<double> geomRect;
    geomRect.topLeft     = Point<double>(env->getMinX(), env->getMaxY());
    geomRect.bottomRight = Point<double>(env->getMaxX(), env->getMinY());

    auto intersect = rectangle_intersection(geomRect, gridExtent.bounding_box());
    if (!intersect.is_valid() || intersect.width() == 0 || intersect.height() == 0) {
        // no intersection
        return {};
    }

    auto topLeftCell     = gridExtent.convert_point_to_cell(intersect.topLeft);
    auto bottomRightCell = gridExtent.convert_point_to_cell(intersect.bottomRight);

    // the bottom right corner on the grid edge falls outside of the grid
    bottomRightCell.r = std::min(bottomRightCell.r, gridExtent.rows - 1);
    bottomRightCell.c = std::min(bottomRightCell.c, gridExtent.cols - 1);

    auto lowerLeft = gridExtent.convert_cell_ll_to_xy(Cell(bottomRightCell.r, topLeftCell.c));

    geometryExtent.xll  = lowerLeft.x;
    geometryExtent.yll  = lowerLeft.y;
    geometryExtent.cols = std::max(0, (bottomRightCell.c - topLeftCell.c) + 1);
    geometryExtent.rows = std::max(0, (bottomRightCell.r - topLeftCell.r) + 1);

    return geometryExtent;
}

std::vector<Cell> cells_with_centre_in_geometry(const geos::geom::Geometry& geom, const GeoMetadata& gridExtent)
{
    std::vector<Cell> result;

    const auto geometryExtent = create_geometry_intersection_extent(geom, gridExtent);
    if (geometryExtent.rows == 0 || geometryExtent.cols == 0) {
        return result;
    }

    geos::algorithm::locate::IndexedPointInAreaLocator locator(geom);

    // offset direction not parallel to the grid axes
    const Point<double> boundaryOffset(std::abs(gridExtent.cellSize.x) * 1e-6, -std::abs(gridExtent.cellSize.y) * 0.5e-6);

    for (auto cell : gdx::RasterCells(geometryExtent.rows, geometryExtent.cols)) {
        const auto centre   = geometryExtent.convert_cell_centre_to_xy(cell);
        const auto gridCell = gridExtent.convert_point_to_cell(centre);
        if (!gridExtent.is_on_map(gridCell)) {
            continue;
        }

        const geos::geom::Coordinate coord(centre.x, centre.y);
        const auto location = locator.locate(&coord);
        if (location == geos::geom::Location::INTERIOR) {
            result.push_back(gridCell);
        } else if (location == geos::geom::Location::BOUNDARY) {
            // a centre on a shared boundary belongs to the geometry on its lower right side
            const geos::geom::Coordinate shifted(centre.x + boundaryOffset.x, centre.y + boundaryOffset.y);
            if (locator.locate(&shifted) == geos::geom::Location::INTERIOR) {
                result.push_back(gridCell);
            }
        }
    }

    return result;
}

static std::vector<double> region_statistics(const Region& region, std::span<const ZonalRaster> rasters, std::span<const std::unordered_map<int32_t, size_t>> categoryIndices, size_t columnCount)
{
    std::vector<double> values(columnCount, 0.0);

    const auto& gridExtent = rasters.front().raster().metadata();
    const auto cells       = cells_with_centre_in_geometry(region.geometry(), gridExtent);

    for (const auto& cell : cells) {
        size_t offset = 0;
        for (size_t i = 0; i < rasters.size(); ++i) {
            const auto& raster = rasters[i].raster();

            if (!raster.is_nodata(cell) && !std::isnan(raster[cell])) {
                if (rasters[i].kind() == ZonalRaster::Kind::Categorical) {
                    const auto category = static_cast<int32_t>(std::lround(raster[cell]));
                    if (auto iter = categoryIndices[i].find(category); iter != categoryIndices[i].end()) {
                        values[offset + iter->second] += 1.0;
                    }
                } else {
                    values[offset] += raster[cell];
                }
            }

            offset += rasters[i].kind() == ZonalRaster::Kind::Categorical ? rasters[i].categories().size() : 1;
        }
    }

    return values;
}

ZonalStatistics compute_zonal_statistics(std::span<const Region> regions, std::span<const ZonalRaster> rasters, const ZonalStatisticsProgress::Callback& progressCb)
{
    throw_on_grid_mismatch(rasters);

    std::vector<std::string> columns;
    std::vector<std::unordered_map<int32_t, size_t>> categoryIndices(rasters.size());
    for (size_t i = 0; i < rasters.size(); ++i) {
        append_to_container(columns, rasters[i].column_names());

        const auto categories = rasters[i].categories();
        for (size_t catIndex = 0; catIndex < categories.size(); ++catIndex) {
            categoryIndices[i].emplace(static_cast<int32_t>(categories[catIndex]), catIndex);
        }
    }

    std::vector<ZonalStatistics::Row> rows;
    rows.reserve(regions.size());

    {
        chrono::DurationRecorder rec;

        std::mutex mut;
        ZonalStatisticsProgress progress(regions.size(), progressCb);
        tbb::parallel_for_each(regions.begin(), regions.end(), [&](const Region& region) {
            auto values = region_statistics(region, rasters, categoryIndices, columns.size());
            if (std::all_of(values.begin(), values.end(), [](double v) { return v == 0.0; })) {
                Log::debug("No pixels covered by region {}", region.id());
            }

            progress.set_payload(region.id());
            progress.tick();

            std::scoped_lock lock(mut);
            rows.emplace_back(region.id(), std::move(values));
        });

        Log::debug("Zonal statistics of {} regions took: {}", regions.size(), rec.elapsed_time_string());
    }

    // processing order is not deterministic
    std::sort(rows.begin(), rows.end(), [](const ZonalStatistics::Row& lhs, const ZonalStatistics::Row& rhs) {
        return lhs.region < rhs.region;
    });

    return ZonalStatistics(std::move(columns), std::move(rows));
}

}
