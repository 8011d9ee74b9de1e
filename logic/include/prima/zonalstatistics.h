#pragma once

#include "prima/landuse.h"
#include "prima/region.h"

#include "infra/geometadata.h"
#include "infra/progressinfo.h"
#include "infra/span.h"

#include <gdx/denseraster.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prima {

class ZonalStatistics
{
public:
    struct Row
    {
        Row() = default;
        Row(std::string_view reg, std::vector<double> vals)
        : region(reg)
        , values(std::move(vals))
        {
        }

        std::string region;
        std::vector<double> values; // one value per column
    };

    ZonalStatistics() = default;
    ZonalStatistics(std::vector<std::string> columns, std::vector<Row> rows);

    std::span<const std::string> columns() const noexcept;
    std::span<const Row> rows() const noexcept;
    size_t row_count() const noexcept;

    std::optional<size_t> column_index(std::string_view column) const noexcept;
    size_t required_column_index(std::string_view column) const;

    const Row* find_row(std::string_view region) const noexcept;
    const Row& row(std::string_view region) const;

    double value(std::string_view region, std::string_view column) const;
    double land_use_count(std::string_view region, LandUseType type) const;
    double population(std::string_view region) const;

private:
    std::vector<std::string> _columns;
    std::vector<Row> _rows;
    std::unordered_map<std::string, size_t> _rowIndex;
};

class ZonalRaster
{
public:
    enum class Kind
    {
        Categorical, // count the pixels per category
        Continuous,  // sum the pixel values
    };

    static ZonalRaster categorical(const gdx::DenseRaster<double>& raster, std::vector<LandUseType> categories);
    static ZonalRaster continuous(std::string_view name, const gdx::DenseRaster<double>& raster);

    Kind kind() const noexcept;
    const gdx::DenseRaster<double>& raster() const noexcept;
    std::span<const LandUseType> categories() const noexcept;
    std::vector<std::string> column_names() const;

private:
    ZonalRaster(Kind kind, std::string_view name, const gdx::DenseRaster<double>& raster, std::vector<LandUseType> categories);

    Kind _kind;
    std::string _name;
    const gdx::DenseRaster<double>* _raster;
    std::vector<LandUseType> _categories;
};

using ZonalStatisticsProgress = inf::ProgressTracker<std::string>;

// Throws when the rasters do not share the same grid
void throw_on_grid_mismatch(std::span<const ZonalRaster> rasters);

// The raster window that contains the geometry envelope, clipped to the grid extent
inf::GeoMetadata create_geometry_intersection_extent(const geos::geom::Geometry& geom, const inf::GeoMetadata& gridExtent);

// Cells of the grid whose centre lies inside the geometry
// A centre on the boundary is included when the geometry continues to the lower right of it,
// so adjacent geometries never both claim or both miss a cell
std::vector<inf::Cell> cells_with_centre_in_geometry(const geos::geom::Geometry& geom, const inf::GeoMetadata& gridExtent);

// One row per region with the category counts and value sums of the rasters, sorted on region id
ZonalStatistics compute_zonal_statistics(std::span<const Region> regions, std::span<const ZonalRaster> rasters, const ZonalStatisticsProgress::Callback& progressCb);

}
