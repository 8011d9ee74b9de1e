#include "prima/modelrun.h"

#include "prima/constants.h"
#include "prima/countryloaddisaggregation.h"
#include "prima/inputparsers.h"
#include "prima/region.h"
#include "prima/runconfigurationparser.h"
#include "prima/sectorlanduse.h"
#include "prima/sites.h"
#include "prima/tablecache.h"
#include "prima/zonalstatistics.h"
#include "outputreaders.h"
#include "outputwriters.h"

#include "infra/algo.h"
#include "infra/chrono.h"
#include "infra/exception.h"
#include "infra/string.h"

#include "gdx/denserasterio.h"

#include <fmt/format.h>
#include <oneapi/tbb/global_control.h>
#include <oneapi/tbb/info.h>

namespace prima {

using namespace inf;
using namespace std::string_view_literals;

int run_model(const fs::path& runConfigPath, inf::Log::Level logLevel, std::optional<int32_t> concurrency, const ModelProgress::Callback& progressCb)
{
    auto runConfig = parse_run_configuration_file(runConfigPath);
    runConfig.set_max_concurrency(concurrency);
    fs::create_directories(runConfig.output_path());

    std::unique_ptr<inf::LogRegistration> logReg;
    inf::Log::add_file_sink(runConfig.paths().log_path());

    logReg = std::make_unique<inf::LogRegistration>("prima");
    inf::Log::set_level(logLevel);

    return run_model(runConfig, progressCb);
}

// The land use and population rasters, only read when zonal statistics need to be calculated
class InputRasters
{
public:
    explicit InputRasters(const RunConfiguration& cfg)
    : _cfg(cfg)
    {
    }

    std::span<const ZonalRaster> zonal_rasters(std::span<const LandUseType> landUseTypes)
    {
        if (_zonalRasters.empty()) {
            chrono::ScopedDurationLog d("Read input rasters");
            _landuse    = gdx::read_dense_raster<double>(_cfg.input().landuse);
            _population = gdx::read_dense_raster<double>(_cfg.input().population);

            _zonalRasters.push_back(ZonalRaster::categorical(_landuse, container_as_vector(landUseTypes)));
            _zonalRasters.push_back(ZonalRaster::continuous(constants::PopulationColumn, _population));
            throw_on_grid_mismatch(_zonalRasters);
        }

        return _zonalRasters;
    }

    const GeoMetadata& metadata(std::span<const LandUseType> landUseTypes)
    {
        return zonal_rasters(landUseTypes).front().raster().metadata();
    }

private:
    const RunConfiguration& _cfg;
    gdx::DenseRaster<double> _landuse;
    gdx::DenseRaster<double> _population;
    std::vector<ZonalRaster> _zonalRasters;
};

static toml::table create_parameters(const RunConfiguration& cfg)
{
    toml::array sectors;
    for (auto& sector : cfg.sectors()) {
        sectors.push_back(std::string(sector.name()));
    }

    toml::table params;
    params.insert("region_name", std::string(cfg.region_name()));
    params.insert("subregions_name", std::string(cfg.subregions_name()));
    params.insert("year", static_cast<int64_t>(static_cast<int>(cfg.year())));
    params.insert("sectors", std::move(sectors));
    params.insert("default_sector_shares", std::string(cfg.default_sector_shares()));
    return params;
}

// Reports the progress of a stage as progress of the model run
static ProgressTracker<std::string>::Callback forward_progress(ModelProgress& progress, std::string_view stage)
{
    return [&progress, stage](const ProgressTracker<std::string>::Status& status) {
        progress.set_payload(ModelProgressInfo(fmt::format("{}: {}", stage, status.payload())));
        progress.tick();
        return ProgressStatusResult::Continue;
    };
}

SubregionLoadResult disaggregate_load(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb)
{
    const auto& input = cfg.input();
    const auto& paths = cfg.paths();

    const auto weights      = create_sector_landuse_weights(parse_landuse_assumptions(input.landuseAssumptions), cfg.sectors());
    const auto landUseTypes = weights.land_use_types();

    InputRasters rasters(cfg);
    std::optional<std::vector<Region>> countries;
    auto get_countries = [&]() -> const std::vector<Region>& {
        if (!countries.has_value()) {
            chrono::ScopedDurationLog d("Read countries");
            countries = read_regions(input.countries, input.countriesField, RegionCountry::FromId, rasters.metadata(landUseTypes));
        }

        return *countries;
    };

    ModelProgress progress(0, progressCb);

    const auto countryStats = get_or_compute(
        paths.country_statistics_path(),
        [&]() {
            chrono::ScopedDurationLog d("Country zonal statistics");
            const auto& regions = get_countries();
            progress.reset(regions.size());
            return compute_zonal_statistics(regions, rasters.zonal_rasters(landUseTypes), forward_progress(progress, "Country statistics"sv));
        },
        read_zonal_statistics,
        [&](const ZonalStatistics& stats, const fs::path& path) {
            write_zonal_statistics(stats, "Country", path);
            write_metadata(path, {"Zonal statistics per country", create_parameters(cfg), {input.landuse, input.population, input.countries, input.landuseAssumptions}});
        });

    const auto sectorLoad = get_or_compute(
        paths.sector_load_path(),
        [&]() {
            const auto countryLoad = parse_country_load(input.loadTimeseries);
            const auto shares      = parse_sector_shares(input.sectorShares, cfg.default_sector_shares());
            const auto profiles    = parse_sectoral_profiles(input.sectoralProfiles);

            const auto sectors = weights.disaggregation_sectors();
            progress.reset(countryLoad.entries().size());
            return disaggregate_country_load(countryLoad, shares, profiles, sectors, forward_progress(progress, "Sector load"sv));
        },
        read_sector_load,
        [&](const HourlyLoadTable& load, const fs::path& path) {
            write_sector_load(load, path);
            write_metadata(path, {"Hourly load per country and sector in MW", create_parameters(cfg), {input.loadTimeseries, input.sectorShares, input.sectoralProfiles, input.landuseAssumptions}});
        });

    if (const auto yearlyPath = paths.yearly_sector_load_path(); !fs::is_regular_file(yearlyPath)) {
        write_yearly_sector_load(yearly_sector_load(sectorLoad), yearlyPath);
        write_metadata(yearlyPath, {"Yearly load per country and sector in MWh", create_parameters(cfg), {paths.sector_load_path()}});
    }

    const auto loadPerUnit = get_or_compute(
        paths.land_use_load_path(),
        [&]() {
            progress.reset(countryStats.row_count());
            return load_per_land_use_unit(sectorLoad, weights, countryStats, forward_progress(progress, "Land use load"sv));
        },
        read_land_use_load,
        [&](const HourlyLoadTable& load, const fs::path& path) {
            write_land_use_load(load, path);
            write_metadata(path, {"Hourly load per land use pixel and per inhabitant in MW", create_parameters(cfg), {paths.sector_load_path(), paths.country_statistics_path(), input.landuseAssumptions}});
        });

    const auto countryPartStats = get_or_compute(
        paths.country_part_statistics_path(),
        [&]() {
            chrono::ScopedDurationLog d("Country part zonal statistics");
            const auto& countryRegions = get_countries();

            std::vector<Region> countryParts;
            {
                chrono::ScopedDurationLog dParts("Create country parts");
                const auto subregions = read_regions(input.subregions, input.subregionsField, RegionCountry::None, rasters.metadata(landUseTypes));
                progress.reset(subregions.size());
                countryParts = create_country_parts(subregions, countryRegions, forward_progress(progress, "Country parts"sv));
            }

            progress.reset(countryParts.size());
            return compute_zonal_statistics(countryParts, rasters.zonal_rasters(landUseTypes), forward_progress(progress, "Country part statistics"sv));
        },
        read_zonal_statistics,
        [&](const ZonalStatistics& stats, const fs::path& path) {
            write_zonal_statistics(stats, "CountryPart", path);
            write_metadata(path, {"Zonal statistics per subregion country part", create_parameters(cfg), {input.landuse, input.population, input.countries, input.subregions, input.landuseAssumptions}});
        });

    progress.reset(countryPartStats.row_count());
    auto result = aggregate_subregion_load(countryPartStats, loadPerUnit, landUseTypes, forward_progress(progress, "Subregion load"sv));

    const auto outputPath = paths.subregion_load_path();
    write_subregion_load(result, outputPath);
    write_metadata(outputPath, {"Hourly load per subregion in MW", create_parameters(cfg), {paths.land_use_load_path(), paths.country_part_statistics_path()}});
    Log::info("Subregion load stored in: {}", outputPath);

    return result;
}

void generate_sites(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb)
{
    const auto& input    = cfg.input();
    const auto sitesPath = cfg.paths().sites_path();

    if (input.landMask.empty() || input.eezMask.empty()) {
        throw RuntimeError("The land and eez masks are needed to create the sites");
    }

    if (fs::is_regular_file(sitesPath)) {
        Log::info("Sites already available: {}", sitesPath);
        return;
    }

    chrono::ScopedDurationLog d("Sites");
    const auto landMask = gdx::read_dense_raster<double>(input.landMask);
    const auto eezMask  = gdx::read_dense_raster<double>(input.eezMask);

    const auto subregions = read_regions(input.subregions, input.subregionsField, RegionCountry::None, landMask.metadata());

    ModelProgress progress(subregions.size(), progressCb);
    const auto sites = create_sites(subregions, input.subregions, input.subregionsField, landMask, eezMask, forward_progress(progress, "Sites"sv));

    write_sites(sites, sitesPath);
    write_metadata(sitesPath, {"Sites of the subregions", create_parameters(cfg), {input.landMask, input.eezMask, input.subregions}});
    Log::info("Sites stored in: {}", sitesPath);
}

int run_model(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb)
{
    try {
        tbb::global_control tbbControl(tbb::global_control::max_allowed_parallelism, cfg.max_concurrency().value_or(oneapi::tbb::info::default_concurrency()));

        chrono::ScopedDurationLog d("Model run");
        disaggregate_load(cfg, progressCb);
        if (!cfg.input().landMask.empty()) {
            generate_sites(cfg, progressCb);
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Log::error(e.what());
        fmt::print("{}\n", e.what());
        return EXIT_FAILURE;
    }
}
}
