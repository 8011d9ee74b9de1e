#pragma once

#include "prima/runconfiguration.h"
#include "prima/sites.h"
#include "prima/subregionload.h"

#include "infra/filesystem.h"
#include "infra/log.h"
#include "infra/progressinfo.h"

namespace prima {

struct ModelProgressInfo
{
    ModelProgressInfo() = default;
    ModelProgressInfo(std::string_view i)
    : info(i)
    {
    }

    std::string to_string() const
    {
        return info;
    }

    std::string info;
};

using ModelProgress = inf::ProgressTracker<ModelProgressInfo>;

// Runs all the stages of the model, stages with a result present in the output directory are not recalculated
SubregionLoadResult disaggregate_load(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb);

// Creates the sites table of the subregions, skipped when the table is already present
// Requires the land and eez masks in the configuration
void generate_sites(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb);

int run_model(const fs::path& runConfigPath, inf::Log::Level logLevel, std::optional<int32_t> concurrency, const ModelProgress::Callback& progressCb);
int run_model(const RunConfiguration& cfg, const ModelProgress::Callback& progressCb);

}
