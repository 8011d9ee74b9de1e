#pragma once

#include "prima/region.h"

#include "infra/filesystem.h"
#include "infra/progressinfo.h"
#include "infra/span.h"

#include <gdx/denseraster.h>
#include <string>
#include <vector>

namespace prima {

// A subregion as node of the energy system model
struct Site
{
    std::string name;  // suffixed with '_offshore' when the region covers more sea than land
    int64_t index = 0; // index of the first feature of the region in the vector
    double area   = 0.0; // m2
    double longitude = 0.0;
    double latitude  = 0.0;
    bool slackNode   = false;
};

using SitesProgress = inf::ProgressTracker<std::string>;

// One site per region, in the feature order of the vector the regions were read from
// The first site is the slack node
// The land and eez masks are summed per region to decide between the onshore and offshore name
// The area is calculated in an equal area projection, the centroid is in WGS84 coordinates
std::vector<Site> create_sites(std::span<const Region> regions,
                               const fs::path& vectorPath,
                               const std::string& idField,
                               const gdx::DenseRaster<double>& landMask,
                               const gdx::DenseRaster<double>& eezMask,
                               const SitesProgress::Callback& progressCb);

}
