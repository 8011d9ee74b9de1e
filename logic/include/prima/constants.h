#pragma once

#include <cstdint>
#include <string_view>

namespace prima::constants {

namespace sector {

inline const std::string_view Residential = "RES";

}

// Zonal statistics column containing the population sum
inline const std::string_view PopulationColumn = "Population";

inline constexpr const char TableSeparator = ';';

// WGS 84 / NSIDC EASE-Grid 2.0 Global, cylindrical equal area projection for the site areas
inline constexpr int32_t EqualAreaEpsg = 6933;

// Zonal statistics columns of the sites masks
inline const std::string_view LandColumn = "Land";
inline const std::string_view EezColumn  = "EEZ";

}
