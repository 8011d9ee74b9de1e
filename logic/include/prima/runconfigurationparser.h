#pragma once

#include "infra/filesystem.h"

#include <string_view>

namespace prima {

class RunConfiguration;

RunConfiguration parse_run_configuration_file(const fs::path& config);
// Relative paths in the configuration are resolved against the base path
RunConfiguration parse_run_configuration(std::string_view configContents, const fs::path& basePath);

}
