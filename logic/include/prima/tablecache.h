#pragma once

#include "infra/filesystem.h"
#include "infra/log.h"

#include <type_traits>

namespace prima {

// Stage results are cached on disk, the presence of the file is the only validity check
// read:    (const fs::path&) -> Table
// write:   (const Table&, const fs::path&) -> void
// compute: () -> Table
template <typename ComputeFn, typename ReadFn, typename WriteFn>
auto get_or_compute(const fs::path& path, ComputeFn&& compute, ReadFn&& read, WriteFn&& write) -> std::invoke_result_t<ComputeFn>
{
    if (fs::is_regular_file(path)) {
        inf::Log::info("Using cached result: {}", path);
        return read(path);
    }

    auto table = compute();
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }

    write(table, path);
    inf::Log::info("Result stored in: {}", path);
    return table;
}

}
