#pragma once

#include <string_view>

#include "errors.hpp"
#include "log.hpp"
#include "cache/cache_store.hpp"
#include "table/min_bleps.hpp"

namespace minblep {

/// minblep version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static constexpr std::string_view string() { return "0.1.0"; }
};

} // namespace minblep
