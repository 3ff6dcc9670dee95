#pragma once

/** \file log.hpp
 *  \brief Env-gated diagnostics on stderr.
 *
 * Lines are tagged as `[SIFT][component] message`. Output is enabled by
 * setting SIFT_DEBUG to a value not starting with '0'; the flag is read once.
 */

#include <iostream>
#include <string_view>

#include "sift/core/config.hpp"

namespace sift::core {

inline bool debug_enabled() {
    static const bool enabled = env_flag(kDebugEnv);
    return enabled;
}

template <typename... Args>
void debug_log(std::string_view component, const Args&... args) {
    if (!debug_enabled()) return;
    std::cerr << "[SIFT][" << component << "] ";
    (std::cerr << ... << args);
    std::cerr << std::endl;
}

} // namespace sift::core
