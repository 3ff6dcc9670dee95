#pragma once

/** \file config.hpp
 *  \brief Environment-driven configuration knobs.
 *
 * Recognized variables:
 * - SIFT_DEBUG: enables `[SIFT][...]` diagnostics on stderr.
 * - SIFT_STRING_EQUALITY: default for eval_options::string_form_equality when
 *   options are built with eval_options::from_env().
 */

#include <cstdlib>
#include <optional>
#include <string>

namespace sift::core {

inline constexpr const char* kDebugEnv = "SIFT_DEBUG";
inline constexpr const char* kStringEqualityEnv = "SIFT_STRING_EQUALITY";

// Returns std::nullopt if the variable is not set; an engaged empty string if
// it is set to "". Windows goes through _dupenv_s so the CRT buffer is freed.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
        std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// Set, non-empty and not starting with '0'.
inline bool env_flag(const char* name) noexcept {
    auto v = safe_getenv(name);
    return v && !v->empty() && (*v)[0] != '0';
}

} // namespace sift::core
