#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <optional>
#include <string>
#include "sift/context.hpp"
#include "sift/core/config.hpp"

using sift::core::env_flag;
using sift::core::safe_getenv;

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
    _putenv_s(name, value ? value : "");
#else
    if (value) setenv(name, value, 1); else unsetenv(name);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

TEST_CASE("safe_getenv distinguishes unset from set", "[config][env]") {
    const char* key = "SIFT_TEST_SAFE_GETENV";
    unset_env_var(key);
    REQUIRE_FALSE(safe_getenv(key).has_value());
    set_env_var(key, "hello");
    REQUIRE(safe_getenv(key) == std::string("hello"));
    unset_env_var(key);
    REQUIRE_FALSE(safe_getenv(nullptr).has_value());
    REQUIRE_FALSE(safe_getenv("").has_value());
}

TEST_CASE("env flags", "[config][env]") {
    const char* key = "SIFT_TEST_FLAG";
    unset_env_var(key);
    REQUIRE_FALSE(env_flag(key));
    set_env_var(key, "1");
    REQUIRE(env_flag(key));
    set_env_var(key, "0");
    REQUIRE_FALSE(env_flag(key));
    unset_env_var(key);
}

TEST_CASE("string equality option follows the environment", "[config][env]") {
    set_env_var(sift::core::kStringEqualityEnv, "1");
    REQUIRE(sift::eval_options::from_env().string_form_equality);
    unset_env_var(sift::core::kStringEqualityEnv);
    REQUIRE_FALSE(sift::eval_options::from_env().string_form_equality);
}
