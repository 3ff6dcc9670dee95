#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (parse, codec and term evaluation failures).
 * - Human-readable message and originating component for diagnostics.
 * - Boolean predicate evaluation never produces an error for absent fields or failed
 *   coercions; those resolve to false. Errors only come from the term sublanguage.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <utility>

namespace sift::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  parse_error = 2001,
  serialization_error = 3001,
  evaluation_error = 4001,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "text.parser" */
};

/** \brief Shorthand for building an unexpected error value. */
inline auto fail(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

/** \brief Stable name of an error code for log lines and tool output. */
constexpr auto to_string(error_code ec) -> const char* {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::parse_error: return "parse_error";
    case error_code::serialization_error: return "serialization_error";
    case error_code::evaluation_error: return "evaluation_error";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "internal";
}

} // namespace sift::core
