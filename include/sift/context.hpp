#pragma once

/** \file context.hpp
 *  \brief Caller-owned evaluation context: named functions, variables and options.
 *
 * A context is passed per call (as a nullable pointer) and is never stored by the
 * library. Its maps must not be mutated while evaluations that share it are running.
 */

#include <expected>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "sift/core/config.hpp"
#include "sift/error.hpp"
#include "sift/value.hpp"

namespace sift {

/** \brief Callable invoked by function_call terms. Errors propagate to the caller. */
using function = std::function<std::expected<Value, core::error>(const std::vector<Value>&)>;

/** \brief Evaluation switches. */
struct eval_options {
  /** is/is not also match when both sides have the same textual form ("5" vs 5) */
  bool string_form_equality{false};

  static auto from_env() -> eval_options {
    eval_options o;
    o.string_form_equality = core::env_flag(core::kStringEqualityEnv);
    return o;
  }
};

struct context {
  std::unordered_map<std::string, function> functions;
  std::unordered_map<std::string, Value> variables;
  eval_options options{};
};

} // namespace sift
