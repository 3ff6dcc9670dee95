#pragma once

/** \file term.hpp
 *  \brief Value-producing terms for the function sublanguage.
 *
 * Unlike boolean expressions, term evaluation surfaces failures: an unresolved
 * field, an unknown function or variable, or a function's own error abort the
 * evaluation with core::error_code::evaluation_error.
 *
 * Ownership: sub-terms are shared immutable nodes; a term tree is safe to evaluate
 * from several threads at once.
 */

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sift/context.hpp"
#include "sift/error.hpp"
#include "sift/record.hpp"
#include "sift/value.hpp"

namespace sift {

struct term;
using term_ptr = std::shared_ptr<const term>;

/** \brief Field lookup; unresolved fields are an error. */
struct field_term {
  std::string name;
  bool operator==(const field_term&) const = default;
};

struct constant_term {
  Value value;
  bool operator==(const constant_term&) const = default;
};

/** \brief The whole input record. */
struct self_term {
  bool operator==(const self_term&) const = default;
};

/** \brief Context variable lookup; missing variables are an error. */
struct variable_term {
  std::string name;
  bool operator==(const variable_term&) const = default;
};

/** \brief Call of a named (context) or directly bound function. */
struct function_call {
  std::string name;          /**< looked up in context::functions first */
  function bound;            /**< fallback when the name is empty or not registered */
  std::vector<term> args;
  /** bound targets are not comparable; only their presence is */
  bool operator==(const function_call& o) const;
};

/** \brief condition ? then : else, using truthiness; a missing else yields Null. */
struct conditional {
  term_ptr condition;
  term_ptr then_term;
  term_ptr else_term;
  bool operator==(const conditional& o) const;
};

/** \brief Applies truthiness to the inner term and yields a Boolean. */
struct bool_coercion {
  term_ptr inner;
  bool operator==(const bool_coercion& o) const;
};

struct term {
  std::variant<field_term, constant_term, self_term, variable_term,
               function_call, conditional, bool_coercion> node;
  bool operator==(const term&) const = default;
};

/** \brief Evaluates a term against an input; ctx may be null. */
auto evaluate(const term& t, const record_view& input, const context* ctx = nullptr)
    -> std::expected<Value, core::error>;

// Construction helpers.
inline auto field(std::string name) -> term { return term{field_term{std::move(name)}}; }
inline auto constant(Value v) -> term { return term{constant_term{std::move(v)}}; }
inline auto self() -> term { return term{self_term{}}; }
inline auto variable(std::string name) -> term { return term{variable_term{std::move(name)}}; }
inline auto call(std::string name, std::vector<term> args) -> term {
  return term{function_call{std::move(name), {}, std::move(args)}};
}
inline auto call(function fn, std::vector<term> args) -> term {
  return term{function_call{{}, std::move(fn), std::move(args)}};
}
inline auto if_then_else(term cond, term then_t, std::optional<term> else_t = std::nullopt) -> term {
  return term{conditional{
      std::make_shared<const term>(std::move(cond)),
      std::make_shared<const term>(std::move(then_t)),
      else_t ? std::make_shared<const term>(std::move(*else_t)) : term_ptr{}}};
}
inline auto as_bool(term inner) -> term {
  return term{bool_coercion{std::make_shared<const term>(std::move(inner))}};
}

} // namespace sift
