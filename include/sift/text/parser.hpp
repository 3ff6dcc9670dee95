#pragma once

/** \file parser.hpp
 *  \brief Recursive-descent parser and canonical stringifier for query text.
 *
 * Grammar:
 * ```
 * expr       := or_expr
 * or_expr    := and_expr ("or" and_expr)*
 * and_expr   := unary ("and" unary)*
 * unary      := "not" unary | primary
 * primary    := "(" expr ")" | comparison
 * comparison := IDENT operator value
 * operator   := "is not" | "is" | "contains" | ">=" | "<=" | ">" | "<"
 * value      := STRING | NUMBER | IDENT
 * ```
 * Chains fold left into two-child nodes: `a and b and c` is `((a and b) and c)`.
 * The first error aborts parsing; there is no recovery.
 *
 * Example usage:
 * ```cpp
 * auto q = sift::text::parse(R"(Name is "bob" and Age > 30)");
 * if (!q) return std::unexpected(q.error());
 * auto s = sift::text::stringify(*q); // (Name is "bob" and Age > 30)
 * ```
 */

#include <expected>
#include <string>
#include <string_view>

#include "sift/error.hpp"
#include "sift/expression.hpp"
#include "sift/value.hpp"

namespace sift::text {

/** \brief Parses query text. Lexical and grammatical failures are parse_error. */
auto parse(std::string_view input) -> std::expected<query, core::error>;

/** \brief Canonical text of a query; an empty query prints as "". */
auto stringify(const query& q) -> std::string;

/** \brief Auto-typing of bare values: true/false, then integer, then finite float, else text. */
auto literal_value(std::string_view raw) -> Value;

} // namespace sift::text
