#pragma once

/** \file codec.hpp
 *  \brief Tagged-union JSON wire format for queries.
 *
 * Wire shape:
 * ```
 * {"Expression":{"Type":"Is","Expression":{"Field":"Name","Value":"bob"}}}
 * {"Expression":{"Type":"And","Expression":{"Expressions":[{"Expression":{...}}, ...]}}}
 * {"Expression":{"Type":"Not","Expression":{"Expression":{"Expression":{...}}}}}
 * {"Expression":null}
 * ```
 * Discriminants are stable: Is, IsNot, Contains, IContains, And, Or, Not, GT, GTE, LT, LTE.
 * Output uses a fixed key order, so encode(decode(bytes)) == bytes for canonical input.
 * Errors are reported as core::error_code::serialization_error.
 */

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "sift/error.hpp"
#include "sift/expression.hpp"
#include "sift/json_value.hpp"

namespace sift::codec {

/** \brief Stable wire tag of an expression node; compare_expr has none. */
auto discriminant(const expression& e) -> std::optional<std::string_view>;

/** \brief Query -> JSON document. */
auto to_document(const query& q) -> std::expected<json, core::error>;

/** \brief JSON document -> query (two-pass: tag first, then the tag's payload shape). */
auto from_document(const json& j) -> std::expected<query, core::error>;

/** \brief Query -> compact JSON text. */
auto encode(const query& q) -> std::expected<std::string, core::error>;

/** \brief JSON text -> query. Malformed JSON is a serialization_error. */
auto decode(std::string_view text) -> std::expected<query, core::error>;

} // namespace sift::codec
