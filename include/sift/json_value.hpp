#pragma once

/** \file json_value.hpp
 *  \brief Mapping between Value and JSON documents.
 *
 * Used by the wire codec for literal operands and by tools that adapt decoded JSON
 * objects into records. Object key order is preserved on output (ordered_json).
 */

#include <nlohmann/json.hpp>

#include "sift/value.hpp"

namespace sift {

using json = nlohmann::ordered_json;

/** \brief JSON -> Value. Unsigned numbers that fit an int64 become Integer. */
auto from_json_value(const json& j) -> Value;

/** \brief Value -> JSON. Number literals are written as numbers when they parse,
 *  references as their pointee (an empty reference is null). */
auto to_json_value(const Value& v) -> json;

} // namespace sift
