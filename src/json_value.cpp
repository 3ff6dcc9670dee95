/** \file json_value.cpp
 *  \brief Value <-> JSON mapping.
 */

#include "sift/json_value.hpp"

#include <limits>

namespace sift {

auto from_json_value(const json& j) -> Value {
  switch (j.type()) {
    case json::value_t::null:
    case json::value_t::discarded:
      return Value{};
    case json::value_t::boolean:
      return Value(j.get<bool>());
    case json::value_t::number_integer:
      return Value(j.get<std::int64_t>());
    case json::value_t::number_unsigned: {
      const auto u = j.get<std::uint64_t>();
      if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Value(static_cast<std::int64_t>(u));
      }
      return Value(u);
    }
    case json::value_t::number_float:
      return Value(j.get<double>());
    case json::value_t::string:
      return Value(j.get<std::string>());
    case json::value_t::array: {
      Value::list_t out;
      out.reserve(j.size());
      for (const auto& e : j) out.push_back(from_json_value(e));
      return Value(std::move(out));
    }
    case json::value_t::object: {
      Value::map_t out;
      for (const auto& [k, e] : j.items()) out.emplace(k, from_json_value(e));
      return Value(std::move(out));
    }
    case json::value_t::binary:
      break;
  }
  return Value{};
}

auto to_json_value(const Value& v) -> json {
  return std::visit([](const auto& x) -> json {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, null_t>) {
      return nullptr;
    } else if constexpr (std::is_same_v<T, Value::list_t>) {
      json arr = json::array();
      for (const auto& e : x) arr.push_back(to_json_value(e));
      return arr;
    } else if constexpr (std::is_same_v<T, Value::map_t>) {
      json obj = json::object();
      for (const auto& [k, e] : x) obj[k] = to_json_value(e);
      return obj;
    } else if constexpr (std::is_same_v<T, number_literal>) {
      const Value lit(x);
      if (x.text.find_first_of(".eE") == std::string::npos) {
        if (auto i = coerce_int(lit)) return *i;
        if (auto u = coerce_uint(lit)) return *u;
      }
      if (auto f = coerce_float(lit)) return *f;
      return x.text;
    } else if constexpr (std::is_same_v<T, Value::ref_t>) {
      if (!x) return nullptr;
      return to_json_value(*x);
    } else {
      return x;
    }
  }, v.data());
}

} // namespace sift
