#pragma once

/** \file value.hpp
 *  \brief Dynamically typed value used for record fields, literal operands and term results.
 *
 * Ownership: a Value is a self-contained snapshot. Lists and maps own their elements;
 * references share an immutable pointee and never alias caller state.
 *
 * Host types are projected into Value once, at the boundary, through to_value().
 */

#include <concepts>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "sift/error.hpp"

namespace sift {

/** \brief Unit type for the Null alternative. */
struct null_t {
  friend constexpr bool operator==(null_t, null_t) noexcept { return true; }
};
inline constexpr null_t null{};

/** \brief Numeric literal kept in its textual form (e.g. an untyped JSON number). */
struct number_literal {
  std::string text;
  bool operator==(const number_literal&) const = default;
};

enum class value_kind : std::uint8_t {
  null,
  integer,
  unsigned_integer,
  floating,
  string,
  boolean,
  list,
  map,
  number_literal,
  reference,
};

/** \brief Tagged union over the value kinds the evaluator understands. */
class Value {
public:
  using list_t = std::vector<Value>;
  using map_t = std::map<std::string, Value, std::less<>>;
  /** nullable reference; an empty pointer is an empty reference */
  using ref_t = std::shared_ptr<const Value>;
  using storage_t = std::variant<null_t, std::int64_t, std::uint64_t, double, std::string,
                                 bool, list_t, map_t, number_literal, ref_t>;

  Value() = default;
  Value(null_t) {}
  Value(std::nullptr_t) {}
  Value(bool b) : data_(b) {}
  template <std::integral T>
    requires (!std::same_as<T, bool>)
  Value(T v) {
    if constexpr (std::is_signed_v<T>) data_ = static_cast<std::int64_t>(v);
    else data_ = static_cast<std::uint64_t>(v);
  }
  template <std::floating_point T>
  Value(T v) : data_(static_cast<double>(v)) {}
  Value(std::string s) : data_(std::move(s)) {}
  Value(std::string_view s) : data_(std::string(s)) {}
  Value(const char* s) : data_(std::string(s)) {}
  Value(list_t l) : data_(std::move(l)) {}
  Value(map_t m) : data_(std::move(m)) {}
  Value(number_literal n) : data_(std::move(n)) {}
  Value(ref_t r) : data_(std::move(r)) {}

  auto kind() const noexcept -> value_kind { return static_cast<value_kind>(data_.index()); }
  auto is_null() const noexcept -> bool { return kind() == value_kind::null; }
  auto is_string() const noexcept -> bool { return kind() == value_kind::string; }

  template <typename T>
  auto holds() const noexcept -> bool { return std::holds_alternative<T>(data_); }

  template <typename T>
  auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

  auto data() const noexcept -> const storage_t& { return data_; }

  friend bool operator==(const Value& a, const Value& b);

private:
  storage_t data_;
};

/** \brief Build a reference Value pointing at a copy of v. */
inline auto make_ref(Value v) -> Value {
  return Value(std::make_shared<const Value>(std::move(v)));
}

/** \brief An empty reference (the null pointer case). */
inline auto empty_ref() -> Value { return Value(Value::ref_t{}); }

/** \brief Follows references until a non-reference value; an empty reference yields Null. */
auto deref(const Value& v) -> const Value&;

/** \brief True for Null, an empty reference, an empty list or an empty map. */
auto is_nil_like(const Value& v) -> bool;

/** \brief True for integer, unsigned integer and floating values (after deref). */
auto is_numeric(const Value& v) -> bool;

/** \brief Default textual form: strings verbatim, numbers in decimal, `<nil>` for Null. */
auto to_text(const Value& v) -> std::string;

/** \brief Shortest round-trip decimal form of a double. */
auto format_double(double d) -> std::string;

// Numeric coercion. Accepts any numeric kind, numeric text, number literals and
// references to those. Returns std::nullopt (never an error) when the value is not
// numeric or does not fit the target.
auto coerce_int(const Value& v) -> std::optional<std::int64_t>;
auto coerce_uint(const Value& v) -> std::optional<std::uint64_t>;
auto coerce_float(const Value& v) -> std::optional<double>;

/** \brief Parses the whole of s as a boolean token (1 t T TRUE true True, and the false forms). */
auto parse_bool(std::string_view s) -> std::optional<bool>;

/** \brief Truthiness used by conditionals and boolean coercion.
 *
 * Null is false, numbers are true when non-zero, strings must be boolean tokens
 * (anything else is an evaluation_error), lists and maps are true when non-empty,
 * references follow their pointee.
 */
auto truthy(const Value& v) -> std::expected<bool, core::error>;

/** \brief Three-way ordering used by term comparisons: numeric when both sides
 *  coerce to a float, byte-wise on the textual forms otherwise. */
auto compare(const Value& a, const Value& b) -> int;

namespace detail {
template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};
template <typename T> struct is_string_map : std::false_type {};
template <typename T, typename C, typename A>
struct is_string_map<std::map<std::string, T, C, A>> : std::true_type {};
template <typename T, typename H, typename E, typename A>
struct is_string_map<std::unordered_map<std::string, T, H, E, A>> : std::true_type {};
template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};
} // namespace detail

/** \brief Projects a host value into a Value.
 *
 * Integers keep their signedness, floats widen to double, vectors become lists,
 * string-keyed maps become maps and std::optional becomes a reference (empty
 * optional -> empty reference).
 */
template <typename T>
auto to_value(const T& x) -> Value {
  using U = std::remove_cvref_t<T>;
  if constexpr (std::is_same_v<U, Value>) {
    return x;
  } else if constexpr (detail::is_optional<U>::value) {
    if (!x) return empty_ref();
    return make_ref(to_value(*x));
  } else if constexpr (detail::is_vector<U>::value) {
    Value::list_t out;
    out.reserve(x.size());
    for (const auto& e : x) out.push_back(to_value(e));
    return Value(std::move(out));
  } else if constexpr (detail::is_string_map<U>::value) {
    Value::map_t out;
    for (const auto& [k, e] : x) out.emplace(k, to_value(e));
    return Value(std::move(out));
  } else {
    return Value(x);
  }
}

} // namespace sift
