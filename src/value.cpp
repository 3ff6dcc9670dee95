/** \file value.cpp
 *  \brief Value equality, textual forms, numeric coercion and truthiness.
 */

#include "sift/value.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace sift {

namespace {

const Value kNull{};

template <typename T>
auto parse_whole(std::string_view s) -> std::optional<T> {
  if (s.empty()) return std::nullopt;
  const char* first = s.data();
  const char* last = s.data() + s.size();
  // from_chars rejects a leading '+', strconv does not
  if (*first == '+' && s.size() > 1 && *(first + 1) != '-') ++first;
  T out{};
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) return std::nullopt;
  return out;
}

// A numeric reading of text: exact integer when the text is an integer, else float.
struct numeric_text {
  std::optional<std::int64_t> i;
  std::optional<std::uint64_t> u;
  std::optional<double> f;
};

auto read_numeric_text(std::string_view s) -> numeric_text {
  numeric_text n;
  n.i = parse_whole<std::int64_t>(s);
  if (!n.i) n.u = parse_whole<std::uint64_t>(s);
  if (!n.i && !n.u) n.f = parse_whole<double>(s);
  return n;
}

auto float_to_int(double d) -> std::optional<std::int64_t> {
  if (!std::isfinite(d)) return std::nullopt;
  const double t = std::trunc(d);
  if (t < -9223372036854775808.0 || t >= 9223372036854775808.0) return std::nullopt;
  return static_cast<std::int64_t>(t);
}

auto float_to_uint(double d) -> std::optional<std::uint64_t> {
  if (!std::isfinite(d)) return std::nullopt;
  const double t = std::trunc(d);
  if (t < 0.0 || t >= 18446744073709551616.0) return std::nullopt;
  return static_cast<std::uint64_t>(t);
}

auto join_list(const Value::list_t& l) -> std::string {
  std::string out = "[";
  for (std::size_t i = 0; i < l.size(); ++i) {
    if (i) out += ' ';
    out += to_text(l[i]);
  }
  out += ']';
  return out;
}

auto join_map(const Value::map_t& m) -> std::string {
  std::string out = "map[";
  bool first = true;
  for (const auto& [k, v] : m) {
    if (!first) out += ' ';
    first = false;
    out += k;
    out += ':';
    out += to_text(v);
  }
  out += ']';
  return out;
}

} // namespace

auto deref(const Value& v) -> const Value& {
  const Value* cur = &v;
  while (const auto* r = cur->get_if<Value::ref_t>()) {
    if (!*r) return kNull;
    cur = r->get();
  }
  return *cur;
}

auto is_nil_like(const Value& v) -> bool {
  const Value& d = deref(v);
  if (d.is_null()) return true;
  if (const auto* l = d.get_if<Value::list_t>()) return l->empty();
  if (const auto* m = d.get_if<Value::map_t>()) return m->empty();
  return false;
}

auto is_numeric(const Value& v) -> bool {
  switch (deref(v).kind()) {
    case value_kind::integer:
    case value_kind::unsigned_integer:
    case value_kind::floating:
      return true;
    default:
      return false;
  }
}

bool operator==(const Value& a, const Value& b) {
  const Value& x = deref(a);
  const Value& y = deref(b);
  // integers compare by mathematical value regardless of signedness
  if (const auto* xi = x.get_if<std::int64_t>()) {
    if (const auto* yu = y.get_if<std::uint64_t>()) return *xi >= 0 && static_cast<std::uint64_t>(*xi) == *yu;
  }
  if (const auto* xu = x.get_if<std::uint64_t>()) {
    if (const auto* yi = y.get_if<std::int64_t>()) return *yi >= 0 && static_cast<std::uint64_t>(*yi) == *xu;
  }
  if (x.kind() != y.kind()) return false;
  return std::visit([&](const auto& lhs) -> bool {
    using T = std::decay_t<decltype(lhs)>;
    if constexpr (std::is_same_v<T, Value::ref_t>) {
      return true; // both empty references after deref
    } else {
      return lhs == *y.get_if<T>();
    }
  }, x.data());
}

auto format_double(double d) -> std::string {
  char buf[64];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
  if (ec != std::errc{}) return std::to_string(d);
  return std::string(buf, ptr);
}

auto to_text(const Value& v) -> std::string {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, null_t>) {
      return "<nil>";
    } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
      return std::to_string(x);
    } else if constexpr (std::is_same_v<T, double>) {
      return format_double(x);
    } else if constexpr (std::is_same_v<T, std::string>) {
      return x;
    } else if constexpr (std::is_same_v<T, bool>) {
      return x ? "true" : "false";
    } else if constexpr (std::is_same_v<T, Value::list_t>) {
      return join_list(x);
    } else if constexpr (std::is_same_v<T, Value::map_t>) {
      return join_map(x);
    } else if constexpr (std::is_same_v<T, number_literal>) {
      return x.text;
    } else {
      return x ? to_text(*x) : std::string("<nil>");
    }
  }, v.data());
}

auto coerce_int(const Value& v) -> std::optional<std::int64_t> {
  const Value& d = deref(v);
  if (const auto* i = d.get_if<std::int64_t>()) return *i;
  if (const auto* u = d.get_if<std::uint64_t>()) {
    if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
    return static_cast<std::int64_t>(*u);
  }
  if (const auto* f = d.get_if<double>()) return float_to_int(*f);
  std::string_view text;
  if (const auto* s = d.get_if<std::string>()) text = *s;
  else if (const auto* n = d.get_if<number_literal>()) text = n->text;
  else return std::nullopt;
  auto n = read_numeric_text(text);
  if (n.i) return n.i;
  if (n.u) return std::nullopt;
  if (n.f) return float_to_int(*n.f);
  return std::nullopt;
}

auto coerce_uint(const Value& v) -> std::optional<std::uint64_t> {
  const Value& d = deref(v);
  if (const auto* u = d.get_if<std::uint64_t>()) return *u;
  if (const auto* i = d.get_if<std::int64_t>()) {
    if (*i < 0) return std::nullopt;
    return static_cast<std::uint64_t>(*i);
  }
  if (const auto* f = d.get_if<double>()) return float_to_uint(*f);
  std::string_view text;
  if (const auto* s = d.get_if<std::string>()) text = *s;
  else if (const auto* n = d.get_if<number_literal>()) text = n->text;
  else return std::nullopt;
  auto n = read_numeric_text(text);
  if (n.i) return *n.i < 0 ? std::nullopt : std::optional<std::uint64_t>(static_cast<std::uint64_t>(*n.i));
  if (n.u) return n.u;
  if (n.f) return float_to_uint(*n.f);
  return std::nullopt;
}

auto coerce_float(const Value& v) -> std::optional<double> {
  const Value& d = deref(v);
  if (const auto* f = d.get_if<double>()) return *f;
  if (const auto* i = d.get_if<std::int64_t>()) return static_cast<double>(*i);
  if (const auto* u = d.get_if<std::uint64_t>()) return static_cast<double>(*u);
  std::string_view text;
  if (const auto* s = d.get_if<std::string>()) text = *s;
  else if (const auto* n = d.get_if<number_literal>()) text = n->text;
  else return std::nullopt;
  return parse_whole<double>(text);
}

auto parse_bool(std::string_view s) -> std::optional<bool> {
  if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") return true;
  if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") return false;
  return std::nullopt;
}

auto truthy(const Value& v) -> std::expected<bool, core::error> {
  const Value& d = deref(v);
  switch (d.kind()) {
    case value_kind::null:
    case value_kind::reference: // only an empty reference survives deref
      return false;
    case value_kind::boolean:
      return *d.get_if<bool>();
    case value_kind::integer:
      return *d.get_if<std::int64_t>() != 0;
    case value_kind::unsigned_integer:
      return *d.get_if<std::uint64_t>() != 0;
    case value_kind::floating:
      return *d.get_if<double>() != 0.0;
    case value_kind::string: {
      const auto& s = *d.get_if<std::string>();
      if (auto b = parse_bool(s)) return *b;
      return core::fail(core::error_code::evaluation_error,
                        "cannot interpret \"" + s + "\" as a boolean", "value.truthy");
    }
    case value_kind::number_literal: {
      const auto& n = *d.get_if<number_literal>();
      if (auto f = parse_whole<double>(n.text)) return *f != 0.0;
      return core::fail(core::error_code::evaluation_error,
                        "invalid number literal \"" + n.text + "\"", "value.truthy");
    }
    case value_kind::list:
      return !d.get_if<Value::list_t>()->empty();
    case value_kind::map:
      return !d.get_if<Value::map_t>()->empty();
  }
  return true;
}

auto compare(const Value& a, const Value& b) -> int {
  if (auto x = coerce_float(a)) {
    if (auto y = coerce_float(b)) {
      if (*x < *y) return -1;
      if (*x > *y) return 1;
      return 0;
    }
  }
  const int c = to_text(a).compare(to_text(b));
  return (c > 0) - (c < 0);
}

} // namespace sift
