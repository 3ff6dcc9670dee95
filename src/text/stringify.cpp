/** \file stringify.cpp
 *  \brief Canonical text form of query trees.
 */

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

#include "sift/text/parser.hpp"

namespace sift::text {

namespace {

// Fixed notation with a mandatory '.', so the lexer reads the value back as a float.
auto float_text(double d) -> std::string {
  if (!std::isfinite(d)) return format_double(d);
  char buf[512];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::fixed);
  if (ec != std::errc{}) return format_double(d);
  std::string out(buf, ptr);
  if (out.find('.') == std::string::npos) out += ".0";
  return out;
}

auto value_text(const Value& v) -> std::string {
  const Value& x = deref(v);
  if (const auto* s = x.get_if<std::string>()) return "\"" + *s + "\"";
  if (const auto* d = x.get_if<double>()) return float_text(*d);
  return to_text(x);
}

auto op_text(compare_op op) -> const char* {
  switch (op) {
    case compare_op::eq: return "eq";
    case compare_op::neq: return "neq";
    case compare_op::gt: return "gt";
    case compare_op::gte: return "gte";
    case compare_op::lt: return "lt";
    case compare_op::lte: return "lte";
    case compare_op::contains: return "contains";
    case compare_op::icontains: return "icontains";
  }
  return "?";
}

auto term_text(const term& t) -> std::string;

auto term_ptr_text(const term_ptr& t) -> std::string { return t ? term_text(*t) : "null"; }

auto term_text(const term& t) -> std::string {
  return std::visit([](const auto& n) -> std::string {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, field_term>) {
      return n.name;
    } else if constexpr (std::is_same_v<T, constant_term>) {
      return value_text(n.value);
    } else if constexpr (std::is_same_v<T, self_term>) {
      return "self";
    } else if constexpr (std::is_same_v<T, variable_term>) {
      return "$" + n.name;
    } else if constexpr (std::is_same_v<T, function_call>) {
      std::string out = n.name.empty() ? std::string("fn") : n.name;
      out += '(';
      for (std::size_t i = 0; i < n.args.size(); ++i) {
        if (i) out += ", ";
        out += term_text(n.args[i]);
      }
      return out + ')';
    } else if constexpr (std::is_same_v<T, conditional>) {
      return "if(" + term_ptr_text(n.condition) + ", " + term_ptr_text(n.then_term) + ", " +
             term_ptr_text(n.else_term) + ")";
    } else {
      return "bool(" + term_ptr_text(n.inner) + ")";
    }
  }, t.node);
}

auto join(const std::vector<query>& children, const char* sep) -> std::string {
  std::string out = "(";
  for (std::size_t i = 0; i < children.size(); ++i) {
    if (i) out += sep;
    out += stringify(children[i]);
  }
  return out + ")";
}

} // namespace

auto stringify(const query& q) -> std::string {
  if (q.empty()) return {};
  return std::visit([](const auto& n) -> std::string {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, is_expr>) {
      return n.field + " is " + value_text(n.value);
    } else if constexpr (std::is_same_v<T, is_not_expr>) {
      return n.field + " is not " + value_text(n.value);
    } else if constexpr (std::is_same_v<T, contains_expr>) {
      return n.field + " contains " + value_text(n.value);
    } else if constexpr (std::is_same_v<T, icontains_expr>) {
      return n.field + " icontains " + value_text(n.value);
    } else if constexpr (std::is_same_v<T, greater_than>) {
      return n.field() + " > " + value_text(n.value());
    } else if constexpr (std::is_same_v<T, greater_or_equal>) {
      return n.field() + " >= " + value_text(n.value());
    } else if constexpr (std::is_same_v<T, less_than>) {
      return n.field() + " < " + value_text(n.value());
    } else if constexpr (std::is_same_v<T, less_or_equal>) {
      return n.field() + " <= " + value_text(n.value());
    } else if constexpr (std::is_same_v<T, and_expr>) {
      return join(n.children, " and ");
    } else if constexpr (std::is_same_v<T, or_expr>) {
      return join(n.children, " or ");
    } else if constexpr (std::is_same_v<T, not_expr>) {
      return "not " + stringify(n.child);
    } else {
      return std::string("compare(") + term_text(n.lhs) + ", " + op_text(n.op) + ", " +
             term_text(n.rhs) + ")";
    }
  }, q.get()->node);
}

} // namespace sift::text
