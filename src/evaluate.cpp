/** \file evaluate.cpp
 *  \brief Boolean evaluation of expression nodes.
 *
 * Absent fields, kind mismatches and failed numeric coercions all resolve to false so a
 * predicate can be applied uniformly to heterogeneous records. Only compare_expr, through
 * its terms, can produce an error.
 */

#include "sift/expression.hpp"

#include <algorithm>
#include <cctype>

namespace sift {

namespace {

auto lower_ascii(std::string s) -> std::string {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

template <typename T>
auto ordered(ordering op, const T& lhs, const T& rhs) -> bool {
  switch (op) {
    case ordering::gt: return lhs > rhs;
    case ordering::gte: return lhs >= rhs;
    case ordering::lt: return lhs < rhs;
    case ordering::lte: return lhs <= rhs;
  }
  return false;
}

auto is_match(const Value& field, const Value& operand, const context* ctx) -> bool {
  if (deref(operand).is_null() && is_nil_like(field)) return true;
  if (field == operand) return true;
  if (ctx && ctx->options.string_form_equality) return to_text(field) == to_text(operand);
  return false;
}

auto contains_match(const Value& field, const Value& operand) -> bool {
  const Value& f = deref(field);
  if (const auto* l = f.get_if<Value::list_t>()) {
    // element kind must match the operand kind exactly; no int/uint or reference unification
    return std::any_of(l->begin(), l->end(),
                       [&](const Value& e) { return e.kind() == operand.kind() && e == operand; });
  }
  if (const auto* s = f.get_if<std::string>()) {
    return s->find(to_text(operand)) != std::string::npos;
  }
  return false;
}

auto icontains_match(const Value& field, const Value& operand) -> bool {
  const auto* s = deref(field).get_if<std::string>();
  if (!s) return false;
  return lower_ascii(*s).find(lower_ascii(to_text(operand))) != std::string::npos;
}

// An integral-looking literal compares as an integer, anything else as a float.
auto literal_is_integral(const number_literal& n) -> bool {
  return n.text.find_first_of(".eEnNiI") == std::string::npos;
}

template <ordering Op>
auto ordered_match(const ordered_comparison<Op>& e, const Value& field) -> bool {
  const Value& f = deref(field);
  switch (f.kind()) {
    case value_kind::integer: {
      auto n = coerce_int(e.value());
      return n && ordered(Op, *f.get_if<std::int64_t>(), *n);
    }
    case value_kind::unsigned_integer: {
      auto n = coerce_uint(e.value());
      return n && ordered(Op, *f.get_if<std::uint64_t>(), *n);
    }
    case value_kind::floating: {
      auto n = coerce_float(e.value());
      return n && ordered(Op, *f.get_if<double>(), *n);
    }
    case value_kind::number_literal: {
      if (literal_is_integral(*f.get_if<number_literal>())) {
        auto lhs = coerce_int(f);
        auto rhs = coerce_int(e.value());
        if (lhs) return rhs && ordered(Op, *lhs, *rhs);
      }
      auto lhs = coerce_float(f);
      auto rhs = coerce_float(e.value());
      return lhs && rhs && ordered(Op, *lhs, *rhs);
    }
    case value_kind::string:
      return ordered(Op, std::string_view(*f.get_if<std::string>()),
                     std::string_view(e.operand_text()));
    default:
      return false;
  }
}

auto compare_terms(const compare_expr& e, const record_view& input, const context* ctx)
    -> std::expected<bool, core::error> {
  auto lhs = evaluate(e.lhs, input, ctx);
  if (!lhs) return std::unexpected(lhs.error());
  auto rhs = evaluate(e.rhs, input, ctx);
  if (!rhs) return std::unexpected(rhs.error());
  switch (e.op) {
    case compare_op::eq: return compare(*lhs, *rhs) == 0;
    case compare_op::neq: return compare(*lhs, *rhs) != 0;
    case compare_op::gt: return compare(*lhs, *rhs) > 0;
    case compare_op::gte: return compare(*lhs, *rhs) >= 0;
    case compare_op::lt: return compare(*lhs, *rhs) < 0;
    case compare_op::lte: return compare(*lhs, *rhs) <= 0;
    case compare_op::contains:
      return to_text(*lhs).find(to_text(*rhs)) != std::string::npos;
    case compare_op::icontains:
      return lower_ascii(to_text(*lhs)).find(lower_ascii(to_text(*rhs))) != std::string::npos;
  }
  return false;
}

} // namespace

auto evaluate(const expression& e, const record_view& input, const context* ctx)
    -> std::expected<bool, core::error> {
  return std::visit([&](const auto& node) -> std::expected<bool, core::error> {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, and_expr>) {
      for (const auto& c : node.children) {
        auto m = c.evaluate(input, ctx);
        if (!m || !*m) return m;
      }
      return true; // and([]) == true
    } else if constexpr (std::is_same_v<T, or_expr>) {
      for (const auto& c : node.children) {
        auto m = c.evaluate(input, ctx);
        if (!m || *m) return m;
      }
      return false; // or([]) == false
    } else if constexpr (std::is_same_v<T, not_expr>) {
      auto m = node.child.evaluate(input, ctx);
      if (!m) return m;
      return !*m;
    } else if constexpr (std::is_same_v<T, compare_expr>) {
      return compare_terms(node, input, ctx);
    } else if constexpr (std::is_same_v<T, is_expr>) {
      auto f = input.resolve(node.field);
      return f && is_match(*f, node.value, ctx);
    } else if constexpr (std::is_same_v<T, is_not_expr>) {
      auto f = input.resolve(node.field);
      return f && !is_match(*f, node.value, ctx);
    } else if constexpr (std::is_same_v<T, contains_expr>) {
      auto f = input.resolve(node.field);
      return f && contains_match(*f, node.value);
    } else if constexpr (std::is_same_v<T, icontains_expr>) {
      auto f = input.resolve(node.field);
      return f && icontains_match(*f, node.value);
    } else {
      auto f = input.resolve(node.field());
      return f && ordered_match(node, *f);
    }
  }, e.node);
}

} // namespace sift
