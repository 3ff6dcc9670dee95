/** \file term.cpp
 *  \brief Term evaluation.
 */

#include "sift/term.hpp"

#include "sift/core/log.hpp"

namespace sift {

namespace {

bool same_node(const term_ptr& a, const term_ptr& b) {
  if (a == b) return true;
  if (!a || !b) return false;
  return *a == *b;
}

auto eval_function_call(const function_call& fc, const record_view& input, const context* ctx)
    -> std::expected<Value, core::error> {
  const function* fn = nullptr;
  if (!fc.name.empty() && ctx) {
    auto it = ctx->functions.find(fc.name);
    if (it != ctx->functions.end() && it->second) fn = &it->second;
  }
  if (!fn && fc.bound) fn = &fc.bound;
  if (!fn) {
    core::debug_log("term", "unresolved function \"", fc.name, "\"");
    return core::fail(core::error_code::evaluation_error,
                      "function \"" + fc.name + "\" not found", "term.function_call");
  }

  std::vector<Value> args;
  args.reserve(fc.args.size());
  for (const auto& a : fc.args) {
    auto v = evaluate(a, input, ctx);
    if (!v) return std::unexpected(v.error());
    args.push_back(std::move(*v));
  }
  return (*fn)(args);
}

} // namespace

bool function_call::operator==(const function_call& o) const {
  return name == o.name && static_cast<bool>(bound) == static_cast<bool>(o.bound) && args == o.args;
}

bool conditional::operator==(const conditional& o) const {
  return same_node(condition, o.condition) && same_node(then_term, o.then_term) &&
         same_node(else_term, o.else_term);
}

bool bool_coercion::operator==(const bool_coercion& o) const {
  return same_node(inner, o.inner);
}

auto evaluate(const term& t, const record_view& input, const context* ctx)
    -> std::expected<Value, core::error> {
  return std::visit([&](const auto& node) -> std::expected<Value, core::error> {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, field_term>) {
      if (input.is_null()) {
        return core::fail(core::error_code::evaluation_error,
                          "cannot resolve field " + node.name + " on a null input", "term.field");
      }
      auto v = input.resolve(node.name);
      if (!v) {
        return core::fail(core::error_code::evaluation_error,
                          "field " + node.name + " not found", "term.field");
      }
      return std::move(*v);
    } else if constexpr (std::is_same_v<T, constant_term>) {
      return node.value;
    } else if constexpr (std::is_same_v<T, self_term>) {
      auto v = input.snapshot();
      if (!v) {
        return core::fail(core::error_code::evaluation_error,
                          "input has no value representation", "term.self");
      }
      return std::move(*v);
    } else if constexpr (std::is_same_v<T, variable_term>) {
      if (ctx) {
        auto it = ctx->variables.find(node.name);
        if (it != ctx->variables.end()) return it->second;
      }
      return core::fail(core::error_code::evaluation_error,
                        "variable " + node.name + " not found", "term.variable");
    } else if constexpr (std::is_same_v<T, function_call>) {
      return eval_function_call(node, input, ctx);
    } else if constexpr (std::is_same_v<T, conditional>) {
      if (!node.condition || !node.then_term) {
        return core::fail(core::error_code::invalid_argument,
                          "conditional requires a condition and a then branch", "term.conditional");
      }
      auto c = evaluate(*node.condition, input, ctx);
      if (!c) return c;
      auto b = truthy(*c);
      if (!b) return std::unexpected(b.error());
      if (*b) return evaluate(*node.then_term, input, ctx);
      if (node.else_term) return evaluate(*node.else_term, input, ctx);
      return Value{};
    } else {
      if (!node.inner) {
        return core::fail(core::error_code::invalid_argument,
                          "boolean coercion without an inner term", "term.bool");
      }
      auto v = evaluate(*node.inner, input, ctx);
      if (!v) return v;
      auto b = truthy(*v);
      if (!b) return std::unexpected(b.error());
      return Value(*b);
    }
  }, t.node);
}

} // namespace sift
