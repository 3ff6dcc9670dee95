/** \file record.cpp
 *  \brief Capability dispatch for field resolution.
 */

#include "sift/record.hpp"

namespace sift {

record_view::record_view(const Value& v) : origin_(&v) {
  const Value* target = &v;
  // one transparent dereference; an empty reference is a null record
  if (const auto* r = v.get_if<Value::ref_t>()) {
    if (!*r) return;
    target = r->get();
  }
  if (const auto* m = target->get_if<Value::map_t>()) src_ = m;
}

auto record_view::resolve(std::string_view name) const -> std::optional<Value> {
  return std::visit([&](const auto& src) -> std::optional<Value> {
    using T = std::decay_t<decltype(src)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return std::nullopt;
    } else if constexpr (std::is_same_v<T, const dynamic_getter*>) {
      auto r = src->get(name);
      if (!r) return std::nullopt;
      return std::move(*r);
    } else if constexpr (std::is_same_v<T, const record_like*>) {
      return src->field(name);
    } else {
      auto it = src->find(name);
      if (it == src->end()) return std::nullopt;
      return it->second;
    }
  }, src_);
}

auto record_view::snapshot() const -> std::optional<Value> {
  if (origin_) return *origin_;
  return std::visit([](const auto& src) -> std::optional<Value> {
    using T = std::decay_t<decltype(src)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return Value{};
    } else if constexpr (std::is_same_v<T, const dynamic_getter*>) {
      return std::nullopt;
    } else if constexpr (std::is_same_v<T, const record_like*>) {
      return src->snapshot();
    } else {
      return Value(*src);
    }
  }, src_);
}

} // namespace sift
