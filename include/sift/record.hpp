#pragma once

/** \file record.hpp
 *  \brief Capability model for evaluation inputs.
 *
 * A record is whatever the caller evaluates a query against. Instead of runtime type
 * inspection the core dispatches on a closed set of capabilities:
 * - dynamic_getter: asked first; an error from get() means "field absent".
 * - record_like: exact, case-sensitive field lookup (see schema<T> for host structs).
 * - map-like: a Value::map_t keyed by field name.
 * - null: a null reference at the dereference step; every field is absent.
 *
 * Ownership: record_view is non-owning. The viewed object must outlive the evaluation call.
 */

#include <concepts>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sift/error.hpp"
#include "sift/value.hpp"

namespace sift {

/** \brief Dynamic lookup capability; takes priority over every other capability. */
class dynamic_getter {
public:
  virtual ~dynamic_getter() = default;
  virtual auto get(std::string_view name) const -> std::expected<Value, core::error> = 0;
};

/** \brief Record-like capability: field lookup by exact name. */
class record_like {
public:
  virtual ~record_like() = default;
  /** nullopt when the record has no field with that name */
  virtual auto field(std::string_view name) const -> std::optional<Value> = 0;
  /** whole-record Value (used by self terms); nullopt when not representable */
  virtual auto snapshot() const -> std::optional<Value> { return std::nullopt; }
};

/** \brief Non-owning view over one evaluation input. */
class record_view {
public:
  record_view() = default;                    // null input
  record_view(std::nullptr_t) {}
  record_view(const dynamic_getter& g) : src_(&g) {}
  record_view(const record_like& r) : src_(&r) {}
  record_view(const Value::map_t& m) : src_(&m) {}
  /** types exposing both capabilities resolve through the getter */
  template <typename R>
    requires std::derived_from<R, dynamic_getter> && std::derived_from<R, record_like>
  record_view(const R& r) : src_(static_cast<const dynamic_getter*>(&r)) {}
  /** map -> map-like; reference -> dereferenced once; anything else -> null */
  record_view(const Value& v);

  // Nullable references: a null pointer yields a null record.
  record_view(const dynamic_getter* g) { if (g) src_ = g; }
  record_view(const record_like* r) { if (r) src_ = r; }
  record_view(const Value::map_t* m) { if (m) src_ = m; }
  record_view(const Value* v) { if (v) *this = record_view(*v); }
  template <typename R>
    requires std::derived_from<R, dynamic_getter> && std::derived_from<R, record_like>
  record_view(const R* r) { if (r) src_ = static_cast<const dynamic_getter*>(r); }

  auto is_null() const noexcept -> bool { return std::holds_alternative<std::monostate>(src_); }

  /** \brief Resolves a field; nullopt means absent (never an error). */
  auto resolve(std::string_view name) const -> std::optional<Value>;

  /** \brief The whole input as a Value, when it has one. */
  auto snapshot() const -> std::optional<Value>;

private:
  std::variant<std::monostate, const dynamic_getter*, const record_like*,
               const Value::map_t*> src_;
  const Value* origin_{nullptr};
};

/** \brief Field table that adapts a host struct T into a record_like.
 *
 * Example usage:
 * ```cpp
 * struct user { std::string name; int age; };
 * const auto users = sift::schema<user>{}
 *     .field("Name", &user::name)
 *     .field("Age", &user::age);
 * user u{"bob", 35};
 * auto rec = users.bind(u);
 * query.evaluate(rec);
 * ```
 */
template <typename T>
class schema {
public:
  using accessor = std::function<Value(const T&)>;

  template <typename M>
  auto field(std::string name, M T::*member) && -> schema&& {
    fields_.emplace_back(std::move(name), [member](const T& obj) { return to_value(obj.*member); });
    return std::move(*this);
  }

  auto field(std::string name, accessor fn) && -> schema&& {
    fields_.emplace_back(std::move(name), std::move(fn));
    return std::move(*this);
  }

  auto find(std::string_view name) const -> const accessor* {
    for (const auto& [n, fn] : fields_) {
      if (n == name) return &fn;
    }
    return nullptr;
  }

  auto fields() const noexcept -> const std::vector<std::pair<std::string, accessor>>& { return fields_; }

  class bound final : public record_like {
  public:
    bound(const schema& s, const T& obj) : schema_(&s), obj_(&obj) {}

    auto field(std::string_view name) const -> std::optional<Value> override {
      if (const auto* fn = schema_->find(name)) return (*fn)(*obj_);
      return std::nullopt;
    }

    auto snapshot() const -> std::optional<Value> override {
      Value::map_t m;
      for (const auto& [n, fn] : schema_->fields()) m.emplace(n, fn(*obj_));
      return Value(std::move(m));
    }

  private:
    const schema* schema_;
    const T* obj_;
  };

  /** \brief The schema and obj must outlive the returned record. */
  auto bind(const T& obj) const -> bound { return bound(*this, obj); }

private:
  std::vector<std::pair<std::string, accessor>> fields_;
};

} // namespace sift
