/** \file expression.cpp
 *  \brief query ownership and structural equality.
 */

#include "sift/expression.hpp"

namespace sift {

query::query(expression e) : expr_(std::make_unique<expression>(std::move(e))) {}

query::query(const query& other)
    : expr_(other.expr_ ? std::make_unique<expression>(*other.expr_) : nullptr) {}

query::query(query&&) noexcept = default;

query& query::operator=(const query& other) {
  if (this != &other) {
    expr_ = other.expr_ ? std::make_unique<expression>(*other.expr_) : nullptr;
  }
  return *this;
}

query& query::operator=(query&&) noexcept = default;

query::~query() = default;

bool operator==(const query& a, const query& b) {
  if (!a.expr_ || !b.expr_) return !a.expr_ && !b.expr_;
  return *a.expr_ == *b.expr_;
}

auto query::evaluate(const record_view& input, const context* ctx) const
    -> std::expected<bool, core::error> {
  if (!expr_) return false;
  return sift::evaluate(*expr_, input, ctx);
}

auto apply_filter(const query* q, const std::vector<record_view>& store, const context* ctx)
    -> std::expected<std::vector<std::size_t>, core::error> {
  std::vector<std::size_t> ids;
  ids.reserve(store.size());
  if (!q) {
    for (std::size_t i = 0; i < store.size(); ++i) ids.push_back(i);
    return ids;
  }
  for (std::size_t i = 0; i < store.size(); ++i) {
    auto m = q->evaluate(store[i], ctx);
    if (!m) return std::unexpected(m.error());
    if (*m) ids.push_back(i);
  }
  return ids;
}

} // namespace sift
