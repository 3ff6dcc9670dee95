#pragma once

/** \file expression.hpp
 *  \brief Boolean expression AST and its owning query wrapper.
 *
 * Use cases: parse a textual predicate or decode one from JSON, then evaluate it against
 * any number of records.
 * Ownership: a query exclusively owns its expression; composite nodes own their child
 * queries, so trees are finite and acyclic by construction. Copies are deep.
 * Thread-safety: trees are immutable after construction and may be evaluated concurrently.
 */

#include <concepts>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "sift/context.hpp"
#include "sift/error.hpp"
#include "sift/record.hpp"
#include "sift/term.hpp"
#include "sift/value.hpp"

namespace sift {

struct expression;
struct is_expr;
struct is_not_expr;
struct contains_expr;
struct icontains_expr;
struct and_expr;
struct or_expr;
struct not_expr;
struct compare_expr;

enum class ordering : std::uint8_t { gt, gte, lt, lte };

template <ordering Op>
class ordered_comparison;

using greater_than = ordered_comparison<ordering::gt>;
using greater_or_equal = ordered_comparison<ordering::gte>;
using less_than = ordered_comparison<ordering::lt>;
using less_or_equal = ordered_comparison<ordering::lte>;

template <typename T>
inline constexpr bool is_node_v =
    std::is_same_v<T, is_expr> || std::is_same_v<T, is_not_expr> ||
    std::is_same_v<T, contains_expr> || std::is_same_v<T, icontains_expr> ||
    std::is_same_v<T, greater_than> || std::is_same_v<T, greater_or_equal> ||
    std::is_same_v<T, less_than> || std::is_same_v<T, less_or_equal> ||
    std::is_same_v<T, and_expr> || std::is_same_v<T, or_expr> ||
    std::is_same_v<T, not_expr> || std::is_same_v<T, compare_expr>;

/** \brief Owning wrapper around zero or one expression. An empty query never matches. */
class query {
public:
  query() = default;
  explicit query(expression e);
  template <typename N>
    requires is_node_v<std::remove_cvref_t<N>>
  query(N&& node);

  query(const query& other);
  query(query&&) noexcept;
  query& operator=(const query& other);
  query& operator=(query&&) noexcept;
  ~query();

  auto empty() const noexcept -> bool { return !expr_; }
  auto get() const noexcept -> const expression* { return expr_.get(); }

  /** \brief Evaluates against a record; an empty query yields false. ctx may be null. */
  auto evaluate(const record_view& input, const context* ctx = nullptr) const
      -> std::expected<bool, core::error>;

  friend bool operator==(const query& a, const query& b);

private:
  std::unique_ptr<expression> expr_;
};

/** \brief field == value (structural). */
struct is_expr {
  std::string field;
  Value value;
  bool operator==(const is_expr&) const = default;
};

/** \brief field present and != value. An absent field does not match. */
struct is_not_expr {
  std::string field;
  Value value;
  bool operator==(const is_not_expr&) const = default;
};

/** \brief List membership or substring test. */
struct contains_expr {
  std::string field;
  Value value;
  bool operator==(const contains_expr&) const = default;
};

/** \brief Case-insensitive substring test on string fields. */
struct icontains_expr {
  std::string field;
  Value value;
  bool operator==(const icontains_expr&) const = default;
};

/** \brief Ordered comparison of a field against a literal.
 *
 * The operand's textual form, used when the field is a string, is computed once at
 * construction so evaluation never writes to the node.
 */
template <ordering Op>
class ordered_comparison {
public:
  static constexpr ordering op = Op;

  ordered_comparison(std::string field, Value value)
      : field_(std::move(field)), value_(std::move(value)), operand_text_(to_text(value_)) {}

  auto field() const noexcept -> const std::string& { return field_; }
  auto value() const noexcept -> const Value& { return value_; }
  auto operand_text() const noexcept -> const std::string& { return operand_text_; }

  bool operator==(const ordered_comparison& o) const {
    return field_ == o.field_ && value_ == o.value_;
  }

private:
  std::string field_;
  Value value_;
  std::string operand_text_;
};

/** \brief Conjunction; and([]) == true. */
struct and_expr {
  std::vector<query> children;
  bool operator==(const and_expr&) const = default;
};

/** \brief Disjunction; or([]) == false. */
struct or_expr {
  std::vector<query> children;
  bool operator==(const or_expr&) const = default;
};

struct not_expr {
  query child;
  bool operator==(const not_expr&) const = default;
};

enum class compare_op : std::uint8_t { eq, neq, gt, gte, lt, lte, contains, icontains };

/** \brief Comparison between two terms. Term errors propagate. Has no wire form. */
struct compare_expr {
  term lhs;
  term rhs;
  compare_op op{compare_op::eq};
  bool operator==(const compare_expr&) const = default;
};

struct expression {
  using node_t = std::variant<is_expr, is_not_expr, contains_expr, icontains_expr,
                              greater_than, greater_or_equal, less_than, less_or_equal,
                              and_expr, or_expr, not_expr, compare_expr>;

  template <typename N>
    requires is_node_v<std::remove_cvref_t<N>>
  expression(N&& n) : node(std::forward<N>(n)) {}

  node_t node;

  bool operator==(const expression&) const = default;
};

template <typename N>
  requires is_node_v<std::remove_cvref_t<N>>
query::query(N&& node) : expr_(std::make_unique<expression>(std::forward<N>(node))) {}

/** \brief Evaluates one expression node. */
auto evaluate(const expression& e, const record_view& input, const context* ctx = nullptr)
    -> std::expected<bool, core::error>;

/** \brief Indices of the records matching q; a null q selects every record.
 *  The first evaluation error aborts the scan. */
auto apply_filter(const query* q, const std::vector<record_view>& store,
                  const context* ctx = nullptr) -> std::expected<std::vector<std::size_t>, core::error>;

// Construction helpers.
inline auto is(std::string f, Value v) -> query { return query(is_expr{std::move(f), std::move(v)}); }
inline auto is_not(std::string f, Value v) -> query { return query(is_not_expr{std::move(f), std::move(v)}); }
inline auto contains(std::string f, Value v) -> query { return query(contains_expr{std::move(f), std::move(v)}); }
inline auto icontains(std::string f, Value v) -> query { return query(icontains_expr{std::move(f), std::move(v)}); }
inline auto gt(std::string f, Value v) -> query { return query(greater_than(std::move(f), std::move(v))); }
inline auto gte(std::string f, Value v) -> query { return query(greater_or_equal(std::move(f), std::move(v))); }
inline auto lt(std::string f, Value v) -> query { return query(less_than(std::move(f), std::move(v))); }
inline auto lte(std::string f, Value v) -> query { return query(less_or_equal(std::move(f), std::move(v))); }
inline auto all_of(std::vector<query> qs) -> query { return query(and_expr{std::move(qs)}); }
inline auto any_of(std::vector<query> qs) -> query { return query(or_expr{std::move(qs)}); }
inline auto negate(query q) -> query { return query(not_expr{std::move(q)}); }

} // namespace sift
