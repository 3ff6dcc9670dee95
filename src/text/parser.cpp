/** \file parser.cpp
 *  \brief Recursive-descent parser for query text.
 */

#include "sift/text/parser.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>
#include <vector>

#include "sift/core/log.hpp"
#include "sift/text/lexer.hpp"

namespace sift::text {

namespace {

auto parse_error(std::string message, const token& at) -> std::unexpected<core::error> {
  core::debug_log("parse", message, " at offset ", at.offset);
  return core::fail(core::error_code::parse_error,
                    std::move(message) + " at offset " + std::to_string(at.offset), "text.parser");
}

class parser {
public:
  explicit parser(std::vector<token> tokens) : ts_(std::move(tokens)) {}

  auto parse_all() -> std::expected<query, core::error> {
    auto q = parse_or();
    if (!q) return q;
    if (peek().type != token_type::eof) return parse_error("unexpected token " + describe(peek()), peek());
    return q;
  }

private:
  auto peek() const -> const token& { return ts_[pos_]; }

  auto next() -> const token& {
    const token& t = ts_[pos_];
    if (t.type != token_type::eof) ++pos_;
    return t;
  }

  auto parse_or() -> std::expected<query, core::error> {
    auto left = parse_and();
    if (!left) return left;
    while (peek().type == token_type::or_kw) {
      next();
      auto right = parse_and();
      if (!right) return right;
      std::vector<query> pair;
      pair.reserve(2);
      pair.push_back(std::move(*left));
      pair.push_back(std::move(*right));
      left = query(or_expr{std::move(pair)});
    }
    return left;
  }

  auto parse_and() -> std::expected<query, core::error> {
    auto left = parse_unary();
    if (!left) return left;
    while (peek().type == token_type::and_kw) {
      next();
      auto right = parse_unary();
      if (!right) return right;
      std::vector<query> pair;
      pair.reserve(2);
      pair.push_back(std::move(*left));
      pair.push_back(std::move(*right));
      left = query(and_expr{std::move(pair)});
    }
    return left;
  }

  auto parse_unary() -> std::expected<query, core::error> {
    if (peek().type == token_type::not_kw) {
      next();
      auto inner = parse_unary();
      if (!inner) return inner;
      return query(not_expr{std::move(*inner)});
    }
    return parse_primary();
  }

  auto parse_primary() -> std::expected<query, core::error> {
    if (peek().type == token_type::lparen) {
      next();
      auto q = parse_or();
      if (!q) return q;
      if (peek().type != token_type::rparen) return parse_error("expected )", peek());
      next();
      return q;
    }
    return parse_comparison();
  }

  auto parse_comparison() -> std::expected<query, core::error> {
    const token& field_tok = next();
    if (field_tok.type != token_type::ident) {
      return parse_error("expected identifier, got " + describe(field_tok), field_tok);
    }
    std::string field = field_tok.text;

    const token& op = next();
    switch (op.type) {
      case token_type::is_kw:
      case token_type::is_not_kw:
      case token_type::contains_kw:
      case token_type::gt:
      case token_type::gte:
      case token_type::lt:
      case token_type::lte:
        break;
      default:
        return parse_error("unexpected operator " + describe(op), op);
    }

    const token& val = next();
    Value value;
    switch (val.type) {
      case token_type::string:
        value = Value(val.text);
        break;
      case token_type::number:
      case token_type::ident:
        value = literal_value(val.text);
        break;
      default:
        return parse_error("expected value, got " + describe(val), val);
    }

    switch (op.type) {
      case token_type::is_kw: return query(is_expr{std::move(field), std::move(value)});
      case token_type::is_not_kw: return query(is_not_expr{std::move(field), std::move(value)});
      case token_type::contains_kw: return query(contains_expr{std::move(field), std::move(value)});
      case token_type::gt: return query(greater_than(std::move(field), std::move(value)));
      case token_type::gte: return query(greater_or_equal(std::move(field), std::move(value)));
      case token_type::lt: return query(less_than(std::move(field), std::move(value)));
      case token_type::lte: return query(less_or_equal(std::move(field), std::move(value)));
      default: return parse_error("unknown operator", op);
    }
  }

  std::vector<token> ts_;
  std::size_t pos_{0};
};

} // namespace

auto literal_value(std::string_view raw) -> Value {
  if (raw == "true") return Value(true);
  if (raw == "false") return Value(false);
  if (raw.empty()) return Value(std::string{});

  const char* first = raw.data();
  const char* last = raw.data() + raw.size();
  if (*first == '+') ++first;

  std::int64_t i{};
  if (auto [p, ec] = std::from_chars(first, last, i); ec == std::errc{} && p == last) return Value(i);

  double d{};
  if (auto [p, ec] = std::from_chars(first, last, d); ec == std::errc{} && p == last && std::isfinite(d)) {
    return Value(d);
  }
  return Value(std::string(raw));
}

auto parse(std::string_view input) -> std::expected<query, core::error> {
  auto tokens = lex(input);
  if (!tokens) return std::unexpected(tokens.error());
  core::debug_log("parse", tokens->size(), " tokens from \"", input, "\"");
  parser p(std::move(*tokens));
  return p.parse_all();
}

} // namespace sift::text
