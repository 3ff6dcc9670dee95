#pragma once

/** \file lexer.hpp
 *  \brief Tokenizer for the textual query language.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "sift/error.hpp"

namespace sift::text {

enum class token_type : std::uint8_t {
  eof,
  ident,
  string,
  number,
  and_kw,
  or_kw,
  not_kw,
  is_kw,
  is_not_kw,
  contains_kw,
  gt,
  gte,
  lt,
  lte,
  lparen,
  rparen,
};

struct token {
  token_type type{token_type::eof};
  std::string text;       /**< lexeme; string tokens hold the unquoted contents */
  std::size_t offset{0};  /**< byte offset of the token in the input */
};

/** \brief Splits input into tokens, always terminated by an eof token.
 *
 * Keywords (and, or, not, is, is not, contains) must be followed by a delimiter or the
 * end of input, so `android` is an identifier. `is not` is matched before `is`.
 * Strings are verbatim between double quotes, with no escapes.
 * Errors: unterminated string, unexpected character (parse_error).
 */
auto lex(std::string_view input) -> std::expected<std::vector<token>, core::error>;

/** \brief Printable token name for diagnostics. */
auto describe(const token& t) -> std::string;

} // namespace sift::text
