/** \file lexer.cpp
 *  \brief Tokenizer for the textual query language.
 */

#include "sift/text/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace sift::text {

namespace {

// Bytes >= 0x80 count as word characters so UTF-8 identifiers stay whole.
auto is_word(char c) -> bool {
  const auto u = static_cast<unsigned char>(c);
  return u >= 0x80 || std::isalnum(u) || c == '_';
}

auto is_delim(char c) -> bool { return !is_word(c); }

auto is_space(char c) -> bool { return std::isspace(static_cast<unsigned char>(c)) != 0; }

auto is_digit(char c) -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

struct keyword {
  std::string_view text;
  token_type type;
};

// Order matters: "is not" before "is".
constexpr std::array<keyword, 6> kKeywords{{
    {"and", token_type::and_kw},
    {"or", token_type::or_kw},
    {"not", token_type::not_kw},
    {"is not", token_type::is_not_kw},
    {"is", token_type::is_kw},
    {"contains", token_type::contains_kw},
}};

struct symbol {
  std::string_view text;
  token_type type;
};

constexpr std::array<symbol, 6> kSymbols{{
    {">=", token_type::gte},
    {"<=", token_type::lte},
    {">", token_type::gt},
    {"<", token_type::lt},
    {"(", token_type::lparen},
    {")", token_type::rparen},
}};

auto starts_number(std::string_view rest) -> bool {
  if (rest.empty()) return false;
  if (is_digit(rest[0])) return true;
  if (rest[0] == '.') return rest.size() > 1 && is_digit(rest[1]);
  if (rest[0] == '-' && rest.size() > 1) {
    return is_digit(rest[1]) || (rest[1] == '.' && rest.size() > 2 && is_digit(rest[2]));
  }
  return false;
}

auto lex_error(std::string message) -> std::unexpected<core::error> {
  return core::fail(core::error_code::parse_error, std::move(message), "text.lexer");
}

} // namespace

auto lex(std::string_view input) -> std::expected<std::vector<token>, core::error> {
  std::vector<token> tokens;
  std::size_t i = 0;
  while (i < input.size()) {
    if (is_space(input[i])) {
      ++i;
      continue;
    }
    const std::string_view rest = input.substr(i);

    bool matched = false;
    for (const auto& kw : kKeywords) {
      if (rest.starts_with(kw.text) &&
          (rest.size() == kw.text.size() || is_delim(rest[kw.text.size()]))) {
        tokens.push_back(token{kw.type, std::string(kw.text), i});
        i += kw.text.size();
        matched = true;
        break;
      }
    }
    if (matched) continue;

    for (const auto& sym : kSymbols) {
      if (rest.starts_with(sym.text)) {
        tokens.push_back(token{sym.type, std::string(sym.text), i});
        i += sym.text.size();
        matched = true;
        break;
      }
    }
    if (matched) continue;

    if (rest[0] == '"') {
      const auto close = rest.find('"', 1);
      if (close == std::string_view::npos) {
        return lex_error("unterminated string at offset " + std::to_string(i));
      }
      tokens.push_back(token{token_type::string, std::string(rest.substr(1, close - 1)), i});
      i += close + 1;
      continue;
    }

    if (starts_number(rest)) {
      std::size_t j = 1;
      while (j < rest.size() && (is_digit(rest[j]) || rest[j] == '.')) ++j;
      tokens.push_back(token{token_type::number, std::string(rest.substr(0, j)), i});
      i += j;
      continue;
    }

    std::size_t j = 0;
    while (j < rest.size() && !is_space(rest[j]) && !is_delim(rest[j])) ++j;
    if (j == 0) {
      return lex_error("unexpected character '" + std::string(1, rest[0]) + "' at offset " +
                       std::to_string(i));
    }
    tokens.push_back(token{token_type::ident, std::string(rest.substr(0, j)), i});
    i += j;
  }
  tokens.push_back(token{token_type::eof, {}, input.size()});
  return tokens;
}

auto describe(const token& t) -> std::string {
  switch (t.type) {
    case token_type::eof: return "end of input";
    case token_type::string: return "\"" + t.text + "\"";
    default: return "'" + t.text + "'";
  }
}

} // namespace sift::text
