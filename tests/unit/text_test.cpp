#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "sift/text/lexer.hpp"
#include "sift/text/parser.hpp"

using namespace sift;

namespace {

auto types(std::string_view input) -> std::vector<text::token_type> {
  auto toks = text::lex(input);
  REQUIRE(toks.has_value());
  std::vector<text::token_type> out;
  for (const auto& t : *toks) out.push_back(t.type);
  return out;
}

auto parsed(std::string_view input) -> query {
  auto q = text::parse(input);
  REQUIRE(q.has_value());
  return *q;
}

auto eval(const query& q, const Value& rec) -> bool {
  auto r = q.evaluate(rec);
  REQUIRE(r.has_value());
  return *r;
}

const Value kFixtures[] = {
    Value(Value::map_t{{"Name", "bob"}, {"Age", 35}, {"Tags", Value::list_t{"go", "news"}}, {"Score", 1.5}}),
    Value(Value::map_t{{"Name", "alice"}, {"Age", 20}, {"Tags", Value::list_t{"news"}}, {"Active", true}}),
    Value(Value::map_t{{"Name", "carol"}, {"Temp", -3}}),
};

} // namespace

TEST_CASE("keywords need a delimiter", "[text][lexer]") {
  using tt = text::token_type;
  REQUIRE(types("android is notable") == std::vector<tt>{tt::ident, tt::is_kw, tt::ident, tt::eof});
  REQUIRE(types("Name is not \"x\"") == std::vector<tt>{tt::ident, tt::is_not_kw, tt::string, tt::eof});
  REQUIRE(types("(a>=1)or(b<2)") ==
          std::vector<tt>{tt::lparen, tt::ident, tt::gte, tt::number, tt::rparen, tt::or_kw,
                          tt::lparen, tt::ident, tt::lt, tt::number, tt::rparen, tt::eof});
  REQUIRE(types("Temp > -3.5") == std::vector<tt>{tt::ident, tt::gt, tt::number, tt::eof});
}

TEST_CASE("lexer errors carry offsets", "[text][lexer]") {
  auto open = text::lex("Name is \"bob");
  REQUIRE_FALSE(open.has_value());
  REQUIRE(open.error().code == core::error_code::parse_error);
  REQUIRE(open.error().message == "unterminated string at offset 8");

  auto stray = text::lex("Name is bob!");
  REQUIRE_FALSE(stray.has_value());
  REQUIRE(stray.error().code == core::error_code::parse_error);
}

TEST_CASE("parses the documented examples", "[text][parser]") {
  const auto q = parsed(R"(Name is "bob" and Age > 30)");
  REQUIRE(q == all_of({is("Name", "bob"), gt("Age", 30)}));
  REQUIRE(eval(q, Value(Value::map_t{{"Name", "bob"}, {"Age", 35}})));
  REQUIRE_FALSE(eval(q, Value(Value::map_t{{"Name", "bob"}, {"Age", 20}})));

  REQUIRE(parsed(R"(Tags contains "go")") == contains("Tags", "go"));
  REQUIRE(parsed(R"(not (Name is "alice"))") == negate(is("Name", "alice")));
}

TEST_CASE("values are typed from their lexeme", "[text][parser]") {
  REQUIRE(parsed("A is 30") == is("A", 30));
  REQUIRE(parsed("A is 2.5") == is("A", 2.5));
  REQUIRE(parsed("A is -4") == is("A", -4));
  REQUIRE(parsed("A is true") == is("A", true));
  REQUIRE(parsed("A is bob") == is("A", "bob"));
  REQUIRE(parsed(R"(A is "30")") == is("A", "30"));
}

TEST_CASE("precedence and left folding", "[text][parser]") {
  REQUIRE(parsed("a is 1 or b is 2 and c is 3") ==
          any_of({is("a", 1), all_of({is("b", 2), is("c", 3)})}));
  REQUIRE(parsed("a is 1 and b is 2 and c is 3") ==
          all_of({all_of({is("a", 1), is("b", 2)}), is("c", 3)}));
  REQUIRE(parsed("not a is 1 and b is 2") == all_of({negate(is("a", 1)), is("b", 2)}));
  REQUIRE(parsed("not not a is 1") == negate(negate(is("a", 1))));
}

TEST_CASE("grammar errors", "[text][parser]") {
  const char* bad[] = {
      R"(Name is "bob)",
      "Name is",
      "is 3",
      "Name equals 3",
      "(Name is 3",
      "Name is 3)",
      "Name is 3 Age",
      "Name is 3 and",
      "",
  };
  for (const char* input : bad) {
    auto r = text::parse(input);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::parse_error);
  }
}

TEST_CASE("stringify is canonical and re-parses", "[text][stringify]") {
  REQUIRE(text::stringify(parsed(R"(Name is "bob" and Age > 30)")) == R"((Name is "bob" and Age > 30))");
  REQUIRE(text::stringify(parsed("not (a is 1 or b <= 2.0)")) == "not (a is 1 or b <= 2.0)");
  REQUIRE(text::stringify(query{}).empty());

  const char* inputs[] = {
      R"(Name is "bob" and Age > 30)",
      R"(Tags contains "go" or not (Name is "alice"))",
      "Age >= 20 and Age < 35.0 or Active is true",
      "Temp > -4 and Temp <= -3",
      "Score > 1.25 and Name is not carol",
      "a is 1 and b is 2 and (c is 3 or d is 4)",
  };
  for (const char* input : inputs) {
    const auto q = parsed(input);
    const auto again = parsed(text::stringify(q));
    REQUIRE(again == q);
    for (const auto& rec : kFixtures) REQUIRE(eval(again, rec) == eval(q, rec));
  }
}
