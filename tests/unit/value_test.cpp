#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "sift/value.hpp"

using namespace sift;

TEST_CASE("host values project into the matching kind", "[value]") {
  REQUIRE(Value{}.kind() == value_kind::null);
  REQUIRE(Value(nullptr).is_null());
  REQUIRE(Value(42).kind() == value_kind::integer);
  REQUIRE(Value(std::uint16_t{7}).kind() == value_kind::unsigned_integer);
  REQUIRE(Value(1.5f).kind() == value_kind::floating);
  REQUIRE(Value(true).kind() == value_kind::boolean);
  REQUIRE(Value("abc").is_string());
  REQUIRE(Value(number_literal{"12"}).kind() == value_kind::number_literal);

  const std::vector<int> ints{1, 2, 3};
  const Value l = to_value(ints);
  REQUIRE(l.kind() == value_kind::list);
  REQUIRE(l.get_if<Value::list_t>()->size() == 3);

  const std::map<std::string, double> prices{{"a", 1.0}};
  REQUIRE(to_value(prices).kind() == value_kind::map);

  const std::optional<int> none;
  REQUIRE(to_value(none).kind() == value_kind::reference);
  REQUIRE(deref(to_value(none)).is_null());
  REQUIRE(deref(to_value(std::optional<int>{5})) == Value(5));
}

TEST_CASE("equality is structural with signed and unsigned integers unified", "[value]") {
  REQUIRE(Value(5) == Value(std::uint64_t{5}));
  REQUIRE_FALSE(Value(-1) == Value(std::numeric_limits<std::uint64_t>::max()));
  REQUIRE_FALSE(Value(5) == Value(5.0));
  REQUIRE_FALSE(Value("5") == Value(5));
  REQUIRE(Value(Value::list_t{1, "x"}) == Value(Value::list_t{1, "x"}));
  REQUIRE(make_ref(Value("bob")) == Value("bob"));
  REQUIRE(empty_ref() == Value{});
}

TEST_CASE("nil-like values", "[value]") {
  REQUIRE(is_nil_like(Value{}));
  REQUIRE(is_nil_like(empty_ref()));
  REQUIRE(is_nil_like(Value(Value::list_t{})));
  REQUIRE(is_nil_like(Value(Value::map_t{})));
  REQUIRE_FALSE(is_nil_like(Value(0)));
  REQUIRE_FALSE(is_nil_like(Value("")));
}

TEST_CASE("textual forms", "[value]") {
  REQUIRE(to_text(Value{}) == "<nil>");
  REQUIRE(to_text(Value(-3)) == "-3");
  REQUIRE(to_text(Value(2.5)) == "2.5");
  REQUIRE(to_text(Value(true)) == "true");
  REQUIRE(to_text(Value(Value::list_t{1, "a"})) == "[1 a]");
  Value::map_t m{{"b", 2}, {"a", 1}};
  REQUIRE(to_text(Value(m)) == "map[a:1 b:2]");
  REQUIRE(to_text(make_ref(Value(9))) == "9");
}

TEST_CASE("numeric coercion", "[value][coercion]") {
  REQUIRE(coerce_int(Value("42")) == 42);
  REQUIRE(coerce_int(Value("+7")) == 7);
  REQUIRE(coerce_int(Value(3.9)) == 3);
  REQUIRE(coerce_int(Value(number_literal{"-12"})) == -12);
  REQUIRE_FALSE(coerce_int(Value("abc")).has_value());
  REQUIRE_FALSE(coerce_int(Value(std::numeric_limits<std::uint64_t>::max())).has_value());
  REQUIRE_FALSE(coerce_int(Value(true)).has_value());

  REQUIRE_FALSE(coerce_uint(Value(-1)).has_value());
  REQUIRE(coerce_uint(Value("18446744073709551615")) == std::numeric_limits<std::uint64_t>::max());

  REQUIRE(coerce_float(Value("1.25")) == 1.25);
  REQUIRE(coerce_float(Value(4)) == 4.0);
  REQUIRE_FALSE(coerce_float(Value(Value::list_t{})).has_value());
  REQUIRE(coerce_float(make_ref(Value("2"))) == 2.0);
}

TEST_CASE("truthiness", "[value][truthy]") {
  REQUIRE(truthy(Value{}) == false);
  REQUIRE(truthy(Value(0)) == false);
  REQUIRE(truthy(Value(2)) == true);
  REQUIRE(truthy(Value("True")) == true);
  REQUIRE(truthy(Value("f")) == false);
  REQUIRE(truthy(Value(Value::list_t{1})) == true);
  REQUIRE(truthy(empty_ref()) == false);
  REQUIRE(truthy(Value(number_literal{"0.0"})) == false);

  auto bad = truthy(Value("maybe"));
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::evaluation_error);
}

TEST_CASE("three-way compare prefers numbers", "[value]") {
  REQUIRE(compare(Value("10"), Value(9)) > 0);
  REQUIRE(compare(Value(2), Value(2.0)) == 0);
  REQUIRE(compare(Value("apple"), Value("banana")) < 0);
}
