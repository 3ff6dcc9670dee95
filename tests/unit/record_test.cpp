#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

#include "sift/record.hpp"

using namespace sift;

namespace {

struct user {
  std::string name;
  int age{0};
  std::optional<std::string> nickname;
};

// Answers "Name" and reports every other field as an error.
class name_only_getter : public dynamic_getter {
public:
  auto get(std::string_view name) const -> std::expected<Value, core::error> override {
    if (name == "Name") return Value("getter");
    return core::fail(core::error_code::not_found, "no such field", "test");
  }
};

// Exposes both capabilities; the getter knows only "Name".
class dual_record : public dynamic_getter, public record_like {
public:
  auto get(std::string_view name) const -> std::expected<Value, core::error> override {
    if (name == "Name") return Value("getter");
    return core::fail(core::error_code::not_found, "no such field", "test");
  }
  auto field(std::string_view name) const -> std::optional<Value> override {
    if (name == "Name" || name == "Extra") return Value("record");
    return std::nullopt;
  }
};

} // namespace

TEST_CASE("map-like records resolve by exact key", "[record]") {
  Value::map_t m{{"Name", "bob"}, {"Age", 35}};
  record_view r(m);
  REQUIRE(r.resolve("Name") == Value("bob"));
  REQUIRE_FALSE(r.resolve("name").has_value());
  REQUIRE_FALSE(r.is_null());
}

TEST_CASE("a Value holding a map or a reference to one is map-like", "[record]") {
  const Value rec(Value::map_t{{"Age", 20}});
  REQUIRE(record_view(rec).resolve("Age") == Value(20));

  const Value ref = make_ref(rec);
  REQUIRE(record_view(ref).resolve("Age") == Value(20));

  const Value nil = empty_ref();
  REQUIRE(record_view(nil).is_null());

  const Value scalar(3);
  REQUIRE(record_view(scalar).is_null());
  REQUIRE_FALSE(record_view(scalar).resolve("Age").has_value());
}

TEST_CASE("null inputs resolve nothing", "[record]") {
  const Value::map_t* missing = nullptr;
  record_view r(missing);
  REQUIRE(r.is_null());
  REQUIRE_FALSE(r.resolve("x").has_value());
  REQUIRE(record_view(nullptr).is_null());
  REQUIRE(record_view().snapshot() == Value{});
}

TEST_CASE("dynamic getter errors mean absent", "[record]") {
  name_only_getter g;
  record_view r(g);
  REQUIRE(r.resolve("Name") == Value("getter"));
  REQUIRE_FALSE(r.resolve("Age").has_value());
  REQUIRE_FALSE(r.snapshot().has_value());
}

TEST_CASE("schema binds host structs as records", "[record][schema]") {
  const auto users = schema<user>{}
                         .field("Name", &user::name)
                         .field("Age", &user::age)
                         .field("Nick", &user::nickname)
                         .field("Adult", [](const user& u) { return Value(u.age >= 18); });
  const user u{"bob", 35, std::nullopt};
  const auto bound = users.bind(u);
  record_view r(bound);

  REQUIRE(r.resolve("Name") == Value("bob"));
  REQUIRE(r.resolve("Age") == Value(35));
  REQUIRE(r.resolve("Adult") == Value(true));
  REQUIRE(r.resolve("Nick")->kind() == value_kind::reference);
  REQUIRE_FALSE(r.resolve("age").has_value());

  auto snap = r.snapshot();
  REQUIRE(snap.has_value());
  REQUIRE(snap->get_if<Value::map_t>()->size() == 4);
}

TEST_CASE("the getter wins when a record has both capabilities", "[record]") {
  const dual_record d{};
  record_view r(d);
  REQUIRE(r.resolve("Name") == Value("getter"));
  REQUIRE_FALSE(r.resolve("Extra").has_value());

  const dual_record* p = &d;
  REQUIRE(record_view(p).resolve("Name") == Value("getter"));
  const dual_record* none = nullptr;
  REQUIRE(record_view(none).is_null());
}
