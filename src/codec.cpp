/** \file codec.cpp
 *  \brief JSON encode/decode of query trees.
 */

#include "sift/codec.hpp"

#include <array>
#include <utility>

#include "sift/core/log.hpp"

namespace sift::codec {

namespace {

enum class wire_kind { is, is_not, contains, icontains, and_, or_, not_, gt, gte, lt, lte };

constexpr std::array<std::pair<std::string_view, wire_kind>, 11> kWireTags{{
    {"Is", wire_kind::is},
    {"IsNot", wire_kind::is_not},
    {"Contains", wire_kind::contains},
    {"IContains", wire_kind::icontains},
    {"And", wire_kind::and_},
    {"Or", wire_kind::or_},
    {"Not", wire_kind::not_},
    {"GT", wire_kind::gt},
    {"GTE", wire_kind::gte},
    {"LT", wire_kind::lt},
    {"LTE", wire_kind::lte},
}};

auto lookup_tag(std::string_view tag) -> std::optional<wire_kind> {
  for (const auto& [name, kind] : kWireTags) {
    if (name == tag) return kind;
  }
  return std::nullopt;
}

auto bad_payload(std::string message) -> std::unexpected<core::error> {
  core::debug_log("codec", "decode failed: ", message);
  return core::fail(core::error_code::serialization_error, std::move(message), "codec.decode");
}

// ---- encoding ----

auto encode_query(const query& q) -> std::expected<json, core::error>;

auto leaf_payload(const std::string& field, const Value& value) -> json {
  json p = json::object();
  p["Field"] = field;
  p["Value"] = to_json_value(value);
  return p;
}

auto children_payload(const std::vector<query>& children) -> std::expected<json, core::error> {
  json arr = json::array();
  for (const auto& c : children) {
    auto cj = encode_query(c);
    if (!cj) return cj;
    arr.push_back(std::move(*cj));
  }
  json p = json::object();
  p["Expressions"] = std::move(arr);
  return p;
}

auto encode_payload(const expression& e) -> std::expected<json, core::error> {
  return std::visit([](const auto& node) -> std::expected<json, core::error> {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, and_expr> || std::is_same_v<T, or_expr>) {
      return children_payload(node.children);
    } else if constexpr (std::is_same_v<T, not_expr>) {
      auto cj = encode_query(node.child);
      if (!cj) return cj;
      json p = json::object();
      p["Expression"] = std::move(*cj);
      return p;
    } else if constexpr (std::is_same_v<T, compare_expr>) {
      return core::fail(core::error_code::serialization_error,
                        "term comparisons have no wire form", "codec.encode");
    } else if constexpr (std::is_same_v<T, is_expr> || std::is_same_v<T, is_not_expr> ||
                         std::is_same_v<T, contains_expr> || std::is_same_v<T, icontains_expr>) {
      return leaf_payload(node.field, node.value);
    } else {
      return leaf_payload(node.field(), node.value());
    }
  }, e.node);
}

auto encode_query(const query& q) -> std::expected<json, core::error> {
  json out = json::object();
  if (q.empty()) {
    out["Expression"] = nullptr;
    return out;
  }
  const expression& e = *q.get();
  auto tag = discriminant(e);
  if (!tag) {
    return core::fail(core::error_code::serialization_error,
                      "expression kind has no wire discriminant", "codec.encode");
  }
  auto payload = encode_payload(e);
  if (!payload) return payload;
  json typed = json::object();
  typed["Type"] = std::string(*tag);
  typed["Expression"] = std::move(*payload);
  out["Expression"] = std::move(typed);
  return out;
}

// ---- decoding ----

struct leaf_fields {
  std::string field;
  Value value;
};

auto decode_leaf(const json& payload) -> std::expected<leaf_fields, core::error> {
  auto f = payload.find("Field");
  if (f == payload.end() || !f->is_string()) return bad_payload("comparison payload requires a string Field");
  leaf_fields out{f->get<std::string>(), Value{}};
  if (auto v = payload.find("Value"); v != payload.end()) out.value = from_json_value(*v);
  return out;
}

auto decode_children(const json& payload) -> std::expected<std::vector<query>, core::error> {
  std::vector<query> children;
  auto it = payload.find("Expressions");
  if (it == payload.end() || it->is_null()) return children;
  if (!it->is_array()) return bad_payload("Expressions must be an array");
  children.reserve(it->size());
  for (const auto& c : *it) {
    auto q = from_document(c);
    if (!q) return std::unexpected(q.error());
    children.push_back(std::move(*q));
  }
  return children;
}

template <typename Node>
auto make_leaf(const json& payload) -> std::expected<query, core::error> {
  auto leaf = decode_leaf(payload);
  if (!leaf) return std::unexpected(leaf.error());
  if constexpr (std::is_constructible_v<Node, std::string, Value>) {
    return query(Node(std::move(leaf->field), std::move(leaf->value)));
  } else {
    return query(Node{std::move(leaf->field), std::move(leaf->value)});
  }
}

auto decode_expression(const json& typed) -> std::expected<query, core::error> {
  if (!typed.is_object()) return bad_payload("Expression must be an object");

  // pass one: only the discriminant
  auto t = typed.find("Type");
  if (t == typed.end() || !t->is_string()) return bad_payload("missing Type discriminant");
  const auto tag = t->get<std::string>();
  auto kind = lookup_tag(tag);
  if (!kind) return bad_payload("unrecognized type value \"" + tag + "\"");

  // pass two: the payload shape that tag implies
  auto p = typed.find("Expression");
  if (p == typed.end() || !p->is_object()) return bad_payload("Type " + tag + " requires an object payload");
  const json& payload = *p;

  switch (*kind) {
    case wire_kind::is: return make_leaf<is_expr>(payload);
    case wire_kind::is_not: return make_leaf<is_not_expr>(payload);
    case wire_kind::contains: return make_leaf<contains_expr>(payload);
    case wire_kind::icontains: return make_leaf<icontains_expr>(payload);
    case wire_kind::gt: return make_leaf<greater_than>(payload);
    case wire_kind::gte: return make_leaf<greater_or_equal>(payload);
    case wire_kind::lt: return make_leaf<less_than>(payload);
    case wire_kind::lte: return make_leaf<less_or_equal>(payload);
    case wire_kind::and_: {
      auto children = decode_children(payload);
      if (!children) return std::unexpected(children.error());
      return query(and_expr{std::move(*children)});
    }
    case wire_kind::or_: {
      auto children = decode_children(payload);
      if (!children) return std::unexpected(children.error());
      return query(or_expr{std::move(*children)});
    }
    case wire_kind::not_: {
      auto c = payload.find("Expression");
      if (c == payload.end() || c->is_null()) return query(not_expr{query{}});
      auto child = from_document(*c);
      if (!child) return child;
      return query(not_expr{std::move(*child)});
    }
  }
  return bad_payload("unhandled discriminant " + tag);
}

} // namespace

auto discriminant(const expression& e) -> std::optional<std::string_view> {
  return std::visit([](const auto& node) -> std::optional<std::string_view> {
    using T = std::decay_t<decltype(node)>;
    if constexpr (std::is_same_v<T, is_expr>) return "Is";
    else if constexpr (std::is_same_v<T, is_not_expr>) return "IsNot";
    else if constexpr (std::is_same_v<T, contains_expr>) return "Contains";
    else if constexpr (std::is_same_v<T, icontains_expr>) return "IContains";
    else if constexpr (std::is_same_v<T, and_expr>) return "And";
    else if constexpr (std::is_same_v<T, or_expr>) return "Or";
    else if constexpr (std::is_same_v<T, not_expr>) return "Not";
    else if constexpr (std::is_same_v<T, greater_than>) return "GT";
    else if constexpr (std::is_same_v<T, greater_or_equal>) return "GTE";
    else if constexpr (std::is_same_v<T, less_than>) return "LT";
    else if constexpr (std::is_same_v<T, less_or_equal>) return "LTE";
    else return std::nullopt;
  }, e.node);
}

auto to_document(const query& q) -> std::expected<json, core::error> {
  return encode_query(q);
}

auto from_document(const json& j) -> std::expected<query, core::error> {
  if (!j.is_object()) return bad_payload("query must be a JSON object");
  auto it = j.find("Expression");
  if (it == j.end() || it->is_null()) return query{};
  return decode_expression(*it);
}

auto encode(const query& q) -> std::expected<std::string, core::error> {
  auto doc = to_document(q);
  if (!doc) return std::unexpected(doc.error());
  try {
    return doc->dump();
  } catch (const json::exception& ex) {
    return core::fail(core::error_code::serialization_error, ex.what(), "codec.encode");
  }
}

auto decode(std::string_view text) -> std::expected<query, core::error> {
  json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return bad_payload("malformed JSON");
  return from_document(j);
}

} // namespace sift::codec
