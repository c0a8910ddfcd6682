#include "schema.hpp"
#include <algorithm>
#include <expr/expr.hpp>
#include <nlohmann/json.hpp>

namespace nodebook::schema {
#include "macros_open.hpp"

  using nlohmann::json;
  using cnl::ErrorKind;

  Schema::Schema(std::vector<SchemaEntry> const& entries) {
    for (auto const& entry: entries)
      add(entry);
  }

  auto Schema::add(SchemaEntry entry) -> Schema& {
    auto const index = _entries.size();
    auto const insert = [&](std::map<std::string, size_t>& map, std::string const& name) {
      if (!map.emplace(name, index).second)
        _duplicates.push_back(name);
    };
    match(
      entry,
      [&](NodeType const& t) { insert(_nodeTypes, t.name); },
      [&](RelationType const& t) { insert(_relationTypes, t.name); },
      [&](AttributeType const& t) { insert(_attributeTypes, t.name); },
      [&](FunctionType const& t) { insert(_functionTypes, t.name); }
    );
    _entries.push_back(std::move(entry));
    return *this;
  }

  template <typename T>
  auto Schema::_find(std::map<std::string, size_t> const& index, std::string const& name) const -> T const* {
    auto const it = index.find(name);
    if (it == index.end())
      return nullptr;
    return &std::get<T>(_entries[it->second]);
  }

  auto Schema::nodeType(std::string const& name) const -> NodeType const* {
    return _find<NodeType>(_nodeTypes, name);
  }
  auto Schema::relationType(std::string const& name) const -> RelationType const* {
    return _find<RelationType>(_relationTypes, name);
  }
  auto Schema::attributeType(std::string const& name) const -> AttributeType const* {
    return _find<AttributeType>(_attributeTypes, name);
  }
  auto Schema::functionType(std::string const& name) const -> FunctionType const* {
    return _find<FunctionType>(_functionTypes, name);
  }

  auto Schema::ancestry(std::string const& type) const -> std::set<std::string> {
    auto res = std::set<std::string>{type};
    auto stk = std::vector<std::string>{type};
    while (!stk.empty()) {
      auto const curr = std::move(stk.back());
      stk.pop_back();
      if (auto const t = nodeType(curr))
        for (auto const& parent: t->parentTypes)
          if (res.insert(parent).second)
            stk.push_back(parent);
    }
    return res;
  }

  auto Schema::validate(cnl::Reporter& reporter) const -> void {
    auto const invalid = [&](std::string message) { reporter.error(0, ErrorKind::invalidSchema, std::move(message)); };
    auto const checkTypes = [&](std::string const& owner, std::string const& what, std::vector<std::string> const& types) {
      for (auto const& t: types)
        if (!nodeType(t))
          invalid(owner + " has unknown " + what + " type \"" + t + "\"");
    };

    for (auto const& name: _duplicates)
      invalid("\"" + name + "\" is defined more than once");

    for (auto const& entry: _entries) {
      match(
        entry,
        [&](NodeType const& t) { checkTypes("node type \"" + t.name + "\"", "parent", t.parentTypes); },
        [&](RelationType const& t) {
          auto const owner = "relation type \"" + t.name + "\"";
          if (t.symmetric && t.inverseName && *t.inverseName != t.name)
            invalid(owner + " is symmetric but its inverse is \"" + *t.inverseName + "\"");
          checkTypes(owner, "domain", t.domain);
          checkTypes(owner, "range", t.range);
        },
        [&](AttributeType const& t) { checkTypes("attribute type \"" + t.name + "\"", "scope", t.scope); },
        [&](FunctionType const& t) {
          auto const owner = "function type \"" + t.name + "\"";
          checkTypes(owner, "scope", t.scope);
          try {
            expr::Expression::parse(t.expression);
          } catch (expr::ParseError& e) {
            invalid(owner + " has a malformed expression: " + e.what());
          }
        }
      );
    }

    // Cycle detection by depth-first search; each cycle is reported once, at the type closing it.
    enum class Colour { white, grey, black };
    auto colour = std::map<std::string, Colour>();
    auto path = std::vector<std::string>();
    auto dfs = [&](auto&& self, std::string const& name) -> void {
      colour[name] = Colour::grey;
      path.push_back(name);
      for (auto const& parent: nodeType(name)->parentTypes) {
        if (!nodeType(parent))
          continue;
        auto const c = colour[parent];
        if (c == Colour::grey) {
          auto cycle = std::string();
          for (auto it = std::ranges::find(path, parent); it != path.end(); it++)
            cycle += *it + " -> ";
          reporter.error(0, ErrorKind::cyclicTypeHierarchy, "type hierarchy contains a cycle: " + cycle + parent);
        } else if (c == Colour::white) {
          self(self, parent);
        }
      }
      path.pop_back();
      colour[name] = Colour::black;
    };
    for (auto const& [name, index]: _nodeTypes)
      if (colour[name] == Colour::white)
        dfs(dfs, name);
  }

  // clang-format off
#define TO(key, name) j[key] = o.name
#define OPT_TO(key, name) if (o.name) j[key] = *o.name
#define FROM(key, name) j.at(key).get_to(o.name)
#define OPT_FROM(key, name) o.name = j.contains(key) && !j[key].is_null() ? std::make_optional(j[key].get<decltype(o.name)::value_type>()) : std::nullopt
#define DEF_FROM(key, name) if (j.contains(key) && !j[key].is_null()) j[key].get_to(o.name)

  void to_json(json& j, ValueType const& o) { j = std::string(valueTypeName(o)); }
  void from_json(json const& j, ValueType& o) {
    auto const s = j.get<std::string>();
    auto const t = valueTypeFromName(s);
    if (!t) throw std::invalid_argument("unknown value type \"" + s + "\"");
    o = *t;
  }

  void to_json  (json& j, NodeType const& o) { j = {}; TO("name", name); TO("description", description); TO("parent_types", parentTypes); }
  void from_json(json const& j, NodeType& o) { o = {}; FROM("name", name); DEF_FROM("description", description); DEF_FROM("parent_types", parentTypes); }

  void to_json(json& j, RelationType const& o) {
    j = {}; TO("name", name); OPT_TO("inverse_name", inverseName); TO("description", description);
    TO("symmetric", symmetric); TO("transitive", transitive); TO("domain", domain); TO("range", range);
  }
  void from_json(json const& j, RelationType& o) {
    o = {}; FROM("name", name); OPT_FROM("inverse_name", inverseName); DEF_FROM("description", description);
    DEF_FROM("symmetric", symmetric); DEF_FROM("transitive", transitive); DEF_FROM("domain", domain); DEF_FROM("range", range);
  }

  void to_json(json& j, AttributeType const& o) {
    j = {}; TO("name", name); TO("description", description); TO("value_type", valueType); TO("scope", scope); OPT_TO("unit", unit);
  }
  void from_json(json const& j, AttributeType& o) {
    o = {}; FROM("name", name); DEF_FROM("description", description);
    DEF_FROM("data_type", valueType); DEF_FROM("value_type", valueType);
    DEF_FROM("domain", scope); DEF_FROM("scope", scope); OPT_FROM("unit", unit);
  }

  void to_json  (json& j, FunctionType const& o) { j = {}; TO("name", name); TO("expression", expression); TO("scope", scope); TO("description", description); }
  void from_json(json const& j, FunctionType& o) { o = {}; FROM("name", name); FROM("expression", expression); DEF_FROM("scope", scope); DEF_FROM("description", description); }
  // clang-format on

  void to_json(json& j, Schema const& o) {
    j = {
      {     "node_types", json::array()},
      { "relation_types", json::array()},
      {"attribute_types", json::array()},
      { "function_types", json::array()},
    };
    for (auto const& entry: o.entries())
      match(
        entry,
        [&](NodeType const& t) { j["node_types"].push_back(t); },
        [&](RelationType const& t) { j["relation_types"].push_back(t); },
        [&](AttributeType const& t) { j["attribute_types"].push_back(t); },
        [&](FunctionType const& t) { j["function_types"].push_back(t); }
      );
  }

  void from_json(json const& j, Schema& o) {
    o = Schema();
    if (!j.is_object())
      throw std::invalid_argument("schema must be a JSON object");
    for (auto const& t: j.value("node_types", json::array()))
      o.add(t.get<NodeType>());
    for (auto const& t: j.value("relation_types", json::array()))
      o.add(t.get<RelationType>());
    for (auto const& t: j.value("attribute_types", json::array()))
      o.add(t.get<AttributeType>());
    for (auto const& t: j.value("function_types", json::array()))
      o.add(t.get<FunctionType>());
  }

#undef TO
#undef OPT_TO
#undef FROM
#undef OPT_FROM
#undef DEF_FROM

  auto loadSchema(json const& j) -> Schema {
    try {
      return j.get<Schema>();
    } catch (json::exception& e) {
      throw SchemaError(std::string("malformed schema: ") + e.what());
    } catch (std::invalid_argument& e) {
      throw SchemaError(std::string("malformed schema: ") + e.what());
    }
  }

#include "macros_close.hpp"
}
