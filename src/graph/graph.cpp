#include "graph.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace nodebook::graph {
#include "macros_open.hpp"

  using nlohmann::json;

  auto normalize(std::string_view s) -> std::string {
    auto res = std::string();
    auto pendingSpace = false;
    for (auto const c: s) {
      if (std::isspace(static_cast<unsigned char>(c))) {
        pendingSpace = true;
        continue;
      }
      if (pendingSpace && !res.empty())
        res += '_';
      pendingSpace = false;
      res += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return res;
  }

  auto nodeId(std::string_view baseName) -> std::string {
    return normalize(baseName);
  }

  auto morphId(std::string_view nodeId, std::string_view morphName) -> MorphId {
    return MorphId(std::string(nodeId) + "_" + normalize(morphName));
  }

  auto relationId(std::string_view source, std::string_view name, std::string_view target) -> std::string {
    return "rel_" + std::string(source) + "_" + normalize(name) + "_" + std::string(target);
  }

  auto attributeId(std::string_view source, std::string_view name, std::string_view value) -> std::string {
    auto v = normalize(value);
    std::erase(v, '"');
    return "attr_" + std::string(source) + "_" + normalize(name) + "_" + v;
  }

  auto derivedAttributeId(MorphId const& morph, std::string_view name) -> std::string {
    return "fn_" + morph.str() + "_" + normalize(name);
  }

  auto displayName(std::string_view baseName, std::optional<std::string> const& adjective, std::optional<std::string> const& quantifier)
    -> std::string {
    auto res = std::string();
    if (quantifier)
      res += *quantifier + " ";
    if (adjective)
      res += *adjective + " ";
    return res + std::string(baseName);
  }

  auto Graph::morphContents(std::string const& nodeId) const -> std::map<MorphId, MorphContents> {
    auto res = std::map<MorphId, MorphContents>();
    if (auto const it = nodes.find(nodeId); it != nodes.end())
      for (auto const& morph: it->second.morphs)
        res[morph.id];
    for (auto const& [id, r]: relations)
      if (r.source == nodeId)
        for (auto const& m: r.morphs)
          res[m].relations.push_back(&r);
    for (auto const& [id, a]: attributes)
      if (a.source == nodeId)
        for (auto const& m: a.morphs)
          res[m].attributes.push_back(&a);
    return res;
  }

  auto entityId(Entity const& e) -> std::string const& {
    return std::visit([](auto const& v) -> std::string const& { return v.id; }, e);
  }

  auto entityKind(Entity const& e) -> std::string_view {
    return match(
      e,
      [](Node const&) { return std::string_view("node"); },
      [](Relation const&) { return std::string_view("relation"); },
      [](Attribute const&) { return std::string_view("attribute"); },
      [](GraphInfo const&) { return std::string_view("graph"); }
    );
  }

  // clang-format off
#define TO(key, name) j[key] = o.name
#define OPT_TO(key, name) if (o.name) j[key] = *o.name
#define FROM(key, name) j.at(key).get_to(o.name)
#define OPT_FROM(key, name) o.name = j.contains(key) ? std::make_optional(j[key].get<decltype(o.name)::value_type>()) : std::nullopt
#define DEF_FROM(key, name) if (j.contains(key)) j[key].get_to(o.name)

  void to_json  (json& j, MorphId const& o) { j = o.str(); }
  void from_json(json const& j, MorphId& o) { o = MorphId(j.get<std::string>()); }
  void to_json  (json& j, Morph const& o) { j = {}; TO("morph_id", id); TO("name", name); }
  void from_json(json const& j, Morph& o) { o = {}; FROM("morph_id", id); FROM("name", name); }

  void to_json(json& j, Node const& o) {
    j = {}; TO("id", id); TO("base_name", baseName); TO("name", name); OPT_TO("adjective", adjective); OPT_TO("quantifier", quantifier);
    TO("role", role); TO("types", types); TO("parent_types", parentTypes); TO("description", description); TO("morphs", morphs);
  }
  void from_json(json const& j, Node& o) {
    o = {}; FROM("id", id); FROM("base_name", baseName); DEF_FROM("name", name); OPT_FROM("adjective", adjective); OPT_FROM("quantifier", quantifier);
    FROM("role", role); DEF_FROM("types", types); DEF_FROM("parent_types", parentTypes); DEF_FROM("description", description); DEF_FROM("morphs", morphs);
    if (o.name.empty()) o.name = displayName(o.baseName, o.adjective, o.quantifier);
    if (o.morphs.empty()) o.morphs.push_back({morphId(o.id, defaultMorphName), std::string(defaultMorphName)});
  }

  void to_json(json& j, Relation const& o) {
    j = {}; TO("id", id); TO("source_id", source); TO("target_id", target); TO("name", name);
    OPT_TO("adverb", adverb); OPT_TO("modality", modality); TO("morph_ids", morphs);
  }
  void from_json(json const& j, Relation& o) {
    o = {}; FROM("id", id); FROM("source_id", source); FROM("target_id", target); FROM("name", name);
    OPT_FROM("adverb", adverb); OPT_FROM("modality", modality); DEF_FROM("morph_ids", morphs);
  }

  void to_json(json& j, Attribute const& o) {
    j = {}; TO("id", id); TO("source_id", source); TO("name", name); TO("value", value);
    OPT_TO("unit", unit); OPT_TO("modality", modality); OPT_TO("quantifier", quantifier);
    TO("isDerived", derived); OPT_TO("expression", expression); TO("morph_ids", morphs);
  }
  void from_json(json const& j, Attribute& o) {
    o = {}; FROM("id", id); FROM("source_id", source); FROM("name", name); FROM("value", value);
    OPT_FROM("unit", unit); OPT_FROM("modality", modality); OPT_FROM("quantifier", quantifier);
    DEF_FROM("isDerived", derived); OPT_FROM("expression", expression); DEF_FROM("morph_ids", morphs);
  }

  void to_json  (json& j, GraphInfo const& o) { j = {}; TO("id", id); TO("description", description); }
  void from_json(json const& j, GraphInfo& o) { o = {}; FROM("id", id); DEF_FROM("description", description); }
  // clang-format on

  void to_json(json& j, Graph const& o) {
    j = {
      {"id", o.id},
      {"description", o.description},
      {"nodes", json::array()},
      {"relations", json::array()},
      {"attributes", json::array()},
    };
    for (auto const& [id, n]: o.nodes)
      j["nodes"].push_back(n);
    for (auto const& [id, r]: o.relations)
      j["relations"].push_back(r);
    for (auto const& [id, a]: o.attributes)
      j["attributes"].push_back(a);
  }

  void from_json(json const& j, Graph& o) {
    o = {};
    j.at("id").get_to(o.id);
    if (j.contains("description"))
      j["description"].get_to(o.description);
    for (auto const& n: j.value("nodes", json::array())) {
      auto node = n.get<Node>();
      o.nodes.insert_or_assign(node.id, std::move(node));
    }
    for (auto const& r: j.value("relations", json::array())) {
      auto relation = r.get<Relation>();
      o.relations.insert_or_assign(relation.id, std::move(relation));
    }
    for (auto const& a: j.value("attributes", json::array())) {
      auto attribute = a.get<Attribute>();
      o.attributes.insert_or_assign(attribute.id, std::move(attribute));
    }
  }

  void to_json(json& j, ChangeOp const& o) {
    switch (o) {
      case ChangeOp::create: j = "create"; break;
      case ChangeOp::update: j = "update"; break;
      case ChangeOp::remove: j = "delete"; break;
    }
  }

  void from_json(json const& j, ChangeOp& o) {
    auto const s = j.get<std::string>();
    if (s == "create")
      o = ChangeOp::create;
    else if (s == "update")
      o = ChangeOp::update;
    else if (s == "delete")
      o = ChangeOp::remove;
    else
      throw std::invalid_argument("unknown change operation \"" + s + "\"");
  }

  void to_json(json& j, Change const& o) {
    j = {
      {"op", o.op},
      {"type", std::string(entityKind(o.entity))},
      {"id", entityId(o.entity)},
    };
    std::visit([&](auto const& v) { j["data"] = v; }, o.entity);
  }

  void from_json(json const& j, Change& o) {
    j.at("op").get_to(o.op);
    auto const type = j.at("type").get<std::string>();
    auto const& data = j.at("data");
    if (type == "node")
      o.entity = data.get<Node>();
    else if (type == "relation")
      o.entity = data.get<Relation>();
    else if (type == "attribute")
      o.entity = data.get<Attribute>();
    else if (type == "graph")
      o.entity = data.get<GraphInfo>();
    else
      throw std::invalid_argument("unknown entity type \"" + type + "\"");
  }

#undef TO
#undef OPT_TO
#undef FROM
#undef OPT_FROM
#undef DEF_FROM

#include "macros_close.hpp"
}
