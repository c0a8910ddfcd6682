#ifndef NODEBOOK_GRAPH_GRAPH_HPP
#define NODEBOOK_GRAPH_GRAPH_HPP

#include <compare>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <common.hpp>
#include <nlohmann/json_fwd.hpp>

namespace nodebook::graph {
#include "macros_open.hpp"

  // Every node owns this morph.
  constexpr auto defaultMorphName = std::string_view("basic");
  // Role of nodes declared without a type.
  constexpr auto defaultRole = std::string_view("individual");

  // Trims, lowercases and joins whitespace runs with `_`.
  auto normalize(std::string_view s) -> std::string;

  class MorphId {
  public:
    MorphId() = default;
    explicit MorphId(std::string value):
        _value(std::move(value)) {}

    auto str() const -> std::string const& { return _value; }
    auto operator<=>(MorphId const&) const = default;

  private:
    std::string _value;
  };

  auto nodeId(std::string_view baseName) -> std::string;
  auto morphId(std::string_view nodeId, std::string_view morphName) -> MorphId;
  auto relationId(std::string_view source, std::string_view name, std::string_view target) -> std::string;
  auto attributeId(std::string_view source, std::string_view name, std::string_view value) -> std::string;
  auto derivedAttributeId(MorphId const& morph, std::string_view name) -> std::string;

  // Display name: `[quantifier] [adjective] baseName`.
  auto displayName(std::string_view baseName, std::optional<std::string> const& adjective, std::optional<std::string> const& quantifier)
    -> std::string;

  struct Morph {
    MorphId id;
    std::string name;

    auto operator==(Morph const&) const -> bool = default;
  };

  struct Node {
    std::string id;
    std::string baseName;
    std::string name;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::string role;
    std::vector<std::string> types;       // As declared.
    std::vector<std::string> parentTypes; // Resolved ancestry, sorted.
    std::string description;
    std::vector<Morph> morphs;            // The default morph comes first.

    auto operator==(Node const&) const -> bool = default;
  };

  struct Relation {
    std::string id;
    std::string source;
    std::string target;
    std::string name;
    std::optional<std::string> adverb;
    std::optional<std::string> modality;
    std::vector<MorphId> morphs; // Sorted.

    auto operator==(Relation const&) const -> bool = default;
  };

  struct Attribute {
    std::string id;
    std::string source;
    std::string name;
    std::string value;
    std::optional<std::string> unit;
    std::optional<std::string> modality;
    std::optional<std::string> quantifier;
    bool derived = false;
    std::optional<std::string> expression; // Present iff `derived`.
    std::vector<MorphId> morphs;           // Sorted.

    auto operator==(Attribute const&) const -> bool = default;
  };

  // Graph-level metadata.
  struct GraphInfo {
    std::string id;
    std::string description;

    auto operator==(GraphInfo const&) const -> bool = default;
  };

  struct MorphContents {
    std::vector<Relation const*> relations;
    std::vector<Attribute const*> attributes;
  };

  struct Graph {
    std::string id;
    std::string description;
    std::map<std::string, Node> nodes;
    std::map<std::string, Relation> relations;
    std::map<std::string, Attribute> attributes;

    // Relations and attributes whose source is `nodeId`, grouped by morph.
    // Pointers are invalidated by any modification of the graph.
    auto morphContents(std::string const& nodeId) const -> std::map<MorphId, MorphContents>;

    auto operator==(Graph const&) const -> bool = default;
  };

  enum class ChangeOp : uint32_t { create, update, remove };
  using Entity = std::variant<Node, Relation, Attribute, GraphInfo>;

  // `entity` holds the new value for `create` and `update`, and the removed value for `remove`.
  struct Change {
    ChangeOp op;
    Entity entity;

    auto operator==(Change const&) const -> bool = default;
  };
  using ChangeList = std::vector<Change>;

  auto entityId(Entity const& e) -> std::string const&;
  auto entityKind(Entity const& e) -> std::string_view;

  void to_json(nlohmann::json& j, MorphId const& o);
  void from_json(nlohmann::json const& j, MorphId& o);
  void to_json(nlohmann::json& j, Morph const& o);
  void from_json(nlohmann::json const& j, Morph& o);
  void to_json(nlohmann::json& j, Node const& o);
  void from_json(nlohmann::json const& j, Node& o);
  void to_json(nlohmann::json& j, Relation const& o);
  void from_json(nlohmann::json const& j, Relation& o);
  void to_json(nlohmann::json& j, Attribute const& o);
  void from_json(nlohmann::json const& j, Attribute& o);
  void to_json(nlohmann::json& j, GraphInfo const& o);
  void from_json(nlohmann::json const& j, GraphInfo& o);
  void to_json(nlohmann::json& j, Graph const& o);
  void from_json(nlohmann::json const& j, Graph& o);
  void to_json(nlohmann::json& j, ChangeOp const& o);
  void from_json(nlohmann::json const& j, ChangeOp& o);
  void to_json(nlohmann::json& j, Change const& o);
  void from_json(nlohmann::json const& j, Change& o);

#include "macros_close.hpp"
}

#endif // NODEBOOK_GRAPH_GRAPH_HPP
