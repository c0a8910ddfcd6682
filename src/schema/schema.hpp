#ifndef NODEBOOK_SCHEMA_SCHEMA_HPP
#define NODEBOOK_SCHEMA_SCHEMA_HPP

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <cnl/diagnostics.hpp>
#include <nlohmann/json_fwd.hpp>
#include "values.hpp"

namespace nodebook::schema {
#include "macros_open.hpp"

  struct NodeType {
    std::string name;
    std::string description;
    std::vector<std::string> parentTypes;

    auto operator==(NodeType const&) const -> bool = default;
  };

  struct RelationType {
    std::string name;
    std::optional<std::string> inverseName;
    std::string description;
    bool symmetric = false;
    bool transitive = false;
    std::vector<std::string> domain; // Empty means unrestricted.
    std::vector<std::string> range;  // Empty means unrestricted.

    auto operator==(RelationType const&) const -> bool = default;
  };

  struct AttributeType {
    std::string name;
    std::string description;
    ValueType valueType = ValueType::string;
    std::vector<std::string> scope; // Empty means unrestricted.
    std::optional<std::string> unit;

    auto operator==(AttributeType const&) const -> bool = default;
  };

  struct FunctionType {
    std::string name;
    std::string expression;
    std::vector<std::string> scope; // Empty means unrestricted.
    std::string description;

    auto operator==(FunctionType const&) const -> bool = default;
  };

  using SchemaEntry = std::variant<NodeType, RelationType, AttributeType, FunctionType>;

  // Thrown for schema documents that cannot be read at all.
  struct SchemaError: std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // An immutable (once shared) set of type definitions.
  class Schema {
  public:
    Schema() = default;
    explicit Schema(std::vector<SchemaEntry> const& entries);

    // Later definitions with an existing name are kept only for `validate()` to report.
    auto add(SchemaEntry entry) -> Schema&;

    auto entries() const -> std::vector<SchemaEntry> const& { return _entries; }
    auto nodeType(std::string const& name) const -> NodeType const*;
    auto relationType(std::string const& name) const -> RelationType const*;
    auto attributeType(std::string const& name) const -> AttributeType const*;
    auto functionType(std::string const& name) const -> FunctionType const*;

    // Transitive closure over parent types, including `type` itself.
    // Terminates on cyclic hierarchies; unknown names contribute only themselves.
    auto ancestry(std::string const& type) const -> std::set<std::string>;

    // Reports problems that invalidate the whole schema (always fatal kinds, at line 0).
    auto validate(cnl::Reporter& reporter) const -> void;

  private:
    std::vector<SchemaEntry> _entries;
    std::map<std::string, size_t> _nodeTypes;
    std::map<std::string, size_t> _relationTypes;
    std::map<std::string, size_t> _attributeTypes;
    std::map<std::string, size_t> _functionTypes;
    std::vector<std::string> _duplicates;

    template <typename T>
    auto _find(std::map<std::string, size_t> const& index, std::string const& name) const -> T const*;
  };

  // Publishes immutable schema snapshots.
  // A compilation pins the snapshot current at its start; later updates do not affect it.
  class SchemaRegistry {
  public:
    explicit SchemaRegistry(Schema schema = {}):
        _current(std::make_shared<Schema const>(std::move(schema))) {}

    auto snapshot() const -> std::shared_ptr<Schema const> {
      auto const lock = std::lock_guard(_mutex);
      return _current;
    }
    auto publish(Schema schema) -> void {
      auto next = std::make_shared<Schema const>(std::move(schema));
      auto const lock = std::lock_guard(_mutex);
      _current = std::move(next);
    }

  private:
    mutable std::mutex _mutex;
    std::shared_ptr<Schema const> _current;
  };

  // Throws `SchemaError` if `j` is not a schema document.
  auto loadSchema(nlohmann::json const& j) -> Schema;

  void to_json(nlohmann::json& j, ValueType const& o);
  void from_json(nlohmann::json const& j, ValueType& o);
  void to_json(nlohmann::json& j, NodeType const& o);
  void from_json(nlohmann::json const& j, NodeType& o);
  void to_json(nlohmann::json& j, RelationType const& o);
  void from_json(nlohmann::json const& j, RelationType& o);
  void to_json(nlohmann::json& j, AttributeType const& o);
  void from_json(nlohmann::json const& j, AttributeType& o);
  void to_json(nlohmann::json& j, FunctionType const& o);
  void from_json(nlohmann::json const& j, FunctionType& o);
  void to_json(nlohmann::json& j, Schema const& o);
  void from_json(nlohmann::json const& j, Schema& o);

#include "macros_close.hpp"
}

#endif // NODEBOOK_SCHEMA_SCHEMA_HPP
