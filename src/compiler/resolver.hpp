#ifndef NODEBOOK_COMPILER_RESOLVER_HPP
#define NODEBOOK_COMPILER_RESOLVER_HPP

#include <map>
#include <memory>
#include <set>
#include <cnl/ast.hpp>
#include <cnl/diagnostics.hpp>
#include <expr/expr.hpp>
#include <graph/store.hpp>
#include <schema/schema.hpp>
#include "options.hpp"

namespace nodebook::compiler {
#include "macros_open.hpp"

  struct ResolvedNode {
    graph::Node node;
    std::set<std::string> ancestry;
    size_t line;                      // 0 for implicit nodes.
    bool declared;                    // Otherwise an implicit relation target.
    std::set<graph::MorphId> touched; // Morphs whose full contents this submission states.
  };

  struct ResolvedRelation {
    graph::Relation relation; // With exactly one morph.
    size_t line;
    bool inferred; // Materialised inverse of a symmetric relation.
  };

  struct ResolvedAttribute {
    graph::Attribute attribute; // With exactly one morph.
    schema::Value value;
    size_t line;
  };

  struct ResolvedFunction {
    std::string nodeId;
    graph::MorphId morph;
    std::string name;
    std::shared_ptr<expr::Expression const> expression;
    size_t line; // For functions carried over from the stored graph, the line of their node.
  };

  struct ResolvedGraph {
    std::optional<std::string> description;
    std::map<std::string, ResolvedNode> nodes;
    std::vector<ResolvedRelation> relations;
    std::vector<ResolvedAttribute> attributes;
    std::vector<ResolvedFunction> functions;
    // Stored literal attributes of the morphs a declared node leaves alone. Inputs of carried-over functions only.
    std::vector<ResolvedAttribute> carried;
    std::set<std::string> skippedNodes;    // Declared, but left out because of errors.
    std::set<std::string> skippedEntities; // IDs of relations and attributes whose declarations were left out.
  };

  // Whether a name in a function expression refers to the attribute or function called `name`.
  // Matches exactly or after normalisation (so `atomic_number` matches "atomic number").
  auto referenceMatches(std::string const& name, std::string const& reference) -> bool;

  // Type-checks a parsed document against a schema.
  // Declarations with errors are reported and left out of the result.
  class Resolver {
  public:
    Resolver(
      schema::Schema const& schema,
      graph::Graph const& prior,
      graph::NodeRegistry const& registry,
      CompileOptions const& options,
      cnl::Reporter& reporter
    ):
        _schema(schema),
        _prior(prior),
        _registry(registry),
        _options(options),
        _reporter(reporter) {}

    auto operator()(cnl::Document const& document) -> ResolvedGraph;

  private:
    schema::Schema const& _schema;
    graph::Graph const& _prior;
    graph::NodeRegistry const& _registry;
    CompileOptions const& _options;
    cnl::Reporter& _reporter;
    ResolvedGraph _res;
    std::map<std::string, std::shared_ptr<expr::Expression const>> _expressions;

    auto _roleAncestry(std::string const& role) const -> std::set<std::string>;
    auto _node(cnl::NodeDecl const& decl) -> void;
    auto _relation(ResolvedNode const& source, cnl::RelationDecl const& decl) -> void;
    struct Target {
      std::string id;
      std::string name;
      std::set<std::string> ancestry;
    };
    auto _target(cnl::RelationDecl const& decl) -> std::optional<Target>;
    auto _attribute(ResolvedNode const& source, cnl::AttributeDecl const& decl) -> void;
    auto _function(ResolvedNode const& source, cnl::FunctionDecl const& decl) -> void;
    auto _carryUntouched() -> void;
    auto _checkReferences() -> void;
    auto _materialiseSymmetric() -> void;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_COMPILER_RESOLVER_HPP
