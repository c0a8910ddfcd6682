#include "resolver.hpp"
#include <algorithm>

namespace nodebook::compiler {
#include "macros_open.hpp"

  using cnl::ErrorKind;
  using graph::MorphId;

  auto quoted(std::string const& s) -> std::string {
    return "\"" + s + "\"";
  }

  auto joined(auto const& names, std::string const& sep) -> std::string {
    auto res = std::string();
    for (auto const& name: names) {
      if (!res.empty())
        res += sep;
      res += name;
    }
    return res.empty() ? "(none)" : res;
  }

  auto intersects(std::set<std::string> const& ancestry, std::vector<std::string> const& types) -> bool {
    return std::ranges::any_of(types, [&](std::string const& t) { return ancestry.contains(t); });
  }

  auto referenceMatches(std::string const& name, std::string const& reference) -> bool {
    return name == reference || graph::normalize(name) == graph::normalize(reference);
  }

  auto Resolver::operator()(cnl::Document const& document) -> ResolvedGraph {
    _res = {};
    _res.description = document.description;
    // Nodes first, so that relation targets resolve regardless of declaration order.
    for (auto const& decl: document.nodes)
      _node(decl);
    for (auto const& decl: document.nodes) {
      auto const it = _res.nodes.find(graph::nodeId(decl.baseName));
      if (it == _res.nodes.end() || !it->second.declared)
        continue;
      // Copy: implicit targets may be inserted into `_res.nodes` meanwhile.
      auto const source = it->second;
      for (auto const& r: decl.relations)
        _relation(source, r);
      for (auto const& a: decl.attributes)
        _attribute(source, a);
      for (auto const& f: decl.functions)
        _function(source, f);
    }
    _carryUntouched();
    _checkReferences();
    _materialiseSymmetric();
    return std::move(_res);
  }

  auto Resolver::_roleAncestry(std::string const& role) const -> std::set<std::string> {
    if (_schema.nodeType(role))
      return _schema.ancestry(role);
    return {};
  }

  auto Resolver::_node(cnl::NodeDecl const& decl) -> void {
    auto const id = graph::nodeId(decl.baseName);
    auto ancestry = std::set<std::string>();
    auto ok = true;
    for (auto const& type: decl.types) {
      if (!_schema.nodeType(type)) {
        _reporter.error(decl.line, ErrorKind::unknownNodeType, "unknown node type " + quoted(type) + " for " + quoted(decl.baseName));
        ok = false;
        continue;
      }
      ancestry.merge(_schema.ancestry(type));
    }
    if (!ok) {
      _reporter.skip(decl.line, "node " + quoted(decl.baseName));
      _res.skippedNodes.insert(id);
      return;
    }

    auto const role = decl.types.empty() ? _options.defaultRole : decl.types.front();
    if (decl.types.empty())
      ancestry = _roleAncestry(role);

    auto node = graph::Node();
    node.id = id;
    node.baseName = decl.baseName;
    node.name = graph::displayName(decl.baseName, decl.adjective, decl.quantifier);
    node.adjective = decl.adjective;
    node.quantifier = decl.quantifier;
    node.role = role;
    node.types = decl.types;
    node.parentTypes.assign(ancestry.begin(), ancestry.end());
    node.description = decl.description.value_or("");

    auto touched = std::set<MorphId>();
    auto const basic = graph::morphId(id, graph::defaultMorphName);
    node.morphs.push_back({basic, std::string(graph::defaultMorphName)});
    touched.insert(basic);
    for (auto const& m: decl.morphs) {
      auto const mid = graph::morphId(id, m.name);
      if (touched.insert(mid).second)
        node.morphs.push_back({mid, m.name});
    }

    _res.nodes.insert_or_assign(id, ResolvedNode{std::move(node), std::move(ancestry), decl.line, true, std::move(touched)});
  }

  auto Resolver::_target(cnl::RelationDecl const& decl) -> std::optional<Target> {
    auto const id = graph::nodeId(decl.target);

    // Declared in this submission (or already created as an implicit target).
    if (auto const it = _res.nodes.find(id); it != _res.nodes.end())
      return Target{id, it->second.node.name, it->second.ancestry};

    // Present in the stored graph.
    if (auto const it = _prior.nodes.find(id); it != _prior.nodes.end()) {
      auto const& node = it->second;
      auto ancestry = std::set<std::string>();
      for (auto const& type: node.types)
        if (_schema.nodeType(type))
          ancestry.merge(_schema.ancestry(type));
      if (node.types.empty())
        ancestry = _roleAncestry(node.role);
      return Target{id, node.name, std::move(ancestry)};
    }

    // Known elsewhere, or created on demand.
    auto const entry = _registry.find(id);
    if (!entry && _options.implicitTargets == ImplicitTargets::reject) {
      _reporter.error(decl.line, ErrorKind::unknownNodeType, "relation target " + quoted(decl.target) + " does not name a declared node");
      return std::nullopt;
    }
    auto const role = entry ? entry->role : _options.defaultRole;
    auto ancestry = _roleAncestry(role);
    auto node = graph::Node();
    node.id = id;
    node.baseName = decl.target;
    node.name = graph::displayName(decl.target, decl.adjective, std::nullopt);
    node.adjective = decl.adjective;
    node.role = role;
    node.parentTypes.assign(ancestry.begin(), ancestry.end());
    node.morphs.push_back({graph::morphId(id, graph::defaultMorphName), std::string(graph::defaultMorphName)});
    auto res = Target{id, node.name, ancestry};
    _res.nodes.emplace(id, ResolvedNode{std::move(node), std::move(ancestry), 0, false, {}});
    return res;
  }

  auto Resolver::_relation(ResolvedNode const& source, cnl::RelationDecl const& decl) -> void {
    auto const what = "relation " + quoted(decl.name);
    auto const id = graph::relationId(source.node.id, decl.name, graph::nodeId(decl.target));
    auto const skip = [&](std::string const& description) {
      _reporter.skip(decl.line, description);
      _res.skippedEntities.insert(id);
    };
    auto const type = _schema.relationType(decl.name);
    if (!type) {
      _reporter.error(decl.line, ErrorKind::unknownRelationType, "unknown relation type " + quoted(decl.name));
      skip(what);
      return;
    }
    if (_res.skippedNodes.contains(graph::nodeId(decl.target))) {
      skip(what + " to skipped node " + quoted(decl.target));
      return;
    }
    auto const target = _target(decl);
    if (!target) {
      skip(what);
      return;
    }

    auto ok = true;
    if (!type->domain.empty() && !intersects(source.ancestry, type->domain)) {
      _reporter.error(
        decl.line,
        ErrorKind::domainRangeViolation,
        what + " expects a source of type " + joined(type->domain, " or ") + ", but " + quoted(source.node.name) + " is "
          + joined(source.ancestry, ", ")
      );
      ok = false;
    }
    if (!type->range.empty() && !intersects(target->ancestry, type->range)) {
      _reporter.error(
        decl.line,
        ErrorKind::domainRangeViolation,
        what + " expects a target of type " + joined(type->range, " or ") + ", but " + quoted(target->name) + " is "
          + joined(target->ancestry, ", ")
      );
      ok = false;
    }
    if (!ok) {
      skip(what);
      return;
    }

    auto r = graph::Relation();
    r.id = id;
    r.source = source.node.id;
    r.target = target->id;
    r.name = decl.name;
    r.adverb = decl.adverb;
    r.modality = decl.modality;
    r.morphs.push_back(graph::morphId(source.node.id, decl.morph));
    _res.relations.push_back({std::move(r), decl.line, false});
  }

  auto Resolver::_attribute(ResolvedNode const& source, cnl::AttributeDecl const& decl) -> void {
    auto const what = "attribute " + quoted(decl.name);
    auto const id = graph::attributeId(source.node.id, decl.name, decl.value);
    auto const skip = [&] {
      _reporter.skip(decl.line, what);
      _res.skippedEntities.insert(id);
    };
    auto const type = _schema.attributeType(decl.name);
    if (!type) {
      _reporter.error(decl.line, ErrorKind::unknownAttributeType, "unknown attribute type " + quoted(decl.name));
      skip();
      return;
    }
    if (!type->scope.empty() && !intersects(source.ancestry, type->scope)) {
      _reporter.error(
        decl.line,
        ErrorKind::attributeOutOfScope,
        what + " applies to " + joined(type->scope, " or ") + ", but " + quoted(source.node.name) + " is "
          + joined(source.ancestry, ", ")
      );
      skip();
      return;
    }
    auto value = schema::parseValue(type->valueType, decl.value);
    if (!value) {
      auto const outOfRange = type->valueType == schema::ValueType::integer && schema::isIntegerLiteral(decl.value);
      _reporter.error(
        decl.line,
        ErrorKind::invalidAttributeValue,
        "value " + quoted(decl.value) + " of " + what
          + (outOfRange ? " is outside the 64-bit integer range"
                        : " is not a valid " + std::string(schema::valueTypeName(type->valueType)))
      );
      skip();
      return;
    }

    auto a = graph::Attribute();
    a.id = id;
    a.source = source.node.id;
    a.name = decl.name;
    a.value = decl.value;
    a.unit = decl.unit ? decl.unit : type->unit;
    a.modality = decl.modality;
    a.quantifier = decl.quantifier;
    a.morphs.push_back(graph::morphId(source.node.id, decl.morph));
    _res.attributes.push_back({std::move(a), std::move(*value), decl.line});
  }

  auto Resolver::_function(ResolvedNode const& source, cnl::FunctionDecl const& decl) -> void {
    auto const what = "function " + quoted(decl.name);
    auto const morph = graph::morphId(source.node.id, decl.morph);
    auto const skip = [&] {
      _reporter.skip(decl.line, what);
      _res.skippedEntities.insert(graph::derivedAttributeId(morph, decl.name));
    };
    auto const type = _schema.functionType(decl.name);
    if (!type) {
      _reporter.error(decl.line, ErrorKind::unknownFunctionType, "unknown function type " + quoted(decl.name));
      skip();
      return;
    }
    if (!type->scope.empty() && !intersects(source.ancestry, type->scope)) {
      _reporter.error(
        decl.line,
        ErrorKind::attributeOutOfScope,
        what + " applies to " + joined(type->scope, " or ") + ", but " + quoted(source.node.name) + " is "
          + joined(source.ancestry, ", ")
      );
      skip();
      return;
    }
    auto& expression = _expressions[type->name];
    if (!expression) {
      try {
        expression = std::make_shared<expr::Expression const>(expr::Expression::parse(type->expression));
      } catch (expr::ParseError& e) {
        _expressions.erase(type->name);
        _reporter.error(decl.line, ErrorKind::syntax, "cannot parse the expression of " + what + ": " + e.what());
        skip();
        return;
      }
    }
    for (auto const& f: _res.functions)
      if (f.nodeId == source.node.id && f.morph == morph && f.name == decl.name)
        return;
    _res.functions.push_back({source.node.id, morph, decl.name, expression, decl.line});
  }

  // Functions applied under morphs that a declared node leaves alone may still depend on its default morph.
  // They are re-evaluated from their stored expressions, with the stored literals of their own morph as inputs.
  auto Resolver::_carryUntouched() -> void {
    for (auto const& [id, n]: _res.nodes) {
      if (!n.declared || !_prior.nodes.contains(id))
        continue;
      for (auto const& [_, a]: _prior.attributes) {
        if (a.source != id)
          continue;
        auto morphs = a.morphs;
        std::erase_if(morphs, [&](MorphId const& m) { return n.touched.contains(m); });
        if (morphs.empty())
          continue;
        if (a.derived) {
          if (!a.expression)
            continue;
          auto expression = std::shared_ptr<expr::Expression const>();
          try {
            expression = std::make_shared<expr::Expression const>(expr::Expression::parse(*a.expression));
          } catch (expr::ParseError&) {
            // Left as stored.
            continue;
          }
          for (auto const& m: morphs)
            _res.functions.push_back({id, m, a.name, expression, n.line});
          continue;
        }
        auto const type = _schema.attributeType(a.name);
        auto value = type ? schema::parseValue(type->valueType, a.value) : std::nullopt;
        auto carried = a;
        carried.morphs = std::move(morphs);
        _res.carried.push_back({std::move(carried), value ? std::move(*value) : schema::Value(a.value), n.line});
      }
    }
  }

  // Every name in an expression must denote an attribute or function of the same node,
  // in the same morph or in the default morph.
  auto Resolver::_checkReferences() -> void {
    auto const visible = [&](ResolvedFunction const& f, std::string const& ref) {
      auto const basic = graph::morphId(f.nodeId, graph::defaultMorphName);
      auto const inScope = [&](std::vector<MorphId> const& morphs) {
        return std::ranges::any_of(morphs, [&](MorphId const& m) { return m == f.morph || m == basic; });
      };
      for (auto const* as: {&_res.attributes, &_res.carried})
        for (auto const& a: *as)
          if (a.attribute.source == f.nodeId && inScope(a.attribute.morphs) && referenceMatches(a.attribute.name, ref))
            return true;
      for (auto const& g: _res.functions)
        if (g.nodeId == f.nodeId && (g.morph == f.morph || g.morph == basic) && referenceMatches(g.name, ref))
          return true;
      return false;
    };

    // All functions stay visible until every one has been checked.
    auto ok = std::vector<bool>(_res.functions.size(), true);
    for (auto i = 0uz; i < _res.functions.size(); i++) {
      auto const& f = _res.functions[i];
      for (auto const& ref: f.expression->references())
        if (!visible(f, ref)) {
          _reporter.error(
            f.line,
            ErrorKind::unknownAttributeReference,
            "function " + quoted(f.name) + " refers to " + quoted(ref) + ", which " + quoted(_res.nodes.at(f.nodeId).node.name)
              + " does not have"
          );
          ok[i] = false;
        }
      if (!ok[i]) {
        _reporter.skip(f.line, "function " + quoted(f.name));
        _res.skippedEntities.insert(graph::derivedAttributeId(f.morph, f.name));
      }
    }
    auto kept = std::vector<ResolvedFunction>();
    for (auto i = 0uz; i < _res.functions.size(); i++)
      if (ok[i])
        kept.push_back(std::move(_res.functions[i]));
    _res.functions = std::move(kept);
  }

  auto Resolver::_materialiseSymmetric() -> void {
    auto const count = _res.relations.size();
    for (auto i = 0uz; i < count; i++) {
      auto const r = _res.relations[i].relation;
      auto const type = _schema.relationType(r.name);
      if (!type || !type->symmetric)
        continue;
      auto const present = std::ranges::any_of(_res.relations, [&](ResolvedRelation const& x) {
        return x.relation.source == r.target && x.relation.target == r.source && x.relation.name == r.name;
      });
      if (present)
        continue;
      auto inverse = graph::Relation();
      inverse.id = graph::relationId(r.target, r.name, r.source);
      inverse.source = r.target;
      inverse.target = r.source;
      inverse.name = r.name;
      inverse.morphs.push_back(graph::morphId(r.target, graph::defaultMorphName));
      _res.relations.push_back({std::move(inverse), _res.relations[i].line, true});
    }
  }

#include "macros_close.hpp"
}
