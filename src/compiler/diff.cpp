#include "diff.hpp"
#include <algorithm>

namespace nodebook::compiler {
#include "macros_open.hpp"

  using cnl::ErrorKind;
  using graph::ChangeOp, graph::MorphId;

  namespace {

    // Fields other than membership, for conflict detection.
    auto sameFields(graph::Relation const& l, graph::Relation const& r) -> bool {
      return l.source == r.source && l.target == r.target && l.name == r.name && l.adverb == r.adverb
          && l.modality == r.modality;
    }
    auto sameFields(graph::Attribute const& l, graph::Attribute const& r) -> bool {
      return l.source == r.source && l.name == r.name && l.value == r.value && l.unit == r.unit
          && l.modality == r.modality && l.quantifier == r.quantifier && l.derived == r.derived
          && l.expression == r.expression;
    }

    auto addMorph(std::vector<MorphId>& morphs, MorphId const& m) -> void {
      if (std::ranges::find(morphs, m) == morphs.end())
        morphs.push_back(m);
    }

    // Drops membership in touched morphs.
    template <typename T>
    auto untouched(std::map<std::string, T> const& prior, std::set<MorphId> const& touched) -> std::map<std::string, T> {
      auto res = prior;
      for (auto& [_, e]: res)
        std::erase_if(e.morphs, [&](MorphId const& m) { return touched.contains(m); });
      return res;
    }

    // Restates one declaration of an entity within its morph.
    template <typename T>
    auto restate(
      std::map<std::string, T>& entities,
      std::map<std::string, size_t>& seen,
      T const& decl,
      size_t line,
      cnl::Reporter& reporter
    ) -> void {
      auto const [it, created] = entities.try_emplace(decl.id, decl);
      auto& e = it->second;
      if (created)
        e.morphs.clear();
      else if (auto const s = seen.find(decl.id); s != seen.end() && !sameFields(e, decl)) {
        reporter.error(
          line,
          ErrorKind::identityConflict,
          "\"" + decl.id + "\" contradicts its declaration on line " + std::to_string(s->second)
        );
        return;
      } else {
        // Fields follow the submission; membership outside touched morphs is kept.
        auto morphs = std::move(e.morphs);
        e = decl;
        e.morphs = std::move(morphs);
      }
      seen.try_emplace(decl.id, line);
      for (auto const& m: decl.morphs)
        addMorph(e.morphs, m);
    }

    template <typename T>
    auto retain(std::map<std::string, T>& entities, std::map<std::string, T> const& prior, std::set<std::string> const& ids)
      -> void {
      for (auto const& id: ids)
        if (auto const it = prior.find(id); it != prior.end())
          entities.insert_or_assign(id, it->second);
    }

    template <typename T>
    auto prune(std::map<std::string, T>& entities) -> void {
      std::erase_if(entities, [](auto const& p) { return p.second.morphs.empty(); });
      for (auto& [_, e]: entities)
        std::ranges::sort(e.morphs);
    }

    template <typename T>
    auto emitRemoved(graph::ChangeList& res, std::map<std::string, T> const& prior, std::map<std::string, T> const& next)
      -> void {
      for (auto const& [id, e]: prior)
        if (!next.contains(id))
          res.push_back({ChangeOp::remove, e});
    }

    template <typename T>
    auto emitUpdated(graph::ChangeList& res, std::map<std::string, T> const& prior, std::map<std::string, T> const& next)
      -> void {
      for (auto const& [id, e]: next)
        if (auto const it = prior.find(id); it != prior.end() && it->second != e)
          res.push_back({ChangeOp::update, e});
    }

    template <typename T>
    auto emitCreated(graph::ChangeList& res, std::map<std::string, T> const& prior, std::map<std::string, T> const& next)
      -> void {
      for (auto const& [id, e]: next)
        if (!prior.contains(id))
          res.push_back({ChangeOp::create, e});
    }

  }

  auto diff(
    graph::Graph const& prior,
    ResolvedGraph const& resolved,
    Evaluation const& evaluation,
    CompileOptions const& options,
    cnl::Reporter& reporter
  ) -> graph::ChangeList {
    auto touched = std::set<MorphId>();
    for (auto const& [_, n]: resolved.nodes)
      if (n.declared)
        touched.insert(n.touched.begin(), n.touched.end());

    // Nodes.
    auto nodes = prior.nodes;
    auto recreated = std::set<std::string>();
    for (auto const& [id, n]: resolved.nodes) {
      auto const it = prior.nodes.find(id);
      if (it == prior.nodes.end()) {
        nodes.emplace(id, n.node);
        continue;
      }
      if (!n.declared)
        continue;
      auto next = n.node;
      for (auto const& m: it->second.morphs)
        if (std::ranges::none_of(next.morphs, [&](graph::Morph const& x) { return x.id == m.id; }))
          next.morphs.push_back(m);
      if (next.role != it->second.role)
        recreated.insert(id);
      nodes.insert_or_assign(id, std::move(next));
    }

    // Relations and attributes.
    auto relations = untouched(prior.relations, touched);
    auto attributes = untouched(prior.attributes, touched);
    retain(relations, prior.relations, resolved.skippedEntities);
    retain(attributes, prior.attributes, resolved.skippedEntities);
    retain(attributes, prior.attributes, evaluation.failed);
    auto seen = std::map<std::string, size_t>();
    for (auto const& r: resolved.relations)
      restate(relations, seen, r.relation, r.line, reporter);
    for (auto const& a: resolved.attributes)
      restate(attributes, seen, a.attribute, a.line, reporter);
    for (auto const& a: evaluation.derived)
      restate(attributes, seen, a, 0uz, reporter);
    prune(relations);
    prune(attributes);

    // Whole-document submissions delete the nodes they no longer mention,
    // except for those still targeted by a surviving relation.
    if (!options.partial) {
      auto deleted = std::set<std::string>();
      for (auto const& [id, _]: prior.nodes)
        if (!resolved.nodes.contains(id) && !resolved.skippedNodes.contains(id))
          deleted.insert(id);
      for (auto changed = true; changed;) {
        changed = false;
        for (auto const& [_, r]: relations)
          if (!deleted.contains(r.source) && deleted.erase(r.target) > 0)
            changed = true;
      }
      for (auto const& id: deleted)
        nodes.erase(id);
      std::erase_if(relations, [&](auto const& p) {
        return deleted.contains(p.second.source) || deleted.contains(p.second.target);
      });
      std::erase_if(attributes, [&](auto const& p) { return deleted.contains(p.second.source); });
    }

    auto description = prior.description;
    if (!options.partial)
      description = resolved.description.value_or("");
    else if (resolved.description)
      description = *resolved.description;

    auto res = graph::ChangeList();
    emitRemoved(res, prior.attributes, attributes);
    emitRemoved(res, prior.relations, relations);
    emitRemoved(res, prior.nodes, nodes);
    for (auto const& id: recreated)
      res.push_back({ChangeOp::remove, prior.nodes.at(id)});

    if (description != prior.description)
      res.push_back({ChangeOp::update, graph::GraphInfo{prior.id, description}});
    for (auto const& [id, n]: nodes)
      if (auto const it = prior.nodes.find(id); it != prior.nodes.end() && it->second != n && !recreated.contains(id))
        res.push_back({ChangeOp::update, n});
    emitUpdated(res, prior.relations, relations);
    emitUpdated(res, prior.attributes, attributes);

    for (auto const& [id, n]: nodes)
      if (!prior.nodes.contains(id) || recreated.contains(id))
        res.push_back({ChangeOp::create, n});
    emitCreated(res, prior.relations, relations);
    emitCreated(res, prior.attributes, attributes);
    return res;
  }

#include "macros_close.hpp"
}
