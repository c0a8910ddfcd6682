#include "store.hpp"
#include <algorithm>

namespace nodebook::graph {
#include "macros_open.hpp"

  auto NodeRegistry::find(std::string const& nodeId) const -> RegistryEntry const* {
    auto const it = _entries.find(nodeId);
    return it == _entries.end() ? nullptr : &it->second;
  }

  auto NodeRegistry::record(std::string const& graphId, Node const& node) -> void {
    auto& entry = _entries[node.id];
    entry.name = node.name;
    entry.role = node.role;
    entry.graphs.insert(graphId);
  }

  auto NodeRegistry::forget(std::string const& graphId, std::string const& nodeId) -> void {
    auto const it = _entries.find(nodeId);
    if (it == _entries.end())
      return;
    it->second.graphs.erase(graphId);
    if (it->second.graphs.empty())
      _entries.erase(it);
  }

  template <typename T>
  auto applyTo(std::map<std::string, T>& map, ChangeOp op, T const& value) -> void {
    auto const it = map.find(value.id);
    switch (op) {
      case ChangeOp::create:
        if (it != map.end())
          throw StoreError("cannot create \"" + value.id + "\": already exists");
        map.emplace(value.id, value);
        break;
      case ChangeOp::update:
        if (it == map.end())
          throw StoreError("cannot update \"" + value.id + "\": does not exist");
        it->second = value;
        break;
      case ChangeOp::remove:
        if (it == map.end())
          throw StoreError("cannot delete \"" + value.id + "\": does not exist");
        map.erase(it);
        break;
    }
  }

  auto checkMorphs(Graph const& g, std::string const& id, std::string const& source, std::vector<MorphId> const& morphs)
    -> void {
    auto const it = g.nodes.find(source);
    if (it == g.nodes.end())
      throw StoreError("\"" + id + "\" refers to missing node \"" + source + "\"");
    if (morphs.empty())
      throw StoreError("\"" + id + "\" belongs to no morph");
    for (auto const& m: morphs)
      if (std::ranges::none_of(it->second.morphs, [&](Morph const& x) { return x.id == m; }))
        throw StoreError("\"" + id + "\" refers to missing morph \"" + m.str() + "\"");
  }

  auto applyChanges(Graph& graph, ChangeList const& changes) -> void {
    auto g = graph;
    for (auto const& change: changes) {
      match(
        change.entity,
        [&](Node const& v) { applyTo(g.nodes, change.op, v); },
        [&](Relation const& v) { applyTo(g.relations, change.op, v); },
        [&](Attribute const& v) { applyTo(g.attributes, change.op, v); },
        [&](GraphInfo const& v) {
          if (change.op != ChangeOp::update)
            throw StoreError("graph metadata can only be updated");
          g.description = v.description;
        }
      );
    }
    for (auto const& [id, r]: g.relations) {
      checkMorphs(g, id, r.source, r.morphs);
      if (!g.nodes.contains(r.target))
        throw StoreError("\"" + id + "\" refers to missing node \"" + r.target + "\"");
    }
    for (auto const& [id, a]: g.attributes)
      checkMorphs(g, id, a.source, a.morphs);
    graph = std::move(g);
  }

  auto MemoryStore::loadGraphSnapshot(std::string const& graphId) const -> Graph {
    auto const lock = std::lock_guard(_mutex);
    if (auto const it = _graphs.find(graphId); it != _graphs.end())
      return it->second;
    auto res = Graph();
    res.id = graphId;
    return res;
  }

  auto MemoryStore::applyChangeList(std::string const& graphId, ChangeList const& changes) -> void {
    auto const lock = std::lock_guard(_mutex);
    auto const it = _graphs.find(graphId);
    auto g = it != _graphs.end() ? it->second : Graph{graphId, {}, {}, {}, {}};
    applyChanges(g, changes);
    _graphs.insert_or_assign(graphId, std::move(g));
    for (auto const& change: changes)
      if (auto const node = std::get_if<Node>(&change.entity)) {
        if (change.op == ChangeOp::remove)
          _registry.forget(graphId, node->id);
        else
          _registry.record(graphId, *node);
      }
  }

  auto MemoryStore::registry() const -> NodeRegistry {
    auto const lock = std::lock_guard(_mutex);
    return _registry;
  }

  auto MemoryStore::putGraph(Graph graph) -> void {
    auto const lock = std::lock_guard(_mutex);
    if (auto const it = _graphs.find(graph.id); it != _graphs.end())
      for (auto const& [id, node]: it->second.nodes)
        _registry.forget(graph.id, id);
    for (auto const& [id, node]: graph.nodes)
      _registry.record(graph.id, node);
    auto const key = graph.id;
    _graphs.insert_or_assign(key, std::move(graph));
  }

  auto MemoryStore::graphIds() const -> std::vector<std::string> {
    auto const lock = std::lock_guard(_mutex);
    auto res = std::vector<std::string>();
    for (auto const& [id, g]: _graphs)
      res.push_back(id);
    return res;
  }

#include "macros_close.hpp"
}
