#ifndef NODEBOOK_GRAPH_STORE_HPP
#define NODEBOOK_GRAPH_STORE_HPP

#include <mutex>
#include <set>
#include <stdexcept>
#include "graph.hpp"

namespace nodebook::graph {
#include "macros_open.hpp"

  struct StoreError: std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  struct RegistryEntry {
    std::string name;
    std::string role;
    std::set<std::string> graphs;

    auto operator==(RegistryEntry const&) const -> bool = default;
  };

  // Which graphs each node ID appears in.
  class NodeRegistry {
  public:
    auto find(std::string const& nodeId) const -> RegistryEntry const*;
    auto record(std::string const& graphId, Node const& node) -> void;
    auto forget(std::string const& graphId, std::string const& nodeId) -> void;
    auto size() const -> size_t { return _entries.size(); }

  private:
    std::map<std::string, RegistryEntry> _entries;
  };

  // Applies `changes` in order, then checks that every relation and attribute refers to existing nodes and morphs.
  // Throws `StoreError` and leaves `graph` unmodified if any change does not fit.
  auto applyChanges(Graph& graph, ChangeList const& changes) -> void;

  // The persistence boundary of the compiler.
  class IGraphStore {
    interface(IGraphStore);
  public:
    // Returns an empty graph for unknown IDs.
    virtual auto loadGraphSnapshot(std::string const& graphId) const -> Graph required;
    // All or nothing.
    virtual auto applyChangeList(std::string const& graphId, ChangeList const& changes) -> void required;
    // A copy of the cross-graph registry.
    virtual auto registry() const -> NodeRegistry required;
  };

  class MemoryStore: public IGraphStore {
  public:
    auto loadGraphSnapshot(std::string const& graphId) const -> Graph override;
    auto applyChangeList(std::string const& graphId, ChangeList const& changes) -> void override;
    auto registry() const -> NodeRegistry override;

    // Replaces a whole graph (e.g. one loaded from disk).
    auto putGraph(Graph graph) -> void;
    auto graphIds() const -> std::vector<std::string>;

  private:
    mutable std::mutex _mutex;
    std::map<std::string, Graph> _graphs;
    NodeRegistry _registry;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_GRAPH_STORE_HPP
