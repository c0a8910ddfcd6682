#ifndef NODEBOOK_COMPILER_SERVICE_HPP
#define NODEBOOK_COMPILER_SERVICE_HPP

#include <map>
#include <mutex>
#include <string>
#include <graph/store.hpp>
#include <schema/schema.hpp>
#include "compiler.hpp"

namespace nodebook::compiler {
#include "macros_open.hpp"

  // One mutex per graph ID, created on first use.
  class GraphLocks {
  public:
    auto acquire(std::string const& graphId) -> std::unique_lock<std::mutex>;

  private:
    std::mutex _mutex;
    std::map<std::string, std::mutex> _locks; // Nodes of `std::map` never move.
  };

  // Serialises compilations per graph, and applies their results to a store.
  class CompileService {
  public:
    CompileService(graph::IGraphStore& store, schema::SchemaRegistry const& schemas):
        _store(store),
        _schemas(schemas) {}

    // Compiles against the current snapshot and applies the result if it compiled.
    // Throws `graph::StoreError` if the store rejects the changes.
    auto submit(std::string const& graphId, std::string const& text, CompileOptions const& options) -> CompileResult;

    // Compiles without applying.
    auto check(std::string const& graphId, std::string const& text, CompileOptions const& options) -> CompileResult;

  private:
    graph::IGraphStore& _store;
    schema::SchemaRegistry const& _schemas;
    GraphLocks _locks;

    auto _run(std::string const& graphId, std::string const& text, CompileOptions const& options) -> CompileResult;
  };

  // Runs `compile()` on a separate thread, giving up after `options.timeoutMs` (if nonzero).
  // A compilation that times out keeps running detached; its result is discarded.
  auto compileWithTimeout(
    std::string const& text,
    std::shared_ptr<schema::Schema const> schema,
    graph::Graph prior,
    graph::NodeRegistry registry,
    CompileOptions const& options
  ) -> CompileResult;

#include "macros_close.hpp"
}

#endif // NODEBOOK_COMPILER_SERVICE_HPP
