#ifndef NODEBOOK_SERVER_LANGUAGE_SERVER_HPP
#define NODEBOOK_SERVER_LANGUAGE_SERVER_HPP

#include <optional>
#include <thread>
#include <unordered_map>
#include <cnl/diagnostics.hpp>
#include <compiler/service.hpp>
#include "document.hpp"
#include "json_rpc_server.hpp"
#include "lsp.hpp"

namespace nodebook::server {
#include "macros_open.hpp"

  // `file:///notes/chemistry.cnl` -> `chemistry`.
  auto graphIdFromUri(std::string const& uri) -> std::string;

  // Converts 1-based compiler lines to whole-line LSP ranges. Line 0 (schema problems) maps to the start of the document.
  auto toLspDiagnostics(Document const& doc, std::vector<cnl::Diagnostic> const& diagnostics) -> std::vector<lsp::Diagnostic>;

  // LSP and `nodebook/*` handlers over one store.
  class LanguageServer {
  public:
    LanguageServer(graph::IGraphStore& store, schema::SchemaRegistry& schemas, compiler::CompileOptions options = {}):
        _store(store),
        _schemas(schemas),
        _service(store, schemas),
        _options(std::move(options)) {}

    // Registers all handlers with `srv`, which must outlive any check started through it.
    auto attach(JsonRpcServer& srv) -> void;

    // Blocks until all background checks have published their diagnostics.
    auto waitForChecks() -> void;

    auto options() const -> compiler::CompileOptions const& { return _options; }

  private:
    struct Entry {
      Document document;
      std::optional<int32_t> version;
      std::optional<std::jthread> thread;
    };

    graph::IGraphStore& _store;
    schema::SchemaRegistry& _schemas;
    compiler::CompileService _service;
    compiler::CompileOptions _options;
    // Accessed from the listener thread only; checks work on copies.
    std::unordered_map<lsp::DocumentUri, Entry> _entries;

    auto _initialize(nlohmann::json const& params) -> nlohmann::json;
    auto _exit(JsonRpcServer* srv) -> void;
    auto _didOpen(JsonRpcServer* srv, nlohmann::json const& params) -> void;
    auto _didChange(JsonRpcServer* srv, nlohmann::json const& params) -> void;
    auto _didClose(JsonRpcServer* srv, nlohmann::json const& params) -> void;
    auto _compile(JsonRpcServer* srv, nlohmann::json const& params) -> nlohmann::json;
    auto _snapshot(nlohmann::json const& params) -> nlohmann::json;
    auto _setSchema(JsonRpcServer* srv, nlohmann::json const& params) -> nlohmann::json;
    auto _startCheck(JsonRpcServer* srv, lsp::DocumentUri const& uri) -> void;
  };

#include "macros_close.hpp"
}

#endif // NODEBOOK_SERVER_LANGUAGE_SERVER_HPP
