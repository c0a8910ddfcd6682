#include "language_server.hpp"
#include <algorithm>

namespace nodebook::server {
#include "macros_open.hpp"

  using nlohmann::json;
  using lsp::MessageType;

  // `window/showMessage` pops up in the editor, `window/logMessage` goes to its output panel.
  auto notifyClient(JsonRpcServer* srv, std::string const& method, MessageType type, std::string const& text) -> void {
    auto params = json::object();
    params["type"] = static_cast<uint32_t>(type);
    params["message"] = text;
    srv->callNotification(method, params);
  }

  auto showMessage(JsonRpcServer* srv, MessageType type, std::string const& text) -> void {
    notifyClient(srv, "window/showMessage", type, text);
  }

  auto logMessage(JsonRpcServer* srv, MessageType type, std::string const& text) -> void {
    notifyClient(srv, "window/logMessage", type, text);
  }

  auto graphIdFromUri(std::string const& uri) -> std::string {
    auto name = uri.substr(uri.find_last_of("/\\") + 1);
    if (auto const dot = name.rfind('.'); dot != std::string::npos && dot > 0)
      name.resize(dot);
    return name;
  }

  auto toLspDiagnostics(Document const& doc, std::vector<cnl::Diagnostic> const& diagnostics)
    -> std::vector<lsp::Diagnostic> {
    auto res = std::vector<lsp::Diagnostic>();
    for (auto const& d: diagnostics) {
      auto const range = d.line > 0 ? doc.lineRange(std::min(d.line - 1, doc.lineCount() - 1)) : lsp::Range();
      auto severity = lsp::DiagnosticSeverity::error;
      res.push_back({range, d.message, severity, std::string(cnl::kindName(d.kind)), "nodebook"});
    }
    return res;
  }

  auto LanguageServer::attach(JsonRpcServer& srv) -> void {
    srv.addMethod("initialize", [this](JsonRpcServer*, json const& params) { return _initialize(params); });
    srv.addMethod("shutdown", [](JsonRpcServer*, json const&) { return json(); });
    srv.addNotification("initialized", [](JsonRpcServer*, json const&) {});
    srv.addNotification("exit", [this](JsonRpcServer* srv, json const&) { _exit(srv); });
    srv.addNotification("textDocument/didOpen", [this](JsonRpcServer* srv, json const& params) { _didOpen(srv, params); });
    srv.addNotification("textDocument/didChange", [this](JsonRpcServer* srv, json const& params) {
      _didChange(srv, params);
    });
    srv.addNotification("textDocument/didClose", [this](JsonRpcServer* srv, json const& params) {
      _didClose(srv, params);
    });
    srv.addMethod("nodebook/compile", [this](JsonRpcServer* srv, json const& params) { return _compile(srv, params); });
    srv.addMethod("nodebook/snapshot", [this](JsonRpcServer*, json const& params) { return _snapshot(params); });
    srv.addMethod("nodebook/setSchema", [this](JsonRpcServer* srv, json const& params) {
      return _setSchema(srv, params);
    });
  }

  auto LanguageServer::waitForChecks() -> void {
    for (auto& [uri, entry]: _entries)
      if (entry.thread && entry.thread->joinable())
        entry.thread->join();
  }

  auto LanguageServer::_initialize(json const& params) -> json {
    if (params.contains("initializationOptions") && params["initializationOptions"].is_object()) {
      auto const& init = params["initializationOptions"];
      init.get_to(_options);
      if (init.contains("schema"))
        _schemas.publish(schema::loadSchema(init["schema"]));
    }
    // Incremental text synchronisation.
    auto sync = json::object();
    sync["openClose"] = true;
    sync["change"] = 2;
    auto res = json::object();
    res["capabilities"]["textDocumentSync"] = sync;
    res["serverInfo"] = {
      {   "name", "nodebook-server"},
      {"version",           "0.1.0"}
    };
    return res;
  }

  auto LanguageServer::_exit(JsonRpcServer* srv) -> void {
    _entries.clear();
    srv->requestStop();
  }

  auto LanguageServer::_didOpen(JsonRpcServer* srv, json const& params) -> void {
    auto const d = params.at("textDocument").get<lsp::TextDocumentItem>();
    logMessage(srv, MessageType::log, "Opened " + d.uri + (d.version ? " at version " + std::to_string(*d.version) : ""));
    auto& entry = _entries[d.uri];
    entry.thread.reset();
    entry.document = Document(d.text.value_or(""));
    entry.version = d.version;
    _startCheck(srv, d.uri);
  }

  auto LanguageServer::_didChange(JsonRpcServer* srv, json const& params) -> void {
    auto const d = params.at("textDocument").get<lsp::TextDocumentItem>();
    auto& entry = _entries[d.uri];
    entry.thread.reset();
    entry.version = d.version;
    for (auto const& change: params.at("contentChanges").get<std::vector<lsp::TextDocumentContentChangeEvent>>())
      entry.document.apply(change);
    _startCheck(srv, d.uri);
  }

  auto LanguageServer::_didClose(JsonRpcServer* srv, json const& params) -> void {
    auto const d = params.at("textDocument").get<lsp::TextDocumentIdentifier>();
    logMessage(srv, MessageType::log, "Closed " + d.uri);
    _entries.erase(d.uri);
  }

  // Compiles the current text in check-only mode on a separate thread.
  auto LanguageServer::_startCheck(JsonRpcServer* srv, lsp::DocumentUri const& uri) -> void {
    auto& entry = _entries[uri];
    entry.thread.emplace([this, srv, uri, doc = entry.document, version = entry.version, options = _options](
                           std::stop_token stopToken
                         ) {
      auto result = compiler::CompileResult();
      try {
        result = _service.check(graphIdFromUri(uri), doc.text(), options);
      } catch (std::exception& e) {
        logMessage(srv, MessageType::error, "Check failed for " + uri + ": " + e.what());
        return;
      }
      if (stopToken.stop_requested())
        return;
      auto const params = lsp::PublishDiagnosticsParams{uri, version, toLspDiagnostics(doc, result.errors)};
      srv->callNotification("textDocument/publishDiagnostics", params);
    });
  }

  auto LanguageServer::_compile(JsonRpcServer* srv, json const& params) -> json {
    auto text = std::optional<std::string>();
    if (params.contains("text"))
      text = params["text"].get<std::string>();
    auto graphId = params.value("graph", std::string());
    if (params.contains("uri")) {
      auto const uri = params["uri"].get<std::string>();
      if (graphId.empty())
        graphId = graphIdFromUri(uri);
      if (auto const it = _entries.find(uri); !text && it != _entries.end())
        text = it->second.document.text();
    }
    if (graphId.empty() || !text)
      throw JsonRpcException(ErrorCode::invalidParams, "nodebook/compile needs \"graph\" or \"uri\", and \"text\"");

    auto options = _options;
    if (params.contains("options"))
      params["options"].get_to(options);
    auto const result = params.value("dryRun", false) ? _service.check(graphId, *text, options)
                                                      : _service.submit(graphId, *text, options);
    if (result.applied)
      showMessage(srv, MessageType::info, "Graph \"" + graphId + "\": " + std::to_string(result.changes.size()) + " change(s) applied");
    return result;
  }

  auto LanguageServer::_snapshot(json const& params) -> json {
    if (!params.contains("graph"))
      throw JsonRpcException(ErrorCode::invalidParams, "nodebook/snapshot needs \"graph\"");
    return _store.loadGraphSnapshot(params["graph"].get<std::string>());
  }

  auto LanguageServer::_setSchema(JsonRpcServer* srv, json const& params) -> json {
    if (!params.contains("schema"))
      throw JsonRpcException(ErrorCode::invalidParams, "nodebook/setSchema needs \"schema\"");
    auto s = schema::Schema();
    try {
      s = schema::loadSchema(params["schema"]);
    } catch (schema::SchemaError& e) {
      throw JsonRpcException(ErrorCode::invalidParams, e.what());
    }
    auto reporter = cnl::Reporter();
    s.validate(reporter);
    auto const ok = !reporter.hasFatal();
    if (ok) {
      _schemas.publish(std::move(s));
      logMessage(srv, MessageType::info, "Schema updated");
    }
    return {
      {    "ok",                     ok},
      {"errors", reporter.diagnostics()}
    };
  }

#include "macros_close.hpp"
}
