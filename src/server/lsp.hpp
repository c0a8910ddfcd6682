#ifndef NODEBOOK_SERVER_LSP_HPP
#define NODEBOOK_SERVER_LSP_HPP

#include <optional>
#include <string>
#include <vector>
#include <common.hpp>
#include <nlohmann/json_fwd.hpp>

// The subset of LSP 3.16 structures used by the language server.
// See: https://microsoft.github.io/language-server-protocol/specifications/specification-3-16/
namespace nodebook::server::lsp {
#include "macros_open.hpp"

  enum class DiagnosticSeverity : uint32_t { error = 1, warning, information, hint };
  enum class MessageType : uint32_t { error = 1, warning, info, log };

  using DocumentUri = std::string;

  // Zero-based; `character` counts UTF-16 code units.
  struct Position {
    uint32_t line = 0;
    uint32_t character = 0;
  };

  // End-exclusive.
  struct Range {
    Position start;
    Position end;
  };

  struct TextDocumentItem {
    DocumentUri uri;
    std::optional<std::string> languageId;
    std::optional<int32_t> version;
    std::optional<std::string> text;
  };

  struct TextDocumentIdentifier {
    DocumentUri uri;
  };

  // Replaces `range`, or the whole document if `range` is absent.
  struct TextDocumentContentChangeEvent {
    std::optional<Range> range;
    std::string text;
  };

  struct Diagnostic {
    Range range;
    std::string message;
    std::optional<DiagnosticSeverity> severity;
    std::optional<std::string> code;
    std::optional<std::string> source;
  };

  struct PublishDiagnosticsParams {
    DocumentUri uri;
    std::optional<int32_t> version;
    std::vector<Diagnostic> diagnostics;
  };

  void to_json(nlohmann::json& j, Position const& o);
  void from_json(nlohmann::json const& j, Position& o);
  void to_json(nlohmann::json& j, Range const& o);
  void from_json(nlohmann::json const& j, Range& o);
  void from_json(nlohmann::json const& j, TextDocumentItem& o);
  void from_json(nlohmann::json const& j, TextDocumentIdentifier& o);
  void from_json(nlohmann::json const& j, TextDocumentContentChangeEvent& o);
  void to_json(nlohmann::json& j, Diagnostic const& o);
  void to_json(nlohmann::json& j, PublishDiagnosticsParams const& o);

#include "macros_close.hpp"
}

#endif // NODEBOOK_SERVER_LSP_HPP
