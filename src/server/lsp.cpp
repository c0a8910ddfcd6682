#include "lsp.hpp"
#include <nlohmann/json.hpp>

namespace nodebook::server::lsp {
#include "macros_open.hpp"

  using nlohmann::json;

  // clang-format off
#define TO(key, name) j[key] = o.name
#define OPT_TO(key, name) if (o.name) j[key] = *o.name
#define FROM(key, name) j.at(key).get_to(o.name)
#define OPT_FROM(key, name) o.name = j.contains(key) && !j[key].is_null() ? std::make_optional(j[key].get<decltype(o.name)::value_type>()) : std::nullopt

  void to_json  (json& j, Position const& o) { j = {}; TO("line", line); TO("character", character); }
  void from_json(json const& j, Position& o) { o = {}; FROM("line", line); FROM("character", character); }
  void to_json  (json& j, Range const& o) { j = {}; TO("start", start); TO("end", end); }
  void from_json(json const& j, Range& o) { o = {}; FROM("start", start); FROM("end", end); }

  void from_json(json const& j, TextDocumentItem& o) {
    o = {}; FROM("uri", uri); OPT_FROM("languageId", languageId); OPT_FROM("version", version); OPT_FROM("text", text);
  }
  void from_json(json const& j, TextDocumentIdentifier& o) { o = {}; FROM("uri", uri); }
  void from_json(json const& j, TextDocumentContentChangeEvent& o) { o = {}; OPT_FROM("range", range); FROM("text", text); }

  void to_json(json& j, Diagnostic const& o) {
    j = {}; TO("range", range); TO("message", message); OPT_TO("code", code); OPT_TO("source", source);
    if (o.severity) j["severity"] = static_cast<uint32_t>(*o.severity);
  }
  void to_json(json& j, PublishDiagnosticsParams const& o) {
    j = {}; TO("uri", uri); OPT_TO("version", version); TO("diagnostics", diagnostics);
  }
  // clang-format on

#undef TO
#undef OPT_TO
#undef FROM
#undef OPT_FROM

#include "macros_close.hpp"
}
