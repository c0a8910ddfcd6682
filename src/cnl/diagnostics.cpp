#include "diagnostics.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace nodebook::cnl {
#include "macros_open.hpp"

  using nlohmann::json;

  // Indexed by `ErrorKind`.
  constexpr auto kindNames = std::array<std::string_view, 16>{
    "Syntax",
    "Structural",
    "UnknownNodeType",
    "UnknownRelationType",
    "UnknownAttributeType",
    "UnknownFunctionType",
    "CyclicTypeHierarchy",
    "InvalidSchema",
    "DomainRangeViolation",
    "AttributeOutOfScope",
    "InvalidAttributeValue",
    "UnknownAttributeReference",
    "CircularDerivation",
    "EvaluationError",
    "IdentityConflict",
    "Timeout",
  };

  auto kindName(ErrorKind kind) -> std::string_view {
    auto const i = static_cast<size_t>(kind);
    assert(i < kindNames.size());
    return kindNames[i];
  }

  auto isFatal(ErrorKind kind) -> bool {
    switch (kind) {
      case ErrorKind::cyclicTypeHierarchy:
      case ErrorKind::invalidSchema:
      case ErrorKind::identityConflict:
      case ErrorKind::timeout:
        return true;
      default:
        return false;
    }
  }

  auto Reporter::hasFatal() const -> bool {
    return std::ranges::any_of(_diagnostics, [](Diagnostic const& d) { return isFatal(d.kind); });
  }

  auto Reporter::diagnostics() const -> std::vector<Diagnostic> {
    auto res = _diagnostics;
    std::ranges::stable_sort(res, {}, &Diagnostic::line);
    return res;
  }

  auto Reporter::skipped() const -> std::vector<Skipped> {
    auto res = _skipped;
    std::ranges::stable_sort(res, {}, &Skipped::line);
    return res;
  }

  auto toString(Diagnostic const& d) -> std::string {
    return std::to_string(d.line) + ": " + std::string(kindName(d.kind)) + ": " + d.message;
  }

  void to_json(json& j, ErrorKind const& kind) {
    j = std::string(kindName(kind));
  }

  void from_json(json const& j, ErrorKind& kind) {
    auto const s = j.get<std::string>();
    auto const it = std::ranges::find(kindNames, s);
    if (it == kindNames.end())
      throw std::invalid_argument("unknown error kind \"" + s + "\"");
    kind = static_cast<ErrorKind>(it - kindNames.begin());
  }

  void to_json(json& j, Diagnostic const& d) {
    j = {
      {   "line",    d.line},
      {   "kind",    d.kind},
      {"message", d.message}
    };
  }

  void from_json(json const& j, Diagnostic& d) {
    j.at("line").get_to(d.line);
    j.at("kind").get_to(d.kind);
    j.at("message").get_to(d.message);
  }

  void to_json(json& j, Skipped const& s) {
    j = {
      {       "line",        s.line},
      {"description", s.description}
    };
  }

  void from_json(json const& j, Skipped& s) {
    j.at("line").get_to(s.line);
    j.at("description").get_to(s.description);
  }

#include "macros_close.hpp"
}
