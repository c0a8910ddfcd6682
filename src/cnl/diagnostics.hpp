#ifndef NODEBOOK_CNL_DIAGNOSTICS_HPP
#define NODEBOOK_CNL_DIAGNOSTICS_HPP

#include <string>
#include <string_view>
#include <vector>
#include <common.hpp>
#include <nlohmann/json_fwd.hpp>

namespace nodebook::cnl {
#include "macros_open.hpp"

  enum class ErrorKind : uint32_t {
    syntax,
    structural,
    unknownNodeType,
    unknownRelationType,
    unknownAttributeType,
    unknownFunctionType,
    cyclicTypeHierarchy,
    invalidSchema,
    domainRangeViolation,
    attributeOutOfScope,
    invalidAttributeValue,
    unknownAttributeReference,
    circularDerivation,
    evaluationError,
    identityConflict,
    timeout
  };

  // Display name, e.g. "UnknownNodeType".
  auto kindName(ErrorKind kind) -> std::string_view;

  // Fatal kinds abort compilation in every mode.
  auto isFatal(ErrorKind kind) -> bool;

  // Line numbers start from 1. Line 0 refers to the schema rather than the submitted text.
  struct Diagnostic {
    size_t line;
    std::string message;
    ErrorKind kind;

    auto operator==(Diagnostic const&) const -> bool = default;
  };

  // A declaration left out of the result in lenient mode.
  struct Skipped {
    size_t line;
    std::string description;

    auto operator==(Skipped const&) const -> bool = default;
  };

  // Collects diagnostics over one compilation.
  class Reporter {
  public:
    auto error(size_t line, ErrorKind kind, std::string message) -> void {
      _diagnostics.push_back({line, std::move(message), kind});
    }
    auto skip(size_t line, std::string description) -> void {
      _skipped.push_back({line, std::move(description)});
    }

    auto empty() const -> bool { return _diagnostics.empty(); }
    auto hasFatal() const -> bool;
    auto count() const -> size_t { return _diagnostics.size(); }

    // Both lists are returned in line order; entries on the same line keep their reporting order.
    auto diagnostics() const -> std::vector<Diagnostic>;
    auto skipped() const -> std::vector<Skipped>;

  private:
    std::vector<Diagnostic> _diagnostics;
    std::vector<Skipped> _skipped;
  };

  // Formats as `<line>: <Kind>: <message>`.
  auto toString(Diagnostic const& d) -> std::string;

  void to_json(nlohmann::json& j, ErrorKind const& kind);
  void from_json(nlohmann::json const& j, ErrorKind& kind);
  void to_json(nlohmann::json& j, Diagnostic const& d);
  void from_json(nlohmann::json const& j, Diagnostic& d);
  void to_json(nlohmann::json& j, Skipped const& s);
  void from_json(nlohmann::json const& j, Skipped& s);

#include "macros_close.hpp"
}

#endif // NODEBOOK_CNL_DIAGNOSTICS_HPP
