#ifndef NODEBOOK_COMPILER_COMPILER_HPP
#define NODEBOOK_COMPILER_COMPILER_HPP

#include <string>
#include <vector>
#include <cnl/diagnostics.hpp>
#include <graph/store.hpp>
#include <nlohmann/json_fwd.hpp>
#include <schema/schema.hpp>
#include "options.hpp"

namespace nodebook::compiler {
#include "macros_open.hpp"

  struct CompileResult {
    bool ok = false;      // Whether `changes` may be applied.
    bool applied = false; // Set by `CompileService` once the store accepted `changes`.
    std::vector<cnl::Diagnostic> errors;
    std::vector<cnl::Skipped> skipped;
    graph::ChangeList changes; // Empty unless `ok`.
    std::vector<graph::Attribute> derived;
    std::vector<std::string> recomputed;

    auto operator==(CompileResult const&) const -> bool = default;
  };

  // Compiles CNL `text` against a schema snapshot into changes to `prior`.
  // Pure: touches neither the store nor any shared state.
  auto compile(
    std::string const& text,
    schema::Schema const& schema,
    graph::Graph const& prior,
    graph::NodeRegistry const& registry,
    CompileOptions const& options
  ) -> CompileResult;

  void to_json(nlohmann::json& j, CompileResult const& o);
  void from_json(nlohmann::json const& j, CompileResult& o);

#include "macros_close.hpp"
}

#endif // NODEBOOK_COMPILER_COMPILER_HPP
