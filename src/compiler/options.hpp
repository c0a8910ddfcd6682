#ifndef NODEBOOK_COMPILER_OPTIONS_HPP
#define NODEBOOK_COMPILER_OPTIONS_HPP

#include <string>
#include <graph/graph.hpp>
#include <nlohmann/json_fwd.hpp>

namespace nodebook::compiler {
#include "macros_open.hpp"

  // What to do with relation targets that no submitted heading declares.
  enum class ImplicitTargets : uint32_t {
    create, // Add them as nodes of the default role (or the role the registry knows).
    reject  // Report them as unknown.
  };

  struct CompileOptions {
    bool strict = true;   // Any error aborts; otherwise only fatal ones do.
    bool partial = false; // The text is an excerpt: omitted nodes are left alone.
    ImplicitTargets implicitTargets = ImplicitTargets::create;
    std::string defaultRole = std::string(graph::defaultRole);
    uint32_t timeoutMs = 0; // 0 waits indefinitely.

    auto operator==(CompileOptions const&) const -> bool = default;
  };

  void to_json(nlohmann::json& j, ImplicitTargets const& o);
  void from_json(nlohmann::json const& j, ImplicitTargets& o);
  void to_json(nlohmann::json& j, CompileOptions const& o);
  // Missing keys keep their current values, so a config file can be layered over defaults.
  void from_json(nlohmann::json const& j, CompileOptions& o);

#include "macros_close.hpp"
}

#endif // NODEBOOK_COMPILER_OPTIONS_HPP
