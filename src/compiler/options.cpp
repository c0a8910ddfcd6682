#include "options.hpp"
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace nodebook::compiler {
#include "macros_open.hpp"

  using nlohmann::json;

  void to_json(json& j, ImplicitTargets const& o) {
    j = o == ImplicitTargets::create ? "create" : "reject";
  }

  void from_json(json const& j, ImplicitTargets& o) {
    auto const s = j.get<std::string>();
    if (s == "create")
      o = ImplicitTargets::create;
    else if (s == "reject")
      o = ImplicitTargets::reject;
    else
      throw std::invalid_argument("implicitTargets must be \"create\" or \"reject\", not \"" + s + "\"");
  }

  void to_json(json& j, CompileOptions const& o) {
    j = {
      {         "strict",          o.strict},
      {        "partial",         o.partial},
      {"implicitTargets", o.implicitTargets},
      {    "defaultRole",     o.defaultRole},
      {      "timeoutMs",       o.timeoutMs},
    };
  }

  void from_json(json const& j, CompileOptions& o) {
    if (j.contains("strict"))
      j["strict"].get_to(o.strict);
    if (j.contains("mode"))
      o.strict = j["mode"].get<std::string>() != "lenient";
    if (j.contains("partial"))
      j["partial"].get_to(o.partial);
    if (j.contains("implicitTargets"))
      j["implicitTargets"].get_to(o.implicitTargets);
    if (j.contains("defaultRole"))
      j["defaultRole"].get_to(o.defaultRole);
    if (j.contains("timeoutMs"))
      j["timeoutMs"].get_to(o.timeoutMs);
  }

#include "macros_close.hpp"
}
