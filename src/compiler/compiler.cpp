#include "compiler.hpp"
#include <cnl/parser.hpp>
#include <nlohmann/json.hpp>
#include "diff.hpp"
#include "evaluator.hpp"
#include "resolver.hpp"

namespace nodebook::compiler {
#include "macros_open.hpp"

  using nlohmann::json;

  auto compile(
    std::string const& text,
    schema::Schema const& schema,
    graph::Graph const& prior,
    graph::NodeRegistry const& registry,
    CompileOptions const& options
  ) -> CompileResult {
    auto reporter = cnl::Reporter();
    auto res = CompileResult();
    auto const finish = [&] {
      res.errors = reporter.diagnostics();
      res.skipped = reporter.skipped();
      return res;
    };

    schema.validate(reporter);
    if (reporter.hasFatal())
      return finish();

    auto const document = cnl::parse(text, reporter);
    auto const resolved = Resolver(schema, prior, registry, options, reporter)(document);
    auto evaluation = evaluate(resolved, prior, reporter);
    res.derived = evaluation.derived;
    res.recomputed = std::move(evaluation.recomputed);
    if (reporter.hasFatal() || (options.strict && !reporter.empty()))
      return finish();

    auto changes = diff(prior, resolved, evaluation, options, reporter);
    if (reporter.hasFatal())
      return finish();

    res.ok = true;
    res.changes = std::move(changes);
    return finish();
  }

  // clang-format off
#define TO(key, name) j[key] = o.name
#define FROM(key, name) j.at(key).get_to(o.name)
#define DEF_FROM(key, name) if (j.contains(key) && !j[key].is_null()) j[key].get_to(o.name)

  void to_json(json& j, CompileResult const& o) {
    j = {}; TO("ok", ok); TO("applied", applied); TO("errors", errors); TO("skipped", skipped);
    TO("changes", changes); TO("derived", derived); TO("recomputed", recomputed);
  }
  void from_json(json const& j, CompileResult& o) {
    o = {}; FROM("ok", ok); DEF_FROM("applied", applied); DEF_FROM("errors", errors); DEF_FROM("skipped", skipped);
    DEF_FROM("changes", changes); DEF_FROM("derived", derived); DEF_FROM("recomputed", recomputed);
  }
  // clang-format on

#undef TO
#undef FROM
#undef DEF_FROM

#include "macros_close.hpp"
}
