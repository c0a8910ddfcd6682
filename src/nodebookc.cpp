#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <cnl/emitter.hpp>
#include <compiler/service.hpp>
#include <nlohmann/json.hpp>

using std::string;
using std::cout, std::cerr, std::endl;
using nlohmann::json;
using namespace nodebook;

constexpr auto usage =
  "usage: nodebookc --schema <schema.json> [--prior <graph.json>] [--graph <id>] [--config <options.json>]\n"
  "                 [--lenient] [--partial] [--reject-implicit] [--out <graph.json>] [--emit] <input.cnl>\n";

auto readFile(string const& path) -> std::optional<string> {
  auto in = std::ifstream(path);
  if (!in)
    return std::nullopt;
  std::ostringstream sstr;
  sstr << in.rdbuf();
  return sstr.str();
}

auto readJson(string const& path) -> json {
  auto const s = readFile(path);
  if (!s)
    throw std::runtime_error("cannot read \"" + path + "\"");
  return json::parse(*s);
}

struct Arguments {
  string schema, input;
  std::optional<string> prior, graph, config, out;
  bool lenient = false, partial = false, rejectImplicit = false, emit = false;
};

auto parseArguments(std::span<char*> args) -> std::optional<Arguments> {
  auto res = Arguments();
  for (auto i = 1uz; i < args.size(); i++) {
    auto const arg = string(args[i]);
    auto const value = [&]() -> std::optional<string> {
      if (i + 1 >= args.size())
        return std::nullopt;
      return string(args[++i]);
    };
    if (arg == "--lenient")
      res.lenient = true;
    else if (arg == "--partial")
      res.partial = true;
    else if (arg == "--reject-implicit")
      res.rejectImplicit = true;
    else if (arg == "--emit")
      res.emit = true;
    else if (arg == "--schema" || arg == "--prior" || arg == "--graph" || arg == "--config" || arg == "--out") {
      auto const v = value();
      if (!v)
        return std::nullopt;
      if (arg == "--schema")
        res.schema = *v;
      else if (arg == "--prior")
        res.prior = v;
      else if (arg == "--graph")
        res.graph = v;
      else if (arg == "--config")
        res.config = v;
      else
        res.out = v;
    } else if (arg.starts_with("--") || !res.input.empty())
      return std::nullopt;
    else
      res.input = arg;
  }
  if (res.schema.empty() || res.input.empty())
    return std::nullopt;
  return res;
}

auto main(int argc, char* argv[]) -> int {
  auto const args = parseArguments(std::span(argv, static_cast<size_t>(argc)));
  if (!args) {
    cerr << usage;
    return 2;
  }

  auto options = compiler::CompileOptions();
  auto registry = schema::SchemaRegistry();
  auto store = graph::MemoryStore();
  auto const graphId = args->graph.value_or(std::filesystem::path(args->input).stem().string());
  try {
    registry.publish(schema::loadSchema(readJson(args->schema)));
    if (args->config)
      readJson(*args->config).get_to(options);
    if (args->prior) {
      auto prior = readJson(*args->prior).get<graph::Graph>();
      prior.id = graphId;
      store.putGraph(std::move(prior));
    }
  } catch (std::exception& e) {
    cerr << "nodebookc: " << e.what() << endl;
    return 2;
  }
  if (args->lenient)
    options.strict = false;
  if (args->partial)
    options.partial = true;
  if (args->rejectImplicit)
    options.implicitTargets = compiler::ImplicitTargets::reject;

  auto const text = readFile(args->input);
  if (!text) {
    cerr << "nodebookc: cannot read \"" << args->input << "\"" << endl;
    return 2;
  }

  auto service = compiler::CompileService(store, registry);
  auto result = compiler::CompileResult();
  try {
    result = service.submit(graphId, *text, options);
  } catch (graph::StoreError& e) {
    cerr << "nodebookc: the graph store rejected the changes: " << e.what() << endl;
    return 1;
  }

  for (auto const& d: result.errors)
    cerr << args->input << ":" << d.line << ": " << cnl::kindName(d.kind) << ": " << d.message << endl;
  for (auto const& s: result.skipped)
    cerr << args->input << ":" << s.line << ": skipped " << s.description << endl;

  auto const snapshot = store.loadGraphSnapshot(graphId);
  if (args->out && result.applied) {
    auto out = std::ofstream(*args->out);
    out << json(snapshot).dump(2) << endl;
    if (!out) {
      cerr << "nodebookc: cannot write \"" << *args->out << "\"" << endl;
      return 1;
    }
  }

  if (args->emit)
    cout << cnl::emit(snapshot);
  else
    cout << json(result).dump(2) << endl;
  return result.ok ? 0 : 1;
}
