#include <fstream>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#ifdef _WIN32
#  include <fcntl.h>
#  include <io.h>
#endif
#include <server/language_server.hpp>

using std::string;
using nlohmann::json;
using namespace nodebook;

auto readJson(string const& path) -> json {
  auto in = std::ifstream(path);
  if (!in)
    throw std::runtime_error("cannot read \"" + path + "\"");
  std::ostringstream sstr;
  sstr << in.rdbuf();
  return json::parse(sstr.str());
}

// Usage: nodebook-server [--schema <schema.json>] [--config <options.json>] [--load <graph.json>]...
auto main(int argc, char* argv[]) -> int {
  // Framing counts bytes, so stdio must not translate line endings.
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif

  auto const args = std::span(argv, static_cast<size_t>(argc));
  auto schemas = schema::SchemaRegistry();
  auto store = graph::MemoryStore();
  auto options = compiler::CompileOptions();
  try {
    for (auto i = 1uz; i + 1 < args.size(); i += 2) {
      auto const flag = string(args[i]);
      auto const path = string(args[i + 1]);
      if (flag == "--schema")
        schemas.publish(schema::loadSchema(readJson(path)));
      else if (flag == "--config")
        readJson(path).get_to(options);
      else if (flag == "--load")
        store.putGraph(readJson(path).get<graph::Graph>());
      else
        throw std::runtime_error("unknown option \"" + flag + "\"");
    }
  } catch (std::exception& e) {
    std::cerr << "nodebook-server: " << e.what() << std::endl;
    return 2;
  }

  auto srv = server::JsonRpcServer(std::cin, std::cout);
  auto ls = server::LanguageServer(store, schemas, options);
  ls.attach(srv);

  // Serves until `exit` or end of input.
  srv.startListen();
  srv.waitForComplete();
  ls.waitForChecks();
  return 0;
}
