#ifndef NODEBOOK_TESTS_FIXTURES_HPP
#define NODEBOOK_TESTS_FIXTURES_HPP

#include <string>
#include <compiler/compiler.hpp>
#include <schema/schema.hpp>

namespace nodebook::tests {

  // Animals, food and chemical elements.
  inline auto zooSchema() -> schema::Schema {
    using namespace schema;
    auto s = Schema();
    s.add(NodeType{"Thing", "", {}});
    s.add(NodeType{"Animal", "", {"Thing"}});
    s.add(NodeType{"Dog", "", {"Animal"}});
    s.add(NodeType{"Person", "", {"Animal"}});
    s.add(NodeType{"Food", "", {"Thing"}});
    s.add(NodeType{"Element", "", {"Thing"}});
    s.add(RelationType{"eats", std::nullopt, "", false, false, {"Animal"}, {}});
    s.add(RelationType{"owns", std::nullopt, "", false, false, {"Person"}, {"Animal"}});
    s.add(RelationType{"is friend of", std::nullopt, "", true, false, {"Animal"}, {"Animal"}});
    s.add(RelationType{"likes", std::nullopt, "", false, false, {}, {}});
    s.add(AttributeType{"age", "", ValueType::integer, {"Animal"}, "years"});
    s.add(AttributeType{"colour", "", ValueType::string, {}, std::nullopt});
    s.add(AttributeType{"weight", "", ValueType::floating, {}, "kg"});
    s.add(AttributeType{"born", "", ValueType::date, {}, std::nullopt});
    s.add(AttributeType{"atomic number", "", ValueType::integer, {"Element"}, std::nullopt});
    s.add(AttributeType{"mass number", "", ValueType::integer, {"Element"}, std::nullopt});
    s.add(FunctionType{"neutron number", "\"mass number\" - \"atomic number\"", {"Element"}, ""});
    s.add(FunctionType{"double neutrons", "2 * \"neutron number\"", {"Element"}, ""});
    s.add(FunctionType{"ratio", "\"mass number\" / \"atomic number\"", {"Element"}, ""});
    s.add(FunctionType{"loop a", "\"loop b\" + 1", {}, ""});
    s.add(FunctionType{"loop b", "\"loop a\" + 1", {}, ""});
    s.add(FunctionType{"colour code", "colour * 2", {}, ""});
    return s;
  }

  inline auto lenient() -> compiler::CompileOptions {
    auto res = compiler::CompileOptions();
    res.strict = false;
    return res;
  }

  // Compiles and applies `text` to `g`; returns the result.
  inline auto compileInto(graph::Graph& g, std::string const& text, compiler::CompileOptions const& options = {})
    -> compiler::CompileResult {
    auto const res = compiler::compile(text, zooSchema(), g, graph::NodeRegistry(), options);
    if (res.ok)
      graph::applyChanges(g, res.changes);
    return res;
  }

  inline auto hasError(compiler::CompileResult const& res, cnl::ErrorKind kind) -> bool {
    for (auto const& d: res.errors)
      if (d.kind == kind)
        return true;
    return false;
  }

}

#endif // NODEBOOK_TESTS_FIXTURES_HPP
