#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "fixtures.hpp"

using namespace nodebook;
using namespace nodebook::tests;
using cnl::ErrorKind;
using nlohmann::json;

TEST(Compiler, StrictModeRejectsAnyError) {
  auto g = graph::Graph();
  g.id = "zoo";
  auto const res = compileInto(g, "# Rex [Dog]\nhas age: old;\n<eats> Bone;\n");
  EXPECT_FALSE(res.ok);
  EXPECT_TRUE(res.changes.empty());
  ASSERT_EQ(res.errors.size(), 1u);
  EXPECT_EQ(res.errors[0].kind, ErrorKind::invalidAttributeValue);
  EXPECT_TRUE(g.nodes.empty());
}

TEST(Compiler, LenientModeSkipsBadDeclarations) {
  auto g = graph::Graph();
  g.id = "zoo";
  auto const res = compileInto(g, "# Rex [Dog]\nhas age: old;\n<eats> Bone;\n# Nessie [Monster]\n", lenient());
  EXPECT_TRUE(res.ok);
  EXPECT_EQ(res.errors.size(), 2u);
  EXPECT_TRUE(hasError(res, ErrorKind::invalidAttributeValue));
  EXPECT_TRUE(hasError(res, ErrorKind::unknownNodeType));
  EXPECT_EQ(res.skipped.size(), 2u);
  EXPECT_TRUE(g.nodes.contains("rex"));
  EXPECT_TRUE(g.nodes.contains("bone"));
  EXPECT_FALSE(g.nodes.contains("nessie"));
  EXPECT_TRUE(g.attributes.empty());
}

TEST(Compiler, SkippedNodeIsNotDeleted) {
  auto g = graph::Graph();
  g.id = "zoo";
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\n# Fido [Dog]\n").ok);
  auto const res = compileInto(g, "# Rex [Dog]\n# Fido [Wolf]\n", lenient());
  EXPECT_TRUE(res.ok);
  EXPECT_TRUE(res.changes.empty());
  EXPECT_TRUE(g.nodes.contains("fido"));
}

TEST(Compiler, FatalErrorsAbortInLenientMode) {
  auto g = graph::Graph();
  g.id = "zoo";
  auto const res = compileInto(g, "# Rex [Dog]\n# Rex [Person]\n", lenient());
  EXPECT_FALSE(res.ok);
  EXPECT_TRUE(hasError(res, ErrorKind::identityConflict));
  EXPECT_TRUE(g.nodes.empty());
}

TEST(Compiler, InvalidSchemaIsFatal) {
  auto schema = schema::Schema();
  schema.add(schema::NodeType{"A", "", {"B"}});
  schema.add(schema::NodeType{"B", "", {"A"}});
  auto const res = compiler::compile("# Rex [A]\n", schema, {}, {}, lenient());
  EXPECT_FALSE(res.ok);
  ASSERT_FALSE(res.errors.empty());
  EXPECT_EQ(res.errors[0].kind, ErrorKind::cyclicTypeHierarchy);
  EXPECT_EQ(res.errors[0].line, 0u);
}

TEST(Compiler, DerivedValuesAreReported) {
  auto g = graph::Graph();
  g.id = "elements";
  auto const res = compileInto(
    g, "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\nhas function \"neutron number\";\n"
  );
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.derived.size(), 1u);
  EXPECT_EQ(res.derived[0].value, "12");
  EXPECT_EQ(res.recomputed, (std::vector<std::string>{"fn_sodium_basic_neutron_number"}));
  ASSERT_TRUE(g.attributes.contains("fn_sodium_basic_neutron_number"));
  EXPECT_TRUE(g.attributes.at("fn_sodium_basic_neutron_number").derived);
}

TEST(Compiler, RemovingFunctionRemovesDerivedAttribute) {
  auto g = graph::Graph();
  g.id = "elements";
  ASSERT_TRUE(
    compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\nhas function \"neutron number\";\n").ok
  );
  auto const res = compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\n");
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.changes.size(), 1u);
  EXPECT_EQ(res.changes[0].op, graph::ChangeOp::remove);
  EXPECT_FALSE(g.attributes.contains("fn_sodium_basic_neutron_number"));
}

TEST(Compiler, ResultJson) {
  auto g = graph::Graph();
  g.id = "zoo";
  auto const res = compileInto(g, "# Rex [Dog]\nhas age: old;\n", lenient());
  auto const j = json(res);
  EXPECT_EQ(j["ok"], true);
  EXPECT_EQ(j["applied"], false);
  ASSERT_EQ(j["errors"].size(), 1u);
  EXPECT_EQ(j["errors"][0]["line"], 2);
  EXPECT_EQ(j["errors"][0]["kind"], "InvalidAttributeValue");
  EXPECT_EQ(j["skipped"].size(), 1u);
  EXPECT_EQ(j["changes"].size(), 1u);
  EXPECT_EQ(j.get<compiler::CompileResult>(), res);
}
