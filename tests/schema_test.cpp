#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "fixtures.hpp"

using namespace nodebook;
using namespace nodebook::schema;
using cnl::ErrorKind;

TEST(Schema, AncestryIsTransitive) {
  auto const s = tests::zooSchema();
  EXPECT_EQ(s.ancestry("Dog"), (std::set<std::string>{"Dog", "Animal", "Thing"}));
  EXPECT_EQ(s.ancestry("Unknown"), (std::set<std::string>{"Unknown"}));
}

TEST(Schema, FixtureIsValid) {
  auto reporter = cnl::Reporter();
  tests::zooSchema().validate(reporter);
  EXPECT_TRUE(reporter.empty());
}

TEST(Schema, CycleIsReportedAndAncestryTerminates) {
  auto s = Schema();
  s.add(NodeType{"A", "", {"B"}});
  s.add(NodeType{"B", "", {"C"}});
  s.add(NodeType{"C", "", {"A"}});
  EXPECT_EQ(s.ancestry("A"), (std::set<std::string>{"A", "B", "C"}));
  auto reporter = cnl::Reporter();
  s.validate(reporter);
  auto const ds = reporter.diagnostics();
  ASSERT_EQ(ds.size(), 1u);
  EXPECT_EQ(ds[0].kind, ErrorKind::cyclicTypeHierarchy);
  EXPECT_EQ(ds[0].line, 0u);
  EXPECT_EQ(ds[0].message, "type hierarchy contains a cycle: A -> B -> C -> A");
  EXPECT_TRUE(reporter.hasFatal());
}

TEST(Schema, InvalidDefinitions) {
  auto s = Schema();
  s.add(NodeType{"A", "", {"Missing"}});
  s.add(NodeType{"A", "", {}});
  s.add(RelationType{"r", "s", "", true, false, {}, {}});
  s.add(AttributeType{"x", "", ValueType::integer, {"Nope"}, std::nullopt});
  s.add(FunctionType{"f", "1 +", {}, ""});
  auto reporter = cnl::Reporter();
  s.validate(reporter);
  auto const ds = reporter.diagnostics();
  EXPECT_EQ(ds.size(), 5u);
  for (auto const& d: ds)
    EXPECT_EQ(d.kind, ErrorKind::invalidSchema);
}

TEST(Schema, LoadFromJson) {
  auto const j = nlohmann::json::parse(R"({
    "node_types": [{"name": "Thing"}, {"name": "Element", "parent_types": ["Thing"]}],
    "relation_types": [{"name": "bonds with", "symmetric": true}],
    "attribute_types": [{"name": "atomic number", "data_type": "integer", "domain": ["Element"]}],
    "function_types": [{"name": "twice", "expression": "2 * \"atomic number\""}]
  })");
  auto const s = loadSchema(j);
  ASSERT_NE(s.nodeType("Element"), nullptr);
  EXPECT_EQ(s.nodeType("Element")->parentTypes, (std::vector<std::string>{"Thing"}));
  ASSERT_NE(s.relationType("bonds with"), nullptr);
  EXPECT_TRUE(s.relationType("bonds with")->symmetric);
  ASSERT_NE(s.attributeType("atomic number"), nullptr);
  EXPECT_EQ(s.attributeType("atomic number")->valueType, ValueType::integer);
  EXPECT_EQ(s.attributeType("atomic number")->scope, (std::vector<std::string>{"Element"}));
  ASSERT_NE(s.functionType("twice"), nullptr);
  EXPECT_EQ(loadSchema(nlohmann::json(s)).entries(), s.entries());
}

TEST(Schema, MalformedJsonThrowsSchemaError) {
  EXPECT_THROW(loadSchema(nlohmann::json::parse("[1, 2]")), SchemaError);
  EXPECT_THROW(loadSchema(nlohmann::json::parse(R"({"node_types": [{"title": "x"}]})")), SchemaError);
  EXPECT_THROW(
    loadSchema(nlohmann::json::parse(R"({"attribute_types": [{"name": "x", "value_type": "decimal"}]})")),
    SchemaError
  );
}

TEST(SchemaRegistry, SnapshotsArePinned) {
  auto registry = SchemaRegistry(tests::zooSchema());
  auto const before = registry.snapshot();
  registry.publish(Schema());
  EXPECT_NE(before->nodeType("Dog"), nullptr);
  EXPECT_EQ(registry.snapshot()->nodeType("Dog"), nullptr);
}
