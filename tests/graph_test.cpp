#include <gtest/gtest.h>
#include <graph/store.hpp>
#include <nlohmann/json.hpp>

using namespace nodebook::graph;

namespace {

  auto node(std::string const& baseName, std::string const& role = "individual") -> Node {
    auto n = Node();
    n.id = nodeId(baseName);
    n.baseName = baseName;
    n.name = baseName;
    n.role = role;
    n.morphs.push_back({morphId(n.id, defaultMorphName), std::string(defaultMorphName)});
    return n;
  }

  auto relation(std::string const& source, std::string const& name, std::string const& target) -> Relation {
    auto r = Relation();
    r.id = relationId(source, name, target);
    r.source = source;
    r.target = target;
    r.name = name;
    r.morphs.push_back(morphId(source, defaultMorphName));
    return r;
  }

}

TEST(Ids, Normalisation) {
  EXPECT_EQ(normalize("  Marie \t Curie "), "marie_curie");
  EXPECT_EQ(nodeId("Sodium"), "sodium");
  EXPECT_EQ(morphId("sodium", "Excited State").str(), "sodium_excited_state");
  EXPECT_EQ(relationId("rex", "Is Friend Of", "fido"), "rel_rex_is_friend_of_fido");
  EXPECT_EQ(attributeId("paris", "name", "\"City of Light\""), "attr_paris_name_city_of_light");
  EXPECT_EQ(derivedAttributeId(morphId("sodium", "basic"), "neutron number"), "fn_sodium_basic_neutron_number");
  EXPECT_EQ(displayName("dogs", std::string("brown"), std::string("all")), "all brown dogs");
}

TEST(Graph, JsonRoundTrip) {
  auto g = Graph();
  g.id = "zoo";
  g.description = "Animals";
  g.nodes.emplace("rex", node("Rex", "Dog"));
  g.nodes.emplace("bone", node("Bone"));
  g.relations.emplace(relation("rex", "eats", "bone").id, relation("rex", "eats", "bone"));
  auto a = Attribute();
  a.id = attributeId("rex", "age", "3");
  a.source = "rex";
  a.name = "age";
  a.value = "3";
  a.unit = "years";
  a.morphs.push_back(morphId("rex", "basic"));
  g.attributes.emplace(a.id, a);

  auto const j = nlohmann::json(g);
  EXPECT_EQ(j["relations"][0]["source_id"], "rex");
  EXPECT_EQ(j["attributes"][0]["isDerived"], false);
  EXPECT_EQ(j.get<Graph>(), g);
}

TEST(Graph, ChangeJson) {
  auto const c = Change{ChangeOp::remove, node("Rex")};
  auto const j = nlohmann::json(c);
  EXPECT_EQ(j["op"], "delete");
  EXPECT_EQ(j["type"], "node");
  EXPECT_EQ(j["id"], "rex");
  EXPECT_EQ(j.get<Change>(), c);
}

TEST(Store, ApplyChangesChecksIntegrity) {
  auto g = Graph();
  g.id = "zoo";
  auto const ok = ChangeList{
    {ChangeOp::create,                  node("Rex")},
    {ChangeOp::create,                 node("Bone")},
    {ChangeOp::create, relation("rex", "eats", "bone")},
  };
  applyChanges(g, ok);
  EXPECT_EQ(g.nodes.size(), 2u);
  EXPECT_EQ(g.relations.size(), 1u);

  // Deleting a relation target without the relation is rejected as a whole.
  auto const before = g;
  EXPECT_THROW(applyChanges(g, {{ChangeOp::remove, node("Bone")}}), StoreError);
  EXPECT_EQ(g, before);
  EXPECT_THROW(applyChanges(g, {{ChangeOp::create, node("Rex")}}), StoreError);
  EXPECT_THROW(applyChanges(g, {{ChangeOp::update, node("Fido")}}), StoreError);
  EXPECT_THROW(applyChanges(g, {{ChangeOp::create, GraphInfo{"zoo", "x"}}}), StoreError);
  EXPECT_EQ(g, before);

  auto r = relation("rex", "likes", "bone");
  r.morphs = {morphId("rex", "ghost")};
  EXPECT_THROW(applyChanges(g, {{ChangeOp::create, r}}), StoreError);
}

TEST(Store, MemoryStoreKeepsRegistry) {
  auto store = MemoryStore();
  EXPECT_TRUE(store.loadGraphSnapshot("zoo").nodes.empty());
  EXPECT_EQ(store.loadGraphSnapshot("zoo").id, "zoo");
  store.applyChangeList("zoo", {{ChangeOp::create, node("Rex", "Dog")}});
  store.applyChangeList("farm", {{ChangeOp::create, node("Rex", "Dog")}});
  auto registry = store.registry();
  ASSERT_NE(registry.find("rex"), nullptr);
  EXPECT_EQ(registry.find("rex")->role, "Dog");
  EXPECT_EQ(registry.find("rex")->graphs, (std::set<std::string>{"farm", "zoo"}));

  store.applyChangeList("zoo", {{ChangeOp::remove, node("Rex", "Dog")}});
  EXPECT_EQ(store.registry().find("rex")->graphs, (std::set<std::string>{"farm"}));
  EXPECT_THROW(store.applyChangeList("zoo", {{ChangeOp::remove, node("Rex", "Dog")}}), StoreError);
  EXPECT_EQ(store.graphIds(), (std::vector<std::string>{"farm", "zoo"}));
}
