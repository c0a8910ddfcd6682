#include <gtest/gtest.h>
#include "fixtures.hpp"

using namespace nodebook;
using namespace nodebook::tests;
using graph::ChangeOp;

namespace {

  auto farm() -> graph::Graph {
    auto g = graph::Graph();
    g.id = "farm";
    return g;
  }

  auto count(graph::ChangeList const& changes, ChangeOp op, std::string_view kind) -> size_t {
    auto res = 0uz;
    for (auto const& c: changes)
      if (c.op == op && graph::entityKind(c.entity) == kind)
        res++;
    return res;
  }

}

TEST(Diff, FirstSubmissionCreatesEverything) {
  auto g = farm();
  auto const res = compileInto(g, "# Rex [Dog]\n<eats> Bone;\nhas age: 3;\n");
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(res.changes.size(), 4u);
  EXPECT_EQ(count(res.changes, ChangeOp::create, "node"), 2u);
  EXPECT_EQ(count(res.changes, ChangeOp::create, "relation"), 1u);
  EXPECT_EQ(count(res.changes, ChangeOp::create, "attribute"), 1u);
  // Nodes are created before what refers to them.
  EXPECT_EQ(graph::entityKind(res.changes.front().entity), "node");
  EXPECT_EQ(g.nodes.size(), 2u);
}

TEST(Diff, ResubmissionIsIdempotent) {
  auto const text =
    "```graph-description\nA farm.\n```\n"
    "# Rex [Dog]\n<eats> Bone;\n<is friend of> Fido;\nhas age: 3;\n"
    "# Fido [Dog]\n## Puppy\nhas weight: 4.5;\n"
    "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\nhas function \"neutron number\";\n";
  auto g = farm();
  ASSERT_TRUE(compileInto(g, text).ok);
  auto const before = g;
  auto const again = compileInto(g, text);
  ASSERT_TRUE(again.ok);
  EXPECT_TRUE(again.changes.empty());
  EXPECT_TRUE(again.recomputed.empty());
  EXPECT_EQ(g, before);
}

TEST(Diff, ChangedValueReplacesAttribute) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\nhas age: 3;\n").ok);
  auto const res = compileInto(g, "# Rex [Dog]\nhas age: 4;\n");
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.changes.size(), 2u);
  EXPECT_EQ(res.changes[0].op, ChangeOp::remove);
  EXPECT_EQ(graph::entityId(res.changes[0].entity), "attr_rex_age_3");
  EXPECT_EQ(res.changes[1].op, ChangeOp::create);
  EXPECT_EQ(graph::entityId(res.changes[1].entity), "attr_rex_age_4");
}

TEST(Diff, OmittedMorphIsLeftAlone) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\n## Heavy\nhas mass number: 24;\n").ok);
  auto const res = compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\n");
  ASSERT_TRUE(res.ok);
  EXPECT_TRUE(res.changes.empty());
  EXPECT_TRUE(g.attributes.contains("attr_sodium_mass_number_24"));

  // Restating the morph replaces only its contents.
  auto const heavier = compileInto(g, "# Sodium [Element]\n## Heavy\nhas mass number: 25;\n");
  ASSERT_TRUE(heavier.ok);
  EXPECT_FALSE(g.attributes.contains("attr_sodium_mass_number_24"));
  EXPECT_TRUE(g.attributes.contains("attr_sodium_mass_number_25"));
  // The default morph is always restated.
  EXPECT_FALSE(g.attributes.contains("attr_sodium_atomic_number_11"));
}

TEST(Diff, SharedEntityKeepsOtherMorphs) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\nhas colour: brown;\n## Muddy\nhas colour: brown;\n").ok);
  auto const& colour = g.attributes.at("attr_rex_colour_brown");
  EXPECT_EQ(colour.morphs.size(), 2u);

  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\n## Muddy\nhas colour: brown;\n").ok);
  ASSERT_TRUE(g.attributes.contains("attr_rex_colour_brown"));
  EXPECT_EQ(g.attributes.at("attr_rex_colour_brown").morphs, (std::vector<graph::MorphId>{graph::morphId("rex", "Muddy")}));
}

TEST(Diff, DocumentModeDeletesOmittedNodes) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\n<eats> Bone;\n# Fido [Dog]\nhas age: 2;\n").ok);

  // Bone is not declared, but still targeted by Rex.
  auto const res = compileInto(g, "# Rex [Dog]\n<eats> Bone;\n");
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(count(res.changes, ChangeOp::remove, "node"), 1u);
  EXPECT_EQ(count(res.changes, ChangeOp::remove, "attribute"), 1u);
  EXPECT_FALSE(g.nodes.contains("fido"));
  EXPECT_TRUE(g.nodes.contains("bone"));

  // Removing Rex cascades to its relation and to Bone.
  auto const gone = compileInto(g, "# Fido [Dog]\n");
  ASSERT_TRUE(gone.ok);
  EXPECT_EQ(g.nodes.size(), 1u);
  EXPECT_TRUE(g.relations.empty());
  ASSERT_FALSE(gone.changes.empty());
  EXPECT_EQ(gone.changes[0].op, ChangeOp::remove);
  EXPECT_EQ(graph::entityKind(gone.changes[0].entity), "relation");
}

TEST(Diff, PartialModeKeepsOmittedNodes) {
  auto options = compiler::CompileOptions();
  options.partial = true;
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "```graph-description\nA farm.\n```\n# Rex [Dog]\n# Fido [Dog]\n").ok);
  auto const res = compileInto(g, "# Fido [Dog]\nhas age: 3;\n", options);
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.changes.size(), 1u);
  EXPECT_EQ(res.changes[0].op, ChangeOp::create);
  EXPECT_TRUE(g.nodes.contains("rex"));
  EXPECT_EQ(g.description, "A farm.");
}

TEST(Diff, RoleChangeRecreatesNode) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\n").ok);
  auto const res = compileInto(g, "# Rex [Person]\n");
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.changes.size(), 2u);
  EXPECT_EQ(res.changes[0].op, ChangeOp::remove);
  EXPECT_EQ(std::get<graph::Node>(res.changes[0].entity).role, "Dog");
  EXPECT_EQ(res.changes[1].op, ChangeOp::create);
  EXPECT_EQ(std::get<graph::Node>(res.changes[1].entity).role, "Person");
  EXPECT_EQ(g.nodes.at("rex").role, "Person");
}

TEST(Diff, DescriptionUpdates) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "```graph-description\nA farm.\n```\n# Rex\n```description\nA dog.\n```\n").ok);
  EXPECT_EQ(g.description, "A farm.");
  EXPECT_EQ(g.nodes.at("rex").description, "A dog.");

  auto const res = compileInto(g, "# Rex\n```description\nA good dog.\n```\n");
  ASSERT_TRUE(res.ok);
  ASSERT_EQ(res.changes.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<graph::GraphInfo>(res.changes[0].entity));
  EXPECT_EQ(std::get<graph::GraphInfo>(res.changes[0].entity).description, "");
  EXPECT_EQ(res.changes[1].op, ChangeOp::update);
  EXPECT_EQ(g.nodes.at("rex").description, "A good dog.");
}

TEST(Diff, ContradictoryRestatementIsIdentityConflict) {
  auto g = farm();
  auto const res = compileInto(g, "# Rex [Dog]\n<eats> Bone;\n<eats> Bone [rarely];\n");
  EXPECT_FALSE(res.ok);
  ASSERT_EQ(res.errors.size(), 1u);
  EXPECT_EQ(res.errors[0].kind, cnl::ErrorKind::identityConflict);
  EXPECT_EQ(res.errors[0].line, 3u);
  EXPECT_TRUE(res.changes.empty());
  EXPECT_TRUE(g.nodes.empty());
}

TEST(Diff, UntouchedMorphFunctionsFollowTheirInputs) {
  auto g = farm();
  auto const first = compileInto(
    g,
    "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\n## Ion\nhas function \"neutron number\";\n"
  );
  ASSERT_TRUE(first.ok);
  EXPECT_EQ(g.attributes.at("fn_sodium_ion_neutron_number").value, "12");

  // The Ion morph is not restated, but its function reads the default morph.
  auto options = compiler::CompileOptions();
  options.partial = true;
  auto const res = compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 24;\n", options);
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(res.recomputed, (std::vector<std::string>{"fn_sodium_ion_neutron_number"}));
  EXPECT_EQ(count(res.changes, ChangeOp::update, "attribute"), 1u);
  auto const& n = g.attributes.at("fn_sodium_ion_neutron_number");
  EXPECT_EQ(n.value, "13");
  EXPECT_EQ(n.morphs, (std::vector<graph::MorphId>{graph::morphId("sodium", "Ion")}));

  auto const again = compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 24;\n", options);
  ASSERT_TRUE(again.ok);
  EXPECT_TRUE(again.changes.empty());
  EXPECT_TRUE(again.recomputed.empty());
}

TEST(Diff, SkippedDeclarationsKeepStoredEntities) {
  auto g = farm();
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\n<eats> Bone;\nhas age: 3;\n# Bone [Food]\n").ok);
  ASSERT_TRUE(g.relations.contains("rel_rex_eats_bone"));

  // Bone's type is misspelt: Bone and the relation to it are skipped, not deleted.
  auto const res = compileInto(g, "# Rex [Dog]\n<eats> Bone;\nhas age: 3;\n# Bone [Fod]\n", lenient());
  ASSERT_TRUE(res.ok);
  EXPECT_TRUE(hasError(res, cnl::ErrorKind::unknownNodeType));
  EXPECT_TRUE(res.changes.empty());
  EXPECT_TRUE(g.relations.contains("rel_rex_eats_bone"));
  EXPECT_EQ(g.nodes.size(), 2u);

  // A function that fails to evaluate keeps its stored value.
  auto const zoo = std::string("# Rex [Dog]\n<eats> Bone;\nhas age: 3;\n# Bone [Food]\n");
  ASSERT_TRUE(compileInto(g, "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\nhas function \"ratio\";\n" + zoo).ok);
  auto const failed = compileInto(
    g, "# Sodium [Element]\nhas atomic number: 0;\nhas mass number: 23;\nhas function \"ratio\";\n" + zoo, lenient()
  );
  ASSERT_TRUE(failed.ok);
  EXPECT_TRUE(hasError(failed, cnl::ErrorKind::evaluationError));
  EXPECT_TRUE(g.attributes.contains("fn_sodium_basic_ratio"));
  EXPECT_TRUE(g.attributes.contains("attr_sodium_atomic_number_0"));
  EXPECT_FALSE(g.attributes.contains("attr_sodium_atomic_number_11"));
}
