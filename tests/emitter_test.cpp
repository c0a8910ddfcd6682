#include <gtest/gtest.h>
#include <cnl/emitter.hpp>
#include "fixtures.hpp"

using namespace nodebook;
using namespace nodebook::tests;

TEST(Emitter, Layout) {
  auto g = graph::Graph();
  g.id = "zoo";
  ASSERT_TRUE(compileInto(g, "# Rex [Dog]\nhas age: 3;\n<eats> Bone [often];\n").ok);
  EXPECT_EQ(cnl::emit(g), "# Bone\n\n# Rex [Dog]\n<eats> Bone [often];\nhas age: 3 *years*;\n");
}

TEST(Emitter, MorphsAndDescriptions) {
  auto g = graph::Graph();
  g.id = "elements";
  auto const res = compileInto(
    g,
    "```graph-description\nSome elements.\n```\n"
    "# **light** Sodium [Element]\n```description\nA soft metal.\n```\n"
    "has atomic number: 11;\n## Heavy\nhas mass number: 24;\nhas function \"neutron number\";\n"
  );
  ASSERT_TRUE(res.ok);
  EXPECT_EQ(
    cnl::emit(g),
    "```graph-description\nSome elements.\n```\n\n"
    "# **light** Sodium [Element]\n```description\nA soft metal.\n```\nhas atomic number: 11;\n"
    "\n## Heavy\nhas mass number: 24;\nhas function \"neutron number\";\n"
  );
}

TEST(Emitter, RoundTrip) {
  auto const text =
    "```graph-description\nA farm.\n```\n"
    "# Rex [Dog]\n<eats> **juicy** Bone;\n<is friend of> Fido;\nhas age: 3;\nhas colour: ++mostly++ brown [probably];\n"
    "# Fido [Dog]\n## Puppy\nhas weight: 4.5;\n"
    "# Sodium [Element]\nhas atomic number: 11;\nhas mass number: 23;\nhas function \"neutron number\";\n";
  auto g = graph::Graph();
  g.id = "farm";
  ASSERT_TRUE(compileInto(g, text).ok);

  auto copy = graph::Graph();
  copy.id = "farm";
  auto const res = compileInto(copy, cnl::emit(g));
  ASSERT_TRUE(res.ok);
  EXPECT_TRUE(res.errors.empty());
  EXPECT_EQ(copy, g);
}
