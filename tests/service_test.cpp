#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <compiler/service.hpp>
#include "fixtures.hpp"

using namespace nodebook;
using namespace nodebook::compiler;

TEST(CompileService, SubmitApplies) {
  auto store = graph::MemoryStore();
  auto const schemas = schema::SchemaRegistry(tests::zooSchema());
  auto service = CompileService(store, schemas);

  auto const res = service.submit("zoo", "# Rex [Dog]\n<eats> Bone;\n", {});
  EXPECT_TRUE(res.ok);
  EXPECT_TRUE(res.applied);
  auto const g = store.loadGraphSnapshot("zoo");
  EXPECT_EQ(g.nodes.size(), 2u);
  EXPECT_EQ(g.relations.size(), 1u);
  ASSERT_NE(store.registry().find("rex"), nullptr);

  auto const again = service.submit("zoo", "# Rex [Dog]\n<eats> Bone;\n", {});
  EXPECT_TRUE(again.ok);
  EXPECT_TRUE(again.changes.empty());
}

TEST(CompileService, CheckDoesNotApply) {
  auto store = graph::MemoryStore();
  auto const schemas = schema::SchemaRegistry(tests::zooSchema());
  auto service = CompileService(store, schemas);

  auto const res = service.check("zoo", "# Rex [Dog]\n", {});
  EXPECT_TRUE(res.ok);
  EXPECT_FALSE(res.applied);
  EXPECT_EQ(res.changes.size(), 1u);
  EXPECT_TRUE(store.loadGraphSnapshot("zoo").nodes.empty());
}

TEST(CompileService, FailedCompilationIsNotApplied) {
  auto store = graph::MemoryStore();
  auto const schemas = schema::SchemaRegistry(tests::zooSchema());
  auto service = CompileService(store, schemas);

  auto const res = service.submit("zoo", "# Rex [Dog]\nhas age: old;\n", {});
  EXPECT_FALSE(res.ok);
  EXPECT_FALSE(res.applied);
  EXPECT_TRUE(store.graphIds().empty());
}

TEST(CompileService, RegistryResolvesTargetsAcrossGraphs) {
  auto store = graph::MemoryStore();
  auto const schemas = schema::SchemaRegistry(tests::zooSchema());
  auto service = CompileService(store, schemas);
  auto options = CompileOptions();
  options.implicitTargets = ImplicitTargets::reject;

  ASSERT_TRUE(service.submit("kennel", "# Rex [Dog]\n", options).ok);
  auto const res = service.submit("people", "# Ann [Person]\n<owns> Rex;\n", options);
  EXPECT_TRUE(res.ok);
  auto const people = store.loadGraphSnapshot("people");
  ASSERT_TRUE(people.nodes.contains("rex"));
  EXPECT_EQ(people.nodes.at("rex").role, "Dog");
  EXPECT_EQ(store.registry().find("rex")->graphs, (std::set<std::string>{"kennel", "people"}));
}

TEST(CompileService, PublishedSchemaIsUsedByLaterCompilations) {
  auto store = graph::MemoryStore();
  auto schemas = schema::SchemaRegistry();
  auto service = CompileService(store, schemas);

  EXPECT_FALSE(service.check("zoo", "# Rex [Dog]\n", {}).ok);
  schemas.publish(tests::zooSchema());
  EXPECT_TRUE(service.check("zoo", "# Rex [Dog]\n", {}).ok);
}

TEST(CompileService, ConcurrentSubmissionsToOneGraph) {
  auto store = graph::MemoryStore();
  auto const schemas = schema::SchemaRegistry(tests::zooSchema());
  auto service = CompileService(store, schemas);
  auto options = CompileOptions();
  options.partial = true;

  auto failures = std::atomic<size_t>(0);
  auto threads = std::vector<std::jthread>();
  for (auto i = 0uz; i < 8; i++)
    threads.emplace_back([&, i] {
      auto const text = "# Dog " + std::to_string(i) + " [Dog]\nhas age: " + std::to_string(i) + ";\n";
      if (!service.submit("zoo", text, options).ok)
        failures++;
    });
  threads.clear();

  EXPECT_EQ(failures.load(), 0u);
  auto const g = store.loadGraphSnapshot("zoo");
  EXPECT_EQ(g.nodes.size(), 8u);
  EXPECT_EQ(g.attributes.size(), 8u);
}

TEST(GraphLocks, SameGraphIsExclusive) {
  auto locks = GraphLocks();
  auto held = locks.acquire("zoo");
  auto other = locks.acquire("farm");
  EXPECT_TRUE(other.owns_lock());

  auto acquired = std::atomic<bool>(false);
  auto t = std::jthread([&] {
    auto const lock = locks.acquire("zoo");
    acquired = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  held.unlock();
  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST(CompileWithTimeout, FinishesWithinLimit) {
  auto options = CompileOptions();
  options.timeoutMs = 60000;
  auto const schema = std::make_shared<schema::Schema const>(tests::zooSchema());
  auto const res = compileWithTimeout("# Rex [Dog]\n", schema, graph::Graph{"zoo", {}, {}, {}, {}}, {}, options);
  EXPECT_TRUE(res.ok);
  EXPECT_EQ(res.changes.size(), 1u);
}

TEST(CompileWithTimeout, ReportsTimeout) {
  auto text = std::string();
  for (auto i = 0uz; i < 10000; i++)
    text += "# Dog " + std::to_string(i) + " [Dog]\n<eats> Bone " + std::to_string(i) + ";\nhas age: 3;\n";
  auto options = CompileOptions();
  options.timeoutMs = 1;
  auto const schema = std::make_shared<schema::Schema const>(tests::zooSchema());
  auto const res = compileWithTimeout(text, schema, graph::Graph{"zoo", {}, {}, {}, {}}, {}, options);
  EXPECT_FALSE(res.ok);
  ASSERT_EQ(res.errors.size(), 1u);
  EXPECT_EQ(res.errors[0].kind, cnl::ErrorKind::timeout);
  EXPECT_EQ(res.errors[0].line, 0u);
  EXPECT_EQ(res.errors[0].message, "compilation did not finish within 1 ms");
}
