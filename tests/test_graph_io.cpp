#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "stategraph/graph_builder.hpp"
#include "stategraph/kernel/graph_engine.hpp"
#include "stategraph/kernel/handlers.hpp"
#include "stategraph/kernel/services/graph_io_service.hpp"
#include "test_helpers.hpp"

using sg::ExecutionStatus;
using sg::GraphErrc;
using sg::GraphIOService;
using sgtest::error_of;
using sgtest::testcase;

class GraphIOTest : public ::testing::Test {
 protected:
  void SetUp() override { sg::handlers::register_builtin(); }

  GraphIOService io;
};

TEST_F(GraphIOTest, LoadsDeclarativeGraph) {
  auto g = io.load(testcase("approval.yaml"));
  EXPECT_EQ(g->name(), "approval");
  EXPECT_EQ(g->entry_point(), "draft");
  ASSERT_EQ(g->nodes().size(), 4u);
  EXPECT_EQ(g->node("draft").name, "Draft reply");
  EXPECT_EQ(g->node("review").name, "review");
  ASSERT_EQ(g->edges().size(), 3u);
  EXPECT_TRUE(g->edges()[0].requires_user_input);
  EXPECT_EQ(g->edges()[0].label, "review");
  EXPECT_EQ(g->mapping().size(), 3u);
  EXPECT_TRUE(g->is_declarative());
}

TEST_F(GraphIOTest, LoadedGraphRoutesOnHumanAnswer) {
  auto g = io.load(testcase("approval.yaml"));

  sg::GraphEngine approve(g);
  auto first = approve.run();
  ASSERT_EQ(first.status, ExecutionStatus::Suspended);
  EXPECT_EQ(first.interaction->options, (std::vector<std::string>{"yes", "no"}));
  EXPECT_EQ(first.state.get_string("status"), "Pending");
  auto published = approve.provide_user_input(YAML::Node("yes"));
  EXPECT_EQ(published.current_node, "publish");
  EXPECT_EQ(published.state.get_string("status"), "Success");
  EXPECT_DOUBLE_EQ(published.state.get_double("confidence", 0.0), 1.0);

  sg::GraphEngine reject(g);
  reject.run();
  auto revised = reject.provide_user_input(YAML::Node("no"));
  EXPECT_EQ(revised.current_node, "revise");
  EXPECT_EQ(revised.state.get_string("status"), "Failed");
  EXPECT_EQ(revised.execution_order, (std::vector<std::string>{"draft", "review", "revise"}));
}

TEST_F(GraphIOTest, RoutingDefaultsReadEmbeddedJson) {
  auto g = io.load(testcase("routing.yaml"));
  EXPECT_EQ(g->mapping().size(), 4u);

  sg::GraphEngine engine(g);
  auto res = engine.run();
  EXPECT_EQ(res.status, ExecutionStatus::Completed);
  EXPECT_EQ(res.execution_order, (std::vector<std::string>{"classify", "billing"}));
  EXPECT_EQ(res.state.get_string("stage"), "billing_done");
  EXPECT_DOUBLE_EQ(res.state.get_double("confidence", 0.0), 1.0);
  EXPECT_TRUE(res.warnings.empty());
}

TEST_F(GraphIOTest, SaveWritesAGraphThatLoadsBackTheSame) {
  const auto dir = sgtest::fresh_temp_dir("graph_io");
  const auto path = dir / "approval_copy.yaml";
  auto original = io.load(testcase("approval.yaml"));
  io.save(*original, path);
  ASSERT_TRUE(std::filesystem::exists(path));

  auto copy = io.load(path);
  EXPECT_EQ(YAML::Dump(io.to_yaml(*copy)), YAML::Dump(io.to_yaml(*original)));

  sg::GraphEngine engine(copy);
  engine.run();
  EXPECT_EQ(engine.provide_user_input(YAML::Node("yes")).current_node, "publish");
  std::filesystem::remove_all(dir);
}

TEST_F(GraphIOTest, ReportsBadDocuments) {
  EXPECT_EQ(error_of([&] { io.load(testcase("broken.yaml")); }), GraphErrc::NotFound);
  EXPECT_EQ(error_of([&] { io.load(testcase("no_such_file.yaml")); }), GraphErrc::Io);
  EXPECT_EQ(error_of([&] { io.parse(YAML::Load("[1, 2]")); }), GraphErrc::InvalidYaml);
  EXPECT_EQ(error_of([&] { io.parse(YAML::Load("{name: g, entry: a}")); }), GraphErrc::InvalidYaml);
  EXPECT_EQ(error_of([&] {
              io.parse(YAML::Load(
                  "{name: g, entry: a, nodes: [{id: a, type: emit, subtype: constant}],"
                  " edges: [{from: a, to: a, when: sometimes}]}"));
            }),
            GraphErrc::InvalidYaml);
  EXPECT_EQ(error_of([&] {
              io.parse(YAML::Load(
                  "{name: g, entry: a, nodes: [{id: a, type: emit, subtype: constant}],"
                  " edges: [{from: a, to: b}]}"));
            }),
            GraphErrc::UnknownReference);
  EXPECT_EQ(error_of([&] {
              io.parse(YAML::Load(
                  "{name: g, nodes: [{id: a, type: emit, subtype: constant}]}"));
            }),
            GraphErrc::MissingEntryPoint);
  EXPECT_EQ(error_of([&] {
              io.parse(YAML::Load(
                  "{name: g, entry: a, nodes: [{id: a, type: emit, subtype: constant},"
                  " {id: a, type: emit, subtype: text}]}"));
            }),
            GraphErrc::DuplicateId);
}

TEST_F(GraphIOTest, RefusesToSaveGraphsBuiltInCode) {
  sg::GraphBuilder b("code_only");
  b.add_node(sgtest::emit_yaml("{stage: a}"), "a");
  b.set_entry_point("a");
  auto g = b.build();
  EXPECT_EQ(error_of([&] { io.to_yaml(*g); }), GraphErrc::InvalidParameter);
}

TEST_F(GraphIOTest, CustomHandlersResolveByKey) {
  auto& registry = sg::HandlerRegistry::instance();
  registry.register_handler("test", "shout", sgtest::emit_yaml("{stage: shouted}"));
  auto keys = registry.get_keys();
  EXPECT_NE(std::find(keys.begin(), keys.end(), "test:shout"), keys.end());
  EXPECT_NE(std::find(keys.begin(), keys.end(), "emit:entry"), keys.end());
  EXPECT_EQ(error_of([&] { registry.register_handler("test", "empty", sg::NodeHandler{}); }),
            GraphErrc::InvalidParameter);

  auto g = io.parse(YAML::Load(
      "{name: custom, entry: a, state_mapping: [stage], nodes: [{id: a, type: test, subtype: shout}]}"));
  EXPECT_EQ(sg::GraphEngine(g).run().state.get_string("stage"), "shouted");

  EXPECT_TRUE(registry.unregister_handler("test", "shout"));
  EXPECT_FALSE(registry.unregister_key("test:shout"));
  EXPECT_EQ(error_of([&] {
              io.parse(YAML::Load("{name: custom, entry: a, nodes: [{id: a, type: test, subtype: shout}]}"));
            }),
            GraphErrc::NotFound);
}
