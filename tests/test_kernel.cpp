#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "stategraph/kernel/interaction.hpp"
#include "stategraph/kernel/kernel.hpp"
#include "test_helpers.hpp"

using sg::ExecutionStatus;
using sg::GraphErrc;
using sg::InteractionService;
using sg::Kernel;
using sgtest::testcase;

class KernelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    export_dir = sgtest::fresh_temp_dir("export");
    sessions = std::make_shared<sg::MemorySessionStore>();
    kernel = std::make_unique<Kernel>(sg::EngineOptions{}, sessions, export_dir.string());
    svc = std::make_unique<InteractionService>(*kernel);
    svc->cmd_seed_builtin_handlers();
  }

  void TearDown() override {
    svc.reset();
    kernel.reset();
    std::filesystem::remove_all(export_dir);
  }

  std::filesystem::path export_dir;
  std::shared_ptr<sg::MemorySessionStore> sessions;
  std::unique_ptr<Kernel> kernel;
  std::unique_ptr<InteractionService> svc;
};

TEST_F(KernelTest, ApprovalSuspendsThenPublishes) {
  auto name = svc->cmd_load_graph(testcase("approval.yaml"));
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, "approval");
  EXPECT_EQ(svc->cmd_list_graphs(), (std::vector<std::string>{"approval"}));

  auto first = svc->cmd_start("approval", std::nullopt, "exec-a");
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->status, ExecutionStatus::Suspended);
  EXPECT_EQ(svc->cmd_status("exec-a"), ExecutionStatus::Suspended);

  auto request = svc->cmd_pending_interaction("exec-a");
  ASSERT_TRUE(request.has_value());
  EXPECT_EQ(request->node_id, "draft");
  EXPECT_EQ(request->node_output["text"].as<std::string>(), "Your refund has been approved.");

  auto done = svc->cmd_provide_input("exec-a", YAML::Node("yes"));
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->status, ExecutionStatus::Completed);
  EXPECT_EQ(done->current_node, "publish");
  EXPECT_FALSE(svc->cmd_pending_interaction("exec-a").has_value());

  auto listed = svc->cmd_list_sessions();
  EXPECT_NE(std::find(listed.begin(), listed.end(), "exec-a"), listed.end());
  EXPECT_FALSE(svc->cmd_last_error("exec-a").has_value());
}

TEST_F(KernelTest, ExportsHistoryAsJson) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("approval.yaml")));
  ASSERT_TRUE(svc->cmd_start("approval", std::nullopt, "exec-json"));
  ASSERT_TRUE(svc->cmd_provide_input("exec-json", YAML::Node("yes")));

  auto path = svc->cmd_export_history("exec-json");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(std::filesystem::path(*path), export_dir / "exec-json.json");

  std::ifstream ifs(*path);
  ASSERT_TRUE(static_cast<bool>(ifs));
  nlohmann::json j = nlohmann::json::parse(ifs);
  EXPECT_EQ(j["execution_id"], "exec-json");
  EXPECT_EQ(j["graph"], "approval");
  EXPECT_EQ(j["status"], "completed");
  EXPECT_EQ(j["state"]["stage"], "publish");
  ASSERT_TRUE(j["state"]["confidence"].is_number());
  EXPECT_DOUBLE_EQ(j["state"]["confidence"].get<double>(), 1.0);

  ASSERT_TRUE(j["history"].is_array());
  std::vector<std::string> ops;
  for (const auto& e : j["history"]) ops.push_back(e["operation"].get<std::string>());
  EXPECT_EQ(ops, (std::vector<std::string>{"project", "user_input", "project", "project"}));
  EXPECT_EQ(j["history"][1]["changes"]["draft_user_input"]["input"], "yes");

  const auto explicit_path = export_dir / "nested" / "copy.json";
  auto written = svc->cmd_export_history("exec-json", explicit_path.string());
  ASSERT_TRUE(written.has_value());
  EXPECT_TRUE(std::filesystem::exists(explicit_path));
}

TEST(HistoryExportTest, NonScalarKeysAreWrittenAsFlowText) {
  auto j = sg::HistoryExportService::value_to_json(YAML::Load("{[x, y]: 1, plain: 2}"));
  ASSERT_TRUE(j.is_object());
  EXPECT_EQ(j["[x, y]"], 1);
  EXPECT_EQ(j["plain"], 2);
}

TEST_F(KernelTest, AsyncInputResumesOnTheRuntimeThread) {
  auto keys = svc->cmd_handler_keys();
  EXPECT_NE(std::find(keys.begin(), keys.end(), "emit:constant"), keys.end());

  ASSERT_TRUE(svc->cmd_load_graph(testcase("approval.yaml")));
  auto started = svc->cmd_start_async("approval", std::nullopt, "exec-async");
  ASSERT_TRUE(started.has_value());
  EXPECT_EQ(started->get().status, ExecutionStatus::Suspended);

  auto resumed = kernel->provide_user_input_async("exec-async", YAML::Node("yes"));
  ASSERT_TRUE(resumed.has_value());
  auto res = resumed->get();
  EXPECT_EQ(res.status, ExecutionStatus::Completed);
  EXPECT_TRUE(sg::is_terminal(res.status));
  EXPECT_EQ(res.current_node, "publish");
  EXPECT_FALSE(kernel->provide_user_input_async("ghost", YAML::Node("yes")).has_value());
}

TEST_F(KernelTest, ErrorsAreKeptPerKey) {
  EXPECT_FALSE(svc->cmd_start("nope").has_value());
  auto err = svc->cmd_last_error("nope");
  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, GraphErrc::NotFound);

  const std::string broken = testcase("broken.yaml");
  EXPECT_FALSE(svc->cmd_load_graph(broken).has_value());
  ASSERT_TRUE(svc->cmd_last_error(broken).has_value());
  EXPECT_EQ(svc->cmd_last_error(broken)->code, GraphErrc::NotFound);

  EXPECT_FALSE(svc->cmd_provide_input("ghost", YAML::Node("x")).has_value());
  EXPECT_EQ(svc->cmd_last_error("ghost")->code, GraphErrc::NotFound);
}

TEST_F(KernelTest, CompletedExecutionRejectsInput) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("routing.yaml")));
  auto res = svc->cmd_start("routing", std::nullopt, "exec-r");
  ASSERT_TRUE(res.has_value());
  ASSERT_EQ(res->status, ExecutionStatus::Completed);

  EXPECT_FALSE(svc->cmd_provide_input("exec-r", YAML::Node("late")).has_value());
  EXPECT_EQ(svc->cmd_last_error("exec-r")->code, GraphErrc::InvalidState);
  EXPECT_FALSE(kernel->run("exec-r").has_value());
  EXPECT_EQ(svc->cmd_last_error("exec-r")->code, GraphErrc::InvalidState);
  EXPECT_EQ(svc->cmd_result("exec-r")->status, ExecutionStatus::Completed);
}

TEST_F(KernelTest, ClosedExecutionResumesFromItsSession) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("approval.yaml")));
  ASSERT_TRUE(svc->cmd_start("approval", std::nullopt, "exec-c"));
  EXPECT_TRUE(svc->cmd_close_execution("exec-c"));
  EXPECT_TRUE(svc->cmd_list_executions().empty());
  EXPECT_FALSE(svc->cmd_status("exec-c").has_value());

  // The id stays taken while its session exists.
  EXPECT_FALSE(kernel->create_execution("approval", "exec-c").has_value());
  EXPECT_EQ(svc->cmd_last_error("exec-c")->code, GraphErrc::DuplicateId);

  auto resumed = svc->cmd_resume_session("exec-c");
  ASSERT_TRUE(resumed.has_value());
  EXPECT_EQ(resumed->status, ExecutionStatus::Suspended);
  EXPECT_EQ(resumed->current_node, "draft");

  auto done = svc->cmd_provide_input("exec-c", YAML::Node("no"));
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->current_node, "revise");
  EXPECT_EQ(done->state.get_string("status"), "Failed");
}

TEST_F(KernelTest, ResumeNeedsTheGraphLoaded) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("approval.yaml")));
  ASSERT_TRUE(svc->cmd_start("approval", std::nullopt, "exec-g"));
  ASSERT_TRUE(svc->cmd_close_execution("exec-g"));
  ASSERT_TRUE(svc->cmd_close_graph("approval"));

  EXPECT_FALSE(svc->cmd_resume_session("exec-g").has_value());
  EXPECT_EQ(svc->cmd_last_error("exec-g")->code, GraphErrc::NotFound);
  EXPECT_TRUE(svc->cmd_list_executions().empty());
}

TEST_F(KernelTest, AbandonDropsTheSession) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("approval.yaml")));
  ASSERT_TRUE(svc->cmd_start("approval", std::nullopt, "exec-x"));
  EXPECT_TRUE(svc->cmd_abandon("exec-x"));
  EXPECT_TRUE(svc->cmd_list_sessions().empty());
  EXPECT_FALSE(svc->cmd_resume_session("exec-x").has_value());
  EXPECT_EQ(svc->cmd_last_error("exec-x")->code, GraphErrc::NotFound);
  EXPECT_FALSE(svc->cmd_abandon("exec-x"));
}

TEST_F(KernelTest, ConcurrentExecutionsDoNotShareState) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("echo.yaml")));
  constexpr int kExecutions = 8;
  std::vector<std::future<sg::ExecutionResult>> futures;
  for (int i = 0; i < kExecutions; ++i) {
    YAML::Node input;
    input["stage"] = "stage-" + std::to_string(i);
    input["ticket"] = i;
    auto fut = svc->cmd_start_async("echo", input, "echo-" + std::to_string(i));
    ASSERT_TRUE(fut.has_value());
    futures.push_back(std::move(*fut));
  }
  for (int i = 0; i < kExecutions; ++i) {
    auto res = futures[i].get();
    EXPECT_EQ(res.execution_id, "echo-" + std::to_string(i));
    EXPECT_EQ(res.status, ExecutionStatus::Completed);
    EXPECT_EQ(res.state.get_string("stage"), "stage-" + std::to_string(i));
    EXPECT_DOUBLE_EQ(res.state.get_double("ticket", -1), static_cast<double>(i));
  }
  EXPECT_EQ(svc->cmd_list_executions().size(), static_cast<std::size_t>(kExecutions));
}

TEST_F(KernelTest, DrainEventsReturnsTheTrace) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("routing.yaml")));
  ASSERT_TRUE(svc->cmd_start("routing", std::nullopt, "exec-e"));

  auto events = svc->cmd_drain_events("exec-e");
  ASSERT_TRUE(events.has_value());
  ASSERT_FALSE(events->empty());
  EXPECT_EQ(events->front().kind, "start");
  EXPECT_EQ(events->back().kind, "complete");
  EXPECT_TRUE(svc->cmd_drain_events("exec-e")->empty());
  EXPECT_FALSE(svc->cmd_drain_events("unknown").has_value());
}

TEST_F(KernelTest, SavesLoadedGraphs) {
  ASSERT_TRUE(svc->cmd_load_graph(testcase("routing.yaml")));
  const auto out = export_dir / "routing_saved.yaml";
  EXPECT_TRUE(svc->cmd_save_graph("routing", out.string()));
  EXPECT_TRUE(std::filesystem::exists(out));
  EXPECT_FALSE(svc->cmd_save_graph("missing", out.string()));
  EXPECT_EQ(svc->cmd_last_error("missing")->code, GraphErrc::NotFound);

  // Same name twice is refused.
  EXPECT_FALSE(svc->cmd_load_graph(out.string()).has_value());
  EXPECT_EQ(svc->cmd_last_error(out.string())->code, GraphErrc::DuplicateId);
}
