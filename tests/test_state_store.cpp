#include <gtest/gtest.h>

#include <set>
#include <string>
#include <thread>
#include <vector>

#include "stategraph/kernel/state_store.hpp"
#include "stategraph/kernel/value_utils.hpp"
#include "test_helpers.hpp"

using sg::FieldMapping;
using sg::FieldRule;
using sg::FieldType;
using sg::HistoryOp;
using sg::NodeOutput;
using sg::StateStore;

namespace {

NodeOutput out(const std::string& yaml) { return NodeOutput{YAML::Load(yaml)}; }

FieldMapping stage_status_mapping() {
  FieldMapping m;
  m.map("stage");
  m.map("status");
  return m;
}

FieldRule confidence_rule() {
  FieldRule r;
  r.source = "confidence";
  r.type = FieldType::Number;
  r.min = 0.0;
  r.max = 1.0;
  r.default_value = YAML::Node(0.5);
  return r;
}

}  // namespace

TEST(StateStoreTest, MappedFieldsReachGlobalStateRawRecordIsKept) {
  StateStore store(stage_status_mapping());
  auto r = store.project("classify", out("{stage: billing, status: Success, secret: 42}"));
  ASSERT_TRUE(r.ok);

  auto all = store.get_all();
  EXPECT_EQ(all.get_string("stage"), "billing");
  EXPECT_EQ(all.get_string("status"), "Success");
  EXPECT_FALSE(all.has("secret"));

  auto rec = store.get("classify_result");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ((*rec)["secret"].as<int>(), 42);
  EXPECT_EQ((*rec)["stage"].as<std::string>(), "billing");
}

TEST(StateStoreTest, HistoryRecordsOnlyChangedFields) {
  StateStore store(stage_status_mapping());
  store.project("a", out("{stage: billing, status: Success}"));
  store.project("a", out("{stage: billing, status: Success}"));
  store.project("a", out("{stage: support, status: Success}"));

  auto h = store.history();
  ASSERT_EQ(h.size(), 3u);
  EXPECT_EQ(h[0].changes.size(), 3u);  // stage, status, a_result
  EXPECT_TRUE(h[1].changes.empty());
  EXPECT_EQ(h[2].changes.count("stage"), 1u);
  EXPECT_EQ(h[2].changes.count("a_result"), 1u);
  EXPECT_EQ(h[2].changes.count("status"), 0u);
  EXPECT_EQ(h[2].changes.at("stage").as<std::string>(), "support");
  for (const auto& e : h) EXPECT_EQ(e.operation, HistoryOp::Project);
  EXPECT_LT(h[0].sequence, h[1].sequence);
  EXPECT_LT(h[1].sequence, h[2].sequence);
}

TEST(StateStoreTest, SameProjectionsInSameOrderGiveSameState) {
  StateStore left(stage_status_mapping());
  StateStore right(stage_status_mapping());
  const std::vector<std::pair<std::string, std::string>> steps = {
      {"a", "{stage: one, status: Pending}"},
      {"b", "{stage: two}"},
      {"a", "{status: Success, extra: [1, 2]}"},
  };
  for (const auto& s : steps) {
    left.project(s.first, out(s.second));
    right.project(s.first, out(s.second));
  }
  const auto l = left.get_all().values();
  const auto r = right.get_all().values();
  ASSERT_EQ(l.size(), r.size());
  for (const auto& kv : l) {
    ASSERT_EQ(r.count(kv.first), 1u) << kv.first;
    EXPECT_TRUE(sg::values_equal(kv.second, r.at(kv.first))) << kv.first;
  }
  EXPECT_EQ(left.get_all().get_string("stage"), "two");
  EXPECT_EQ(left.get_all().get_string("status"), "Success");
}

TEST(StateStoreTest, OutOfRangeNumberIsClamped) {
  FieldMapping m;
  m.add(confidence_rule());
  StateStore store(m);

  auto r = store.project("n", out("{confidence: 1.7}"));
  ASSERT_TRUE(r.ok);
  EXPECT_DOUBLE_EQ(store.get_all().get_double("confidence", -1.0), 1.0);
  ASSERT_EQ(r.substitutions.size(), 1u);
  EXPECT_NE(r.substitutions[0].find("clamped"), std::string::npos);

  store.project("n", out("{confidence: -3}"));
  EXPECT_DOUBLE_EQ(store.get_all().get_double("confidence", -1.0), 0.0);
}

TEST(StateStoreTest, NonFiniteNumbersNeverEscapeTheRange) {
  StateStore store(FieldMapping::routing_defaults());
  auto r = store.project("A", out("{stage: A, status: Success, confidence: nan}"));
  ASSERT_TRUE(r.ok);
  EXPECT_DOUBLE_EQ(store.get_all().get_double("confidence", -1.0), 0.5);
  ASSERT_EQ(r.substitutions.size(), 1u);
  EXPECT_NE(r.substitutions[0].find("defaulted"), std::string::npos);

  store.project("A", out("{stage: A, status: Success, confidence: inf}"));
  EXPECT_DOUBLE_EQ(store.get_all().get_double("confidence", -1.0), 1.0);
  store.project("A", out("{stage: A, status: Success, confidence: -inf}"));
  EXPECT_DOUBLE_EQ(store.get_all().get_double("confidence", -1.0), 0.0);

  FieldMapping unbounded;
  FieldRule score;
  score.source = "score";
  score.type = FieldType::Number;
  score.default_value = YAML::Node(0);
  unbounded.add(score);
  StateStore plain(unbounded);
  plain.project("A", out("{score: inf}"));
  EXPECT_DOUBLE_EQ(plain.get_all().get_double("score", -1.0), 0.0);
}

TEST(StateStoreTest, IntegerClampRoundsIntoTheRange) {
  FieldMapping m;
  FieldRule retries;
  retries.source = "retries";
  retries.type = FieldType::Integer;
  retries.min = 0.5;
  retries.max = 9.5;
  m.add(retries);
  StateStore store(m);

  store.project("n", out("{retries: 0}"));
  EXPECT_EQ(store.get_all().get_string("retries"), "1");
  store.project("n", out("{retries: 12}"));
  EXPECT_EQ(store.get_all().get_string("retries"), "9");
  store.project("n", out("{retries: 4}"));
  EXPECT_EQ(store.get_all().get_string("retries"), "4");
}

TEST(StateStoreTest, RecordsWithSequenceKeysCompareOnRevisit) {
  auto record = [](int value) {
    YAML::Node key;
    key.push_back("x");
    key.push_back("y");
    YAML::Node rec;
    rec["stage"] = "A";
    rec[key] = value;
    return NodeOutput{rec};
  };

  StateStore store(stage_status_mapping());
  ASSERT_TRUE(store.project("A", record(1)).ok);
  ASSERT_TRUE(store.project("A", record(1)).ok);
  auto h = store.history();
  ASSERT_EQ(h.size(), 2u);
  EXPECT_TRUE(h[1].changes.empty());

  store.project("A", record(2));
  EXPECT_EQ(store.history().back().changes.count("A_result"), 1u);
}

TEST(StateStoreTest, InvalidValueFallsBackToDefault) {
  FieldMapping m;
  FieldRule status;
  status.source = "status";
  status.type = FieldType::String;
  status.allowed = {"Success", "Failed"};
  status.default_value = YAML::Node("Success");
  m.add(status);
  m.add(confidence_rule());
  StateStore store(m);

  auto r = store.project("n", out("{status: Sideways, confidence: high}"));
  ASSERT_TRUE(r.ok);
  auto all = store.get_all();
  EXPECT_EQ(all.get_string("status"), "Success");
  EXPECT_DOUBLE_EQ(all.get_double("confidence", -1.0), 0.5);
  EXPECT_EQ(r.substitutions.size(), 2u);
  // History keeps the substitution notes next to the changes.
  auto h = store.history();
  ASSERT_EQ(h.size(), 1u);
  EXPECT_EQ(h[0].details.size(), 2u);
}

TEST(StateStoreTest, InvalidValueWithoutDefaultIsDropped) {
  FieldMapping m;
  FieldRule priority;
  priority.source = "priority";
  priority.allowed = {"low", "high"};
  m.add(priority);
  StateStore store(m);

  auto r = store.project("n", out("{priority: urgent}"));
  ASSERT_TRUE(r.ok);
  EXPECT_FALSE(store.get_all().has("priority"));
  ASSERT_EQ(r.substitutions.size(), 1u);
  EXPECT_NE(r.substitutions[0].find("dropped"), std::string::npos);
  // The raw record still carries the rejected value.
  EXPECT_EQ((*store.get("n_result"))["priority"].as<std::string>(), "urgent");
}

TEST(StateStoreTest, MissingFieldIsFilledWithNodeId) {
  StateStore store(FieldMapping::routing_defaults());
  auto r = store.project("triage", out("{note: nothing to route}"));
  ASSERT_TRUE(r.ok);
  auto all = store.get_all();
  EXPECT_EQ(all.get_string("stage"), "triage");
  EXPECT_EQ(all.get_string("status"), "Success");
  EXPECT_FALSE(all.has("confidence"));  // not filled when missing
}

TEST(StateStoreTest, TextPayloadWithEmbeddedObjectIsProjected) {
  StateStore store(FieldMapping::routing_defaults());
  auto r = store.project(
      "llm", NodeOutput{YAML::Node(std::string(
                 "I think this is a billing issue. {\"stage\": \"billing\", \"confidence\": 0.8} Thanks."))});
  ASSERT_TRUE(r.ok) << r.error;
  auto all = store.get_all();
  EXPECT_EQ(all.get_string("stage"), "billing");
  EXPECT_DOUBLE_EQ(all.get_double("confidence", 0.0), 0.8);
  ASSERT_TRUE(all.get("llm_result")->IsMap());
}

TEST(StateStoreTest, MalformedPayloadLeavesStateUntouched) {
  StateStore store(stage_status_mapping());
  store.project("a", out("{stage: billing}"));
  const auto before = store.get_all().values();

  auto r = store.project("b", NodeOutput{YAML::Node(std::string("no structure at all"))});
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.error.empty());

  const auto after = store.get_all().values();
  ASSERT_EQ(before.size(), after.size());
  EXPECT_FALSE(store.get_all().has("b_result"));

  auto h = store.history();
  ASSERT_EQ(h.size(), 2u);
  EXPECT_EQ(h[1].operation, HistoryOp::Failure);
  EXPECT_EQ(h[1].node_id, "b");
  ASSERT_FALSE(h[1].details.empty());
  EXPECT_EQ(h[1].details[0].rfind("malformed output", 0), 0u);

  EXPECT_FALSE(store.project("c", out("[1, 2, 3]")).ok);
  EXPECT_FALSE(store.project("d", NodeOutput{}).ok);
}

TEST(StateStoreTest, UserInputIsStoredBesideTheResult) {
  StateStore store(stage_status_mapping());
  store.project("draft", out("{stage: draft, text: hello}"));
  store.record_user_input("draft", YAML::Node("yes"));

  auto rec = store.get("draft_user_input");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ((*rec)["input"].as<std::string>(), "yes");
  EXPECT_EQ((*rec)["node_id"].as<std::string>(), "draft");
  EXPECT_FALSE((*rec)["timestamp"].as<std::string>().empty());
  EXPECT_EQ((*rec)["trigger"]["text"].as<std::string>(), "hello");

  // The node's own result is not overwritten.
  EXPECT_EQ((*store.get("draft_result"))["text"].as<std::string>(), "hello");
  EXPECT_EQ(store.history().back().operation, HistoryOp::UserInput);
}

TEST(StateStoreTest, SnapshotsAreDeepCopies) {
  StateStore store(stage_status_mapping());
  store.project("a", out("{stage: one, nested: {k: v}}"));
  const auto snap = store.get_all();

  store.project("a", out("{stage: two, nested: {k: w}}"));
  EXPECT_EQ(snap.get_string("stage"), "one");
  EXPECT_EQ(snap.to_yaml()["stage"].as<std::string>(), "one");
  EXPECT_EQ((*snap.get("a_result"))["nested"]["k"].as<std::string>(), "v");

  auto copy = snap.get("a_result");
  (*copy)["nested"]["k"] = "changed";
  EXPECT_EQ((*snap.get("a_result"))["nested"]["k"].as<std::string>(), "v");
  EXPECT_EQ((*store.get("a_result"))["nested"]["k"].as<std::string>(), "w");

  auto values = snap.values();
  YAML::Node stage = values.at("stage");
  stage = "rewritten";
  EXPECT_EQ(snap.get_string("stage"), "one");
}

TEST(StateStoreTest, ConcurrentProjectionsFormOneTotalOrder) {
  FieldMapping m;
  m.map("counter");
  StateStore store(m);

  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&store, t] {
      for (int i = 0; i < kPerThread; ++i) {
        YAML::Node rec;
        rec["counter"] = t * 1000 + i;
        store.project("worker" + std::to_string(t), NodeOutput{rec});
      }
    });
  }
  for (auto& w : workers) w.join();

  auto h = store.history();
  ASSERT_EQ(h.size(), static_cast<std::size_t>(kThreads * kPerThread));
  std::set<std::uint64_t> seen;
  for (std::size_t i = 0; i < h.size(); ++i) {
    EXPECT_EQ(h[i].sequence, i + 1);
    seen.insert(h[i].sequence);
  }
  EXPECT_EQ(seen.size(), h.size());
  for (int t = 0; t < kThreads; ++t) {
    EXPECT_TRUE(store.get_all().has("worker" + std::to_string(t) + "_result"));
  }
}

TEST(StateStoreTest, ClearUserInputRecordsConsumption) {
  StateStore store;
  store.record_user_input("gate", YAML::Node("approve"));
  ASSERT_TRUE(store.get("gate_user_input").has_value());

  EXPECT_TRUE(store.clear_user_input("gate"));
  EXPECT_FALSE(store.get("gate_user_input").has_value());
  EXPECT_EQ(store.history().back().operation, HistoryOp::Consume);
  EXPECT_FALSE(store.clear_user_input("gate"));
}

TEST(StateStoreTest, RestoreContinuesSequence) {
  StateStore original(stage_status_mapping());
  original.project("a", out("{stage: one}"));
  original.project("b", out("{stage: two}"));

  StateStore copy(stage_status_mapping());
  copy.restore(original.get_all().values(), original.history());
  EXPECT_EQ(copy.get_all().get_string("stage"), "two");
  ASSERT_EQ(copy.history_size(), 2u);

  copy.project("c", out("{stage: three}"));
  auto h = copy.history();
  EXPECT_EQ(h.back().sequence, 3u);
  EXPECT_EQ(original.get_all().get_string("stage"), "two");
}

TEST(StateStoreTest, FailureEntryDoesNotTouchState) {
  StateStore store(stage_status_mapping());
  store.project("a", out("{stage: one}"));
  store.record_failure("b", "Node 'b' failed: boom");
  EXPECT_EQ(store.get_all().size(), 2u);
  auto last = store.history().back();
  EXPECT_EQ(last.operation, HistoryOp::Failure);
  EXPECT_TRUE(last.changes.empty());
  EXPECT_EQ(sg::history_op_from_string(sg::to_string(last.operation)), HistoryOp::Failure);
}
