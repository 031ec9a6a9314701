// Stategraph kernel: StateStore implementation
#include "stategraph/kernel/state_store.hpp"

#include <utility>

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

namespace {

StateMap clone_map(const StateMap& in) {
  StateMap out;
  for (const auto& kv : in) out.emplace(kv.first, clone_value(kv.second));
  return out;
}

// Locates the outermost {...} in free text, e.g. a model reply that wraps its
// JSON object in prose.
std::optional<std::string> embedded_object(const std::string& text) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    return std::nullopt;
  }
  return text.substr(open, close - open + 1);
}

}  // namespace

const char* to_string(HistoryOp op) {
  switch (op) {
    case HistoryOp::Project: return "project";
    case HistoryOp::UserInput: return "user_input";
    case HistoryOp::Failure: return "failure";
    case HistoryOp::Fallback: return "fallback";
    case HistoryOp::Consume: return "consume";
  }
  return "project";
}

std::optional<HistoryOp> history_op_from_string(const std::string& text) {
  if (text == "project") return HistoryOp::Project;
  if (text == "user_input") return HistoryOp::UserInput;
  if (text == "failure") return HistoryOp::Failure;
  if (text == "fallback") return HistoryOp::Fallback;
  if (text == "consume") return HistoryOp::Consume;
  return std::nullopt;
}

StateStore::StateStore(FieldMapping mapping) : mapping_(std::move(mapping)) {}

std::optional<YAML::Node> StateStore::interpret_payload(const StateValue& data,
                                                        std::string& error) {
  if (!data.IsDefined() || data.IsNull()) {
    error = "node returned an empty payload";
    return std::nullopt;
  }
  if (data.IsMap()) return clone_value(data);
  if (data.IsSequence()) {
    error = "node returned a sequence, expected a field/value record";
    return std::nullopt;
  }

  auto text = embedded_object(data.Scalar());
  if (!text) {
    error = "no object found in text payload";
    return std::nullopt;
  }
  try {
    YAML::Node parsed = YAML::Load(*text);
    if (parsed.IsMap()) return parsed;
    error = "embedded payload is not an object";
  } catch (const YAML::Exception& e) {
    error = std::string("embedded payload does not parse: ") + e.what();
  }
  return std::nullopt;
}

ProjectionResult StateStore::project(const std::string& node_id, const NodeOutput& output) {
  ProjectionResult result;
  std::string error;
  auto record = interpret_payload(output.data, error);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!record) {
    result.ok = false;
    result.error = error;
    append_history_locked(node_id, HistoryOp::Failure, {}, {"malformed output: " + error});
    return result;
  }

  StateMap changes;
  const YAML::Node& fields = *record;
  for (const auto& rule : mapping_.rules()) {
    std::optional<FieldCheck> check;
    const YAML::Node raw = fields[rule.source];
    if (raw && !raw.IsNull()) {
      check = FieldMapping::check(rule, raw, node_id);
    } else {
      check = FieldMapping::fill(rule, node_id);
    }
    if (!check) continue;
    if (!check->detail.empty()) result.substitutions.push_back(check->detail);
    if (check->outcome == FieldCheck::Outcome::Dropped) continue;
    if (write_locked(rule.target, check->value, changes)) {
      result.changed_fields.push_back(rule.target);
    }
  }

  const std::string own_key = result_key(node_id);
  if (write_locked(own_key, *record, changes)) {
    result.changed_fields.push_back(own_key);
  }

  append_history_locked(node_id, HistoryOp::Project, std::move(changes), result.substitutions);
  return result;
}

void StateStore::record_user_input(const std::string& node_id, const StateValue& input) {
  std::lock_guard<std::mutex> lock(mutex_);
  YAML::Node rec(YAML::NodeType::Map);
  rec["input"] = clone_value(input);
  rec["timestamp"] = format_timestamp(std::chrono::system_clock::now());
  rec["node_id"] = node_id;
  auto trigger = state_.find(result_key(node_id));
  if (trigger != state_.end()) {
    rec["trigger"] = clone_value(trigger->second);
  } else {
    rec["trigger"] = YAML::Node(YAML::NodeType::Null);
  }

  const std::string key = user_input_key(node_id);
  state_.erase(key);
  state_.emplace(key, rec);

  StateMap changes;
  changes.emplace(key, clone_value(rec));
  append_history_locked(node_id, HistoryOp::UserInput, std::move(changes), {});
}

void StateStore::apply_fallback(const std::string& node_id, const StateMap& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  StateMap changes;
  for (const auto& kv : fields) write_locked(kv.first, kv.second, changes);
  append_history_locked(node_id, HistoryOp::Fallback, std::move(changes),
                        {"fallback record applied"});
}

bool StateStore::clear_user_input(const std::string& node_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string key = user_input_key(node_id);
  if (state_.erase(key) == 0) return false;
  StateMap changes;
  changes.emplace(key, YAML::Node(YAML::NodeType::Null));
  append_history_locked(node_id, HistoryOp::Consume, std::move(changes),
                        {key + " consumed"});
  return true;
}

void StateStore::record_failure(const std::string& node_id, const std::string& reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  append_history_locked(node_id, HistoryOp::Failure, {}, {reason});
}

std::optional<StateValue> StateStore::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = state_.find(key);
  if (it == state_.end()) return std::nullopt;
  return clone_value(it->second);
}

StateSnapshot StateStore::get_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return StateSnapshot(state_);
}

std::vector<HistoryEntry> StateStore::history() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<HistoryEntry> out;
  out.reserve(history_.size());
  for (const auto& e : history_) {
    HistoryEntry copy = e;
    copy.changes = clone_map(e.changes);
    out.push_back(std::move(copy));
  }
  return out;
}

std::size_t StateStore::history_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return history_.size();
}

void StateStore::restore(const StateMap& state, const std::vector<HistoryEntry>& history) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = clone_map(state);
  history_.clear();
  history_.reserve(history.size());
  next_sequence_ = 1;
  for (const auto& e : history) {
    HistoryEntry copy = e;
    copy.changes = clone_map(e.changes);
    if (copy.sequence >= next_sequence_) next_sequence_ = copy.sequence + 1;
    history_.push_back(std::move(copy));
  }
}

void StateStore::append_history_locked(const std::string& node_id, HistoryOp op,
                                       StateMap changes, std::vector<std::string> details) {
  HistoryEntry entry;
  entry.sequence = next_sequence_++;
  entry.timestamp = std::chrono::system_clock::now();
  entry.node_id = node_id;
  entry.operation = op;
  entry.changes = std::move(changes);
  entry.details = std::move(details);
  history_.push_back(std::move(entry));
}

bool StateStore::write_locked(const std::string& key, const StateValue& value, StateMap& changes) {
  auto it = state_.find(key);
  if (it != state_.end() && values_equal(it->second, value)) return false;
  // Rebind rather than assign: assigning through a yaml-cpp handle rewrites
  // every other handle that shares the old node.
  if (it != state_.end()) state_.erase(it);
  state_.emplace(key, clone_value(value));
  changes.erase(key);
  changes.emplace(key, clone_value(value));
  return true;
}

}  // namespace sg
