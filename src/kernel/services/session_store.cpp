#include "stategraph/kernel/services/session_store.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

namespace {

YAML::Node state_to_yaml(const StateMap& state) {
  YAML::Node n(YAML::NodeType::Map);
  for (const auto& kv : state) n[kv.first] = clone_value(kv.second);
  return n;
}

StateMap state_from_yaml(const YAML::Node& n) {
  StateMap out;
  if (!n || n.IsNull()) return out;
  if (!n.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "Checkpoint state must be a map.");
  }
  for (const auto& kv : n) {
    out.emplace(kv.first.as<std::string>(), clone_value(kv.second));
  }
  return out;
}

YAML::Node history_entry_to_yaml(const HistoryEntry& e) {
  YAML::Node n;
  n["sequence"] = e.sequence;
  n["timestamp_ms"] = to_epoch_ms(e.timestamp);
  n["node_id"] = e.node_id;
  n["operation"] = to_string(e.operation);
  n["changes"] = state_to_yaml(e.changes);
  YAML::Node details(YAML::NodeType::Sequence);
  for (const auto& d : e.details) details.push_back(d);
  n["details"] = details;
  return n;
}

HistoryEntry history_entry_from_yaml(const YAML::Node& n) {
  HistoryEntry e;
  e.sequence = n["sequence"].as<std::uint64_t>();
  e.timestamp = from_epoch_ms(n["timestamp_ms"].as<std::int64_t>());
  e.node_id = n["node_id"].as<std::string>();
  auto op = history_op_from_string(n["operation"].as<std::string>());
  if (!op) {
    throw GraphError(GraphErrc::InvalidYaml,
                     "Unknown history operation '" + n["operation"].as<std::string>() + "'.");
  }
  e.operation = *op;
  e.changes = state_from_yaml(n["changes"]);
  if (n["details"]) e.details = n["details"].as<std::vector<std::string>>();
  return e;
}

GraphErrc errc_from_int(int raw) {
  if (raw < static_cast<int>(GraphErrc::Unknown) || raw > static_cast<int>(GraphErrc::Frozen)) {
    return GraphErrc::Unknown;
  }
  return static_cast<GraphErrc>(raw);
}

}  // namespace

YAML::Node checkpoint_to_yaml(const ExecutionCheckpoint& cp) {
  YAML::Node root;
  root["execution_id"] = cp.execution_id;
  root["graph"] = cp.graph_name;
  root["status"] = to_string(cp.status);
  root["current_node"] = cp.current_node;
  if (cp.pending_edge) root["pending_edge"] = *cp.pending_edge;
  root["steps"] = cp.steps;
  root["state"] = state_to_yaml(cp.state);

  YAML::Node visits(YAML::NodeType::Map);
  for (const auto& kv : cp.visits) visits[kv.first] = kv.second;
  root["visits"] = visits;

  YAML::Node order(YAML::NodeType::Sequence);
  for (const auto& id : cp.execution_order) order.push_back(id);
  root["execution_order"] = order;

  YAML::Node warnings(YAML::NodeType::Sequence);
  for (const auto& w : cp.warnings) warnings.push_back(w);
  root["warnings"] = warnings;

  if (cp.failure) {
    YAML::Node f;
    f["node_id"] = cp.failure->node_id;
    f["code"] = static_cast<int>(cp.failure->code);
    f["code_name"] = to_string(cp.failure->code);
    f["message"] = cp.failure->message;
    root["failure"] = f;
  }

  YAML::Node history(YAML::NodeType::Sequence);
  for (const auto& e : cp.history) history.push_back(history_entry_to_yaml(e));
  root["history"] = history;
  return root;
}

ExecutionCheckpoint checkpoint_from_yaml(const YAML::Node& n) {
  if (!n || !n.IsMap() || !n["execution_id"] || !n["graph"]) {
    throw GraphError(GraphErrc::InvalidYaml, "Document is not an execution checkpoint.");
  }
  try {
    ExecutionCheckpoint cp;
    cp.execution_id = n["execution_id"].as<std::string>();
    cp.graph_name = n["graph"].as<std::string>();
    auto status = execution_status_from_string(as_str(n, "status", "idle"));
    if (!status) {
      throw GraphError(GraphErrc::InvalidYaml,
                       "Checkpoint '" + cp.execution_id + "' has an unknown status.");
    }
    cp.status = *status;
    cp.current_node = as_str(n, "current_node");
    if (n["pending_edge"]) cp.pending_edge = n["pending_edge"].as<std::size_t>();
    if (n["steps"]) cp.steps = n["steps"].as<std::size_t>();
    cp.state = state_from_yaml(n["state"]);
    if (n["visits"]) {
      for (const auto& kv : n["visits"]) {
        cp.visits[kv.first.as<std::string>()] = kv.second.as<std::size_t>();
      }
    }
    if (n["execution_order"]) {
      cp.execution_order = n["execution_order"].as<std::vector<std::string>>();
    }
    if (n["warnings"]) cp.warnings = n["warnings"].as<std::vector<std::string>>();
    if (n["failure"]) {
      const YAML::Node f = n["failure"];
      ExecutionFailure failure;
      failure.node_id = as_str(f, "node_id");
      failure.code = errc_from_int(as_int_flexible(f, "code", 1));
      failure.message = as_str(f, "message");
      failure.last_snapshot = StateSnapshot(cp.state);
      cp.failure = failure;
    }
    if (n["history"]) {
      for (const auto& item : n["history"]) cp.history.push_back(history_entry_from_yaml(item));
    }
    return cp;
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml,
                     std::string("Malformed checkpoint: ") + e.what());
  }
}

void MemorySessionStore::save(const std::string& execution_id, const ExecutionCheckpoint& cp) {
  YAML::Emitter out;
  out << checkpoint_to_yaml(cp);
  std::lock_guard<std::mutex> lock(mutex_);
  documents_[execution_id] = out.c_str();
}

std::optional<ExecutionCheckpoint> MemorySessionStore::load(const std::string& execution_id) const {
  std::string text;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(execution_id);
    if (it == documents_.end()) return std::nullopt;
    text = it->second;
  }
  return checkpoint_from_yaml(YAML::Load(text));
}

bool MemorySessionStore::remove(const std::string& execution_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return documents_.erase(execution_id) > 0;
}

std::vector<std::string> MemorySessionStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(documents_.size());
  for (const auto& kv : documents_) ids.push_back(kv.first);
  return ids;
}

FileSessionStore::FileSessionStore(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    throw GraphError(GraphErrc::Io,
                     "Cannot create session directory " + root_.string() + ": " + ec.message());
  }
}

std::filesystem::path FileSessionStore::path_for(const std::string& execution_id) const {
  if (execution_id.empty() || execution_id.find('/') != std::string::npos ||
      execution_id.find('\\') != std::string::npos || execution_id == "." ||
      execution_id == "..") {
    throw GraphError(GraphErrc::InvalidParameter,
                     "Execution id '" + execution_id + "' cannot be used as a file name.");
  }
  return root_ / (execution_id + ".yaml");
}

void FileSessionStore::save(const std::string& execution_id, const ExecutionCheckpoint& cp) {
  const auto path = path_for(execution_id);
  std::lock_guard<std::mutex> lock(mutex_);
  std::ofstream fout(path);
  if (!fout) {
    throw GraphError(GraphErrc::Io, "Failed to open file for writing: " + path.string());
  }
  fout << checkpoint_to_yaml(cp);
}

std::optional<ExecutionCheckpoint> FileSessionStore::load(const std::string& execution_id) const {
  const auto path = path_for(execution_id);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::filesystem::exists(path)) return std::nullopt;
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(path.string());
  } catch (const std::exception& e) {
    throw GraphError(GraphErrc::Io, "Failed to load YAML file " + path.string() + ": " + e.what());
  }
  return checkpoint_from_yaml(doc);
}

bool FileSessionStore::remove(const std::string& execution_id) {
  const auto path = path_for(execution_id);
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  return std::filesystem::remove(path, ec);
}

std::vector<std::string> FileSessionStore::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(root_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
      ids.push_back(entry.path().stem().string());
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace sg
