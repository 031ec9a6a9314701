#include "stategraph/kernel/services/history_export_service.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

namespace {

bool is_integer_text(const std::string& text) {
  std::size_t i = (text[0] == '-' || text[0] == '+') ? 1 : 0;
  if (i == text.size()) return false;
  for (; i < text.size(); ++i) {
    if (text[i] < '0' || text[i] > '9') return false;
  }
  return true;
}

nlohmann::json scalar_to_json(const StateValue& v) {
  const std::string& text = v.Scalar();
  if (v.Tag() == "!") return text;  // quoted in the source document
  if (text == "null" || text == "~") return nullptr;
  if (text == "true" || text == "True" || text == "TRUE") return true;
  if (text == "false" || text == "False" || text == "FALSE") return false;
  if (auto n = as_number(v)) {
    if (is_integer_text(text)) {
      try {
        return nlohmann::json(std::stoll(text));
      } catch (const std::out_of_range&) {
        return *n;
      }
    }
    if (std::isfinite(*n)) return *n;
  }
  return text;
}

nlohmann::json state_to_json(const StateMap& state) {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& kv : state) j[kv.first] = HistoryExportService::value_to_json(kv.second);
  return j;
}

}  // namespace

nlohmann::json HistoryExportService::value_to_json(const StateValue& value) {
  if (!value.IsDefined() || value.IsNull()) return nullptr;
  if (value.IsScalar()) return scalar_to_json(value);
  if (value.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : value) arr.push_back(value_to_json(item));
    return arr;
  }
  nlohmann::json obj = nlohmann::json::object();
  // JSON keys are strings; non-scalar YAML keys are written in flow style.
  for (const auto& kv : value) obj[describe_value(kv.first)] = value_to_json(kv.second);
  return obj;
}

nlohmann::json HistoryExportService::history_to_json(const std::vector<HistoryEntry>& history) const {
  nlohmann::json j = nlohmann::json::array();
  for (const auto& e : history) {
    j.push_back({{"sequence", e.sequence},
                 {"timestamp", format_timestamp(e.timestamp)},
                 {"node_id", e.node_id},
                 {"operation", to_string(e.operation)},
                 {"changes", state_to_json(e.changes)},
                 {"details", e.details}});
  }
  return j;
}

nlohmann::json HistoryExportService::checkpoint_to_json(const ExecutionCheckpoint& cp) const {
  nlohmann::json j;
  j["execution_id"] = cp.execution_id;
  j["graph"] = cp.graph_name;
  j["status"] = to_string(cp.status);
  j["current_node"] = cp.current_node;
  j["steps"] = cp.steps;
  j["execution_order"] = cp.execution_order;
  j["warnings"] = cp.warnings;
  j["state"] = state_to_json(cp.state);
  if (cp.failure) {
    j["failure"] = {{"node_id", cp.failure->node_id},
                    {"code", to_string(cp.failure->code)},
                    {"message", cp.failure->message}};
  }
  j["history"] = history_to_json(cp.history);
  return j;
}

void HistoryExportService::write(const nlohmann::json& doc, const std::filesystem::path& path) const {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream ofs(path);
  if (!ofs) {
    throw GraphError(GraphErrc::Io, "Failed to open file for writing: " + path.string());
  }
  ofs << std::setw(2) << doc << std::endl;
}

}  // namespace sg
