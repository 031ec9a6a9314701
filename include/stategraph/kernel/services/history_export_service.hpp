#pragma once

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

#include "stategraph/execution_types.hpp"

namespace sg {

// JSON audit view of an execution's history for tools outside the engine.
class HistoryExportService {
 public:
  // Plain scalars become numbers, booleans or null when they read as such;
  // quoted scalars stay strings.
  static nlohmann::json value_to_json(const StateValue& value);

  nlohmann::json history_to_json(const std::vector<HistoryEntry>& history) const;
  nlohmann::json checkpoint_to_json(const ExecutionCheckpoint& checkpoint) const;

  void write(const nlohmann::json& doc, const std::filesystem::path& path) const;
};

}  // namespace sg
