#pragma once

#include <filesystem>
#include <memory>

#include "stategraph/graph_model.hpp"

namespace sg {

// Reads and writes declarative graph files. Node handlers are bound through
// HandlerRegistry by `type:subtype`, conditions through conditions::from_yaml.
class GraphIOService {
 public:
  std::shared_ptr<const GraphModel> load(const std::filesystem::path& yaml_path) const;
  std::shared_ptr<const GraphModel> parse(const YAML::Node& root) const;

  // Throws GraphError(InvalidParameter) for graphs with code-only handlers or
  // conditions.
  void save(const GraphModel& graph, const std::filesystem::path& yaml_path) const;
  YAML::Node to_yaml(const GraphModel& graph) const;
};

}  // namespace sg
