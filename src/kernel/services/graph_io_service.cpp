#include "stategraph/kernel/services/graph_io_service.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>

#include "stategraph/graph_builder.hpp"
#include "stategraph/kernel/conditions.hpp"
#include "stategraph/kernel/value_utils.hpp"

namespace sg {

namespace {

FieldMapping mapping_from_yaml(const YAML::Node& n) {
  if (n && n.IsScalar() && n.Scalar() == "routing_defaults") {
    return FieldMapping::routing_defaults();
  }
  return FieldMapping::from_yaml(n);
}

Edge edge_from_yaml(const YAML::Node& n) {
  if (!n.IsMap() || !n["from"] || !n["to"]) {
    throw GraphError(GraphErrc::InvalidYaml, "Edge entry needs 'from' and 'to'.");
  }
  Edge edge;
  edge.source = n["from"].as<std::string>();
  edge.target = n["to"].as<std::string>();
  edge.requires_user_input = as_bool_flexible(n, "requires_user_input", false);
  edge.label = as_str(n, "label");
  if (n["when"]) {
    edge.condition_yaml = YAML::Clone(n["when"]);
    edge.condition = conditions::from_yaml(edge.condition_yaml);
  }
  return edge;
}

}  // namespace

std::shared_ptr<const GraphModel> GraphIOService::load(
    const std::filesystem::path& yaml_path) const {
  YAML::Node config;
  try {
    config = YAML::LoadFile(yaml_path.string());
  } catch (const std::exception& e) {
    throw GraphError(GraphErrc::Io, "Failed to load YAML file " +
                                        yaml_path.string() + ": " + e.what());
  }
  return parse(config);
}

std::shared_ptr<const GraphModel> GraphIOService::parse(const YAML::Node& root) const {
  if (!root.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "YAML root is not a graph map.");
  }
  try {
    GraphBuilder builder(as_str(root, "name", "graph"));
    builder.set_field_mapping(mapping_from_yaml(root["state_mapping"]));

    const YAML::Node nodes = root["nodes"];
    if (!nodes || !nodes.IsSequence()) {
      throw GraphError(GraphErrc::InvalidYaml, "Graph needs a 'nodes' sequence.");
    }
    for (const auto& node_yaml : nodes) {
      Node node = Node::from_yaml(node_yaml);
      if (node.type.empty() || node.subtype.empty()) {
        throw GraphError(GraphErrc::InvalidYaml,
                         "Node '" + node.id + "' needs a type and a subtype.");
      }
      auto handler = HandlerRegistry::instance().find(node.type, node.subtype);
      if (!handler) {
        throw GraphError(GraphErrc::NotFound,
                         "No handler registered for " + make_key(node.type, node.subtype) +
                             " (node '" + node.id + "').");
      }
      node.handler = *handler;
      builder.add_node(std::move(node));
    }

    const YAML::Node edges = root["edges"];
    if (edges) {
      if (!edges.IsSequence()) {
        throw GraphError(GraphErrc::InvalidYaml, "'edges' must be a sequence.");
      }
      for (const auto& edge_yaml : edges) builder.add_edge(edge_from_yaml(edge_yaml));
    }

    builder.set_entry_point(as_str(root, "entry"));
    return builder.build();
  } catch (const YAML::Exception& e) {
    throw GraphError(GraphErrc::InvalidYaml, std::string("Malformed graph YAML: ") + e.what());
  }
}

YAML::Node GraphIOService::to_yaml(const GraphModel& graph) const {
  if (!graph.is_declarative()) {
    throw GraphError(GraphErrc::InvalidParameter,
                     "Graph '" + graph.name() + "' has handlers or conditions built in code "
                     "and cannot be written as YAML.");
  }
  YAML::Node root;
  root["name"] = graph.name();
  root["entry"] = graph.entry_point();
  if (!graph.mapping().empty()) root["state_mapping"] = graph.mapping().to_yaml();

  YAML::Node nodes(YAML::NodeType::Sequence);
  for (const auto& node : graph.nodes()) nodes.push_back(node.to_yaml());
  root["nodes"] = nodes;

  YAML::Node edges(YAML::NodeType::Sequence);
  for (const auto& e : graph.edges()) {
    YAML::Node n;
    n["from"] = e.source;
    n["to"] = e.target;
    if (e.requires_user_input) n["requires_user_input"] = true;
    if (!e.label.empty()) n["label"] = e.label;
    if (e.condition) n["when"] = YAML::Clone(e.condition_yaml);
    edges.push_back(n);
  }
  root["edges"] = edges;
  return root;
}

void GraphIOService::save(const GraphModel& graph,
                          const std::filesystem::path& yaml_path) const {
  YAML::Node root = to_yaml(graph);
  std::ofstream fout(yaml_path);
  if (!fout) {
    throw GraphError(GraphErrc::Io,
                     "Failed to open file for writing: " + yaml_path.string());
  }
  fout << root;
}

}  // namespace sg
