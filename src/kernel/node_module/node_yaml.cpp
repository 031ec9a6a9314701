// Node YAML (de)serialization
#include "stategraph/node.hpp"

namespace sg {

/**
 * @brief Builds a Node from its YAML description.
 *
 * Required: `id` (non-empty scalar). Optional: `name` (defaults to id),
 * `type`, `subtype`, `parameters`. Throws GraphError(InvalidYaml) when `id`
 * is missing or when the entry is not a map.
 */
Node Node::from_yaml(const YAML::Node& n) {
  if (!n || !n.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "Node entry must be a map.");
  }
  if (!n["id"] || !n["id"].IsScalar() || n["id"].Scalar().empty()) {
    throw GraphError(GraphErrc::InvalidYaml, "Node entry is missing a non-empty 'id'.");
  }
  Node node;
  node.id = n["id"].as<std::string>();
  node.name = n["name"] ? n["name"].as<std::string>() : node.id;
  node.type = n["type"] ? n["type"].as<std::string>() : "";
  node.subtype = n["subtype"] ? n["subtype"].as<std::string>() : "";
  if (n["parameters"]) {
    node.parameters = YAML::Clone(n["parameters"]);
  }
  return node;
}

YAML::Node Node::to_yaml() const {
  YAML::Node n;
  n["id"] = id;
  if (!name.empty() && name != id) n["name"] = name;
  if (!type.empty()) n["type"] = type;
  if (!subtype.empty()) n["subtype"] = subtype;
  if (parameters && !parameters.IsNull()) n["parameters"] = YAML::Clone(parameters);
  return n;
}

}  // namespace sg
