#include "stategraph/graph_builder.hpp"

#include <utility>

namespace sg {

GraphBuilder::GraphBuilder(std::string name) : name_(std::move(name)) {}

void GraphBuilder::ensure_mutable(const char* op) const {
  if (frozen_) {
    throw GraphError(GraphErrc::Frozen,
                     std::string(op) + ": graph '" + name_ + "' is already built.");
  }
}

std::string GraphBuilder::add_node(NodeHandler handler, const std::string& id) {
  Node node;
  node.id = id;
  node.name = id;
  node.handler = std::move(handler);
  return add_node(std::move(node));
}

std::string GraphBuilder::add_node(Node node) {
  ensure_mutable("add_node");
  if (node.id.empty()) {
    throw GraphError(GraphErrc::InvalidParameter, "Node id must not be empty.");
  }
  if (!node.handler) {
    throw GraphError(GraphErrc::InvalidParameter,
                     "Node '" + node.id + "' has no handler.");
  }
  if (!ids_.insert(node.id).second) {
    throw GraphError(GraphErrc::DuplicateId,
                     "Node id '" + node.id + "' already exists in graph '" + name_ + "'.");
  }
  if (node.name.empty()) node.name = node.id;
  nodes_.push_back(std::move(node));
  return nodes_.back().id;
}

std::size_t GraphBuilder::add_edge(const std::string& source,
                                   const std::string& target,
                                   Condition condition,
                                   bool requires_user_input,
                                   std::string label) {
  Edge edge;
  edge.source = source;
  edge.target = target;
  edge.condition = std::move(condition);
  edge.requires_user_input = requires_user_input;
  edge.label = std::move(label);
  return add_edge(std::move(edge));
}

std::size_t GraphBuilder::add_edge(Edge edge) {
  ensure_mutable("add_edge");
  edge.index = edges_.size();
  edges_.push_back(std::move(edge));
  return edges_.back().index;
}

void GraphBuilder::set_entry_point(const std::string& id) {
  ensure_mutable("set_entry_point");
  entry_point_ = id;
}

void GraphBuilder::set_field_mapping(FieldMapping mapping) {
  ensure_mutable("set_field_mapping");
  mapping_ = std::move(mapping);
}

std::shared_ptr<const GraphModel> GraphBuilder::build() {
  ensure_mutable("build");
  if (entry_point_.empty()) {
    throw GraphError(GraphErrc::MissingEntryPoint,
                     "Graph '" + name_ + "' has no entry point.");
  }
  if (!ids_.count(entry_point_)) {
    throw GraphError(GraphErrc::UnknownReference,
                     "Entry point '" + entry_point_ + "' is not a node of graph '" + name_ + "'.");
  }
  for (const auto& e : edges_) {
    for (const std::string* end : {&e.source, &e.target}) {
      if (!ids_.count(*end)) {
        throw GraphError(GraphErrc::UnknownReference,
                         "Edge #" + std::to_string(e.index) + " (" + e.source + " -> " +
                             e.target + ") references unknown node '" + *end + "'.");
      }
    }
  }
  frozen_ = true;
  return std::make_shared<GraphModel>(name_, std::move(nodes_), std::move(edges_),
                                       entry_point_, std::move(mapping_));
}

}  // namespace sg
