#include "stategraph/graph_model.hpp"

#include <utility>

namespace sg {

GraphModel::GraphModel(std::string name,
                       std::vector<Node> nodes,
                       std::vector<Edge> edges,
                       std::string entry_point,
                       FieldMapping mapping)
    : name_(std::move(name)),
      nodes_(std::move(nodes)),
      edges_(std::move(edges)),
      entry_point_(std::move(entry_point)),
      mapping_(std::move(mapping)) {
  for (std::size_t i = 0; i < nodes_.size(); ++i) {
    node_index_.emplace(nodes_[i].id, i);
  }
  for (std::size_t i = 0; i < edges_.size(); ++i) {
    edges_[i].index = i;
    outgoing_[edges_[i].source].push_back(i);
  }
}

bool GraphModel::has_node(const std::string& id) const {
  return node_index_.count(id) > 0;
}

const Node* GraphModel::find_node(const std::string& id) const {
  auto it = node_index_.find(id);
  return it == node_index_.end() ? nullptr : &nodes_[it->second];
}

const Node& GraphModel::node(const std::string& id) const {
  const Node* n = find_node(id);
  if (!n) {
    throw GraphError(GraphErrc::NotFound,
                     "Node '" + id + "' is not part of graph '" + name_ + "'.");
  }
  return *n;
}

std::vector<const Edge*> GraphModel::outgoing(const std::string& id) const {
  std::vector<const Edge*> out;
  auto it = outgoing_.find(id);
  if (it == outgoing_.end()) return out;
  out.reserve(it->second.size());
  for (std::size_t idx : it->second) out.push_back(&edges_[idx]);
  return out;
}

const Edge& GraphModel::edge_at(std::size_t index) const {
  if (index >= edges_.size()) {
    throw GraphError(GraphErrc::NotFound,
                     "Edge #" + std::to_string(index) + " is not part of graph '" + name_ + "'.");
  }
  return edges_[index];
}

bool GraphModel::is_declarative() const {
  for (const auto& n : nodes_) {
    if (n.type.empty() || n.subtype.empty()) return false;
  }
  for (const auto& e : edges_) {
    if (e.condition && e.condition_yaml.IsNull()) return false;
  }
  return true;
}

}  // namespace sg
