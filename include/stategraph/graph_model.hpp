#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "stategraph/edge.hpp"
#include "stategraph/kernel/field_mapping.hpp"
#include "stategraph/node.hpp"
#include "stategraph/sg_types.hpp"

namespace sg {

/**
 * @class GraphModel
 * @brief Frozen graph definition produced by GraphBuilder::build().
 *
 * Nodes keep insertion order and edges keep registration order. Nothing here
 * can be mutated after construction, so one model may back any number of
 * concurrent executions.
 */
class GraphModel {
public:
    GraphModel(std::string name,
               std::vector<Node> nodes,
               std::vector<Edge> edges,
               std::string entry_point,
               FieldMapping mapping);

    const std::string& name() const { return name_; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }
    const std::string& entry_point() const { return entry_point_; }
    const FieldMapping& mapping() const { return mapping_; }

    bool has_node(const std::string& id) const;
    // nullptr when the id is unknown.
    const Node* find_node(const std::string& id) const;
    // Throws GraphError(NotFound).
    const Node& node(const std::string& id) const;

    // Outgoing edges of `id` in registration order.
    std::vector<const Edge*> outgoing(const std::string& id) const;
    // Throws GraphError(NotFound) when the index is out of range.
    const Edge& edge_at(std::size_t index) const;

    // True when every node has a registry key and every condition has a YAML
    // form, i.e. GraphIOService can write the graph back out.
    bool is_declarative() const;

private:
    std::string name_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::string entry_point_;
    FieldMapping mapping_;

    std::unordered_map<std::string, std::size_t> node_index_;
    std::unordered_map<std::string, std::vector<std::size_t>> outgoing_;
};

} // namespace sg
