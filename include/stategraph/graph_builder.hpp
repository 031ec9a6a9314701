#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "stategraph/graph_model.hpp"

namespace sg {

/**
 * @class GraphBuilder
 * @brief Mutable assembly area for a graph.
 *
 * Errors:
 * - add_node: DuplicateId for a repeated id, InvalidParameter for an empty id
 *   or an empty handler.
 * - build: MissingEntryPoint when no entry was set, UnknownReference when the
 *   entry or an edge endpoint names a node that was never added.
 * - any mutator after build(): Frozen.
 */
class GraphBuilder {
public:
    explicit GraphBuilder(std::string name = "graph");

    std::string add_node(NodeHandler handler, const std::string& id);
    std::string add_node(Node node);

    // Returns the registration index of the edge. An empty condition is
    // always true.
    std::size_t add_edge(const std::string& source,
                         const std::string& target,
                         Condition condition = {},
                         bool requires_user_input = false,
                         std::string label = {});
    std::size_t add_edge(Edge edge);

    void set_entry_point(const std::string& id);
    void set_field_mapping(FieldMapping mapping);

    std::shared_ptr<const GraphModel> build();
    bool frozen() const { return frozen_; }

private:
    void ensure_mutable(const char* op) const;

    std::string name_;
    std::vector<Node> nodes_;
    std::unordered_set<std::string> ids_;
    std::vector<Edge> edges_;
    std::string entry_point_;
    FieldMapping mapping_;
    bool frozen_ = false;
};

} // namespace sg
