// Stategraph kernel: NodeRegistry invokes the nodes of one graph
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "stategraph/graph_model.hpp"
#include "stategraph/state_snapshot.hpp"

namespace sg {

/**
 * @brief Per-execution view of a graph's nodes.
 *
 * Tracks how often each node was visited so handlers can tell a first visit
 * from a loop iteration. Handler exceptions come back as
 * GraphError(NodeFailure) whose message names the node.
 */
class NodeRegistry {
public:
    struct Invocation {
        NodeOutput output;
        std::size_t visit = 0;
        double elapsed_ms = 0.0;
    };

    explicit NodeRegistry(std::shared_ptr<const GraphModel> graph);

    Invocation invoke(const std::string& id,
                      const std::optional<StateValue>& entry_input,
                      const StateSnapshot& state);

    const std::map<std::string, std::size_t>& visit_counts() const { return visits_; }
    void restore_visits(std::map<std::string, std::size_t> visits) { visits_ = std::move(visits); }

private:
    std::shared_ptr<const GraphModel> graph_;
    std::map<std::string, std::size_t> visits_;
};

} // namespace sg
