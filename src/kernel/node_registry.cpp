// Stategraph kernel: NodeRegistry implementation
#include "stategraph/kernel/node_registry.hpp"

#include <chrono>
#include <utility>

namespace sg {

NodeRegistry::NodeRegistry(std::shared_ptr<const GraphModel> graph) : graph_(std::move(graph)) {
  if (!graph_) {
    throw GraphError(GraphErrc::InvalidParameter, "NodeRegistry needs a graph.");
  }
}

NodeRegistry::Invocation NodeRegistry::invoke(const std::string& id,
                                              const std::optional<StateValue>& entry_input,
                                              const StateSnapshot& state) {
  const Node& target = graph_->node(id);
  Invocation inv;
  inv.visit = ++visits_[id];

  NodeContext ctx{target, entry_input, state, inv.visit};
  auto start = std::chrono::high_resolution_clock::now();
  try {
    inv.output = target.handler(ctx);
  } catch (const GraphError& e) {
    throw GraphError(GraphErrc::NodeFailure,
                     "Node '" + target.id + "' (" + target.name + ") failed: " + e.what());
  } catch (const std::exception& e) {
    throw GraphError(GraphErrc::NodeFailure,
                     "Node '" + target.id + "' (" + target.name + ") failed: " + e.what());
  } catch (...) {
    throw GraphError(GraphErrc::NodeFailure,
                     "Node '" + target.id + "' (" + target.name + ") failed: unknown exception");
  }
  auto end = std::chrono::high_resolution_clock::now();
  inv.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
  if (inv.elapsed_ms < 0) inv.elapsed_ms = 0.0;
  return inv;
}

}  // namespace sg
