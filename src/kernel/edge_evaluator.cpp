// Stategraph kernel: EdgeEvaluator implementation
#include "stategraph/kernel/edge_evaluator.hpp"

#include <algorithm>

namespace sg {

bool EdgeEvaluator::evaluate(const Edge& edge, const StateSnapshot& snapshot) {
  ++invocations_;
  if (!edge.condition) return true;
  try {
    return edge.condition(snapshot);
  } catch (const GraphError& e) {
    throw GraphError(GraphErrc::ConditionError,
                     "Condition of edge #" + std::to_string(edge.index) + " (" + edge.source +
                         " -> " + edge.target + ") failed: " + e.what());
  } catch (const std::exception& e) {
    throw GraphError(GraphErrc::ConditionError,
                     "Condition of edge #" + std::to_string(edge.index) + " (" + edge.source +
                         " -> " + edge.target + ") failed: " + e.what());
  } catch (...) {
    throw GraphError(GraphErrc::ConditionError,
                     "Condition of edge #" + std::to_string(edge.index) + " (" + edge.source +
                         " -> " + edge.target + ") failed: unknown exception");
  }
}

const Edge* EdgeEvaluator::first_true(const std::vector<const Edge*>& edges,
                                      const StateSnapshot& snapshot) {
  std::vector<const Edge*> ordered(edges);
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const Edge* a, const Edge* b) { return a->index < b->index; });
  for (const Edge* edge : ordered) {
    if (evaluate(*edge, snapshot)) return edge;
  }
  return nullptr;
}

}  // namespace sg
