// Stategraph kernel: EdgeEvaluator picks the outgoing transition of a node
#pragma once

#include <cstddef>
#include <vector>

#include "stategraph/edge.hpp"

namespace sg {

class EdgeEvaluator {
public:
    // Throws GraphError(ConditionError) when the condition throws.
    bool evaluate(const Edge& edge, const StateSnapshot& snapshot);

    // First edge in registration order whose condition holds, nullptr if none.
    const Edge* first_true(const std::vector<const Edge*>& edges, const StateSnapshot& snapshot);

    // Number of condition invocations so far; unconditional edges count too.
    std::size_t invocations() const { return invocations_; }

private:
    std::size_t invocations_ = 0;
};

} // namespace sg
