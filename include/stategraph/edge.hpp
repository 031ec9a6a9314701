#pragma once
#include <cstddef>
#include <functional>
#include <string>

#include "stategraph/sg_types.hpp"
#include "stategraph/state_snapshot.hpp"

namespace sg {

// A condition reads a snapshot and nothing else.
using Condition = std::function<bool(const StateSnapshot&)>;

/// A directed, conditionally taken transition.
/// `index` is the registration order inside the graph; when several edges of
/// one node are true in the same pass, the lowest index wins.
struct Edge {
    std::size_t index = 0;
    std::string source;
    std::string target;
    Condition condition;  // empty means unconditional
    bool requires_user_input = false;
    std::string label;

    // Declarative form when the edge came from YAML; null otherwise.
    YAML::Node condition_yaml;
};

} // namespace sg
