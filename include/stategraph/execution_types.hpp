// Stategraph kernel: value types exchanged between the engine and its callers
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "stategraph/kernel/state_store.hpp"
#include "stategraph/sg_types.hpp"
#include "stategraph/state_snapshot.hpp"

namespace sg {

enum class ExecutionStatus { Idle, Running, Suspended, Completed, Failed };

const char* to_string(ExecutionStatus status);
std::optional<ExecutionStatus> execution_status_from_string(const std::string& text);

inline bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::Completed || status == ExecutionStatus::Failed;
}

// What to do when a node's payload cannot be read as a record.
enum class MalformedOutputPolicy { Warn, Fatal, Fallback };
// What happens to `{node}_user_input` after it satisfied an edge.
enum class UserInputConsumption { Persist, Clear };

const char* to_string(MalformedOutputPolicy policy);
std::optional<MalformedOutputPolicy> malformed_output_policy_from_string(const std::string& text);
const char* to_string(UserInputConsumption mode);
std::optional<UserInputConsumption> user_input_consumption_from_string(const std::string& text);

struct EngineOptions {
    std::size_t max_steps = 0;  // 0 = unbounded
    MalformedOutputPolicy malformed_output = MalformedOutputPolicy::Warn;
    UserInputConsumption user_input_consumption = UserInputConsumption::Persist;
    std::string options_field = "options";
    bool quiet = true;
};

/// Everything a frontend needs to ask a human for input.
struct InteractionRequest {
    std::string node_id;
    StateValue node_output;            // `{node_id}_result` at suspension time
    std::vector<std::string> options;  // from node_output[options_field], may be empty
    std::size_t edge_index = 0;
    std::string edge_target;
};

struct ExecutionFailure {
    std::string node_id;
    GraphErrc code = GraphErrc::Unknown;
    std::string message;
    StateSnapshot last_snapshot;
};

// One step either moved on, stopped for input, ran out of edges or failed.
struct StepRunning {
    std::string node_id;
    std::string next_node;
};
struct StepSuspended {
    InteractionRequest request;
};
struct StepCompleted {
    std::string node_id;
};
struct StepFailed {
    ExecutionFailure failure;
};
using StepOutcome = std::variant<StepRunning, StepSuspended, StepCompleted, StepFailed>;

struct ExecutionResult {
    std::string execution_id;
    ExecutionStatus status = ExecutionStatus::Idle;
    std::string current_node;
    StateSnapshot state;
    std::optional<InteractionRequest> interaction;
    std::optional<ExecutionFailure> failure;
    std::vector<std::string> warnings;
    std::vector<std::string> execution_order;
    std::size_t steps = 0;
};

/**
 * @brief Persistable image of one execution.
 *
 * Enough to rebuild a GraphEngine over the same graph in another process:
 * state and history of the store, the node the execution stands on, the edge
 * that blocks it while suspended, and the per-node visit counts.
 */
struct ExecutionCheckpoint {
    std::string execution_id;
    std::string graph_name;
    ExecutionStatus status = ExecutionStatus::Idle;
    std::string current_node;
    std::optional<std::size_t> pending_edge;
    std::size_t steps = 0;
    StateMap state;
    std::vector<HistoryEntry> history;
    std::map<std::string, std::size_t> visits;
    std::vector<std::string> execution_order;
    std::vector<std::string> warnings;
    std::optional<ExecutionFailure> failure;
};

} // namespace sg
