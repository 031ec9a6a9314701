// Stategraph kernel: GraphEngine drives one execution of a graph
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stategraph/execution_types.hpp"
#include "stategraph/graph_model.hpp"
#include "stategraph/kernel/edge_evaluator.hpp"
#include "stategraph/kernel/node_registry.hpp"
#include "stategraph/kernel/services/graph_event_service.hpp"
#include "stategraph/kernel/services/session_store.hpp"
#include "stategraph/kernel/state_store.hpp"

namespace sg {

/**
 * @class GraphEngine
 * @brief State machine of one execution: Idle -> Running -> Suspended |
 * Completed | Failed, and Suspended -> Running on resume.
 *
 * A step invokes the current node, projects its output into the store, takes
 * a fresh snapshot and walks the node's outgoing edges in registration order.
 * The first true edge decides: no edge completes the execution, an edge that
 * requires user input suspends it until `{node}_user_input` exists, anything
 * else advances.
 *
 * The engine is not thread-safe. Callers that share an engine between threads
 * go through ExecutionRuntime, which serializes every call.
 */
class GraphEngine {
public:
    GraphEngine(std::shared_ptr<const GraphModel> graph,
                EngineOptions options = {},
                std::string execution_id = {});

    GraphEngine(const GraphEngine&) = delete;
    GraphEngine& operator=(const GraphEngine&) = delete;

    // Both optional; the engine only notifies them.
    void attach_session_store(std::shared_ptr<SessionStore> sessions) { sessions_ = std::move(sessions); }
    void attach_event_service(GraphEventService* events) { events_ = events; }

    // Idle only; throws GraphError(InvalidState) otherwise. Runs until the
    // execution suspends, completes or fails.
    ExecutionResult run(std::optional<StateValue> entry_input = std::nullopt);

    // Idle -> Running without invoking anything; step() then advances one node.
    void start(std::optional<StateValue> entry_input = std::nullopt);
    // Running only; throws GraphError(InvalidState) otherwise.
    StepOutcome step();

    // Suspended only; throws GraphError(InvalidState) otherwise. Records the
    // input, re-evaluates the blocking edge and keeps running when it holds.
    ExecutionResult provide_user_input(const StateValue& input);

    // Rebuilds an Idle engine from a persisted checkpoint of the same graph.
    void restore(const ExecutionCheckpoint& checkpoint);
    ExecutionCheckpoint checkpoint() const;

    ExecutionResult result() const;
    ExecutionStatus status() const { return status_; }
    const std::string& execution_id() const { return execution_id_; }
    const std::string& current_node() const { return current_node_; }
    std::optional<InteractionRequest> pending_interaction() const;
    std::vector<HistoryEntry> history() const { return store_.history(); }
    StateSnapshot state() const { return store_.get_all(); }

    const StateStore& store() const { return store_; }
    const GraphModel& graph() const { return *graph_; }
    const EngineOptions& options() const { return options_; }
    std::size_t condition_invocations() const { return evaluator_.invocations(); }

private:
    ExecutionResult drive();
    StepOutcome step_once();
    StepOutcome project_and_route(const std::string& node_id, const NodeRegistry::Invocation& inv);
    StepOutcome fail(const std::string& node_id, GraphErrc code, const std::string& message);
    StepOutcome suspend(const Edge& edge);
    void handle_malformed(const std::string& node_id, const ProjectionResult& projection);
    void advance(const Edge& edge);
    void persist();
    void warn(const std::string& node_id, const std::string& message);
    InteractionRequest make_request(const Edge& edge) const;

    std::shared_ptr<const GraphModel> graph_;
    EngineOptions options_;
    std::string execution_id_;

    StateStore store_;
    NodeRegistry registry_;
    EdgeEvaluator evaluator_;

    ExecutionStatus status_ = ExecutionStatus::Idle;
    std::string current_node_;
    std::optional<std::size_t> pending_edge_;
    std::optional<StateValue> entry_input_;
    std::size_t steps_ = 0;
    std::vector<std::string> execution_order_;
    std::vector<std::string> warnings_;
    std::optional<ExecutionFailure> failure_;

    std::shared_ptr<SessionStore> sessions_;
    GraphEventService* events_ = nullptr;
};

// "<graph>-<epoch ms>-<counter>", unique within the process.
std::string make_execution_id(const std::string& graph_name);

} // namespace sg
