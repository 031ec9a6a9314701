// Stategraph kernel: Interaction API between frontends and Kernel
#pragma once

#include <future>
#include <optional>
#include <string>
#include <vector>

#include "stategraph/kernel/handlers.hpp"
#include "stategraph/kernel/kernel.hpp"

namespace sg {

// Minimal interaction facade to decouple frontends from Kernel internals.
class InteractionService {
public:
    explicit InteractionService(Kernel& kernel) : kernel_(kernel) {}

    // Handlers
    void cmd_seed_builtin_handlers() { handlers::register_builtin(); }
    std::vector<std::string> cmd_handler_keys() const { return HandlerRegistry::instance().get_keys(); }

    // Graph lifecycle
    std::optional<std::string> cmd_load_graph(const std::string& yaml_path) { return kernel_.load_graph(yaml_path); }
    bool cmd_register_graph(std::shared_ptr<const GraphModel> graph) { return kernel_.register_graph(std::move(graph)); }
    bool cmd_save_graph(const std::string& graph, const std::string& yaml_path) { return kernel_.save_graph(graph, yaml_path); }
    bool cmd_close_graph(const std::string& graph) { return kernel_.close_graph(graph); }
    std::vector<std::string> cmd_list_graphs() const { return kernel_.list_graphs(); }

    // Executions
    std::optional<ExecutionResult> cmd_start(const std::string& graph,
                                             std::optional<StateValue> entry_input = std::nullopt,
                                             const std::string& execution_id = {}) {
        return kernel_.start(graph, std::move(entry_input), execution_id);
    }
    std::optional<std::future<ExecutionResult>> cmd_start_async(const std::string& graph,
                                                                std::optional<StateValue> entry_input = std::nullopt,
                                                                const std::string& execution_id = {}) {
        auto id = kernel_.create_execution(graph, execution_id);
        if (!id) return std::nullopt;
        return kernel_.run_async(*id, std::move(entry_input));
    }
    std::optional<ExecutionResult> cmd_provide_input(const std::string& execution_id, const StateValue& input) {
        return kernel_.provide_user_input(execution_id, input);
    }
    std::optional<ExecutionResult> cmd_resume_session(const std::string& execution_id) {
        return kernel_.resume_session(execution_id);
    }
    std::optional<ExecutionResult> cmd_result(const std::string& execution_id) { return kernel_.result(execution_id); }
    std::optional<ExecutionStatus> cmd_status(const std::string& execution_id) { return kernel_.status(execution_id); }
    std::optional<InteractionRequest> cmd_pending_interaction(const std::string& execution_id) {
        return kernel_.pending_interaction(execution_id);
    }
    std::optional<std::vector<HistoryEntry>> cmd_history(const std::string& execution_id) {
        return kernel_.history(execution_id);
    }
    std::optional<std::string> cmd_export_history(const std::string& execution_id, const std::string& path = {}) {
        return kernel_.export_history(execution_id, path);
    }
    std::optional<std::vector<GraphEventService::StepEvent>> cmd_drain_events(const std::string& execution_id) {
        return kernel_.drain_events(execution_id);
    }
    bool cmd_close_execution(const std::string& execution_id) { return kernel_.close_execution(execution_id); }
    bool cmd_abandon(const std::string& execution_id) { return kernel_.abandon(execution_id); }
    std::vector<std::string> cmd_list_executions() const { return kernel_.list_executions(); }
    std::vector<std::string> cmd_list_sessions() const { return kernel_.sessions().list(); }

    std::optional<Kernel::LastError> cmd_last_error(const std::string& key) const {
        return kernel_.last_error(key);
    }

private:
    Kernel& kernel_;
};

} // namespace sg
