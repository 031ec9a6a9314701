// Stategraph kernel: multi-graph, multi-execution Kernel facade
#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stategraph/engine_config.hpp"
#include "stategraph/kernel/execution_runtime.hpp"
#include "stategraph/kernel/services/graph_io_service.hpp"
#include "stategraph/kernel/services/history_export_service.hpp"

namespace sg {

/**
 * @brief Owns the loaded graphs and the live executions.
 *
 * Each execution runs on its own ExecutionRuntime. Calls return std::optional
 * or bool; on failure the error is kept per key (execution id, or graph name
 * for graph calls) and can be read back with last_error().
 */
class Kernel {
public:
    struct LastError { GraphErrc code = GraphErrc::Unknown; std::string message; };

    Kernel();
    explicit Kernel(const EngineConfig& config);
    Kernel(EngineOptions options, std::shared_ptr<SessionStore> sessions,
           std::string history_export_dir = "out/history");
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Graphs. load_graph returns the graph's name.
    std::optional<std::string> load_graph(const std::string& yaml_path);
    bool register_graph(std::shared_ptr<const GraphModel> graph);
    bool save_graph(const std::string& name, const std::string& yaml_path);
    bool close_graph(const std::string& name);
    std::vector<std::string> list_graphs() const;
    std::shared_ptr<const GraphModel> find_graph(const std::string& name) const;

    // Executions. An empty execution id is replaced by a generated one.
    std::optional<std::string> create_execution(const std::string& graph_name,
                                                const std::string& execution_id = {});
    std::optional<ExecutionResult> run(const std::string& execution_id,
                                       std::optional<StateValue> entry_input = std::nullopt);
    // Errors surface through the future rather than last_error().
    std::optional<std::future<ExecutionResult>> run_async(const std::string& execution_id,
                                                          std::optional<StateValue> entry_input = std::nullopt);
    std::optional<ExecutionResult> start(const std::string& graph_name,
                                         std::optional<StateValue> entry_input = std::nullopt,
                                         const std::string& execution_id = {});
    std::optional<ExecutionResult> provide_user_input(const std::string& execution_id,
                                                      const StateValue& input);
    std::optional<std::future<ExecutionResult>> provide_user_input_async(const std::string& execution_id,
                                                                         const StateValue& input);

    // Rebuilds an execution from the session store, e.g. after a restart.
    std::optional<ExecutionResult> resume_session(const std::string& execution_id);

    std::optional<ExecutionResult> result(const std::string& execution_id);
    std::optional<ExecutionStatus> status(const std::string& execution_id);
    std::optional<InteractionRequest> pending_interaction(const std::string& execution_id);
    std::optional<std::vector<HistoryEntry>> history(const std::string& execution_id);
    std::optional<std::vector<GraphEventService::StepEvent>> drain_events(const std::string& execution_id);

    // Writes the JSON audit document; an empty path means
    // `<history_export_dir>/<execution_id>.json`. Returns the path written.
    std::optional<std::string> export_history(const std::string& execution_id,
                                              const std::string& path = {});

    // Stops the runtime but keeps the persisted session.
    bool close_execution(const std::string& execution_id);
    // Stops the runtime, drops any pending request and removes the session.
    bool abandon(const std::string& execution_id);
    std::vector<std::string> list_executions() const;

    std::optional<LastError> last_error(const std::string& key) const;

    const EngineOptions& options() const { return options_; }
    SessionStore& sessions() { return *sessions_; }

private:
    std::shared_ptr<ExecutionRuntime> find_runtime(const std::string& execution_id) const;
    // Throws GraphError(NotFound).
    std::shared_ptr<ExecutionRuntime> require_runtime(const std::string& execution_id) const;
    std::shared_ptr<ExecutionRuntime> add_runtime(std::shared_ptr<const GraphModel> graph,
                                                  const std::string& execution_id);

    void set_error(const std::string& key, GraphErrc code, const std::string& message);
    void clear_error(const std::string& key);

    EngineOptions options_;
    std::shared_ptr<SessionStore> sessions_;
    std::string history_export_dir_;
    GraphIOService io_service_;
    HistoryExportService export_service_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const GraphModel>> graphs_;
    std::map<std::string, std::shared_ptr<ExecutionRuntime>> executions_;
    std::map<std::string, LastError> last_error_;
};

} // namespace sg
