// Stategraph kernel: Kernel implementation
#include "stategraph/kernel/kernel.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

Kernel::Kernel() : Kernel(EngineOptions{}, std::make_shared<MemorySessionStore>()) {}

Kernel::Kernel(const EngineConfig& config)
    : Kernel(config.engine_options(), make_session_store(config), config.history_export_dir) {}

Kernel::Kernel(EngineOptions options, std::shared_ptr<SessionStore> sessions,
               std::string history_export_dir)
    : options_(std::move(options)),
      sessions_(std::move(sessions)),
      history_export_dir_(std::move(history_export_dir)) {
    if (!sessions_) sessions_ = std::make_shared<MemorySessionStore>();
}

Kernel::~Kernel() {
    std::map<std::string, std::shared_ptr<ExecutionRuntime>> live;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        live.swap(executions_);
    }
    for (auto& kv : live) kv.second->stop();
}

void Kernel::set_error(const std::string& key, GraphErrc code, const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_error_[key] = { code, message };
}

void Kernel::clear_error(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_error_.erase(key);
}

std::optional<Kernel::LastError> Kernel::last_error(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = last_error_.find(key);
    if (it == last_error_.end()) return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// Graphs
// ---------------------------------------------------------------------------

std::optional<std::string> Kernel::load_graph(const std::string& yaml_path) {
    std::shared_ptr<const GraphModel> graph;
    try {
        graph = io_service_.load(yaml_path);
    } catch (const GraphError& ge) {
        std::cerr << "Failed to load graph YAML '" << yaml_path << "': " << ge.what() << std::endl;
        set_error(yaml_path, ge.code(), ge.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        std::cerr << "Failed to load graph YAML '" << yaml_path << "': " << e.what() << std::endl;
        set_error(yaml_path, GraphErrc::Unknown, e.what());
        return std::nullopt;
    }
    const std::string name = graph->name();
    if (!register_graph(std::move(graph))) {
        set_error(yaml_path, GraphErrc::DuplicateId, "Graph '" + name + "' is already loaded.");
        return std::nullopt;
    }
    clear_error(yaml_path);
    return name;
}

bool Kernel::register_graph(std::shared_ptr<const GraphModel> graph) {
    if (!graph) return false;
    std::lock_guard<std::mutex> lk(mutex_);
    if (graphs_.count(graph->name())) return false;
    graphs_.emplace(graph->name(), std::move(graph));
    return true;
}

bool Kernel::save_graph(const std::string& name, const std::string& yaml_path) {
    auto graph = find_graph(name);
    if (!graph) {
        set_error(name, GraphErrc::NotFound, "Graph not found: " + name);
        return false;
    }
    try {
        io_service_.save(*graph, yaml_path);
        clear_error(name);
        return true;
    } catch (const GraphError& ge) {
        set_error(name, ge.code(), ge.what());
        return false;
    } catch (const std::exception& e) {
        set_error(name, GraphErrc::Unknown, e.what());
        return false;
    }
}

bool Kernel::close_graph(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    return graphs_.erase(name) > 0;
}

std::vector<std::string> Kernel::list_graphs() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> names;
    names.reserve(graphs_.size());
    for (const auto& kv : graphs_) names.push_back(kv.first);
    return names;
}

std::shared_ptr<const GraphModel> Kernel::find_graph(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = graphs_.find(name);
    return it == graphs_.end() ? nullptr : it->second;
}

// ---------------------------------------------------------------------------
// Executions
// ---------------------------------------------------------------------------

std::shared_ptr<ExecutionRuntime> Kernel::find_runtime(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = executions_.find(execution_id);
    return it == executions_.end() ? nullptr : it->second;
}

std::shared_ptr<ExecutionRuntime> Kernel::require_runtime(const std::string& execution_id) const {
    auto rt = find_runtime(execution_id);
    if (!rt) throw GraphError(GraphErrc::NotFound, "Execution not found: " + execution_id);
    return rt;
}

std::shared_ptr<ExecutionRuntime> Kernel::add_runtime(std::shared_ptr<const GraphModel> graph,
                                                      const std::string& execution_id) {
    auto rt = std::make_shared<ExecutionRuntime>(std::move(graph), options_, sessions_, execution_id);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (executions_.count(execution_id)) {
            throw GraphError(GraphErrc::DuplicateId, "Execution '" + execution_id + "' already exists.");
        }
        executions_.emplace(execution_id, rt);
    }
    rt->start();
    return rt;
}

std::optional<std::string> Kernel::create_execution(const std::string& graph_name,
                                                    const std::string& execution_id) {
    auto graph = find_graph(graph_name);
    if (!graph) {
        set_error(graph_name, GraphErrc::NotFound, "Graph not found: " + graph_name);
        return std::nullopt;
    }
    const std::string id = execution_id.empty() ? make_execution_id(graph_name) : execution_id;
    try {
        auto persisted = sessions_->list();
        if (std::find(persisted.begin(), persisted.end(), id) != persisted.end()) {
            throw GraphError(GraphErrc::DuplicateId,
                             "Execution '" + id + "' already has a persisted session; resume it instead.");
        }
        add_runtime(graph, id);
        clear_error(id);
        return id;
    } catch (const GraphError& ge) {
        set_error(id, ge.code(), ge.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        set_error(id, GraphErrc::Unknown, e.what());
        return std::nullopt;
    }
}

std::optional<ExecutionResult> Kernel::run(const std::string& execution_id,
                                           std::optional<StateValue> entry_input) {
    try {
        auto rt = require_runtime(execution_id);
        ExecutionResult res = rt->post([input = std::move(entry_input)](GraphEngine& e) {
            return e.run(input);
        }).get();
        if (res.failure) {
            set_error(execution_id, res.failure->code, res.failure->message);
        } else {
            clear_error(execution_id);
        }
        return res;
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "std::exception during run: " << e.what();
        set_error(execution_id, GraphErrc::Unknown, ss.str());
        return std::nullopt;
    }
}

std::optional<std::future<ExecutionResult>> Kernel::run_async(const std::string& execution_id,
                                                              std::optional<StateValue> entry_input) {
    auto rt = find_runtime(execution_id);
    if (!rt) {
        set_error(execution_id, GraphErrc::NotFound, "Execution not found: " + execution_id);
        return std::nullopt;
    }
    try {
        return rt->post([input = std::move(entry_input)](GraphEngine& e) { return e.run(input); });
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    }
}

std::optional<ExecutionResult> Kernel::start(const std::string& graph_name,
                                             std::optional<StateValue> entry_input,
                                             const std::string& execution_id) {
    auto id = create_execution(graph_name, execution_id);
    if (!id) return std::nullopt;
    return run(*id, std::move(entry_input));
}

std::optional<ExecutionResult> Kernel::provide_user_input(const std::string& execution_id,
                                                          const StateValue& input) {
    try {
        auto rt = require_runtime(execution_id);
        StateValue value = clone_value(input);
        ExecutionResult res = rt->post([value](GraphEngine& e) {
            return e.provide_user_input(value);
        }).get();
        if (res.failure) {
            set_error(execution_id, res.failure->code, res.failure->message);
        } else {
            clear_error(execution_id);
        }
        return res;
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        set_error(execution_id, GraphErrc::Unknown, e.what());
        return std::nullopt;
    }
}

std::optional<std::future<ExecutionResult>> Kernel::provide_user_input_async(const std::string& execution_id,
                                                                             const StateValue& input) {
    auto rt = find_runtime(execution_id);
    if (!rt) {
        set_error(execution_id, GraphErrc::NotFound, "Execution not found: " + execution_id);
        return std::nullopt;
    }
    StateValue value = clone_value(input);
    try {
        return rt->post([value](GraphEngine& e) { return e.provide_user_input(value); });
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    }
}

std::optional<ExecutionResult> Kernel::resume_session(const std::string& execution_id) {
    if (find_runtime(execution_id)) return result(execution_id);
    std::shared_ptr<ExecutionRuntime> rt;
    try {
        auto cp = sessions_->load(execution_id);
        if (!cp) {
            throw GraphError(GraphErrc::NotFound, "No persisted session for execution " + execution_id);
        }
        auto graph = find_graph(cp->graph_name);
        if (!graph) {
            throw GraphError(GraphErrc::NotFound,
                             "Session " + execution_id + " needs graph '" + cp->graph_name +
                                 "', which is not loaded.");
        }
        rt = add_runtime(graph, execution_id);
        ExecutionResult res = rt->post([checkpoint = std::move(*cp)](GraphEngine& e) {
            e.restore(checkpoint);
            return e.result();
        }).get();
        clear_error(execution_id);
        return res;
    } catch (const GraphError& ge) {
        if (rt) close_execution(execution_id);
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        if (rt) close_execution(execution_id);
        set_error(execution_id, GraphErrc::Unknown, e.what());
        return std::nullopt;
    }
}

std::optional<ExecutionResult> Kernel::result(const std::string& execution_id) {
    auto rt = find_runtime(execution_id);
    if (!rt) return std::nullopt;
    try {
        return rt->post([](GraphEngine& e) { return e.result(); }).get();
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    }
}

std::optional<ExecutionStatus> Kernel::status(const std::string& execution_id) {
    auto rt = find_runtime(execution_id);
    if (!rt) return std::nullopt;
    try {
        return rt->post([](GraphEngine& e) { return e.status(); }).get();
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    }
}

std::optional<InteractionRequest> Kernel::pending_interaction(const std::string& execution_id) {
    auto rt = find_runtime(execution_id);
    if (!rt) return std::nullopt;
    try {
        return rt->post([](GraphEngine& e) { return e.pending_interaction(); }).get();
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    }
}

std::optional<std::vector<HistoryEntry>> Kernel::history(const std::string& execution_id) {
    auto rt = find_runtime(execution_id);
    if (!rt) return std::nullopt;
    try {
        return rt->post([](GraphEngine& e) { return e.history(); }).get();
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    }
}

std::optional<std::vector<GraphEventService::StepEvent>> Kernel::drain_events(const std::string& execution_id) {
    auto rt = find_runtime(execution_id);
    if (!rt) return std::nullopt;
    return rt->event_service().drain();
}

std::optional<std::string> Kernel::export_history(const std::string& execution_id,
                                                  const std::string& path) {
    try {
        std::optional<ExecutionCheckpoint> cp;
        if (auto rt = find_runtime(execution_id)) {
            cp = rt->post([](GraphEngine& e) { return e.checkpoint(); }).get();
        } else {
            cp = sessions_->load(execution_id);
        }
        if (!cp) throw GraphError(GraphErrc::NotFound, "Execution not found: " + execution_id);

        const std::filesystem::path out = path.empty()
            ? std::filesystem::path(history_export_dir_) / (execution_id + ".json")
            : std::filesystem::path(path);
        export_service_.write(export_service_.checkpoint_to_json(*cp), out);
        if (!options_.quiet) std::cout << "History of " << execution_id << " written to " << out.string() << std::endl;
        clear_error(execution_id);
        return out.string();
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return std::nullopt;
    } catch (const std::exception& e) {
        set_error(execution_id, GraphErrc::Io, e.what());
        return std::nullopt;
    }
}

bool Kernel::close_execution(const std::string& execution_id) {
    std::shared_ptr<ExecutionRuntime> rt;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = executions_.find(execution_id);
        if (it == executions_.end()) return false;
        rt = std::move(it->second);
        executions_.erase(it);
    }
    rt->stop();
    return true;
}

bool Kernel::abandon(const std::string& execution_id) {
    const bool was_live = close_execution(execution_id);
    bool was_persisted = false;
    try {
        was_persisted = sessions_->remove(execution_id);
    } catch (const GraphError& ge) {
        set_error(execution_id, ge.code(), ge.what());
        return was_live;
    }
    clear_error(execution_id);
    return was_live || was_persisted;
}

std::vector<std::string> Kernel::list_executions() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> ids;
    ids.reserve(executions_.size());
    for (const auto& kv : executions_) ids.push_back(kv.first);
    return ids;
}

} // namespace sg
