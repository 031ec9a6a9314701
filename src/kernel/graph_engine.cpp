// Stategraph kernel: GraphEngine implementation
#include "stategraph/kernel/graph_engine.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <utility>

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

namespace {

std::shared_ptr<const GraphModel> require_graph(std::shared_ptr<const GraphModel> graph) {
  if (!graph) {
    throw GraphError(GraphErrc::InvalidParameter, "GraphEngine needs a built graph.");
  }
  return graph;
}

StateMap fallback_record(const std::string& node_id) {
  StateMap fields;
  fields.emplace("stage", StateValue(node_id));
  fields.emplace("status", StateValue(std::string("Success")));
  fields.emplace("confidence", StateValue(0.5));
  fields.emplace("fallback", StateValue(true));
  return fields;
}

}  // namespace

std::string make_execution_id(const std::string& graph_name) {
  static std::atomic<std::uint64_t> counter{0};
  const auto now = to_epoch_ms(std::chrono::system_clock::now());
  return graph_name + "-" + std::to_string(now) + "-" + std::to_string(++counter);
}

GraphEngine::GraphEngine(std::shared_ptr<const GraphModel> graph,
                         EngineOptions options,
                         std::string execution_id)
    : graph_(require_graph(std::move(graph))),
      options_(std::move(options)),
      execution_id_(execution_id.empty() ? make_execution_id(graph_->name())
                                         : std::move(execution_id)),
      store_(graph_->mapping()),
      registry_(graph_) {}

void GraphEngine::start(std::optional<StateValue> entry_input) {
  if (status_ != ExecutionStatus::Idle) {
    throw GraphError(GraphErrc::InvalidState,
                     "Execution '" + execution_id_ + "' cannot start: it is " +
                         to_string(status_) + ".");
  }
  status_ = ExecutionStatus::Running;
  current_node_ = graph_->entry_point();
  entry_input_ = std::move(entry_input);
  if (events_) events_->push(execution_id_, current_node_, "start", 0.0);
  if (!options_.quiet) {
    std::cout << "Execution " << execution_id_ << " started at node '" << current_node_ << "'."
              << std::endl;
  }
}

ExecutionResult GraphEngine::run(std::optional<StateValue> entry_input) {
  start(std::move(entry_input));
  return drive();
}

StepOutcome GraphEngine::step() {
  if (status_ != ExecutionStatus::Running) {
    throw GraphError(GraphErrc::InvalidState,
                     "Execution '" + execution_id_ + "' cannot step: it is " +
                         to_string(status_) + ".");
  }
  return step_once();
}

ExecutionResult GraphEngine::drive() {
  while (status_ == ExecutionStatus::Running) step_once();
  return result();
}

StepOutcome GraphEngine::step_once() {
  const std::string node_id = current_node_;
  if (options_.max_steps > 0 && steps_ >= options_.max_steps) {
    return fail(node_id, GraphErrc::StepLimit,
                "Step limit of " + std::to_string(options_.max_steps) +
                    " reached before node '" + node_id + "'.");
  }

  // 1. Invoke
  std::optional<StateValue> input;
  input.swap(entry_input_);
  NodeRegistry::Invocation inv;
  try {
    inv = registry_.invoke(node_id, input, store_.get_all());
  } catch (const GraphError& e) {
    ++steps_;
    execution_order_.push_back(node_id);
    return fail(node_id, e.code(), e.what());
  }
  ++steps_;
  execution_order_.push_back(node_id);
  if (events_) events_->push(execution_id_, node_id, "invoke", inv.elapsed_ms);
  if (!options_.quiet) {
    std::cout << "Executing node '" << node_id << "' (visit " << inv.visit << ", "
              << inv.elapsed_ms << " ms)" << std::endl;
  }

  try {
    return project_and_route(node_id, inv);
  } catch (const GraphError& e) {
    return fail(node_id, e.code(), e.what());
  } catch (const std::exception& e) {
    return fail(node_id, GraphErrc::MalformedOutput,
                "Node '" + node_id + "' output could not be applied: " + e.what());
  }
}

StepOutcome GraphEngine::project_and_route(const std::string& node_id,
                                           const NodeRegistry::Invocation& inv) {
  // 2. Project
  const ProjectionResult projection = store_.project(node_id, inv.output);
  if (!projection.ok) {
    if (options_.malformed_output == MalformedOutputPolicy::Fatal) {
      return fail(node_id, GraphErrc::MalformedOutput,
                  "Node '" + node_id + "' returned malformed output: " + projection.error);
    }
    handle_malformed(node_id, projection);
  } else if (!options_.quiet) {
    for (const auto& s : projection.substitutions) {
      std::cout << "  - " << s << std::endl;
    }
  }

  // 3. Route on a fresh snapshot
  const StateSnapshot snapshot = store_.get_all();
  const Edge* chosen = evaluator_.first_true(graph_->outgoing(node_id), snapshot);

  if (!chosen) {
    status_ = ExecutionStatus::Completed;
    if (events_) events_->push(execution_id_, node_id, "complete", 0.0);
    if (!options_.quiet) {
      std::cout << "Execution " << execution_id_ << " completed at node '" << node_id << "'."
                << std::endl;
    }
    persist();
    return StepCompleted{node_id};
  }
  if (chosen->requires_user_input && !snapshot.has(user_input_key(node_id))) {
    return suspend(*chosen);
  }
  advance(*chosen);
  return StepRunning{node_id, chosen->target};
}

void GraphEngine::handle_malformed(const std::string& node_id, const ProjectionResult& projection) {
  if (options_.malformed_output == MalformedOutputPolicy::Fallback) {
    store_.apply_fallback(node_id, fallback_record(node_id));
    warn(node_id, "malformed output replaced by a fallback record: " + projection.error);
    return;
  }
  warn(node_id, "malformed output ignored: " + projection.error);
}

void GraphEngine::advance(const Edge& edge) {
  if (edge.requires_user_input &&
      options_.user_input_consumption == UserInputConsumption::Clear) {
    store_.clear_user_input(edge.source);
  }
  current_node_ = edge.target;
  pending_edge_.reset();
  status_ = ExecutionStatus::Running;
  if (!options_.quiet) {
    std::cout << "  -> '" << edge.target << "' via edge #" << edge.index << std::endl;
  }
}

StepOutcome GraphEngine::suspend(const Edge& edge) {
  status_ = ExecutionStatus::Suspended;
  pending_edge_ = edge.index;
  InteractionRequest request = make_request(edge);
  if (events_) {
    events_->push(execution_id_, edge.source, "suspend", 0.0,
                  "waiting for input on edge #" + std::to_string(edge.index));
  }
  if (!options_.quiet) {
    std::cout << "Execution " << execution_id_ << " suspended at node '" << edge.source
              << "', waiting for user input." << std::endl;
  }
  persist();
  return StepSuspended{std::move(request)};
}

StepOutcome GraphEngine::fail(const std::string& node_id, GraphErrc code, const std::string& message) {
  status_ = ExecutionStatus::Failed;
  pending_edge_.reset();
  store_.record_failure(node_id, message);
  ExecutionFailure failure{node_id, code, message, store_.get_all()};
  failure_ = failure;
  if (events_) events_->push(execution_id_, node_id, "fail", 0.0, message);
  if (!options_.quiet) {
    std::cerr << "Error: execution " << execution_id_ << " failed at node '" << node_id
              << "' [" << to_string(code) << "]: " << message << std::endl;
  }
  persist();
  return StepFailed{std::move(failure)};
}

void GraphEngine::warn(const std::string& node_id, const std::string& message) {
  warnings_.push_back("node '" + node_id + "': " + message);
  if (events_) events_->push(execution_id_, node_id, "warning", 0.0, message);
  std::cerr << "Warning: " << warnings_.back() << std::endl;
}

void GraphEngine::persist() {
  if (!sessions_) return;
  try {
    sessions_->save(execution_id_, checkpoint());
  } catch (const std::exception& e) {
    warnings_.push_back(std::string("session save failed: ") + e.what());
    std::cerr << "Warning: could not persist execution '" << execution_id_ << "': " << e.what()
              << std::endl;
  }
}

ExecutionResult GraphEngine::provide_user_input(const StateValue& input) {
  if (status_ != ExecutionStatus::Suspended || !pending_edge_) {
    throw GraphError(GraphErrc::InvalidState,
                     "Execution '" + execution_id_ + "' is not waiting for input: it is " +
                         to_string(status_) + ".");
  }
  store_.record_user_input(current_node_, input);

  // Only the edge that blocked is re-evaluated.
  const Edge& edge = graph_->edge_at(*pending_edge_);
  bool holds = false;
  try {
    holds = evaluator_.evaluate(edge, store_.get_all());
  } catch (const GraphError& e) {
    fail(edge.source, e.code(), e.what());
    return result();
  }
  if (!holds) {
    if (events_) {
      events_->push(execution_id_, edge.source, "suspend", 0.0,
                    "edge #" + std::to_string(edge.index) + " still false after input");
    }
    persist();
    return result();
  }

  if (events_) events_->push(execution_id_, edge.source, "resume", 0.0);
  advance(edge);
  return drive();
}

InteractionRequest GraphEngine::make_request(const Edge& edge) const {
  InteractionRequest request;
  request.node_id = edge.source;
  request.edge_index = edge.index;
  request.edge_target = edge.target;
  request.node_output = store_.get(result_key(edge.source)).value_or(StateValue());

  const StateValue& output = request.node_output;
  if (output.IsMap() && !options_.options_field.empty()) {
    const YAML::Node opts = output[options_.options_field];
    if (opts && opts.IsSequence()) {
      for (const auto& o : opts) {
        if (o.IsScalar()) request.options.push_back(o.Scalar());
      }
    }
  }
  return request;
}

std::optional<InteractionRequest> GraphEngine::pending_interaction() const {
  if (status_ != ExecutionStatus::Suspended || !pending_edge_) return std::nullopt;
  return make_request(graph_->edge_at(*pending_edge_));
}

ExecutionResult GraphEngine::result() const {
  ExecutionResult r;
  r.execution_id = execution_id_;
  r.status = status_;
  r.current_node = current_node_;
  r.state = store_.get_all();
  r.interaction = pending_interaction();
  r.failure = failure_;
  r.warnings = warnings_;
  r.execution_order = execution_order_;
  r.steps = steps_;
  return r;
}

ExecutionCheckpoint GraphEngine::checkpoint() const {
  ExecutionCheckpoint cp;
  cp.execution_id = execution_id_;
  cp.graph_name = graph_->name();
  cp.status = status_;
  cp.current_node = current_node_;
  cp.pending_edge = pending_edge_;
  cp.steps = steps_;
  cp.state = store_.get_all().values();
  cp.history = store_.history();
  cp.visits = registry_.visit_counts();
  cp.execution_order = execution_order_;
  cp.warnings = warnings_;
  cp.failure = failure_;
  return cp;
}

void GraphEngine::restore(const ExecutionCheckpoint& cp) {
  if (status_ != ExecutionStatus::Idle || steps_ != 0) {
    throw GraphError(GraphErrc::InvalidState,
                     "Execution '" + execution_id_ + "' has already run; restore needs a fresh engine.");
  }
  if (cp.graph_name != graph_->name()) {
    throw GraphError(GraphErrc::InvalidParameter,
                     "Checkpoint '" + cp.execution_id + "' belongs to graph '" + cp.graph_name +
                         "', not '" + graph_->name() + "'.");
  }
  if (!cp.current_node.empty() && !graph_->has_node(cp.current_node)) {
    throw GraphError(GraphErrc::UnknownReference,
                     "Checkpoint '" + cp.execution_id + "' stands on unknown node '" +
                         cp.current_node + "'.");
  }
  if (cp.status == ExecutionStatus::Suspended) {
    if (!cp.pending_edge || *cp.pending_edge >= graph_->edges().size() ||
        graph_->edge_at(*cp.pending_edge).source != cp.current_node) {
      throw GraphError(GraphErrc::InvalidParameter,
                       "Suspended checkpoint '" + cp.execution_id +
                           "' has no valid blocking edge.");
    }
  }

  store_.restore(cp.state, cp.history);
  registry_.restore_visits(cp.visits);
  execution_id_ = cp.execution_id;
  status_ = cp.status;
  current_node_ = cp.current_node;
  pending_edge_ = cp.status == ExecutionStatus::Suspended ? cp.pending_edge : std::nullopt;
  steps_ = cp.steps;
  execution_order_ = cp.execution_order;
  warnings_ = cp.warnings;
  failure_ = cp.failure;
  entry_input_.reset();
}

}  // namespace sg
