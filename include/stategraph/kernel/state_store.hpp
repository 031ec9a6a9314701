// Stategraph kernel: StateStore owns global state and its append-only history
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stategraph/kernel/field_mapping.hpp"
#include "stategraph/state_snapshot.hpp"

namespace sg {

inline std::string result_key(const std::string& node_id) { return node_id + "_result"; }
inline std::string user_input_key(const std::string& node_id) { return node_id + "_user_input"; }

enum class HistoryOp { Project, UserInput, Failure, Fallback, Consume };

const char* to_string(HistoryOp op);
std::optional<HistoryOp> history_op_from_string(const std::string& text);

struct HistoryEntry {
    std::uint64_t sequence = 0;
    std::chrono::system_clock::time_point timestamp;
    std::string node_id;
    HistoryOp operation = HistoryOp::Project;
    StateMap changes;                  // fields whose value changed, with their new values
    std::vector<std::string> details;  // validation substitutions, failure reasons
};

struct ProjectionResult {
    bool ok = true;
    std::vector<std::string> changed_fields;
    std::vector<std::string> substitutions;
    std::string error;
};

/**
 * @brief Global state of one execution.
 *
 * All mutation goes through project, record_user_input, apply_fallback and
 * clear_user_input, and happens under one mutex, so every observer sees either
 * the state before or after a whole projection and history stays a single
 * total order even when several threads project into the same store.
 */
class StateStore {
public:
    explicit StateStore(FieldMapping mapping = {});

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    ProjectionResult project(const std::string& node_id, const NodeOutput& output);
    void record_user_input(const std::string& node_id, const StateValue& input);
    void apply_fallback(const std::string& node_id, const StateMap& fields);
    bool clear_user_input(const std::string& node_id);
    // Audit-only entry for a node or condition failure; state is untouched.
    void record_failure(const std::string& node_id, const std::string& reason);

    std::optional<StateValue> get(const std::string& key) const;
    StateSnapshot get_all() const;
    std::vector<HistoryEntry> history() const;
    std::size_t history_size() const;

    const FieldMapping& mapping() const { return mapping_; }

    // Replaces state and history with a persisted copy.
    void restore(const StateMap& state, const std::vector<HistoryEntry>& history);

    // Field/value view of a payload; nullopt with `error` set when the payload
    // is not a record.
    static std::optional<YAML::Node> interpret_payload(const StateValue& data, std::string& error);

private:
    void append_history_locked(const std::string& node_id, HistoryOp op,
                               StateMap changes, std::vector<std::string> details);
    bool write_locked(const std::string& key, const StateValue& value, StateMap& changes);

    mutable std::mutex mutex_;
    FieldMapping mapping_;
    StateMap state_;
    std::vector<HistoryEntry> history_;
    std::uint64_t next_sequence_ = 1;
};

} // namespace sg
