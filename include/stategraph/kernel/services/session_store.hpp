// Stategraph kernel: pluggable persistence sink for execution checkpoints
#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "stategraph/execution_types.hpp"

namespace sg {

/**
 * @brief Where the engine parks executions between calls.
 *
 * The engine calls save() after every Suspended, Completed and Failed outcome.
 * Implementations own the transport; a checkpoint they hand back from load()
 * must restore into an engine built over the same graph.
 */
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual void save(const std::string& execution_id, const ExecutionCheckpoint& checkpoint) = 0;
    virtual std::optional<ExecutionCheckpoint> load(const std::string& execution_id) const = 0;
    virtual bool remove(const std::string& execution_id) = 0;
    virtual std::vector<std::string> list() const = 0;
};

// Keeps each checkpoint as serialized YAML text, so a loaded checkpoint never
// shares nodes with the engine that saved it.
class MemorySessionStore : public SessionStore {
public:
    void save(const std::string& execution_id, const ExecutionCheckpoint& checkpoint) override;
    std::optional<ExecutionCheckpoint> load(const std::string& execution_id) const override;
    bool remove(const std::string& execution_id) override;
    std::vector<std::string> list() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> documents_;
};

// One `<execution_id>.yaml` per execution under `root`.
class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(std::filesystem::path root);

    void save(const std::string& execution_id, const ExecutionCheckpoint& checkpoint) override;
    std::optional<ExecutionCheckpoint> load(const std::string& execution_id) const override;
    bool remove(const std::string& execution_id) override;
    std::vector<std::string> list() const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path path_for(const std::string& execution_id) const;

    std::filesystem::path root_;
    mutable std::mutex mutex_;
};

YAML::Node checkpoint_to_yaml(const ExecutionCheckpoint& checkpoint);
// Throws GraphError(InvalidYaml) on a document that is not a checkpoint.
ExecutionCheckpoint checkpoint_from_yaml(const YAML::Node& n);

} // namespace sg
