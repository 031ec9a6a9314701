#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sg {
namespace fs = std::filesystem;

// A state value is any YAML/JSON-shaped value: scalar, sequence or map.
using StateValue = YAML::Node;

// Ordered so that snapshots, history entries and checkpoints serialize
// deterministically.
using StateMap = std::map<std::string, StateValue>;

// Raw payload returned by a node. `data` is either a field/value map or a
// scalar string carrying an embedded JSON object.
struct NodeOutput {
    StateValue data;
};

#if defined(_WIN32)
    #if defined(STATEGRAPH_LIB_BUILD)
        #define STATEGRAPH_API __declspec(dllexport)
    #else
        #define STATEGRAPH_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(STATEGRAPH_LIB_BUILD)
        #define STATEGRAPH_API __attribute__((visibility("default")))
    #else
        #define STATEGRAPH_API
    #endif
#endif

enum class GraphErrc {
    Unknown = 1, NotFound, DuplicateId, MissingEntryPoint, UnknownReference,
    Io, InvalidYaml, InvalidParameter, MalformedOutput, NodeFailure,
    ConditionError, InvalidState, StepLimit, Frozen,
};

STATEGRAPH_API const char* to_string(GraphErrc code);

struct STATEGRAPH_API GraphError : public std::runtime_error {
    explicit GraphError(const std::string& what)
        : std::runtime_error(what), code_(GraphErrc::Unknown) {}
    GraphError(GraphErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    GraphErrc code() const noexcept { return code_; }
private:
    GraphErrc code_;
};

class Node;
class StateSnapshot;

/**
 * @brief Everything a node handler may look at during one visit.
 *
 * `entry_input` is only set on the first step of an execution. `state` is a
 * private copy of global state taken right before the invocation; `visit`
 * counts visits of this node within the execution, starting at 1.
 */
struct NodeContext {
    const Node& node;
    const std::optional<StateValue>& entry_input;
    const StateSnapshot& state;
    std::size_t visit = 1;
};

using NodeHandler = std::function<NodeOutput(const NodeContext&)>;

// Maps "type:subtype" keys to handlers so that graphs can be declared in YAML.
class HandlerRegistry {
public:
    static HandlerRegistry& instance();

    void register_handler(const std::string& type, const std::string& subtype, NodeHandler fn);
    std::optional<NodeHandler> find(const std::string& type, const std::string& subtype) const;
    std::vector<std::string> get_keys() const;
    bool unregister_handler(const std::string& type, const std::string& subtype);
    bool unregister_key(const std::string& key);
private:
    std::unordered_map<std::string, NodeHandler> table_;
};

inline std::string make_key(const std::string& type, const std::string& subtype) {
    return type + ":" + subtype;
}

} // namespace sg
