#include "stategraph/sg_types.hpp"
#include <algorithm>
#include <stdexcept>

namespace sg {

const char* to_string(GraphErrc code) {
    switch (code) {
        case GraphErrc::Unknown: return "unknown";
        case GraphErrc::NotFound: return "not_found";
        case GraphErrc::DuplicateId: return "duplicate_id";
        case GraphErrc::MissingEntryPoint: return "missing_entry_point";
        case GraphErrc::UnknownReference: return "unknown_reference";
        case GraphErrc::Io: return "io";
        case GraphErrc::InvalidYaml: return "invalid_yaml";
        case GraphErrc::InvalidParameter: return "invalid_parameter";
        case GraphErrc::MalformedOutput: return "malformed_output";
        case GraphErrc::NodeFailure: return "node_failure";
        case GraphErrc::ConditionError: return "condition_error";
        case GraphErrc::InvalidState: return "invalid_state";
        case GraphErrc::StepLimit: return "step_limit";
        case GraphErrc::Frozen: return "frozen";
    }
    return "unknown";
}

HandlerRegistry& HandlerRegistry::instance() {
    static HandlerRegistry inst;
    return inst;
}

void HandlerRegistry::register_handler(const std::string& type, const std::string& subtype, NodeHandler fn) {
    if (!fn) {
        throw GraphError(GraphErrc::InvalidParameter,
                         "Refusing to register an empty handler for " + make_key(type, subtype));
    }
    table_[make_key(type, subtype)] = std::move(fn);
}

std::optional<NodeHandler> HandlerRegistry::find(const std::string& type, const std::string& subtype) const {
    auto it = table_.find(make_key(type, subtype));
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> HandlerRegistry::get_keys() const {
    std::vector<std::string> keys;
    keys.reserve(table_.size());
    for (const auto& pair : table_) keys.push_back(pair.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool HandlerRegistry::unregister_handler(const std::string& type, const std::string& subtype) {
    return unregister_key(make_key(type, subtype));
}

bool HandlerRegistry::unregister_key(const std::string& key) {
    return table_.erase(key) > 0;
}

} // namespace sg
