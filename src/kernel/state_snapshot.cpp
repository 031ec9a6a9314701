#include "stategraph/state_snapshot.hpp"

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

StateSnapshot::StateSnapshot(const StateMap& values) {
    for (const auto& kv : values) {
        values_.emplace(kv.first, clone_value(kv.second));
    }
}

StateMap StateSnapshot::values() const {
    StateMap copy;
    for (const auto& kv : values_) {
        copy.emplace(kv.first, clone_value(kv.second));
    }
    return copy;
}

bool StateSnapshot::has(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && it->second.IsDefined() && !it->second.IsNull();
}

std::optional<StateValue> StateSnapshot::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return clone_value(it->second);
}

std::string StateSnapshot::get_string(const std::string& key, const std::string& defv) const {
    auto it = values_.find(key);
    if (it == values_.end() || !it->second.IsScalar()) return defv;
    return it->second.Scalar();
}

double StateSnapshot::get_double(const std::string& key, double defv) const {
    auto it = values_.find(key);
    if (it == values_.end()) return defv;
    auto n = as_number(it->second);
    return n ? *n : defv;
}

bool StateSnapshot::get_bool(const std::string& key, bool defv) const {
    auto it = values_.find(key);
    if (it == values_.end() || !it->second.IsScalar()) return defv;
    try {
        return it->second.as<bool>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

YAML::Node StateSnapshot::to_yaml() const {
    YAML::Node root(YAML::NodeType::Map);
    for (const auto& kv : values_) {
        root[kv.first] = clone_value(kv.second);
    }
    return root;
}

} // namespace sg
