#pragma once
#include <optional>
#include <string>

#include "stategraph/sg_types.hpp"

namespace sg {

// Immutable copy of global state handed to conditions and node handlers.
// Values are deep-cloned on construction, so later writes to the store are
// never visible through a snapshot.
class StateSnapshot {
public:
    StateSnapshot() = default;
    explicit StateSnapshot(const StateMap& values);

    bool has(const std::string& key) const;
    std::optional<StateValue> get(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& defv = {}) const;
    double get_double(const std::string& key, double defv) const;
    bool get_bool(const std::string& key, bool defv) const;

    // Deep copy; writing through the returned handles leaves the snapshot intact.
    StateMap values() const;
    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    YAML::Node to_yaml() const;

private:
    StateMap values_;
};

} // namespace sg
