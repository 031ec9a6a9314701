#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "stategraph/sg_types.hpp"

namespace sg {

/**
 * @brief Reads an int from a map-shaped node, falling back to `defv` when the
 * key is missing or not an integer.
 */
inline int as_int_flexible(const YAML::Node& n, const std::string& key, int defv) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<int>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

/**
 * @brief Reads a string.
 */
inline std::string as_str(const YAML::Node& n, const std::string& key, const std::string& defv = {}) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<std::string>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

inline bool as_bool_flexible(const YAML::Node& n, const std::string& key, bool defv) {
    if (!n || !n.IsMap() || !n[key]) return defv;
    try {
        return n[key].as<bool>();
    } catch (const YAML::Exception&) {
        return defv;
    }
}

// Numeric view of a scalar, nullopt for NaN or anything that does not parse fully.
std::optional<double> as_number(const StateValue& v);

// Structural equality. Scalars compare textually first and numerically second,
// so "1" == "1.0" but "yes" != "true".
bool values_equal(const StateValue& a, const StateValue& b);

// Deep copy; yaml-cpp nodes otherwise share storage between handles.
inline StateValue clone_value(const StateValue& v) {
    if (!v.IsDefined()) return StateValue();
    return YAML::Clone(v);
}

// One-line flow-style rendering used in logs and history details.
std::string describe_value(const StateValue& v);

// ISO-8601 UTC with millisecond precision, e.g. 2024-05-01T08:30:00.125Z.
std::string format_timestamp(std::chrono::system_clock::time_point tp);

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

} // namespace sg
