// Stategraph kernel: reusable edge conditions and the YAML condition grammar
#pragma once

#include <string>
#include <vector>

#include "stategraph/edge.hpp"

namespace sg {
namespace conditions {

Condition always();
Condition never();

Condition field_exists(const std::string& field);
Condition field_equals(const std::string& field, const StateValue& value);
Condition field_not_equals(const std::string& field, const StateValue& value);
Condition field_in(const std::string& field, const std::vector<StateValue>& values);
Condition field_at_least(const std::string& field, double bound);
Condition field_at_most(const std::string& field, double bound);
Condition field_greater_than(const std::string& field, double bound);
Condition field_less_than(const std::string& field, double bound);

// True when `{node_id}_user_input` exists.
Condition has_user_input(const std::string& node_id);
// True when `{node_id}_user_input.input` equals `value`.
Condition user_input_equals(const std::string& node_id, const StateValue& value);

Condition all_of(std::vector<Condition> parts);
Condition any_of(std::vector<Condition> parts);
Condition negate(Condition inner);

/**
 * @brief Compiles a declarative condition.
 *
 * Accepted forms:
 *   always | never | true | false
 *   {all: [...]}, {any: [...]}, {not: {...}}
 *   {field: F, equals|not_equals: V}
 *   {field: F, in: [V...]}
 *   {field: F, exists: true|false}
 *   {field: F, gte|gt|lte|lt: N}
 *   {user_input: NODE}            optionally with equals: V
 *
 * Throws GraphError(InvalidYaml) for anything else.
 */
Condition from_yaml(const YAML::Node& n);

} // namespace conditions
} // namespace sg
