// Stategraph kernel: typed output-field -> state-field mapping
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "stategraph/sg_types.hpp"

namespace sg {

enum class FieldType { Any, String, Number, Integer, Boolean };

const char* to_string(FieldType type);
std::optional<FieldType> field_type_from_string(const std::string& text);

/**
 * @brief One row of the mapping table.
 *
 * `source` is the field name in a node's output, `target` the key in global
 * state. Validation runs in this order: type check, allowed values, numeric
 * range. A failing type or allowed-values check substitutes `default_value`
 * (or drops the field when there is none); an out-of-range number is clamped
 * into [min, max]. With `fill_missing`, an absent source field is filled with
 * `default_value`. A string default of "$node_id" expands to the id of the
 * node being projected.
 */
struct FieldRule {
    std::string source;
    std::string target;
    FieldType type = FieldType::Any;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::string> allowed;
    StateValue default_value;
    bool fill_missing = false;

    bool has_default() const { return default_value.IsDefined() && !default_value.IsNull(); }
};

struct FieldCheck {
    enum class Outcome { Accepted, Normalized, Defaulted, Dropped };
    Outcome outcome = Outcome::Accepted;
    StateValue value;
    std::string detail;  // empty when Accepted
};

class FieldMapping {
public:
    FieldMapping() = default;

    // Plain rename without validation.
    FieldMapping& map(const std::string& source, const std::string& target);
    FieldMapping& map(const std::string& field) { return map(field, field); }
    // Throws GraphError(DuplicateId) when the source is already mapped.
    FieldMapping& add(FieldRule rule);

    const std::vector<FieldRule>& rules() const { return rules_; }
    const FieldRule* find_by_source(const std::string& source) const;
    bool empty() const { return rules_.empty(); }
    std::size_t size() const { return rules_.size(); }

    // Validates a present value.
    static FieldCheck check(const FieldRule& rule, const StateValue& raw, const std::string& node_id);
    // Resolves an absent value; nullopt when the rule does not fill missing fields.
    static std::optional<FieldCheck> fill(const FieldRule& rule, const std::string& node_id);

    static FieldMapping from_yaml(const YAML::Node& n);
    YAML::Node to_yaml() const;

    // stage/status routing fields with the defaults most graphs want.
    static FieldMapping routing_defaults();

private:
    std::vector<FieldRule> rules_;
};

} // namespace sg
