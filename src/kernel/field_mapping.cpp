// Stategraph kernel: FieldMapping implementation
#include "stategraph/kernel/field_mapping.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "stategraph/kernel/value_utils.hpp"

namespace sg {

namespace {

constexpr const char* kNodeIdToken = "$node_id";

StateValue resolve_default(const FieldRule& rule, const std::string& node_id) {
  if (rule.default_value.IsScalar() && rule.default_value.Scalar() == kNodeIdToken) {
    return StateValue(node_id);
  }
  return clone_value(rule.default_value);
}

FieldCheck substitute(const FieldRule& rule, const std::string& node_id, const std::string& why) {
  FieldCheck check;
  if (rule.has_default()) {
    check.outcome = FieldCheck::Outcome::Defaulted;
    check.value = resolve_default(rule, node_id);
    check.detail = rule.source + ": " + why + ", defaulted to " + describe_value(check.value);
  } else {
    check.outcome = FieldCheck::Outcome::Dropped;
    check.detail = rule.source + ": " + why + ", dropped";
  }
  return check;
}

bool is_integral(double v) {
  return std::isfinite(v) && std::floor(v) == v;
}

std::string join(const std::vector<std::string>& items) {
  std::ostringstream os;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) os << ", ";
    os << items[i];
  }
  return os.str();
}

}  // namespace

const char* to_string(FieldType type) {
  switch (type) {
    case FieldType::Any: return "any";
    case FieldType::String: return "string";
    case FieldType::Number: return "number";
    case FieldType::Integer: return "integer";
    case FieldType::Boolean: return "boolean";
  }
  return "any";
}

std::optional<FieldType> field_type_from_string(const std::string& text) {
  if (text == "any") return FieldType::Any;
  if (text == "string") return FieldType::String;
  if (text == "number") return FieldType::Number;
  if (text == "integer") return FieldType::Integer;
  if (text == "boolean") return FieldType::Boolean;
  return std::nullopt;
}

FieldMapping& FieldMapping::map(const std::string& source, const std::string& target) {
  FieldRule rule;
  rule.source = source;
  rule.target = target;
  return add(std::move(rule));
}

FieldMapping& FieldMapping::add(FieldRule rule) {
  if (rule.source.empty()) {
    throw GraphError(GraphErrc::InvalidParameter, "Field rule needs a source field name.");
  }
  if (rule.target.empty()) rule.target = rule.source;
  if (find_by_source(rule.source)) {
    throw GraphError(GraphErrc::DuplicateId,
                     "Field '" + rule.source + "' is mapped twice.");
  }
  if (rule.min && rule.max && *rule.min > *rule.max) {
    throw GraphError(GraphErrc::InvalidParameter,
                     "Field '" + rule.source + "' has min greater than max.");
  }
  rules_.push_back(std::move(rule));
  return *this;
}

const FieldRule* FieldMapping::find_by_source(const std::string& source) const {
  auto it = std::find_if(rules_.begin(), rules_.end(),
                         [&](const FieldRule& r) { return r.source == source; });
  return it == rules_.end() ? nullptr : &*it;
}

FieldCheck FieldMapping::check(const FieldRule& rule, const StateValue& raw,
                               const std::string& node_id) {
  std::optional<double> number;
  switch (rule.type) {
    case FieldType::Any:
      break;
    case FieldType::String:
      if (!raw.IsScalar()) return substitute(rule, node_id, "expected a string");
      break;
    case FieldType::Number:
      number = as_number(raw);
      if (!number) return substitute(rule, node_id, "expected a number, got " + describe_value(raw));
      break;
    case FieldType::Integer:
      number = as_number(raw);
      if (!number || !is_integral(*number)) {
        return substitute(rule, node_id, "expected an integer, got " + describe_value(raw));
      }
      break;
    case FieldType::Boolean: {
      bool ok = raw.IsScalar();
      if (ok) {
        try {
          (void)raw.as<bool>();
        } catch (const YAML::Exception&) {
          ok = false;
        }
      }
      if (!ok) return substitute(rule, node_id, "expected a boolean, got " + describe_value(raw));
      break;
    }
  }

  if (!rule.allowed.empty()) {
    const bool listed = raw.IsScalar() &&
                        std::find(rule.allowed.begin(), rule.allowed.end(), raw.Scalar()) !=
                            rule.allowed.end();
    if (!listed) {
      return substitute(rule, node_id,
                        describe_value(raw) + " is not one of [" + join(rule.allowed) + "]");
    }
  }

  FieldCheck check;
  check.value = clone_value(raw);
  if (rule.min || rule.max) {
    if (!number) number = as_number(raw);
    if (!number) return substitute(rule, node_id, "expected a number, got " + describe_value(raw));
    double clamped = *number;
    if (rule.min) clamped = std::max(clamped, *rule.min);
    if (rule.max) clamped = std::min(clamped, *rule.max);
    if (rule.type == FieldType::Integer && clamped != *number) {
      // Round toward the inside of the range.
      clamped = clamped < *number ? std::floor(clamped) : std::ceil(clamped);
      if ((rule.min && clamped < *rule.min) || (rule.max && clamped > *rule.max)) {
        return substitute(rule, node_id, "no integer within range");
      }
    }
    if (!std::isfinite(clamped)) return substitute(rule, node_id, "not a finite number");
    if (clamped != *number) {
      check.outcome = FieldCheck::Outcome::Normalized;
      if (rule.type == FieldType::Integer) {
        check.value = StateValue(static_cast<long long>(clamped));
      } else {
        check.value = StateValue(clamped);
      }
      check.detail = rule.source + ": " + describe_value(raw) + " clamped to " +
                     describe_value(check.value);
    }
  } else if (number && !std::isfinite(*number)) {
    return substitute(rule, node_id, "not a finite number");
  }
  return check;
}

std::optional<FieldCheck> FieldMapping::fill(const FieldRule& rule, const std::string& node_id) {
  if (!rule.fill_missing || !rule.has_default()) return std::nullopt;
  FieldCheck check;
  check.outcome = FieldCheck::Outcome::Defaulted;
  check.value = resolve_default(rule, node_id);
  check.detail = rule.source + ": missing, defaulted to " + describe_value(check.value);
  return check;
}

FieldMapping FieldMapping::from_yaml(const YAML::Node& n) {
  FieldMapping mapping;
  if (!n || n.IsNull()) return mapping;

  // Short form: {output_field: state_field, ...}
  if (n.IsMap()) {
    for (const auto& kv : n) {
      mapping.map(kv.first.as<std::string>(), kv.second.as<std::string>());
    }
    return mapping;
  }
  if (!n.IsSequence()) {
    throw GraphError(GraphErrc::InvalidYaml, "state_mapping must be a map or a sequence.");
  }
  for (const auto& item : n) {
    if (item.IsScalar()) {
      mapping.map(item.as<std::string>());
      continue;
    }
    if (!item.IsMap() || !item["source"]) {
      throw GraphError(GraphErrc::InvalidYaml, "state_mapping entry needs a 'source'.");
    }
    FieldRule rule;
    rule.source = item["source"].as<std::string>();
    rule.target = item["target"] ? item["target"].as<std::string>() : rule.source;
    if (item["type"]) {
      auto type = field_type_from_string(item["type"].as<std::string>());
      if (!type) {
        throw GraphError(GraphErrc::InvalidYaml,
                         "Unknown field type '" + item["type"].as<std::string>() +
                             "' for '" + rule.source + "'.");
      }
      rule.type = *type;
    }
    if (item["min"]) rule.min = item["min"].as<double>();
    if (item["max"]) rule.max = item["max"].as<double>();
    if (item["allowed"]) rule.allowed = item["allowed"].as<std::vector<std::string>>();
    if (item["default"]) rule.default_value = YAML::Clone(item["default"]);
    rule.fill_missing = as_bool_flexible(item, "fill_missing", false);
    mapping.add(std::move(rule));
  }
  return mapping;
}

YAML::Node FieldMapping::to_yaml() const {
  YAML::Node arr(YAML::NodeType::Sequence);
  for (const auto& r : rules_) {
    YAML::Node n;
    n["source"] = r.source;
    if (r.target != r.source) n["target"] = r.target;
    if (r.type != FieldType::Any) n["type"] = to_string(r.type);
    if (r.min) n["min"] = *r.min;
    if (r.max) n["max"] = *r.max;
    if (!r.allowed.empty()) n["allowed"] = r.allowed;
    if (r.has_default()) n["default"] = clone_value(r.default_value);
    if (r.fill_missing) n["fill_missing"] = true;
    arr.push_back(n);
  }
  return arr;
}

FieldMapping FieldMapping::routing_defaults() {
  FieldMapping mapping;

  FieldRule stage;
  stage.source = "stage";
  stage.type = FieldType::String;
  stage.default_value = StateValue(std::string(kNodeIdToken));
  stage.fill_missing = true;
  mapping.add(stage);

  FieldRule status;
  status.source = "status";
  status.type = FieldType::String;
  status.default_value = StateValue(std::string("Success"));
  status.fill_missing = true;
  mapping.add(status);

  FieldRule confidence;
  confidence.source = "confidence";
  confidence.type = FieldType::Number;
  confidence.min = 0.0;
  confidence.max = 1.0;
  confidence.default_value = StateValue(0.5);
  mapping.add(confidence);

  FieldRule requires_human;
  requires_human.source = "requires_human";
  requires_human.type = FieldType::Boolean;
  requires_human.default_value = StateValue(false);
  mapping.add(requires_human);

  return mapping;
}

}  // namespace sg
