// Stategraph kernel: condition combinators and YAML compilation
#include "stategraph/kernel/conditions.hpp"

#include <utility>

#include "stategraph/kernel/state_store.hpp"
#include "stategraph/kernel/value_utils.hpp"

namespace sg {
namespace conditions {

namespace {

using Compare = bool (*)(double, double);

Condition numeric(const std::string& field, double bound, Compare cmp) {
  return [field, bound, cmp](const StateSnapshot& s) {
    auto v = s.get(field);
    if (!v) return false;
    auto n = as_number(*v);
    return n.has_value() && cmp(*n, bound);
  };
}

double bound_from(const YAML::Node& n, const char* key) {
  auto v = as_number(n[key]);
  if (!v) {
    throw GraphError(GraphErrc::InvalidYaml,
                     std::string("Condition bound '") + key + "' must be a number, got " +
                         describe_value(n[key]));
  }
  return *v;
}

std::vector<Condition> compile_list(const YAML::Node& seq, const char* key) {
  if (!seq.IsSequence()) {
    throw GraphError(GraphErrc::InvalidYaml,
                     std::string("Condition '") + key + "' expects a sequence.");
  }
  std::vector<Condition> parts;
  parts.reserve(seq.size());
  for (const auto& item : seq) parts.push_back(from_yaml(item));
  return parts;
}

Condition compile_field(const YAML::Node& n) {
  const std::string field = n["field"].as<std::string>();
  if (n["equals"]) return field_equals(field, YAML::Clone(n["equals"]));
  if (n["not_equals"]) return field_not_equals(field, YAML::Clone(n["not_equals"]));
  if (n["in"]) {
    if (!n["in"].IsSequence()) {
      throw GraphError(GraphErrc::InvalidYaml, "Condition 'in' expects a sequence.");
    }
    std::vector<StateValue> values;
    for (const auto& v : n["in"]) values.push_back(YAML::Clone(v));
    return field_in(field, values);
  }
  if (n["exists"]) {
    return n["exists"].as<bool>() ? field_exists(field) : negate(field_exists(field));
  }
  if (n["gte"]) return field_at_least(field, bound_from(n, "gte"));
  if (n["lte"]) return field_at_most(field, bound_from(n, "lte"));
  if (n["gt"]) return field_greater_than(field, bound_from(n, "gt"));
  if (n["lt"]) return field_less_than(field, bound_from(n, "lt"));
  throw GraphError(GraphErrc::InvalidYaml,
                   "Condition on field '" + field + "' has no comparison.");
}

}  // namespace

Condition always() {
  return [](const StateSnapshot&) { return true; };
}

Condition never() {
  return [](const StateSnapshot&) { return false; };
}

Condition field_exists(const std::string& field) {
  return [field](const StateSnapshot& s) { return s.has(field); };
}

Condition field_equals(const std::string& field, const StateValue& value) {
  return [field, value](const StateSnapshot& s) {
    auto v = s.get(field);
    return v.has_value() && values_equal(*v, value);
  };
}

Condition field_not_equals(const std::string& field, const StateValue& value) {
  return negate(field_equals(field, value));
}

Condition field_in(const std::string& field, const std::vector<StateValue>& values) {
  return [field, values](const StateSnapshot& s) {
    auto v = s.get(field);
    if (!v) return false;
    for (const auto& candidate : values) {
      if (values_equal(*v, candidate)) return true;
    }
    return false;
  };
}

Condition field_at_least(const std::string& field, double bound) {
  return numeric(field, bound, [](double a, double b) { return a >= b; });
}

Condition field_at_most(const std::string& field, double bound) {
  return numeric(field, bound, [](double a, double b) { return a <= b; });
}

Condition field_greater_than(const std::string& field, double bound) {
  return numeric(field, bound, [](double a, double b) { return a > b; });
}

Condition field_less_than(const std::string& field, double bound) {
  return numeric(field, bound, [](double a, double b) { return a < b; });
}

Condition has_user_input(const std::string& node_id) {
  return field_exists(user_input_key(node_id));
}

Condition user_input_equals(const std::string& node_id, const StateValue& value) {
  const std::string key = user_input_key(node_id);
  return [key, value](const StateSnapshot& s) {
    auto record = s.get(key);
    if (!record || !record->IsMap()) return false;
    const YAML::Node& fields = *record;
    return values_equal(fields["input"], value);
  };
}

Condition all_of(std::vector<Condition> parts) {
  return [parts = std::move(parts)](const StateSnapshot& s) {
    for (const auto& part : parts) {
      if (!part(s)) return false;
    }
    return true;
  };
}

Condition any_of(std::vector<Condition> parts) {
  return [parts = std::move(parts)](const StateSnapshot& s) {
    for (const auto& part : parts) {
      if (part(s)) return true;
    }
    return false;
  };
}

Condition negate(Condition inner) {
  return [inner = std::move(inner)](const StateSnapshot& s) { return !inner(s); };
}

Condition from_yaml(const YAML::Node& n) {
  if (!n || n.IsNull()) return always();
  if (n.IsScalar()) {
    const std::string word = n.Scalar();
    if (word == "always" || word == "true") return always();
    if (word == "never" || word == "false") return never();
    throw GraphError(GraphErrc::InvalidYaml, "Unknown condition keyword: " + word);
  }
  if (!n.IsMap()) {
    throw GraphError(GraphErrc::InvalidYaml, "Condition must be a keyword or a map.");
  }
  if (n["all"]) return all_of(compile_list(n["all"], "all"));
  if (n["any"]) return any_of(compile_list(n["any"], "any"));
  if (n["not"]) return negate(from_yaml(n["not"]));
  if (n["field"]) return compile_field(n);
  if (n["user_input"]) {
    const std::string node_id = n["user_input"].as<std::string>();
    if (n["equals"]) return user_input_equals(node_id, YAML::Clone(n["equals"]));
    return has_user_input(node_id);
  }
  throw GraphError(GraphErrc::InvalidYaml,
                   "Unrecognised condition: " + describe_value(n));
}

}  // namespace conditions
}  // namespace sg
