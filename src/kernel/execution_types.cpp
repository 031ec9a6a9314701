#include "stategraph/execution_types.hpp"

namespace sg {

const char* to_string(ExecutionStatus status) {
  switch (status) {
    case ExecutionStatus::Idle: return "idle";
    case ExecutionStatus::Running: return "running";
    case ExecutionStatus::Suspended: return "suspended";
    case ExecutionStatus::Completed: return "completed";
    case ExecutionStatus::Failed: return "failed";
  }
  return "idle";
}

std::optional<ExecutionStatus> execution_status_from_string(const std::string& text) {
  if (text == "idle") return ExecutionStatus::Idle;
  if (text == "running") return ExecutionStatus::Running;
  if (text == "suspended") return ExecutionStatus::Suspended;
  if (text == "completed") return ExecutionStatus::Completed;
  if (text == "failed") return ExecutionStatus::Failed;
  return std::nullopt;
}

const char* to_string(MalformedOutputPolicy policy) {
  switch (policy) {
    case MalformedOutputPolicy::Warn: return "warn";
    case MalformedOutputPolicy::Fatal: return "fatal";
    case MalformedOutputPolicy::Fallback: return "fallback";
  }
  return "warn";
}

std::optional<MalformedOutputPolicy> malformed_output_policy_from_string(const std::string& text) {
  if (text == "warn") return MalformedOutputPolicy::Warn;
  if (text == "fatal") return MalformedOutputPolicy::Fatal;
  if (text == "fallback") return MalformedOutputPolicy::Fallback;
  return std::nullopt;
}

const char* to_string(UserInputConsumption mode) {
  switch (mode) {
    case UserInputConsumption::Persist: return "persist";
    case UserInputConsumption::Clear: return "clear";
  }
  return "persist";
}

std::optional<UserInputConsumption> user_input_consumption_from_string(const std::string& text) {
  if (text == "persist") return UserInputConsumption::Persist;
  if (text == "clear") return UserInputConsumption::Clear;
  return std::nullopt;
}

}  // namespace sg
