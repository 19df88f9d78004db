#pragma once

#include <cstdint>

namespace debugpod::model {

enum class InstanceStatus : std::uint8_t {
  kUnspecified  = 0,
  kProvisioning = 1,
  kRunning      = 2,
  kDraining     = 3,
  kTerminated   = 4,
};

constexpr bool IsTerminal(InstanceStatus status) {
  return status == InstanceStatus::kTerminated;
}

constexpr bool CanTransition(InstanceStatus from, InstanceStatus to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == InstanceStatus::kUnspecified) {
    return false;
  }
  if (to == InstanceStatus::kTerminated) {
    return true;
  }

  return static_cast<std::uint8_t>(to) >= static_cast<std::uint8_t>(from);
}

constexpr const char* ToString(InstanceStatus status) {
  switch (status) {
    case InstanceStatus::kProvisioning:
      return "Provisioning";
    case InstanceStatus::kRunning:
      return "Running";
    case InstanceStatus::kDraining:
      return "Draining";
    case InstanceStatus::kTerminated:
      return "Terminated";
    default:
      return "Unspecified";
  }
}

} // namespace debugpod::model
