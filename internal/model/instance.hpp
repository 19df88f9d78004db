#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/model/state_machine.hpp"

namespace debugpod::proxy {
class ApiContract;
}

namespace debugpod::model {

std::string BranchNameFor(const std::string& correlation_id);

struct Instance {
  std::string correlation_id;

  // Distinguishes successive instances that reuse a correlation id.
  std::uint64_t generation = 0;

  std::string source_commit;
  std::string reference_commit;
  std::string compare_advice;
  bool        matches_reference = false;

  std::string working_copy_path;
  std::string branch_name;
  std::string log_path;

  std::uint16_t port       = 0;
  std::int64_t  process_id = 0;

  InstanceStatus status = InstanceStatus::kUnspecified;

  std::chrono::system_clock::time_point created_at{};

  // Immutable once attached; shared by every copy handed out by the registry.
  std::shared_ptr<const debugpod::proxy::ApiContract> api_contract;
};

} // namespace debugpod::model
