#pragma once

#include <cstdint>

#include "debugpod/v1/instance.pb.h"
#include "internal/model/instance.hpp"
#include "service_context.hpp"

namespace debugpod::service {

/*
  Transport-neutral API shared by the HTTP surface and the gRPC adapter.

  Errors leave as util exceptions; each transport maps them itself.
*/
class InstanceService {
 public:
  explicit InstanceService(ServiceContext ctx);

  debugpod::v1::SetupResponse          Setup(const debugpod::v1::SetupRequest& req);
  debugpod::v1::ListInstancesResponse  ListInstances(const debugpod::v1::ListInstancesRequest& req);
  debugpod::v1::GetInstanceResponse    GetInstance(const debugpod::v1::GetInstanceRequest& req);
  debugpod::v1::DeleteInstanceResponse DeleteInstance(const debugpod::v1::DeleteInstanceRequest& req);
  debugpod::v1::CheckPortResponse      CheckPort(const debugpod::v1::CheckPortRequest& req);
  debugpod::v1::ReapResponse           Reap(const debugpod::v1::ReapRequest& req);

  // Host inspection.
  debugpod::v1::ListAgentProcessesResponse ListAgentProcesses();
  debugpod::v1::KillProcessResponse        KillProcess(std::int64_t pid);

  debugpod::v1::HealthResponse Health();

 private:
  ServiceContext ctx_;
};

debugpod::v1::InstanceDescriptor ToDescriptor(const debugpod::model::Instance& instance);
debugpod::v1::InstanceStatus     ToProto(debugpod::model::InstanceStatus status);

} // namespace debugpod::service
