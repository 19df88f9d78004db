#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "debugpod/v1/instance_admin_service.grpc.pb.h"
#include "internal/service/instance_service.hpp"

namespace debugpod::grpc {

class InstanceAdminServer final : public debugpod::v1::InstanceAdminService::Service {
 public:
  explicit InstanceAdminServer(std::shared_ptr<debugpod::service::InstanceService> svc);

  ::grpc::Status Setup(::grpc::ServerContext*, const debugpod::v1::SetupRequest*, debugpod::v1::SetupResponse*) override;

  ::grpc::Status ListInstances(::grpc::ServerContext*, const debugpod::v1::ListInstancesRequest*, debugpod::v1::ListInstancesResponse*) override;

  ::grpc::Status GetInstance(::grpc::ServerContext*, const debugpod::v1::GetInstanceRequest*, debugpod::v1::GetInstanceResponse*) override;

  ::grpc::Status DeleteInstance(::grpc::ServerContext*, const debugpod::v1::DeleteInstanceRequest*, debugpod::v1::DeleteInstanceResponse*) override;

  ::grpc::Status CheckPort(::grpc::ServerContext*, const debugpod::v1::CheckPortRequest*, debugpod::v1::CheckPortResponse*) override;

  ::grpc::Status Reap(::grpc::ServerContext*, const debugpod::v1::ReapRequest*, debugpod::v1::ReapResponse*) override;

 private:
  std::shared_ptr<debugpod::service::InstanceService> service_;
};

} // namespace debugpod::grpc
