#include "instance_admin_server.hpp"

#include "grpc_error.hpp"

namespace debugpod::grpc {

using namespace debugpod::v1;

InstanceAdminServer::InstanceAdminServer(std::shared_ptr<debugpod::service::InstanceService> svc) : service_(std::move(svc)) {
}

::grpc::Status InstanceAdminServer::Setup(::grpc::ServerContext*, const SetupRequest* req, SetupResponse* resp) {
  try {
    *resp = service_->Setup(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status InstanceAdminServer::ListInstances(::grpc::ServerContext*, const ListInstancesRequest* req, ListInstancesResponse* resp) {
  try {
    *resp = service_->ListInstances(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status InstanceAdminServer::GetInstance(::grpc::ServerContext*, const GetInstanceRequest* req, GetInstanceResponse* resp) {
  try {
    *resp = service_->GetInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status InstanceAdminServer::DeleteInstance(::grpc::ServerContext*, const DeleteInstanceRequest* req, DeleteInstanceResponse* resp) {
  try {
    *resp = service_->DeleteInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status InstanceAdminServer::CheckPort(::grpc::ServerContext*, const CheckPortRequest* req, CheckPortResponse* resp) {
  try {
    *resp = service_->CheckPort(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status InstanceAdminServer::Reap(::grpc::ServerContext*, const ReapRequest* req, ReapResponse* resp) {
  try {
    *resp = service_->Reap(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace debugpod::grpc
