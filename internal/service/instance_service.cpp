#include "instance_service.hpp"

#include "internal/core/orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/reaper/orphan_reaper.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace debugpod::service {

using namespace debugpod::v1;
using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

template <typename Fn>
auto Logged(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    DEBUGPOD_LOG_WARN("Request failed",
                      {StringField("route", route), StringField("kind", debugpod::util::ErrorKind(ex)), StringField("error", ex.what())});
    throw;
  }
}

} // namespace

InstanceStatus ToProto(debugpod::model::InstanceStatus status) {
  switch (status) {
    case debugpod::model::InstanceStatus::kProvisioning:
      return INSTANCE_STATUS_PROVISIONING;
    case debugpod::model::InstanceStatus::kRunning:
      return INSTANCE_STATUS_RUNNING;
    case debugpod::model::InstanceStatus::kDraining:
      return INSTANCE_STATUS_DRAINING;
    case debugpod::model::InstanceStatus::kTerminated:
      return INSTANCE_STATUS_TERMINATED;
    default:
      return INSTANCE_STATUS_UNSPECIFIED;
  }
}

InstanceDescriptor ToDescriptor(const debugpod::model::Instance& instance) {
  InstanceDescriptor out;
  out.set_correlation_id(instance.correlation_id);
  out.set_port(instance.port);
  out.set_working_copy_path(instance.working_copy_path);
  out.set_source_commit(instance.source_commit);
  out.set_reference_commit(instance.reference_commit);
  out.set_compare_advice(instance.compare_advice);
  out.set_matches_reference(instance.matches_reference);
  out.set_status(ToProto(instance.status));
  out.set_process_id(instance.process_id);
  out.set_branch_name(instance.branch_name);
  out.set_created_at_ms(debugpod::util::ToUnixMillis(instance.created_at));
  out.set_log_path(instance.log_path);
  return out;
}

InstanceService::InstanceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SetupResponse InstanceService::Setup(const SetupRequest& req) {
  return Logged("InstanceService.Setup", [&] {
    auto result = ctx_.orchestrator->Setup(req.correlation_id(), req.source_commit());

    SetupResponse resp;
    *resp.mutable_instance() = ToDescriptor(result.instance);
    resp.set_created(result.created);
    return resp;
  });
}

ListInstancesResponse InstanceService::ListInstances(const ListInstancesRequest&) {
  ListInstancesResponse resp;
  for (const auto& instance : ctx_.orchestrator->List()) {
    *resp.add_instances() = ToDescriptor(instance);
  }
  return resp;
}

GetInstanceResponse InstanceService::GetInstance(const GetInstanceRequest& req) {
  return Logged("InstanceService.GetInstance", [&] {
    GetInstanceResponse resp;
    *resp.mutable_instance() = ToDescriptor(ctx_.orchestrator->Get(req.correlation_id()));
    return resp;
  });
}

DeleteInstanceResponse InstanceService::DeleteInstance(const DeleteInstanceRequest& req) {
  return Logged("InstanceService.DeleteInstance", [&] {
    ctx_.orchestrator->Delete(req.correlation_id());
    return DeleteInstanceResponse{};
  });
}

CheckPortResponse InstanceService::CheckPort(const CheckPortRequest& req) {
  return Logged("InstanceService.CheckPort", [&] {
    if (req.port() == 0 || req.port() > 65535) {
      throw debugpod::util::InvalidRequest("port must be between 1 and 65535");
    }
    auto result = ctx_.orchestrator->CheckPort(static_cast<std::uint16_t>(req.port()));

    CheckPortResponse resp;
    resp.set_port(result.port);
    resp.set_listening(result.listening);
    resp.set_healthy(result.healthy);
    resp.set_version(result.version);
    resp.set_detail(result.detail);
    return resp;
  });
}

ReapResponse InstanceService::Reap(const ReapRequest&) {
  return Logged("InstanceService.Reap", [&] {
    auto report = ctx_.reaper->RunOnce();

    ReapResponse resp;
    resp.set_worktrees_pruned(report.worktrees_pruned);
    resp.set_branches_deleted(report.branches_deleted);
    for (const auto& id : report.instances_reaped) {
      resp.add_instances_reaped(id);
    }
    resp.set_markers_reclaimed(report.markers_reclaimed);
    resp.set_skipped_busy(report.skipped_busy);
    return resp;
  });
}

ListAgentProcessesResponse InstanceService::ListAgentProcesses() {
  ListAgentProcessesResponse resp;
  for (const auto& process : ctx_.supervisor->ListAgentProcesses()) {
    auto* out = resp.add_processes();
    out->set_pid(process.pid);
    out->set_port(process.port);
    out->set_cmdline(process.cmdline);
  }
  return resp;
}

KillProcessResponse InstanceService::KillProcess(std::int64_t pid) {
  return Logged("InstanceService.KillProcess", [&] {
    if (pid <= 1) {
      throw debugpod::util::InvalidRequest("invalid pid " + std::to_string(pid));
    }

    KillProcessResponse resp;

    bool is_agent = false;
    for (const auto& process : ctx_.supervisor->ListAgentProcesses()) {
      is_agent = is_agent || process.pid == pid;
    }
    if (!is_agent) {
      resp.set_success(false);
      resp.set_message("pid " + std::to_string(pid) + " is not an agent process");
      return resp;
    }

    for (const auto& instance : ctx_.registry->List()) {
      if (instance.process_id == pid) {
        resp.set_success(false);
        resp.set_message("pid " + std::to_string(pid) + " belongs to instance " + instance.correlation_id + "; delete the instance instead");
        return resp;
      }
    }

    ctx_.supervisor->Terminate(pid);
    DEBUGPOD_LOG_INFO("Agent process terminated on request", {IntField("pid", pid)});

    resp.set_success(true);
    resp.set_message("terminated pid " + std::to_string(pid));
    return resp;
  });
}

HealthResponse InstanceService::Health() {
  HealthResponse resp;
  resp.set_status("healthy");
  return resp;
}

} // namespace debugpod::service
