#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "debugpod/v1.hpp"

using namespace debugpod::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  debugpodctl <addr> setup <correlation_id> [commit]\n"
            << "  debugpodctl <addr> list\n"
            << "  debugpodctl <addr> get <correlation_id>\n"
            << "  debugpodctl <addr> delete <correlation_id>\n"
            << "  debugpodctl <addr> check-port <port>\n"
            << "  debugpodctl <addr> reap\n";
}

static const char* StatusName(InstanceStatus status) {
  switch (status) {
    case INSTANCE_STATUS_PROVISIONING:
      return "provisioning";
    case INSTANCE_STATUS_RUNNING:
      return "running";
    case INSTANCE_STATUS_DRAINING:
      return "draining";
    case INSTANCE_STATUS_TERMINATED:
      return "terminated";
    default:
      return "unspecified";
  }
}

static void PrintInstance(const InstanceDescriptor& instance) {
  std::cout << instance.correlation_id() << " port=" << instance.port() << " status=" << StatusName(instance.status())
            << " pid=" << instance.process_id() << " commit=" << instance.source_commit() << "\n";
  std::cout << "  path=" << instance.working_copy_path() << "\n";
  if (!instance.compare_advice().empty()) {
    std::cout << "  compare: " << instance.compare_advice() << "\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = InstanceAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "setup") {
    if (argc < 4) return 1;

    SetupRequest req;
    req.set_correlation_id(argv[3]);
    if (argc >= 5) {
      req.set_source_commit(argv[4]);
    }

    SetupResponse resp;

    auto status = stub->Setup(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.created() ? "created\n" : "existing\n");
    PrintInstance(resp.instance());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListInstancesRequest  req;
    ListInstancesResponse resp;

    auto status = stub->ListInstances(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& instance : resp.instances()) {
      PrintInstance(instance);
    }
    std::cout << "total=" << resp.instances_size() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetInstanceRequest req;
    req.set_correlation_id(argv[3]);

    GetInstanceResponse resp;

    auto status = stub->GetInstance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintInstance(resp.instance());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteInstanceRequest req;
    req.set_correlation_id(argv[3]);

    DeleteInstanceResponse resp;

    auto status = stub->DeleteInstance(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "check-port") {
    if (argc < 4) return 1;

    const auto port = std::stoul(argv[3]);
    if (port == 0 || port > 65535) {
      std::cerr << "invalid port: " << argv[3] << "\n";
      return 1;
    }

    CheckPortRequest req;
    req.set_port(static_cast<std::uint32_t>(port));

    CheckPortResponse resp;

    auto status = stub->CheckPort(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "listening=" << resp.listening() << " healthy=" << resp.healthy() << " version=" << resp.version() << "\n";
    if (!resp.detail().empty()) {
      std::cout << "detail=" << resp.detail() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reap") {
    ReapRequest  req;
    ReapResponse resp;

    auto status = stub->Reap(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "worktrees_pruned=" << resp.worktrees_pruned() << "\n";
    std::cout << "branches_deleted=" << resp.branches_deleted() << "\n";
    std::cout << "markers_reclaimed=" << resp.markers_reclaimed() << "\n";
    for (const auto& id : resp.instances_reaped()) {
      std::cout << "reaped " << id << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
