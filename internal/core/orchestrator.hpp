#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/instance.hpp"
#include "internal/proxy/upstream.hpp"

namespace debugpod::registry {
class InstanceRegistry;
}
namespace debugpod::ports {
class PortAllocator;
}
namespace debugpod::worktree {
class WorkingCopyManager;
}
namespace debugpod::process {
class ProcessSupervisor;
}
namespace debugpod::proxy {
class SpecFilteredProxy;
}
namespace debugpod::reference {
class ReferenceCommitResolver;
class UpstreamMainResolver;
}

namespace debugpod::core {

struct OrchestratorOptions {
  std::chrono::milliseconds readiness_timeout{15000};
  std::chrono::milliseconds readiness_poll_interval{200};
  std::string               main_branch = "master";
};

struct SetupResult {
  model::Instance instance;
  bool            created = false;
};

/*
  Owns the instance lifecycle.

  Setup acquires port, registry entry, working copy and process in that order
  and releases whatever it holds, in reverse, when a later step fails. Setup,
  Delete and reaping of one correlation id are serialized through the
  registry's per-id mutex; different ids proceed in parallel.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<registry::InstanceRegistry> registry, std::shared_ptr<ports::PortAllocator> ports,
               std::shared_ptr<worktree::WorkingCopyManager> worktrees, std::shared_ptr<process::ProcessSupervisor> supervisor,
               std::shared_ptr<proxy::SpecFilteredProxy> proxy, std::shared_ptr<reference::ReferenceCommitResolver> reference_resolver,
               std::shared_ptr<reference::UpstreamMainResolver> upstream_main, OrchestratorOptions options);

  // Idempotent for a healthy Running id: returns it with created == false.
  SetupResult Setup(const std::string& correlation_id, const std::string& source_commit);

  // util::InstanceNotFound for an unknown id.
  void Delete(const std::string& correlation_id);

  model::Instance              Get(const std::string& correlation_id) const;
  std::vector<model::Instance> List() const;

  proxy::PortCheckResult CheckPort(std::uint16_t port);

  // Re-adopts journaled instances that still run; tears down the rest.
  // Returns the number re-adopted.
  std::size_t Recover();

  // Running, process alive, working copy present.
  bool IsHealthy(const model::Instance& instance);

  // Best effort; the caller holds the id's key mutex.
  void TeardownLocked(const model::Instance& instance, const std::string& reason);

  static void ValidateCorrelationId(const std::string& correlation_id);

 private:
  void WaitReady(const model::Instance& instance);

  std::shared_ptr<registry::InstanceRegistry>          registry_;
  std::shared_ptr<ports::PortAllocator>                ports_;
  std::shared_ptr<worktree::WorkingCopyManager>        worktrees_;
  std::shared_ptr<process::ProcessSupervisor>          supervisor_;
  std::shared_ptr<proxy::SpecFilteredProxy>            proxy_;
  std::shared_ptr<reference::ReferenceCommitResolver>  reference_resolver_;
  std::shared_ptr<reference::UpstreamMainResolver>     upstream_main_;
  OrchestratorOptions                                  options_;
};

} // namespace debugpod::core
