#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace debugpod::core {
class Orchestrator;
}
namespace debugpod::registry {
class InstanceRegistry;
}
namespace debugpod::worktree {
class WorkingCopyManager;
}
namespace debugpod::process {
class ProcessSupervisor;
}

namespace debugpod::reaper {

struct ReapReport {
  std::uint32_t            worktrees_pruned = 0;
  std::uint32_t            branches_deleted = 0;
  std::vector<std::string> instances_reaped;
  std::uint32_t            markers_reclaimed = 0;
  std::uint32_t            skipped_busy      = 0;
};

/*
  Reclaims resources whose owner is gone.

  A second RunOnce right after the first finds nothing left to destroy.
  Ids whose key mutex is held (setup or delete in flight) are left for the
  next round.
*/
class OrphanReaper {
 public:
  OrphanReaper(std::shared_ptr<core::Orchestrator> orchestrator, std::shared_ptr<registry::InstanceRegistry> registry,
               std::shared_ptr<worktree::WorkingCopyManager> worktrees, std::shared_ptr<process::ProcessSupervisor> supervisor,
               std::chrono::seconds max_instance_lifetime);

  ReapReport RunOnce();

 private:
  std::string ReapReason(const std::string& correlation_id);
  void        ReclaimMarkers(ReapReport* report);

  std::shared_ptr<core::Orchestrator>           orchestrator_;
  std::shared_ptr<registry::InstanceRegistry>   registry_;
  std::shared_ptr<worktree::WorkingCopyManager> worktrees_;
  std::shared_ptr<process::ProcessSupervisor>   supervisor_;
  std::chrono::seconds                          max_instance_lifetime_;
};

} // namespace debugpod::reaper
