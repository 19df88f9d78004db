#include "orphan_reaper.hpp"

#include <mutex>

#include "internal/core/orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/util/time.hpp"
#include "internal/worktree/working_copy_manager.hpp"

namespace debugpod::reaper {

using debugpod::model::InstanceStatus;
using debugpod::observability::IntField;
using debugpod::observability::StringField;

OrphanReaper::OrphanReaper(std::shared_ptr<core::Orchestrator> orchestrator, std::shared_ptr<registry::InstanceRegistry> registry,
                           std::shared_ptr<worktree::WorkingCopyManager> worktrees, std::shared_ptr<process::ProcessSupervisor> supervisor,
                           std::chrono::seconds max_instance_lifetime)
    : orchestrator_(std::move(orchestrator)),
      registry_(std::move(registry)),
      worktrees_(std::move(worktrees)),
      supervisor_(std::move(supervisor)),
      max_instance_lifetime_(max_instance_lifetime) {
}

// Empty when the instance is fine. Caller holds the key mutex.
std::string OrphanReaper::ReapReason(const std::string& correlation_id) {
  auto instance = registry_->Get(correlation_id);
  if (!instance || instance->status != InstanceStatus::kRunning) {
    return "";
  }
  if (instance->process_id <= 0 || !supervisor_->IsAlive(instance->process_id)) {
    return "process exited";
  }
  if (!worktrees_->Exists(correlation_id)) {
    return "working copy missing";
  }
  if (max_instance_lifetime_.count() > 0 && debugpod::util::AgeOf(instance->created_at) >= max_instance_lifetime_) {
    return "lifetime exceeded";
  }
  return "";
}

void OrphanReaper::ReclaimMarkers(ReapReport* report) {
  for (const auto& marker : supervisor_->ListPidMarkers()) {
    if (registry_->Get(marker.correlation_id)) {
      continue;
    }

    auto             key_mutex = registry_->KeyMutex(marker.correlation_id);
    std::unique_lock key_lock(*key_mutex, std::try_to_lock);
    if (!key_lock.owns_lock() || registry_->Get(marker.correlation_id)) {
      continue;  // setup in flight
    }

    // A marker only names a pid; after a reboot or pid reuse it may point
    // at an unrelated process, which is left alone.
    if (marker.pid > 1 && supervisor_->IsAgentProcess(marker.pid)) {
      DEBUGPOD_LOG_WARN("Terminating unowned agent", {StringField("correlation_id", marker.correlation_id), IntField("pid", marker.pid)});
      try {
        supervisor_->Terminate(marker.pid);
      } catch (const std::exception& e) {
        DEBUGPOD_LOG_ERROR("Unowned agent survived termination", {IntField("pid", marker.pid), StringField("error", e.what())});
        continue;
      }
    } else if (marker.pid > 0) {
      DEBUGPOD_LOG_INFO("Dropping stale pid marker", {StringField("correlation_id", marker.correlation_id), IntField("pid", marker.pid)});
    }
    supervisor_->RemovePidMarker(marker.correlation_id);
    ++report->markers_reclaimed;
  }
}

ReapReport OrphanReaper::RunOnce() {
  ReapReport report;

  try {
    auto sweep              = worktrees_->SweepOrphans();
    report.worktrees_pruned = sweep.worktrees_pruned;
    report.branches_deleted = sweep.branches_deleted;
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Worktree sweep failed", {StringField("error", e.what())});
  }

  for (const auto& instance : registry_->List()) {
    if (instance.status != InstanceStatus::kRunning) {
      continue;
    }

    auto             key_mutex = registry_->KeyMutex(instance.correlation_id);
    std::unique_lock key_lock(*key_mutex, std::try_to_lock);
    if (!key_lock.owns_lock()) {
      ++report.skipped_busy;
      continue;
    }

    const auto reason = ReapReason(instance.correlation_id);
    if (reason.empty()) {
      continue;
    }

    // re-read under the lock; the listed copy may be stale
    auto current = registry_->Get(instance.correlation_id);
    if (!current) {
      continue;
    }
    DEBUGPOD_LOG_WARN("Reaping instance", {StringField("correlation_id", current->correlation_id), StringField("reason", reason)});
    orchestrator_->TeardownLocked(*current, reason);
    report.instances_reaped.push_back(current->correlation_id);
  }

  try {
    ReclaimMarkers(&report);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Pid marker reclamation failed", {StringField("error", e.what())});
  }

  if (report.worktrees_pruned + report.branches_deleted + report.instances_reaped.size() + report.markers_reclaimed > 0) {
    DEBUGPOD_LOG_INFO("Reaper pass finished",
                      {IntField("worktrees_pruned", report.worktrees_pruned), IntField("branches_deleted", report.branches_deleted),
                       IntField("instances_reaped", static_cast<std::int64_t>(report.instances_reaped.size())),
                       IntField("markers_reclaimed", report.markers_reclaimed), IntField("skipped_busy", report.skipped_busy)});
  }
  return report;
}

} // namespace debugpod::reaper
