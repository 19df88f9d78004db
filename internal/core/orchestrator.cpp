#include "orchestrator.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/ports/port_allocator.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/proxy/spec_filtered_proxy.hpp"
#include "internal/reference/reference_resolver.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/worktree/working_copy_manager.hpp"

namespace debugpod::core {

using debugpod::model::Instance;
using debugpod::model::InstanceStatus;
using debugpod::observability::BoolField;
using debugpod::observability::IntField;
using debugpod::observability::StringField;

namespace {

constexpr std::size_t kMaxCorrelationIdLength = 128;

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<registry::InstanceRegistry> registry, std::shared_ptr<ports::PortAllocator> ports,
                           std::shared_ptr<worktree::WorkingCopyManager> worktrees, std::shared_ptr<process::ProcessSupervisor> supervisor,
                           std::shared_ptr<proxy::SpecFilteredProxy> proxy, std::shared_ptr<reference::ReferenceCommitResolver> reference_resolver,
                           std::shared_ptr<reference::UpstreamMainResolver> upstream_main, OrchestratorOptions options)
    : registry_(std::move(registry)),
      ports_(std::move(ports)),
      worktrees_(std::move(worktrees)),
      supervisor_(std::move(supervisor)),
      proxy_(std::move(proxy)),
      reference_resolver_(std::move(reference_resolver)),
      upstream_main_(std::move(upstream_main)),
      options_(std::move(options)) {
}

void Orchestrator::ValidateCorrelationId(const std::string& correlation_id) {
  if (correlation_id.empty()) {
    throw debugpod::util::InvalidRequest("correlation_id is required");
  }
  if (correlation_id.size() > kMaxCorrelationIdLength) {
    throw debugpod::util::InvalidRequest("correlation_id longer than " + std::to_string(kMaxCorrelationIdLength) + " characters");
  }
  if (correlation_id.front() == '.' || correlation_id.front() == '-') {
    throw debugpod::util::InvalidRequest("correlation_id must not start with '.' or '-'");
  }
  const bool valid = std::all_of(correlation_id.begin(), correlation_id.end(), [](unsigned char c) {
    return std::isalnum(c) != 0 || c == '.' || c == '_' || c == '-';
  });
  if (!valid || correlation_id.find("..") != std::string::npos) {
    throw debugpod::util::InvalidRequest("correlation_id may only contain letters, digits, '.', '_' and '-'");
  }
}

bool Orchestrator::IsHealthy(const Instance& instance) {
  return instance.status == InstanceStatus::kRunning && instance.process_id > 0 && supervisor_->IsAlive(instance.process_id) &&
         worktrees_->Exists(instance.correlation_id);
}

void Orchestrator::WaitReady(const Instance& instance) {
  const auto deadline = std::chrono::steady_clock::now() + options_.readiness_timeout;

  while (true) {
    if (!supervisor_->IsAlive(instance.process_id)) {
      throw debugpod::util::StartupTimeout("agent for " + instance.correlation_id + " exited during startup, see " + instance.log_path);
    }
    if (proxy_->IsListening(instance.port)) {
      return;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw debugpod::util::StartupTimeout("agent for " + instance.correlation_id + " not listening on port " + std::to_string(instance.port) +
                                           " after " + std::to_string(options_.readiness_timeout.count()) + " ms");
    }
    std::this_thread::sleep_for(options_.readiness_poll_interval);
  }
}

SetupResult Orchestrator::Setup(const std::string& correlation_id, const std::string& source_commit) {
  ValidateCorrelationId(correlation_id);

  auto            key_mutex = registry_->KeyMutex(correlation_id);
  std::lock_guard key_lock(*key_mutex);

  if (auto existing = registry_->Get(correlation_id)) {
    if (IsHealthy(*existing)) {
      DEBUGPOD_LOG_INFO("Instance already running", {StringField("correlation_id", correlation_id), IntField("port", existing->port)});
      return {*existing, false};
    }
    DEBUGPOD_LOG_WARN("Replacing unhealthy instance",
                      {StringField("correlation_id", correlation_id), StringField("status", model::ToString(existing->status))});
    TeardownLocked(*existing, "replaced");
  }

  std::string requested = source_commit;
  if (requested.empty() && reference_resolver_) {
    requested = reference_resolver_->Resolve().value_or("");
  }
  std::string reference_commit;
  if (upstream_main_) {
    reference_commit = upstream_main_->Resolve().value_or("");
  }

  // nothing else is acquired when the range is exhausted
  const auto port = ports_->Allocate();

  Instance instance;
  instance.correlation_id = correlation_id;
  instance.branch_name    = model::BranchNameFor(correlation_id);
  instance.port           = port;
  instance.status         = InstanceStatus::kProvisioning;
  instance.created_at     = debugpod::util::Now();

  bool registered   = false;
  bool copy_created = false;

  try {
    instance   = registry_->Insert(instance);
    registered = true;

    worktree::WorkingCopy copy;
    try {
      copy = worktrees_->Create(correlation_id, requested);
    } catch (const debugpod::util::AlreadyExists& e) {
      DEBUGPOD_LOG_WARN("Stale working copy found, recreating", {StringField("correlation_id", correlation_id), StringField("reason", e.what())});
      worktrees_->Remove(correlation_id);
      copy = worktrees_->Create(correlation_id, requested);
    }
    copy_created = true;

    instance.working_copy_path = copy.path;
    instance.branch_name       = copy.branch;
    instance.source_commit     = copy.commit;
    instance.reference_commit  = reference_commit;
    instance.matches_reference = !reference_commit.empty() && reference_commit == copy.commit;
    instance.compare_advice    = reference::CompareAdvice(copy.commit, reference_commit, options_.main_branch);

    auto spawned        = supervisor_->Spawn(process::SpawnSpec{correlation_id, copy.path, port});
    instance.process_id = spawned.pid;
    instance.log_path   = spawned.log_path;
    registry_->Update(instance);

    WaitReady(instance);
    instance = registry_->Transition(correlation_id, InstanceStatus::kRunning);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Setup failed, rolling back", {StringField("correlation_id", correlation_id), StringField("error", e.what())});

    if (instance.process_id > 0) {
      try {
        supervisor_->Terminate(instance.process_id);
      } catch (const std::exception& terminate_error) {
        DEBUGPOD_LOG_ERROR("Rollback: terminate failed", {IntField("pid", instance.process_id), StringField("error", terminate_error.what())});
      }
      try {
        supervisor_->RemovePidMarker(correlation_id);
      } catch (const std::exception& marker_error) {
        DEBUGPOD_LOG_WARN("Rollback: pid marker not removed", {StringField("error", marker_error.what())});
      }
    }
    if (copy_created) {
      worktrees_->Remove(correlation_id);
    }
    ports_->Release(port);
    if (registered) {
      try {
        registry_->Remove(correlation_id);
      } catch (const std::exception& remove_error) {
        DEBUGPOD_LOG_ERROR("Rollback: registry entry not removed", {StringField("error", remove_error.what())});
      }
    }
    throw;
  }

  DEBUGPOD_LOG_INFO("Instance running", {StringField("correlation_id", correlation_id), IntField("port", port), IntField("pid", instance.process_id),
                                         StringField("commit", instance.source_commit), BoolField("matches_reference", instance.matches_reference)});
  return {instance, true};
}

void Orchestrator::Delete(const std::string& correlation_id) {
  auto            key_mutex = registry_->KeyMutex(correlation_id);
  std::lock_guard key_lock(*key_mutex);

  auto existing = registry_->Get(correlation_id);
  if (!existing || existing->status == InstanceStatus::kTerminated) {
    throw debugpod::util::InstanceNotFound("instance not found: " + correlation_id);
  }
  TeardownLocked(*existing, "deleted");
}

void Orchestrator::TeardownLocked(const Instance& instance, const std::string& reason) {
  const auto& id = instance.correlation_id;

  try {
    registry_->Transition(id, InstanceStatus::kDraining);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_WARN("Teardown: cannot mark draining", {StringField("correlation_id", id), StringField("error", e.what())});
  }

  if (instance.process_id > 0) {
    try {
      supervisor_->Terminate(instance.process_id);
    } catch (const std::exception& e) {
      DEBUGPOD_LOG_ERROR("Teardown: terminate failed", {StringField("correlation_id", id), IntField("pid", instance.process_id), StringField("error", e.what())});
    }
  }

  try {
    worktrees_->Remove(id);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Teardown: working copy not removed", {StringField("correlation_id", id), StringField("error", e.what())});
  }

  if (instance.port != 0) {
    ports_->Release(instance.port);
  }

  try {
    supervisor_->RemovePidMarker(id);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_WARN("Teardown: pid marker not removed", {StringField("correlation_id", id), StringField("error", e.what())});
  }

  proxy_->Forget(id);

  try {
    registry_->Transition(id, InstanceStatus::kTerminated);
    registry_->Remove(id);
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Teardown: registry entry not removed", {StringField("correlation_id", id), StringField("error", e.what())});
  }

  DEBUGPOD_LOG_INFO("Instance torn down", {StringField("correlation_id", id), StringField("reason", reason), IntField("port", instance.port)});
}

Instance Orchestrator::Get(const std::string& correlation_id) const {
  auto instance = registry_->Get(correlation_id);
  if (!instance || instance->status == InstanceStatus::kTerminated) {
    throw debugpod::util::InstanceNotFound("instance not found: " + correlation_id);
  }
  return *instance;
}

std::vector<Instance> Orchestrator::List() const {
  return registry_->List();
}

proxy::PortCheckResult Orchestrator::CheckPort(std::uint16_t port) {
  if (port == 0) {
    throw debugpod::util::InvalidRequest("port must be between 1 and 65535");
  }
  return proxy_->CheckPort(port);
}

std::size_t Orchestrator::Recover() {
  std::size_t adopted = 0;

  for (const auto& persisted : registry_->LoadPersisted()) {
    auto            key_mutex = registry_->KeyMutex(persisted.correlation_id);
    std::lock_guard key_lock(*key_mutex);

    Instance restored;
    try {
      restored = registry_->Insert(persisted);
    } catch (const std::exception& e) {
      DEBUGPOD_LOG_ERROR("Recovery: cannot restore entry", {StringField("correlation_id", persisted.correlation_id), StringField("error", e.what())});
      continue;
    }

    if (IsHealthy(restored) && ports_->InRange(restored.port) && !ports_->IsReserved(restored.port)) {
      ports_->Reserve(restored.port);
      ++adopted;
      DEBUGPOD_LOG_INFO("Recovery: instance re-adopted",
                        {StringField("correlation_id", restored.correlation_id), IntField("port", restored.port), IntField("pid", restored.process_id)});
      continue;
    }

    TeardownLocked(restored, "not recoverable after restart");
  }

  return adopted;
}

} // namespace debugpod::core
