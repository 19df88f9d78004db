#include "instance_registry.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace debugpod::registry {

using debugpod::model::Instance;
using debugpod::model::InstanceStatus;

db::model::InstanceRecord ToRecord(const Instance& instance) {
  db::model::InstanceRecord record;
  record.correlation_id    = instance.correlation_id;
  record.generation        = instance.generation;
  record.source_commit     = instance.source_commit;
  record.reference_commit  = instance.reference_commit;
  record.compare_advice    = instance.compare_advice;
  record.matches_reference = instance.matches_reference;
  record.working_copy_path = instance.working_copy_path;
  record.branch_name       = instance.branch_name;
  record.log_path          = instance.log_path;
  record.port              = instance.port;
  record.process_id        = instance.process_id;
  record.status            = static_cast<int>(instance.status);
  record.created_at_ms     = debugpod::util::ToUnixMillis(instance.created_at);
  return record;
}

Instance FromRecord(const db::model::InstanceRecord& record) {
  Instance instance;
  instance.correlation_id    = record.correlation_id;
  instance.generation        = record.generation;
  instance.source_commit     = record.source_commit;
  instance.reference_commit  = record.reference_commit;
  instance.compare_advice    = record.compare_advice;
  instance.matches_reference = record.matches_reference;
  instance.working_copy_path = record.working_copy_path;
  instance.branch_name       = record.branch_name;
  instance.log_path          = record.log_path;
  instance.port              = static_cast<std::uint16_t>(record.port);
  instance.process_id        = record.process_id;
  instance.status            = static_cast<InstanceStatus>(record.status);
  instance.created_at        = debugpod::util::FromUnixMillis(record.created_at_ms);
  return instance;
}

InstanceRegistry::InstanceRegistry(std::shared_ptr<db::InstanceRepository> repository) : repository_(std::move(repository)) {
}

void InstanceRegistry::Persist(const Instance& instance) {
  if (!repository_) {
    return;
  }
  auto tx = repository_->Begin();
  db::Check(repository_->UpsertInstance(*tx, ToRecord(instance)), "instance journal write");
  tx->Commit();
}

void InstanceRegistry::Unpersist(const std::string& correlation_id) {
  if (!repository_) {
    return;
  }
  auto tx     = repository_->Begin();
  auto result = repository_->DeleteInstance(*tx, correlation_id);
  if (!result.Is(db::ErrorCode::NotFound)) {
    db::Check(result, "instance journal delete");
  }
  tx->Commit();
}

Instance InstanceRegistry::Insert(Instance instance) {
  std::lock_guard lock(mutex_);

  auto it = instances_.find(instance.correlation_id);
  if (it != instances_.end() && it->second.status != InstanceStatus::kTerminated) {
    throw debugpod::util::AlreadyExists("instance already registered: " + instance.correlation_id);
  }

  instance.generation = next_generation_++;
  instance.api_contract.reset();
  Persist(instance);

  instances_[instance.correlation_id] = instance;
  return instance;
}

void InstanceRegistry::Update(const Instance& instance) {
  std::lock_guard lock(mutex_);

  auto it = instances_.find(instance.correlation_id);
  if (it == instances_.end()) {
    throw debugpod::util::InstanceNotFound("instance not found: " + instance.correlation_id);
  }
  if (it->second.generation != instance.generation) {
    throw debugpod::util::InvalidState("stale update for instance " + instance.correlation_id);
  }
  if (!debugpod::model::CanTransition(it->second.status, instance.status)) {
    throw debugpod::util::InvalidState(std::string("invalid transition ") + debugpod::model::ToString(it->second.status) + " -> " +
                                       debugpod::model::ToString(instance.status));
  }

  Persist(instance);

  auto contract = it->second.api_contract;
  it->second    = instance;
  if (!it->second.api_contract) {
    it->second.api_contract = std::move(contract);
  }
}

Instance InstanceRegistry::Transition(const std::string& correlation_id, InstanceStatus next) {
  std::lock_guard lock(mutex_);

  auto it = instances_.find(correlation_id);
  if (it == instances_.end()) {
    throw debugpod::util::InstanceNotFound("instance not found: " + correlation_id);
  }
  if (!debugpod::model::CanTransition(it->second.status, next)) {
    throw debugpod::util::InvalidState(std::string("invalid transition ") + debugpod::model::ToString(it->second.status) + " -> " +
                                       debugpod::model::ToString(next));
  }

  auto updated   = it->second;
  updated.status = next;
  Persist(updated);

  it->second = updated;
  return updated;
}

std::optional<Instance> InstanceRegistry::Get(const std::string& correlation_id) const {
  std::lock_guard lock(mutex_);
  auto            it = instances_.find(correlation_id);
  if (it == instances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Instance> InstanceRegistry::List() const {
  std::vector<Instance> out;
  {
    std::lock_guard lock(mutex_);
    out.reserve(instances_.size());
    for (const auto& [_, instance] : instances_) {
      out.push_back(instance);
    }
  }
  std::sort(out.begin(), out.end(), [](const Instance& a, const Instance& b) { return a.correlation_id < b.correlation_id; });
  return out;
}

std::size_t InstanceRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return instances_.size();
}

bool InstanceRegistry::Remove(const std::string& correlation_id) {
  std::lock_guard lock(mutex_);
  if (!instances_.contains(correlation_id)) {
    return false;
  }
  Unpersist(correlation_id);
  instances_.erase(correlation_id);
  return true;
}

bool InstanceRegistry::AttachContract(const std::string& correlation_id, std::uint64_t generation,
                                      std::shared_ptr<const proxy::ApiContract> contract) {
  std::lock_guard lock(mutex_);
  auto            it = instances_.find(correlation_id);
  if (it == instances_.end() || it->second.generation != generation) {
    return false;
  }
  it->second.api_contract = std::move(contract);
  return true;
}

std::shared_ptr<std::mutex> InstanceRegistry::KeyMutex(const std::string& correlation_id) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[correlation_id];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::mutex>();
  }
  return key_mutex;
}

std::vector<Instance> InstanceRegistry::LoadPersisted() {
  std::vector<Instance> out;
  if (!repository_) {
    return out;
  }

  auto tx = repository_->Begin();
  for (const auto& record : repository_->ListInstances(*tx)) {
    out.push_back(FromRecord(record));
  }
  tx->Commit();

  std::lock_guard lock(mutex_);
  for (const auto& instance : out) {
    next_generation_ = std::max(next_generation_, instance.generation + 1);
  }
  return out;
}

} // namespace debugpod::registry
