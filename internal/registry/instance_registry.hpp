#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/instance_repository.hpp"
#include "internal/model/instance.hpp"

namespace debugpod::registry {

/*
  Authoritative map correlation_id -> Instance.

  Callers only ever receive copies. Every mutation is written through to the
  optional journal before it becomes visible; a journal failure throws and
  leaves the map unchanged.
*/
class InstanceRegistry {
 public:
  explicit InstanceRegistry(std::shared_ptr<db::InstanceRepository> repository = nullptr);

  // Assigns a fresh generation. util::AlreadyExists when a non-terminated
  // entry holds the id.
  model::Instance Insert(model::Instance instance);

  // Replaces the entry of the same generation; the attached contract is kept.
  void Update(const model::Instance& instance);

  // util::InvalidState for a transition the state machine forbids.
  model::Instance Transition(const std::string& correlation_id, model::InstanceStatus next);

  std::optional<model::Instance> Get(const std::string& correlation_id) const;
  std::vector<model::Instance>   List() const;
  std::size_t                    Size() const;

  bool Remove(const std::string& correlation_id);

  // No-op (false) when the entry is gone or belongs to a newer generation.
  bool AttachContract(const std::string& correlation_id, std::uint64_t generation, std::shared_ptr<const proxy::ApiContract> contract);

  // Serializes setup, delete and reap of one id.
  std::shared_ptr<std::mutex> KeyMutex(const std::string& correlation_id);

  // Journal contents left by a previous run.
  std::vector<model::Instance> LoadPersisted();

 private:
  void Persist(const model::Instance& instance);
  void Unpersist(const std::string& correlation_id);

  std::shared_ptr<db::InstanceRepository> repository_;

  mutable std::mutex                               mutex_;
  std::unordered_map<std::string, model::Instance> instances_;
  std::uint64_t                                    next_generation_ = 1;

  std::mutex                                                   key_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

db::model::InstanceRecord ToRecord(const model::Instance& instance);
model::Instance           FromRecord(const db::model::InstanceRecord& record);

} // namespace debugpod::registry
