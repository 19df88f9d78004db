#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/instance_repository.hpp"

namespace debugpod::db::memory {

class MemoryTransaction;

/*
  Journal kept in process memory. Nothing survives a restart; used when no
  database is configured and as the reference backend in tests.
*/
class MemoryInstanceRepository final : public db::InstanceRepository {
 public:
  using Table = std::map<std::string, model::InstanceRecord>;

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertInstance(Transaction&, const model::InstanceRecord&) override;
  Result                             DeleteInstance(Transaction&, const std::string& correlation_id) override;
  std::vector<model::InstanceRecord> ListInstances(Transaction&) override;

 private:
  friend class MemoryTransaction;

  std::mutex mutex_;
  Table      rows_;
  uint64_t   version_ = 0;
};

} // namespace debugpod::db::memory
