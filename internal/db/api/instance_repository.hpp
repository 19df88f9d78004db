#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/instance_record.hpp"

namespace debugpod::db {

/*
  Journal of live instances.

  The in-memory registry stays authoritative while the process runs; the
  journal only lets a restarted orchestrator find what it left behind.

  All writes require a Transaction. Reads inside a transaction see its
  writes.
*/

class InstanceRepository {
 public:
  virtual ~InstanceRepository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Insert or replace by correlation id.
  virtual Result UpsertInstance(Transaction&, const model::InstanceRecord&) = 0;

  // NotFound when no row exists.
  virtual Result DeleteInstance(Transaction&, const std::string& correlation_id) = 0;

  virtual std::vector<model::InstanceRecord> ListInstances(Transaction&) = 0;
};

} // namespace debugpod::db
