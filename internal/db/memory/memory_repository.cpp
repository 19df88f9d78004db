#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace debugpod::db::memory {

namespace {

MemoryInstanceRepository::Table& RowsOf(Transaction& t) {
  return static_cast<MemoryTransaction&>(t).Rows();
}

} // namespace

std::unique_ptr<Transaction> MemoryInstanceRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

Result MemoryInstanceRepository::UpsertInstance(Transaction& t, const model::InstanceRecord& record) {
  if (record.correlation_id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "correlation id required");
  }
  RowsOf(t)[record.correlation_id] = record;
  return Result::Ok();
}

Result MemoryInstanceRepository::DeleteInstance(Transaction& t, const std::string& correlation_id) {
  if (RowsOf(t).erase(correlation_id) == 0) {
    return Result::Err(ErrorCode::NotFound, correlation_id);
  }
  return Result::Ok();
}

std::vector<model::InstanceRecord> MemoryInstanceRepository::ListInstances(Transaction& t) {
  std::vector<model::InstanceRecord> out;
  for (const auto& entry : RowsOf(t)) {
    out.push_back(entry.second);
  }
  return out;
}

} // namespace debugpod::db::memory
