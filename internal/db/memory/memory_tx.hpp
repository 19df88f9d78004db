#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace debugpod::db::memory {

// Works on a private copy of the table; Commit publishes it.
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryInstanceRepository& repo);
  ~MemoryTransaction() override;

  void    Commit() override;
  void    Rollback() override;
  TxState State() const override {
    return state_;
  }

  MemoryInstanceRepository::Table& Rows() {
    return rows_;
  }

 private:
  MemoryInstanceRepository&       repo_;
  MemoryInstanceRepository::Table rows_;
  uint64_t                        base_version_ = 0;
  TxState                         state_        = TxState::kOpen;
};

} // namespace debugpod::db::memory
