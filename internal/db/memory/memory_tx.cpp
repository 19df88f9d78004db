#include "memory_tx.hpp"

#include <stdexcept>

namespace debugpod::db::memory {

MemoryTransaction::MemoryTransaction(MemoryInstanceRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  rows_         = repo_.rows_;
  base_version_ = repo_.version_;
}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

void MemoryTransaction::Commit() {
  if (state_ != TxState::kOpen) {
    throw std::logic_error("journal transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.version_ != base_version_) {
    state_ = TxState::kRolledBack;
    throw std::runtime_error("instance journal changed by a concurrent transaction");
  }
  repo_.rows_ = std::move(rows_);
  ++repo_.version_;
  state_ = TxState::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (state_ == TxState::kOpen) {
    rows_.clear();
    state_ = TxState::kRolledBack;
  }
}

} // namespace debugpod::db::memory
