#pragma once

namespace debugpod::db {

enum class TxState { kOpen, kCommitted, kRolledBack };

/*
  Unit of work against the instance journal.

  - Writes are invisible to other transactions until Commit().
  - Commit() throws when the backend cannot make the writes durable; the
    transaction is then rolled back.
  - Rollback() after Commit() is a no-op.
  - A transaction destroyed while open rolls back.

  SQLite: BEGIN IMMEDIATE, so a writer fails up front instead of at COMMIT.
  Memory: private copy of the table, published if nobody committed since
  the copy was taken.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual TxState State() const = 0;

  bool IsOpen() const {
    return State() == TxState::kOpen;
  }
};

} // namespace debugpod::db
