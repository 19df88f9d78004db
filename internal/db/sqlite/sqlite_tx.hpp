#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace debugpod::db::sqlite {

/*
  BEGIN IMMEDIATE on construction: the journal's write lock is taken before
  any statement runs, so a busy journal surfaces here (after the connection's
  busy timeout) and never half-way through an upsert.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void    Commit() override;
  void    Rollback() override;
  TxState State() const override {
    return state_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  TxState                   state_ = TxState::kOpen;
};

} // namespace debugpod::db::sqlite
