#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace debugpod::db::sqlite {

using debugpod::observability::StringField;

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != TxState::kOpen) {
    return;
  }
  try {
    Rollback();
  } catch (const std::exception& e) {
    DEBUGPOD_LOG_ERROR("Instance journal rollback failed", {StringField("path", db_->Path()), StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != TxState::kOpen) {
    throw std::logic_error("journal transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    // a failed COMMIT can leave the transaction open
    if (sqlite3_get_autocommit(db_->Handle()) == 0) {
      db_->Exec("ROLLBACK;");
    }
    state_ = TxState::kRolledBack;
    throw std::runtime_error(std::string("instance journal commit failed: ") + e.what());
  }
  state_ = TxState::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != TxState::kOpen) {
    return;
  }
  state_ = TxState::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace debugpod::db::sqlite
