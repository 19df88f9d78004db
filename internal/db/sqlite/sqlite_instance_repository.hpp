#pragma once

#include <memory>

#include "internal/db/api/instance_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace debugpod::db::sqlite {

inline constexpr int kJournalSchemaVersion = 1;

class SqliteInstanceRepository final : public db::InstanceRepository {
 public:
  explicit SqliteInstanceRepository(std::shared_ptr<SqliteDB> db);

  // Brings a journal up to kJournalSchemaVersion; throws for a journal
  // written by a newer release.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertInstance(Transaction&, const model::InstanceRecord&) override;
  Result                             DeleteInstance(Transaction&, const std::string& correlation_id) override;
  std::vector<model::InstanceRecord> ListInstances(Transaction&) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace debugpod::db::sqlite
