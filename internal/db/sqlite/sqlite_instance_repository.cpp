#include "sqlite_instance_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace debugpod::db::sqlite {

using debugpod::db::ErrorCode;
using debugpod::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

SqliteInstanceRepository::SqliteInstanceRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteInstanceRepository::BootstrapSchema(SqliteDB& db) {
  const int version = db.SchemaVersion();
  if (version > kJournalSchemaVersion) {
    throw std::runtime_error("instance journal " + db.Path() + " has schema version " + std::to_string(version) + ", newer than supported " +
                             std::to_string(kJournalSchemaVersion));
  }
  if (version == kJournalSchemaVersion) {
    return;
  }

  db.Exec("BEGIN IMMEDIATE;");
  try {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS instances ("
        "correlation_id TEXT PRIMARY KEY, generation INTEGER NOT NULL, source_commit TEXT NOT NULL, reference_commit TEXT, "
        "compare_advice TEXT, matches_reference INTEGER NOT NULL DEFAULT 0, working_copy_path TEXT NOT NULL, branch_name TEXT NOT NULL, "
        "log_path TEXT, port INTEGER NOT NULL, process_id INTEGER NOT NULL, status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);");
    db.SetSchemaVersion(kJournalSchemaVersion);
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }
}

std::unique_ptr<db::Transaction> SqliteInstanceRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteInstanceRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteInstanceRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteInstanceRepository::UpsertInstance(Transaction& t, const model::InstanceRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO instances(correlation_id,generation,source_commit,reference_commit,compare_advice,matches_reference,"
      "working_copy_path,branch_name,log_path,port,process_id,status,created_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) "
      "ON CONFLICT(correlation_id) DO UPDATE SET generation=excluded.generation,source_commit=excluded.source_commit,"
      "reference_commit=excluded.reference_commit,compare_advice=excluded.compare_advice,matches_reference=excluded.matches_reference,"
      "working_copy_path=excluded.working_copy_path,branch_name=excluded.branch_name,log_path=excluded.log_path,port=excluded.port,"
      "process_id=excluded.process_id,status=excluded.status,created_at_ms=excluded.created_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.correlation_id);
  BindI64(st, 2, static_cast<int64_t>(r.generation));
  BindText(st, 3, r.source_commit);
  BindText(st, 4, r.reference_commit);
  BindText(st, 5, r.compare_advice);
  BindI64(st, 6, r.matches_reference ? 1 : 0);
  BindText(st, 7, r.working_copy_path);
  BindText(st, 8, r.branch_name);
  BindText(st, 9, r.log_path);
  BindI64(st, 10, r.port);
  BindI64(st, 11, r.process_id);
  BindI64(st, 12, r.status);
  BindI64(st, 13, static_cast<int64_t>(r.created_at_ms));

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteInstanceRepository::DeleteInstance(Transaction& t, const std::string& correlation_id) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM instances WHERE correlation_id=?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, correlation_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, correlation_id);
  return result;
}

std::vector<model::InstanceRecord> SqliteInstanceRepository::ListInstances(Transaction& t) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT correlation_id,generation,source_commit,reference_commit,compare_advice,matches_reference,working_copy_path,"
      "branch_name,log_path,port,process_id,status,created_at_ms FROM instances ORDER BY correlation_id;";

  std::vector<model::InstanceRecord> out;

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return out;

  while (sqlite3_step(st) == SQLITE_ROW) {
    model::InstanceRecord r;
    r.correlation_id    = ColText(st, 0);
    r.generation        = static_cast<uint64_t>(ColI64(st, 1));
    r.source_commit     = ColText(st, 2);
    r.reference_commit  = ColText(st, 3);
    r.compare_advice    = ColText(st, 4);
    r.matches_reference = ColI64(st, 5) != 0;
    r.working_copy_path = ColText(st, 6);
    r.branch_name       = ColText(st, 7);
    r.log_path          = ColText(st, 8);
    r.port              = static_cast<uint32_t>(ColI64(st, 9));
    r.process_id        = ColI64(st, 10);
    r.status            = static_cast<int>(ColI64(st, 11));
    r.created_at_ms     = static_cast<uint64_t>(ColI64(st, 12));
    out.push_back(std::move(r));
  }

  sqlite3_finalize(st);
  return out;
}

} // namespace debugpod::db::sqlite
