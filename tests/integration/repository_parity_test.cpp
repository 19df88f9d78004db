#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/instance_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/instance_record.hpp"

#if DEBUGPOD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_instance_repository.hpp"
#endif

namespace {

using debugpod::db::ErrorCode;
using debugpod::db::InstanceRepository;
using debugpod::db::Result;
using debugpod::db::TxState;
using debugpod::db::memory::MemoryInstanceRepository;
using debugpod::db::model::InstanceRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

InstanceRecord MakeRecord(const std::string& id, std::uint16_t port) {
  InstanceRecord record;
  record.correlation_id    = id;
  record.generation        = 1;
  record.source_commit     = "c0ffee";
  record.reference_commit  = "beef02";
  record.compare_advice    = "Compare with current master";
  record.matches_reference = false;
  record.working_copy_path = "/tmp/debug-worktrees/" + id;
  record.branch_name       = "debug/" + id;
  record.log_path          = record.working_copy_path + "/server.log";
  record.port              = port;
  record.process_id        = 4242;
  record.status            = 2;
  record.created_at_ms     = NowMs();
  return record;
}

struct BackendFactory {
  std::string                                               name;
  std::function<std::shared_ptr<InstanceRepository>()>      make_repository;
  std::function<bool()>                                     supports_restart;
  std::function<void()>                                     cleanup;
};

void VerifyUpsertListDelete(InstanceRepository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  assert(repo.UpsertInstance(*tx, MakeRecord(prefix + "-b", 4101)));
  assert(repo.UpsertInstance(*tx, MakeRecord(prefix + "-a", 4100)));

  auto listed = repo.ListInstances(*tx);
  assert(listed.size() == 2);
  assert(listed[0].correlation_id == prefix + "-a");
  assert(listed[0].port == 4100);
  assert(listed[0].branch_name == "debug/" + prefix + "-a");
  assert(listed[0].process_id == 4242);
  assert(!listed[0].matches_reference);

  auto updated   = MakeRecord(prefix + "-a", 4100);
  updated.status = 3;
  updated.generation = 2;
  assert(repo.UpsertInstance(*tx, updated));
  listed = repo.ListInstances(*tx);
  assert(listed.size() == 2);
  assert(listed[0].status == 3);
  assert(listed[0].generation == 2);

  assert(repo.DeleteInstance(*tx, prefix + "-a"));
  assert(repo.DeleteInstance(*tx, prefix + "-b"));
  assert(repo.ListInstances(*tx).empty());

  auto missing = repo.DeleteInstance(*tx, prefix + "-a");
  assert(!missing);
  assert(missing.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyRollbackBehavior(InstanceRepository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertInstance(*tx, MakeRecord(id, 4150)));
    tx->Rollback();
    assert(tx->State() == TxState::kRolledBack);
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx = repo.Begin();
    assert(repo.UpsertInstance(*tx, MakeRecord(id, 4150)));
  }

  auto check_tx = repo.Begin();
  assert(check_tx->IsOpen());
  assert(repo.ListInstances(*check_tx).empty());
  check_tx->Commit();
  assert(check_tx->State() == TxState::kCommitted);
  check_tx->Rollback();
  assert(check_tx->State() == TxState::kCommitted);
}

void VerifyResultCheck() {
  debugpod::db::Check(Result::Ok(), "noop");

  bool threw = false;
  try {
    debugpod::db::Check(Result::Err(ErrorCode::Busy, "locked"), "instance journal write");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "instance journal write: busy: locked";
  }
  assert(threw);
}

void VerifyMemoryCommitConflict() {
  MemoryInstanceRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  assert(repo.UpsertInstance(*first, MakeRecord("conflict-a", 4110)));
  assert(repo.UpsertInstance(*second, MakeRecord("conflict-b", 4111)));
  first->Commit();

  bool threw = false;
  try {
    second->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(second->State() == TxState::kRolledBack);

  auto tx   = repo.Begin();
  auto rows = repo.ListInstances(*tx);
  assert(rows.size() == 1);
  assert(rows[0].correlation_id == "conflict-a");
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  {
    auto repo = backend.make_repository();
    auto tx   = repo->Begin();
    assert(repo->UpsertInstance(*tx, MakeRecord(id, 4199)));
    tx->Commit();
  }

  auto repo = backend.make_repository();
  auto tx   = repo->Begin();
  auto rows = repo->ListInstances(*tx);
  assert(rows.size() == 1);
  assert(rows[0].correlation_id == id);
  assert(rows[0].port == 4199);
  assert(rows[0].working_copy_path == "/tmp/debug-worktrees/" + id);
  assert(repo->DeleteInstance(*tx, id));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryInstanceRepository>(); },
      .supports_restart = []() { return false; },
      .cleanup          = []() {},
  };
}

#if DEBUGPOD_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = (std::filesystem::temp_directory_path() / "debugpod_repository_parity.sqlite").string();
  std::filesystem::remove(db_path);

  auto make_repo = [db_path]() -> std::shared_ptr<InstanceRepository> {
    auto db = std::make_shared<debugpod::db::sqlite::SqliteDB>(db_path);
    debugpod::db::sqlite::SqliteInstanceRepository::BootstrapSchema(*db);
    return std::make_shared<debugpod::db::sqlite::SqliteInstanceRepository>(std::move(db));
  };
  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if DEBUGPOD_DB_SQLITE
void VerifyJournalSchemaVersioning() {
  namespace fs = std::filesystem;
  using debugpod::db::sqlite::SqliteDB;
  using debugpod::db::sqlite::SqliteInstanceRepository;

  const auto dir = fs::temp_directory_path() / "debugpod_journal_schema" / "nested";
  fs::remove_all(dir.parent_path());

  // parent directories are created on open
  const auto path = (dir / "instances.db").string();
  {
    SqliteDB db(path);
    assert(db.SchemaVersion() == 0);
    SqliteInstanceRepository::BootstrapSchema(db);
    assert(db.SchemaVersion() == debugpod::db::sqlite::kJournalSchemaVersion);
    // idempotent
    SqliteInstanceRepository::BootstrapSchema(db);
    assert(db.QueryInt("SELECT COUNT(*) FROM instances;") == 0);

    db.SetSchemaVersion(debugpod::db::sqlite::kJournalSchemaVersion + 1);
  }
  {
    SqliteDB db(path);
    bool     threw = false;
    try {
      SqliteInstanceRepository::BootstrapSchema(db);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // in-memory journal skips WAL
  {
    SqliteDB memory(":memory:");
    assert(memory.InMemory());
    SqliteInstanceRepository::BootstrapSchema(memory);
    assert(memory.SchemaVersion() == debugpod::db::sqlite::kJournalSchemaVersion);
  }

  // a file that is not a database fails on open
  const auto garbage = (dir / "garbage.db").string();
  {
    std::ofstream out(garbage);
    out << "this is not an sqlite journal, just some text padding it out to a page or so\n";
  }
  bool threw = false;
  try {
    SqliteDB db(garbage);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::error_code ec;
  fs::remove_all(dir.parent_path(), ec);
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  auto repo = backend.make_repository();
  VerifyUpsertListDelete(*repo, backend.name + "-life");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  repo.reset();

  VerifyRestartDurability(backend, backend.name + "-durable");
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if DEBUGPOD_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyResultCheck();
  VerifyMemoryCommitConflict();
#if DEBUGPOD_DB_SQLITE
  VerifyJournalSchemaVersioning();
#endif

  std::cout << "debugpod_integration_repository_parity: pass\n";
  return 0;
}
