#pragma once

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace debugpod::db::sqlite {

/*
  Connection to the instance journal file.

  Opening creates the parent directory, switches a file journal to WAL and
  runs a quick integrity check, so a damaged journal fails at startup
  instead of during recovery. ":memory:" opens a private in-memory journal.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool InMemory() const {
    return path_ == ":memory:";
  }

  void Exec(const std::string& sql);

  // First column of the first row; throws when the query yields no row.
  std::int64_t QueryInt(const std::string& sql);

  // PRAGMA user_version.
  int  SchemaVersion();
  void SetSchemaVersion(int version);

 private:
  void Configure(std::chrono::milliseconds busy_timeout);
  void CheckIntegrity();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace debugpod::db::sqlite
