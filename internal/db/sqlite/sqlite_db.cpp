#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>

namespace debugpod::db::sqlite {

namespace {

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* stmt = nullptr;
  ~Statement() {
    sqlite3_finalize(stmt);
  }
};

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("instance journal path must not be empty");
  }

  if (!InMemory()) {
    const auto parent = std::filesystem::path(path_).parent_path();
    std::error_code ec;
    if (!parent.empty() && !std::filesystem::create_directories(parent, ec) && ec) {
      throw std::runtime_error("cannot create journal directory " + parent.string() + ": " + ec.message());
    }
  }

  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open instance journal " + path_ + ": " + msg);
  }

  try {
    Configure(busy_timeout);
    CheckIntegrity();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + msg);
  }
}

std::int64_t SqliteDB::QueryInt(const std::string& sql) {
  Statement st;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st.stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error(path_ + ": " + sqlite3_errmsg(db_));
  }
  if (sqlite3_step(st.stmt) != SQLITE_ROW) {
    throw std::runtime_error(path_ + ": no result for " + sql);
  }
  return sqlite3_column_int64(st.stmt, 0);
}

int SqliteDB::SchemaVersion() {
  return static_cast<int>(QueryInt("PRAGMA user_version;"));
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  if (!InMemory()) {
    // readers never block the journal writer
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  if (sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())) != SQLITE_OK) {
    throw std::runtime_error(std::string("busy_timeout: ") + sqlite3_errmsg(db_));
  }
}

void SqliteDB::CheckIntegrity() {
  Statement st;
  if (sqlite3_prepare_v2(db_, "PRAGMA quick_check;", -1, &st.stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("instance journal " + path_ + " is unreadable: " + sqlite3_errmsg(db_));
  }
  if (sqlite3_step(st.stmt) != SQLITE_ROW) {
    throw std::runtime_error("instance journal " + path_ + " is unreadable: " + sqlite3_errmsg(db_));
  }
  const auto* verdict = reinterpret_cast<const char*>(sqlite3_column_text(st.stmt, 0));
  if (verdict == nullptr || std::string(verdict) != "ok") {
    throw std::runtime_error("instance journal " + path_ + " failed integrity check: " + (verdict ? verdict : "no result"));
  }
}

} // namespace debugpod::db::sqlite
