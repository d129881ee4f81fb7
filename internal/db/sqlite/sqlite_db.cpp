#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace apphost::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode, int busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(wal_mode, busy_timeout_ms);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  // sqlite3_close_v2 defers the close until outstanding statements finish
  if (db_) sqlite3_close_v2(db_);
}

bool SqliteDB::IsOpen() const {
  std::lock_guard lock(mutex_);
  return db_ != nullptr;
}

void SqliteDB::Exec(const std::string& sql) {
  std::lock_guard lock(mutex_);
  if (!db_) throw util::InvalidState("sqlite database '" + path_ + "' is closed");

  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Close() {
  std::lock_guard lock(mutex_);
  if (!db_) return;

  // SQLITE_BUSY means unfinalized statements; the handle stays open
  ThrowIf(sqlite3_close(db_), db_, "sqlite close");
  db_ = nullptr;
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  std::lock_guard lock(mutex_);
  if (!db_) throw util::InvalidState("sqlite database '" + path_ + "' is closed");

  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode, int busy_timeout_ms) {
  auto exec = [this](const char* sql) {
    char* err = nullptr;
    int   rc  = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
      std::string msg = err ? err : "sqlite exec failed";
      sqlite3_free(err);
      throw std::runtime_error(msg);
    }
  };

  // WAL enables concurrent readers while writer holds lock
  if (wal_mode) exec("PRAGMA journal_mode=WAL;");

  exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, busy_timeout_ms), db_, "busy_timeout");

  exec("PRAGMA temp_store=MEMORY;");
}

} // namespace apphost::db::sqlite
