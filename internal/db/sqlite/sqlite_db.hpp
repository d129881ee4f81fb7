#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/database.hpp"

namespace apphost::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB final : public api::Database {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = 5000);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  std::string_view Provider() const override {
    return "sqlite";
  }

  bool IsOpen() const override;

  void Exec(const std::string& sql) override;

  void Close() override;

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  const std::string& Path() const {
    return path_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode, int busy_timeout_ms);

  mutable std::mutex mutex_;
  sqlite3*           db_ = nullptr;
  std::string        path_;
};

} // namespace apphost::db::sqlite
