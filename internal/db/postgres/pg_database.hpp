#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

#include "internal/db/api/database.hpp"

namespace apphost::db::postgres {

/*
  PgDatabase

  Single libpqxx connection owned by the DatabaseContext.
  libpqxx connections are NOT thread-safe; every use is serialized.
*/
class PgDatabase final : public api::Database {
 public:
  explicit PgDatabase(std::string conninfo);

  std::string_view Provider() const override {
    return "postgres";
  }

  bool IsOpen() const override;

  void Exec(const std::string& sql) override;

  void Close() override;

 private:
  std::string conninfo_;

  mutable std::mutex                mutex_;
  std::unique_ptr<pqxx::connection> conn_;
};

} // namespace apphost::db::postgres
