#include "pg_database.hpp"

#include "internal/util/errors.hpp"

namespace apphost::db::postgres {

PgDatabase::PgDatabase(std::string conninfo)
    : conninfo_(std::move(conninfo)),
      conn_(std::make_unique<pqxx::connection>(conninfo_)) {
}

bool PgDatabase::IsOpen() const {
  std::lock_guard lock(mutex_);
  return conn_ && conn_->is_open();
}

void PgDatabase::Exec(const std::string& sql) {
  std::lock_guard lock(mutex_);
  if (!conn_) throw util::InvalidState("postgres connection is closed");

  pqxx::work tx(*conn_);
  tx.exec(sql);
  tx.commit();
}

void PgDatabase::Close() {
  std::lock_guard lock(mutex_);
  if (!conn_) return;

  conn_->close();
  conn_.reset();
}

} // namespace apphost::db::postgres
