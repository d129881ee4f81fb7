#include "database_context.hpp"

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if APPHOST_DB_POSTGRES
#include "internal/db/postgres/pg_database.hpp"
#endif

namespace apphost::db {

using apphost::runtime::config::DatabaseConfig;

DatabaseContext::DatabaseContext(std::shared_ptr<api::Database> database) : database_(std::move(database)) {
}

std::shared_ptr<DatabaseContext> DatabaseContext::Unconfigured() {
  return std::make_shared<DatabaseContext>(nullptr);
}

api::Database& DatabaseContext::Database() const {
  if (!database_) {
    throw util::NotSet("The database has not been configured on the DatabaseContext");
  }
  return *database_;
}

std::string DatabaseContext::ProviderName() const {
  return database_ ? std::string(database_->Provider()) : std::string();
}

// ------------------------------------------------------------
// Factory
// ------------------------------------------------------------

namespace {

std::shared_ptr<api::Database> OpenDatabase(const DatabaseConfig& config) {
  switch (config.backend_case()) {
    case DatabaseConfig::kSqlite: {
      const auto& sqlite = config.sqlite();
      if (sqlite.path().empty()) {
        throw util::InvalidArgument("database.sqlite.path must be set");
      }
      const int busy_timeout_ms = sqlite.busy_timeout_ms() ? static_cast<int>(sqlite.busy_timeout_ms()) : 5000;
      return std::make_shared<sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode(), busy_timeout_ms);
    }

    case DatabaseConfig::kPostgres:
#if APPHOST_DB_POSTGRES
      if (config.postgres().conninfo().empty()) {
        throw util::InvalidArgument("database.postgres.conninfo must be set");
      }
      return std::make_shared<postgres::PgDatabase>(config.postgres().conninfo());
#else
      throw util::InvalidArgument("postgres backend requested but apphost was built without APPHOST_DB_POSTGRES");
#endif

    case DatabaseConfig::BACKEND_NOT_SET:
      break;
  }
  return nullptr;
}

} // namespace

std::shared_ptr<DatabaseContext> CreateDatabaseContext(const DatabaseConfig& config) {
  auto database = OpenDatabase(config);
  if (!database) {
    APPHOST_LOG_WARN("No database configured");
    return DatabaseContext::Unconfigured();
  }

  database->Exec("SELECT 1;");
  APPHOST_LOG_INFO("Database configured", {observability::StringField("provider", database->Provider())});

  return std::make_shared<DatabaseContext>(std::move(database));
}

} // namespace apphost::db
