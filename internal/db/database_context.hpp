#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/database.hpp"

namespace apphost::db {

/*
  Database access for the application.

  A context without a database is "not configured": the host still boots
  (installers, status pages) but nothing may touch the database.
*/
class DatabaseContext {
 public:
  explicit DatabaseContext(std::shared_ptr<api::Database> database);

  static std::shared_ptr<DatabaseContext> Unconfigured();

  bool IsDatabaseConfigured() const {
    return database_ != nullptr;
  }

  // Throws util::NotSet when no database is configured.
  api::Database& Database() const;

  // "sqlite", "postgres", or empty when not configured.
  std::string ProviderName() const;

 private:
  std::shared_ptr<api::Database> database_;
};

/*
  Opens the backend named by the configuration and probes it.
  No backend configured yields an unconfigured context.
*/
std::shared_ptr<DatabaseContext> CreateDatabaseContext(const apphost::runtime::config::DatabaseConfig& config);

} // namespace apphost::db
