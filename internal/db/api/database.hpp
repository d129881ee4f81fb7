#pragma once

#include <string>
#include <string_view>

namespace apphost::db::api {

/*
  Underlying database resource held by a DatabaseContext.

  Close() releases the connection. It is idempotent; a backend that fails
  to release throws and stays open so the caller can retry.
*/
class Database {
 public:
  virtual ~Database() = default;

  virtual std::string_view Provider() const = 0;
  virtual bool             IsOpen() const   = 0;

  // Execute a SQL string (probes, pragmas, migrations)
  virtual void Exec(const std::string& sql) = 0;

  virtual void Close() = 0;
};

} // namespace apphost::db::api
