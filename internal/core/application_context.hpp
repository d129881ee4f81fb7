#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "internal/core/ready_signal.hpp"

namespace apphost::cache {
class CacheHelper;
}
namespace apphost::db {
class DatabaseContext;
}
namespace apphost::service {
class ServiceContext;
}

namespace apphost::core {

class ApplicationContextAccess;

/*
  The application context.

  One per process, reachable through the process-wide ContextSlot. Gates
  access to the application cache, the database context and the service
  registry, and carries the boot readiness barrier.

  Collaborator reads take no lock and are not synchronized with Dispose():
  a reader racing disposal may see a handle or null. Dispose() is meant for
  shutdown and test teardown, not for a context that is in use.
*/
class ApplicationContext {
 public:
  // Throws util::InvalidArgument if any handle is null.
  ApplicationContext(std::shared_ptr<db::DatabaseContext> database_context, std::shared_ptr<service::ServiceContext> services,
                     std::shared_ptr<cache::CacheHelper> cache);

  // Basic context: no database context, no services.
  explicit ApplicationContext(std::shared_ptr<cache::CacheHelper> cache);

  // Does not dispose; Dispose() is always explicit.
  ~ApplicationContext() = default;

  ApplicationContext(const ApplicationContext&)            = delete;
  ApplicationContext& operator=(const ApplicationContext&) = delete;

  // ------------------------------------------------------------
  // Process-wide singleton (see ContextSlot).
  // NOT thread safe: callers serialize, typically once at startup.
  // ------------------------------------------------------------

  static std::shared_ptr<ApplicationContext> Current();

  // Installs the context unless one exists and replace_context is false,
  // in which case the existing one is returned and the argument discarded.
  static std::shared_ptr<ApplicationContext> EnsureContext(std::shared_ptr<ApplicationContext> context, bool replace_context);

  static std::shared_ptr<ApplicationContext> EnsureContext(std::shared_ptr<db::DatabaseContext> database_context,
                                                           std::shared_ptr<service::ServiceContext> services,
                                                           std::shared_ptr<cache::CacheHelper> cache, bool replace_context);

  // ------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------

  // Application wide cache. Null once disposed.
  std::shared_ptr<cache::CacheHelper> ApplicationCache() const;

  // Throw util::NotSet when never assigned or disposed.
  std::shared_ptr<db::DatabaseContext>     DatabaseContext() const;
  std::shared_ptr<service::ServiceContext> Services() const;

  // ------------------------------------------------------------
  // Readiness
  // ------------------------------------------------------------

  // Set once by the boot manager when boot completes.
  bool IsReady() const;

  // Blocks until ready or until timeout_ms elapses (negative: no limit).
  // Returns false on timeout and on a disposed context; Dispose() wakes
  // blocked waiters.
  bool WaitForReady(int timeout_ms) const;

  // Whether the configured version matches the current version.
  // Computed on first access and never re-evaluated.
  bool IsConfigured() const;

  /*
    The url services use to reach the application (keep-alive, scheduled
    tasks). Has a scheme and no trailing slash.

    Resolved from settings on first access, otherwise set from the first
    request by sync::ServerEnvironment::EnsureApplicationUrl. Not locked:
    concurrent first resolutions store equivalent values, last write wins.
  */
  std::optional<std::string> ApplicationUrl();

  // ------------------------------------------------------------
  // Disposal
  // ------------------------------------------------------------

  /*
    Clears the cache, resets all resolvers and resolution, closes the
    database if configured, drops every collaborator and clears IsReady.
    Idempotent. A failing database close propagates and the context stays
    undisposed so the call can be repeated.

    Never dispose a context the application still needs; this is for
    shutdown and unit tests.
  */
  void Dispose();

  bool IsDisposed() const {
    return disposed_.load(std::memory_order_acquire);
  }

 private:
  friend class ApplicationContextAccess;

  void MarkReady();
  void SetDatabaseContext(std::shared_ptr<db::DatabaseContext> database_context);
  void SetServices(std::shared_ptr<service::ServiceContext> services);
  void SetApplicationUrl(std::string url);

  // Stored url without attempting resolution.
  std::optional<std::string> StoredApplicationUrl() const;

  static std::string ConfigurationStatus();
  bool               ComputeConfigured() const;

  std::shared_ptr<cache::CacheHelper>      cache_;
  std::shared_ptr<db::DatabaseContext>     database_context_;
  std::shared_ptr<service::ServiceContext> services_;

  std::atomic<bool> is_ready_{false};
  ReadySignal       ready_signal_;

  mutable std::once_flag configured_once_;
  mutable bool           configured_ = false;

  std::shared_ptr<const std::string> application_url_;

  std::atomic<bool> disposed_{false};
  std::shared_mutex disposal_mutex_;
};

} // namespace apphost::core
