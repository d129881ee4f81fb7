#include "application_context.hpp"

#include <chrono>

#include "internal/cache/cache_helper.hpp"
#include "internal/config/global_settings.hpp"
#include "internal/core/context_slot.hpp"
#include "internal/db/database_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolution/resolution.hpp"
#include "internal/resolution/resolver_collection.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/server_environment.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/version.hpp"

namespace apphost::core {

using observability::StringField;

ApplicationContext::ApplicationContext(std::shared_ptr<db::DatabaseContext> database_context, std::shared_ptr<service::ServiceContext> services,
                                       std::shared_ptr<cache::CacheHelper> cache) {
  if (!database_context) throw util::InvalidArgument("database_context must not be null");
  if (!services) throw util::InvalidArgument("services must not be null");
  if (!cache) throw util::InvalidArgument("cache must not be null");

  database_context_ = std::move(database_context);
  services_         = std::move(services);
  cache_            = std::move(cache);
}

ApplicationContext::ApplicationContext(std::shared_ptr<cache::CacheHelper> cache) {
  if (!cache) throw util::InvalidArgument("cache must not be null");
  cache_ = std::move(cache);
}

// ------------------------------------------------------------
// Singleton
// ------------------------------------------------------------

std::shared_ptr<ApplicationContext> ApplicationContext::Current() {
  return GlobalContextSlot().Current();
}

std::shared_ptr<ApplicationContext> ApplicationContext::EnsureContext(std::shared_ptr<ApplicationContext> context, bool replace_context) {
  return GlobalContextSlot().Ensure(std::move(context), replace_context);
}

std::shared_ptr<ApplicationContext> ApplicationContext::EnsureContext(std::shared_ptr<db::DatabaseContext>     database_context,
                                                                      std::shared_ptr<service::ServiceContext> services,
                                                                      std::shared_ptr<cache::CacheHelper> cache, bool replace_context) {
  return GlobalContextSlot().Ensure(std::move(database_context), std::move(services), std::move(cache), replace_context);
}

// ------------------------------------------------------------
// Collaborators
// ------------------------------------------------------------

std::shared_ptr<cache::CacheHelper> ApplicationContext::ApplicationCache() const {
  return std::atomic_load(&cache_);
}

std::shared_ptr<db::DatabaseContext> ApplicationContext::DatabaseContext() const {
  auto database_context = std::atomic_load(&database_context_);
  if (!database_context) {
    throw util::NotSet("The DatabaseContext has not been set on the ApplicationContext");
  }
  return database_context;
}

std::shared_ptr<service::ServiceContext> ApplicationContext::Services() const {
  auto services = std::atomic_load(&services_);
  if (!services) {
    throw util::NotSet("The ServiceContext has not been set on the ApplicationContext");
  }
  return services;
}

void ApplicationContext::SetDatabaseContext(std::shared_ptr<db::DatabaseContext> database_context) {
  std::atomic_store(&database_context_, std::move(database_context));
}

void ApplicationContext::SetServices(std::shared_ptr<service::ServiceContext> services) {
  std::atomic_store(&services_, std::move(services));
}

// ------------------------------------------------------------
// Readiness
// ------------------------------------------------------------

bool ApplicationContext::IsReady() const {
  return is_ready_.load(std::memory_order_acquire);
}

void ApplicationContext::MarkReady() {
  if (IsDisposed()) {
    throw util::InvalidState("ApplicationContext has been disposed.");
  }
  if (is_ready_.exchange(true, std::memory_order_acq_rel)) {
    throw util::InvalidState("ApplicationContext has already been initialized.");
  }
  ready_signal_.Set();
}

bool ApplicationContext::WaitForReady(int timeout_ms) const {
  return ready_signal_.Wait(std::chrono::milliseconds(timeout_ms)) && !IsDisposed();
}

// ------------------------------------------------------------
// Configured version
// ------------------------------------------------------------

bool ApplicationContext::IsConfigured() const {
  std::call_once(configured_once_, [this] { configured_ = ComputeConfigured(); });
  return configured_;
}

bool ApplicationContext::ComputeConfigured() const {
  const auto configuration_status = ConfigurationStatus();
  const auto current_version      = util::CurrentVersion().ToString(3);

  const bool ok = configuration_status == current_version;
  if (!ok) {
    APPHOST_LOG_DEBUG("CurrentVersion different from configuration status",
                      {StringField("current_version", current_version), StringField("configuration_status", configuration_status)});
  }
  return ok;
}

std::string ApplicationContext::ConfigurationStatus() {
  try {
    return config::GlobalSettings::ConfigurationStatus();
  } catch (const std::exception& e) {
    // missing configuration reads as "never configured"
    APPHOST_LOG_DEBUG("Configuration status unavailable", {StringField("error", e.what())});
    return std::string();
  }
}

// ------------------------------------------------------------
// Application url
// ------------------------------------------------------------

std::optional<std::string> ApplicationContext::ApplicationUrl() {
  if (auto url = StoredApplicationUrl()) return url;

  if (config::GlobalSettings::HasSettings()) {
    try {
      sync::ServerEnvironment::TrySetApplicationUrlFromSettings(*this, *config::GlobalSettings::Settings());
    } catch (const util::NotSet&) {
      // settings were unloaded between the check and the read
    }
  }

  return StoredApplicationUrl();
}

std::optional<std::string> ApplicationContext::StoredApplicationUrl() const {
  auto url = std::atomic_load(&application_url_);
  if (!url) return std::nullopt;
  return *url;
}

void ApplicationContext::SetApplicationUrl(std::string url) {
  std::atomic_store(&application_url_, std::make_shared<const std::string>(std::move(url)));
}

// ------------------------------------------------------------
// Disposal
// ------------------------------------------------------------

void ApplicationContext::Dispose() {
  if (IsDisposed()) return;

  std::unique_lock lock(disposal_mutex_);

  // check again now we hold the lock
  if (IsDisposed()) return;

  if (auto cache = std::atomic_load(&cache_)) {
    cache->ClearAllCache();
  }

  resolution::ResolverCollection::ResetAll();
  // resetting the resolvers should leave nothing for this to do
  resolution::Resolution::Reset();

  // a failing close leaves every handle in place so Dispose() can be retried
  if (auto database_context = std::atomic_load(&database_context_)) {
    if (database_context->IsDatabaseConfigured()) {
      database_context->Database().Close();
    }
  }

  std::atomic_store(&cache_, std::shared_ptr<cache::CacheHelper>());
  std::atomic_store(&database_context_, std::shared_ptr<db::DatabaseContext>());
  std::atomic_store(&services_, std::shared_ptr<service::ServiceContext>());

  is_ready_.store(false, std::memory_order_release);
  disposed_.store(true, std::memory_order_release);

  // waiters still blocked in WaitForReady return false
  ready_signal_.Abandon();

  APPHOST_LOG_INFO("ApplicationContext disposed");
}

} // namespace apphost::core
