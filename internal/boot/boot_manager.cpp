#include "boot_manager.hpp"

#include "internal/cache/cache_helper.hpp"
#include "internal/config/global_settings.hpp"
#include "internal/core/application_context.hpp"
#include "internal/core/application_context_access.hpp"
#include "internal/core/context_slot.hpp"
#include "internal/db/database_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolution/resolution.hpp"
#include "internal/service/runtime_status_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/version.hpp"

namespace apphost::boot {

using apphost::runtime::config::RuntimeConfig;
using observability::BoolField;
using observability::StringField;

BootManager::BootManager() : BootManager(core::GlobalContextSlot()) {
}

BootManager::BootManager(core::ContextSlot& slot) : slot_(slot) {
}

/*
    Build the application context from configuration
*/
BootManager& BootManager::Initialize(const RuntimeConfig& config) {
  if (is_initialized_) {
    throw util::InvalidState("The boot manager has already been initialized");
  }

  APPHOST_LOG_INFO("Booting", {StringField("version", util::CurrentVersion().ToString(3))});

  // ------------------------------------------------------------------
  // Settings (throws if resolution is frozen by a previous boot)
  // ------------------------------------------------------------------
  config::GlobalSettings::Load(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  auto cache            = config.cache().disabled() ? cache::CacheHelper::CreateDisabledCache() : cache::CacheHelper::CreateDefault();
  auto database_context = db::CreateDatabaseContext(config.database());
  auto services         = std::make_shared<service::ServiceContext>();

  // ------------------------------------------------------------------
  // Context
  // ------------------------------------------------------------------
  auto candidate = std::make_shared<core::ApplicationContext>(database_context, services, cache);
  context_       = slot_.Ensure(candidate, config.boot().replace_context());

  if (context_ != candidate) {
    APPHOST_LOG_WARN("An application context already exists, keeping it", {BoolField("replace_context", false)});
  }

  is_initialized_ = true;
  return *this;
}

BootManager& BootManager::Startup(const Callback& after_startup) {
  if (!is_initialized_) {
    throw util::InvalidState("The boot manager has not been initialized");
  }
  if (is_started_) {
    throw util::InvalidState("The boot manager has already been started");
  }

  auto services = context_->Services();
  if (!services->Find(service::RuntimeStatusService::kName)) {
    services->Register(std::make_shared<service::RuntimeStatusService>());
  }

  if (auto url = context_->ApplicationUrl()) {
    APPHOST_LOG_INFO("Application url", {StringField("url", *url)});
  } else {
    APPHOST_LOG_INFO("Application url not configured, waiting for the first request");
  }

  if (after_startup) after_startup(*context_);

  is_started_ = true;
  return *this;
}

BootManager& BootManager::Complete(const Callback& after_complete) {
  if (!is_started_) {
    throw util::InvalidState("The boot manager has not been started");
  }
  if (is_complete_) {
    throw util::InvalidState("The boot manager has already been completed");
  }

  // a kept context may already be ready or disposed; fail before freezing
  if (context_->IsDisposed()) {
    throw util::InvalidState("The application context has been disposed");
  }
  if (context_->IsReady()) {
    throw util::InvalidState("The application context is already ready");
  }

  resolution::Resolution::Freeze();
  core::ApplicationContextAccess::MarkReady(*context_);

  if (after_complete) after_complete(*context_);

  is_complete_ = true;

  APPHOST_LOG_INFO("Boot complete", {BoolField("configured", context_->IsConfigured())});
  return *this;
}

} // namespace apphost::boot
