#include "runtime_status_service.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/cache/cache_helper.hpp"
#include "internal/config/global_settings.hpp"
#include "internal/core/application_context.hpp"
#include "internal/db/database_context.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/version.hpp"

namespace apphost::service {

using apphost::runtime::v1::RuntimeStatus;

RuntimeStatus RuntimeStatusService::Snapshot(core::ApplicationContext& context) const {
  RuntimeStatus status;

  status.set_disposed(context.IsDisposed());
  status.set_ready(context.IsReady());
  status.set_current_version(util::CurrentVersion().ToString(3));

  if (config::GlobalSettings::HasSettings()) {
    try {
      status.set_configuration_status(config::GlobalSettings::ConfigurationStatus());
    } catch (const util::NotSet&) {
      // unloaded concurrently, reads as unconfigured
    }
  }

  if (context.IsDisposed()) {
    return status;
  }

  status.set_configured(context.IsConfigured());

  try {
    if (auto url = context.ApplicationUrl()) {
      status.set_application_url(*url);
    }
  } catch (const util::InvalidArgument& e) {
    // a malformed web_routing.app_url reads as no url
    APPHOST_LOG_WARN("Application url unavailable", {observability::StringField("error", e.what())});
  }

  if (auto cache = context.ApplicationCache()) {
    status.set_cache_enabled(cache->IsEnabled());
  }

  try {
    auto database_context = context.DatabaseContext();
    status.set_database_configured(database_context->IsDatabaseConfigured());
    status.set_database_provider(database_context->ProviderName());
  } catch (const util::NotSet&) {
    status.set_database_configured(false);
  }

  try {
    for (const auto& name : context.Services()->Names()) {
      status.add_services(name);
    }
  } catch (const util::NotSet&) {
    // no registry, no services
  }

  return status;
}

std::string RuntimeStatusService::ToJson(const RuntimeStatus& status) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = false;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  auto        json_status = google::protobuf::util::MessageToJsonString(status, &json, options);
  if (!json_status.ok()) {
    throw std::runtime_error("Failed to serialize runtime status: " + std::string(json_status.message()));
  }
  return json;
}

} // namespace apphost::service
