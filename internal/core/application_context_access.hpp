#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/core/application_context.hpp"

namespace apphost::core {

/*
  Privileged mutation of an ApplicationContext.

  For the boot manager, the server environment and unit tests only;
  application code reads the context through its public accessors.
*/
class ApplicationContextAccess {
 public:
  // Throws util::InvalidState if already ready or disposed.
  static void MarkReady(ApplicationContext& context) {
    context.MarkReady();
  }

  static void SetDatabaseContext(ApplicationContext& context, std::shared_ptr<db::DatabaseContext> database_context) {
    context.SetDatabaseContext(std::move(database_context));
  }

  static void SetServices(ApplicationContext& context, std::shared_ptr<service::ServiceContext> services) {
    context.SetServices(std::move(services));
  }

  static void SetApplicationUrl(ApplicationContext& context, std::string url) {
    context.SetApplicationUrl(std::move(url));
  }

  // Reads the stored url without resolving it from settings.
  static std::optional<std::string> StoredApplicationUrl(const ApplicationContext& context) {
    return context.StoredApplicationUrl();
  }
};

} // namespace apphost::core
