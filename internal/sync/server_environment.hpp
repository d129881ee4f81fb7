#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace apphost::core {
class ApplicationContext;
}

namespace apphost::sync {

// Scheme, host and port observed on an inbound request.
struct RequestOrigin {
  std::string   scheme;
  std::string   host;
  std::uint16_t port = 0;
};

/*
  Derives the application url.

  Order of precedence:
    - web_routing.app_url, used as is
    - scheduled_tasks.base_url, with scheme from global.use_ssl and
      global.system_path appended
    - the origin of the first request, with global.system_path appended

  The url always has a scheme and never ends with a slash.
*/
class ServerEnvironment {
 public:
  // Returns whether the settings provided a url; if so it is stored on the context.
  static bool TrySetApplicationUrlFromSettings(core::ApplicationContext& context, const apphost::runtime::config::RuntimeConfig& settings);

  // No-op when the context already has a url or the settings provide one.
  static void EnsureApplicationUrl(core::ApplicationContext& context, const apphost::runtime::config::RuntimeConfig& settings,
                                   const RequestOrigin& request);

  static std::optional<std::string> UrlFromSettings(const apphost::runtime::config::RuntimeConfig& settings);
  static std::string                UrlFromRequest(const apphost::runtime::config::RuntimeConfig& settings, const RequestOrigin& request);
};

} // namespace apphost::sync
