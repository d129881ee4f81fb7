#include "server_environment.hpp"

#include <algorithm>
#include <cctype>

#include "internal/config/global_settings.hpp"
#include "internal/core/application_context_access.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace apphost::sync {

using apphost::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

std::string TrimTrailingSlashes(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool HasScheme(const std::string& url) {
  return url.find("://") != std::string::npos;
}

} // namespace

std::optional<std::string> ServerEnvironment::UrlFromSettings(const RuntimeConfig& settings) {
  // new setting: full url
  const auto& app_url = settings.web_routing().app_url();
  if (!app_url.empty()) {
    auto url = TrimTrailingSlashes(app_url);
    if (!HasScheme(url)) {
      throw util::InvalidArgument("web_routing.app_url must include a scheme: '" + app_url + "'");
    }
    return url;
  }

  // host and path without scheme
  const auto& base_url = settings.scheduled_tasks().base_url();
  if (!base_url.empty()) {
    const std::string scheme = settings.global().use_ssl() ? "https" : "http";
    return scheme + "://" + TrimTrailingSlashes(base_url) + config::GlobalSettings::SystemPath(settings);
  }

  return std::nullopt;
}

std::string ServerEnvironment::UrlFromRequest(const RuntimeConfig& settings, const RequestOrigin& request) {
  if (request.host.empty()) {
    throw util::InvalidArgument("request host must not be empty");
  }

  const auto scheme = request.scheme.empty() ? std::string("http") : ToLower(request.scheme);

  std::string url = scheme + "://" + ToLower(request.host);

  const bool default_port = request.port == 0 || (scheme == "http" && request.port == 80) || (scheme == "https" && request.port == 443);
  if (!default_port) {
    url += ':' + std::to_string(request.port);
  }

  return url + config::GlobalSettings::SystemPath(settings);
}

bool ServerEnvironment::TrySetApplicationUrlFromSettings(core::ApplicationContext& context, const RuntimeConfig& settings) {
  auto url = UrlFromSettings(settings);
  if (!url) return false;

  APPHOST_LOG_INFO("ApplicationUrl resolved from settings", {StringField("url", *url)});
  core::ApplicationContextAccess::SetApplicationUrl(context, std::move(*url));
  return true;
}

void ServerEnvironment::EnsureApplicationUrl(core::ApplicationContext& context, const RuntimeConfig& settings, const RequestOrigin& request) {
  if (core::ApplicationContextAccess::StoredApplicationUrl(context)) return;
  if (TrySetApplicationUrlFromSettings(context, settings)) return;

  auto url = UrlFromRequest(settings, request);
  APPHOST_LOG_INFO("ApplicationUrl resolved from request", {StringField("url", url)});
  core::ApplicationContextAccess::SetApplicationUrl(context, std::move(url));
}

} // namespace apphost::sync
