#include "global_settings.hpp"

#include "internal/resolution/single_object_resolver.hpp"

namespace apphost::config {

using apphost::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultSystemPath = "/system";

using SettingsResolver = resolution::SingleObjectResolver<const RuntimeConfig>;

const std::shared_ptr<SettingsResolver>& Resolver() {
  static const auto resolver = std::make_shared<SettingsResolver>("SettingsResolver", false, true);
  return resolver;
}

} // namespace

void GlobalSettings::Load(RuntimeConfig config) {
  Resolver()->SetValue(std::make_shared<const RuntimeConfig>(std::move(config)));
}

bool GlobalSettings::HasSettings() {
  return Resolver()->HasValue();
}

std::shared_ptr<const RuntimeConfig> GlobalSettings::Settings() {
  if (!Resolver()->HasValue()) {
    throw util::NotSet("No settings have been loaded");
  }
  return Resolver()->Value();
}

std::string GlobalSettings::ConfigurationStatus() {
  return Settings()->global().configuration_status();
}

std::string GlobalSettings::SystemPath(const RuntimeConfig& config) {
  std::string path = config.global().system_path().empty() ? kDefaultSystemPath : config.global().system_path();
  if (path.front() != '/') {
    path.insert(path.begin(), '/');
  }
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path == "/" ? std::string() : path;
}

} // namespace apphost::config
