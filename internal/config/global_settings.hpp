#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"

namespace apphost::config {

/*
  Process-wide settings loaded at startup.

  Backed by a resolver registered with ResolverCollection, so resetting the
  resolvers (disposing the application context) unloads the settings.
  Loading is only possible while resolution is not frozen.
*/
class GlobalSettings {
 public:
  static void Load(apphost::runtime::config::RuntimeConfig config);

  static bool HasSettings();

  // Throws util::NotSet when nothing is loaded.
  static std::shared_ptr<const apphost::runtime::config::RuntimeConfig> Settings();

  // The version the installation was last configured for.
  // Throws util::NotSet when nothing is loaded.
  static std::string ConfigurationStatus();

  // global.system_path, "/system" when unset. Never ends with '/'.
  static std::string SystemPath(const apphost::runtime::config::RuntimeConfig& config);
};

} // namespace apphost::config
