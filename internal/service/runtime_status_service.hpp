#pragma once

#include <string>

#include "apphost/runtime/v1/status.pb.h"
#include "internal/service/service_context.hpp"

namespace apphost::core {
class ApplicationContext;
}

namespace apphost::service {

/*
  Reports the state of an application context.
  Never throws for missing collaborators or a malformed application url;
  they read as absent.
*/
class RuntimeStatusService final : public Service {
 public:
  static constexpr std::string_view kName = "runtime-status";

  std::string_view Name() const override {
    return kName;
  }

  apphost::runtime::v1::RuntimeStatus Snapshot(core::ApplicationContext& context) const;

  static std::string ToJson(const apphost::runtime::v1::RuntimeStatus& status);
};

} // namespace apphost::service
