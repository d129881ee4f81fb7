#pragma once

#include <functional>
#include <memory>

#include "config/config.pb.h"

namespace apphost::core {
class ApplicationContext;
class ContextSlot;
} // namespace apphost::core

namespace apphost::boot {

/*
  BootManager

  Composition root of the application host. Boot runs in three phases,
  each exactly once and in order:

    Initialize  load settings, build cache / database / services,
                install the context into the slot
    Startup     register built-in services, resolve the application url
    Complete    freeze resolution, mark the context ready

  Phase violations throw util::InvalidState. A failed boot is not retried;
  dispose the context and boot again with a new manager.
*/
class BootManager {
 public:
  using Callback = std::function<void(core::ApplicationContext&)>;

  // Boots into the process-wide slot.
  BootManager();
  explicit BootManager(core::ContextSlot& slot);

  BootManager& Initialize(const apphost::runtime::config::RuntimeConfig& config);
  BootManager& Startup(const Callback& after_startup = {});
  BootManager& Complete(const Callback& after_complete = {});

  // Null before Initialize.
  std::shared_ptr<core::ApplicationContext> Context() const {
    return context_;
  }

 private:
  core::ContextSlot&                        slot_;
  std::shared_ptr<core::ApplicationContext> context_;

  bool is_initialized_ = false;
  bool is_started_     = false;
  bool is_complete_    = false;
};

} // namespace apphost::boot
