#include "resolution.hpp"

#include <atomic>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace apphost::resolution {
namespace {

std::atomic<bool> g_frozen{false};

} // namespace

bool Resolution::IsFrozen() {
  return g_frozen.load(std::memory_order_acquire);
}

void Resolution::Freeze() {
  if (g_frozen.exchange(true, std::memory_order_acq_rel)) {
    throw util::InvalidState("Resolution is frozen, it is not possible to freeze it again.");
  }
  APPHOST_LOG_DEBUG("Resolution frozen");
}

void Resolution::Reset() {
  g_frozen.store(false, std::memory_order_release);
  APPHOST_LOG_DEBUG("Resolution reset");
}

void Resolution::EnsureIsFrozen() {
  if (!IsFrozen()) {
    throw util::InvalidState("Resolution is not frozen, it is not yet possible to get values from it.");
  }
}

void Resolution::EnsureIsNotFrozen() {
  if (IsFrozen()) {
    throw util::InvalidState("Resolution is frozen, it is not possible to configure it anymore.");
  }
}

} // namespace apphost::resolution
