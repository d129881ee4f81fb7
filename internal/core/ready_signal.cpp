#include "ready_signal.hpp"

namespace apphost::core {

void ReadySignal::Set() {
  {
    std::lock_guard lock(mutex_);
    set_ = true;
  }
  cv_.notify_all();
}

void ReadySignal::Abandon() {
  {
    std::lock_guard lock(mutex_);
    abandoned_ = true;
  }
  cv_.notify_all();
}

bool ReadySignal::IsSet() const {
  std::lock_guard lock(mutex_);
  return set_;
}

bool ReadySignal::Wait(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);

  const auto done = [this] { return set_ || abandoned_; };

  if (timeout.count() < 0) {
    cv_.wait(lock, done);
  } else {
    cv_.wait_for(lock, timeout, done);
  }
  return set_;
}

} // namespace apphost::core
