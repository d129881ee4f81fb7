#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace apphost::core {

/*
  One-shot broadcast event.

  Once Set() it stays set: every blocked waiter wakes and every later
  Wait() returns immediately. Abandon() wakes waiters without setting it;
  from then on Wait() returns false at once unless it was already set.
*/
class ReadySignal {
 public:
  void Set();
  void Abandon();

  bool IsSet() const;

  // Returns whether the signal was set within the timeout.
  // A negative timeout waits without limit.
  bool Wait(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            set_       = false;
  bool                            abandoned_ = false;
};

} // namespace apphost::core
