#pragma once

#include <cstdint>
#include <functional>

namespace display_host {

using TimerId = uint64_t;
constexpr TimerId kNoTimer = 0;

// Timers on the single event loop that drives the displays. Callbacks never
// run concurrently with each other or with the caller.
class Scheduler {
 public:
  virtual ~Scheduler() = default;

  virtual TimerId SetInterval(uint64_t periodMs, std::function<void()> fn) = 0;
  virtual TimerId SetTimeout(uint64_t delayMs, std::function<void()> fn) = 0;
  // Clearing an unknown or already fired timer is a no-op.
  virtual void Clear(TimerId id) = 0;
};

}  // namespace display_host
