#pragma once

#include <node_api.h>
#include <uv.h>

#include <functional>
#include <map>

#include "scheduler.h"

namespace display_host {

// Scheduler on the libuv loop of a Node environment. Every callback runs
// inside a Node-API handle scope and callback scope, so it may call into JS.
class UvScheduler : public Scheduler {
 public:
  explicit UvScheduler(napi_env env);
  ~UvScheduler() override;

  UvScheduler(const UvScheduler&) = delete;
  UvScheduler& operator=(const UvScheduler&) = delete;

  bool valid() const { return loop_ != nullptr; }

  TimerId SetInterval(uint64_t periodMs, std::function<void()> fn) override;
  TimerId SetTimeout(uint64_t delayMs, std::function<void()> fn) override;
  void Clear(TimerId id) override;


 private:
  struct Timer {
    uv_timer_t handle;
    TimerId id = kNoTimer;
    bool repeat = false;
    std::function<void()> fn;
    UvScheduler* owner = nullptr;
  };

  TimerId Start(uint64_t ms, bool repeat, std::function<void()> fn);
  void Fire(Timer* timer);
  static void OnTimer(uv_timer_t* handle);
  static void OnClosed(uv_handle_t* handle);
  static void Release(Timer* timer);

  napi_env env_;
  uv_loop_t* loop_ = nullptr;
  napi_ref resource_ = nullptr;
  napi_async_context asyncContext_ = nullptr;
  std::map<TimerId, Timer*> timers_;
  TimerId nextId_ = 1;
};

}  // namespace display_host
