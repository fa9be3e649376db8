#include "uv_scheduler.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

#include "napi_util.h"

namespace display_host {

UvScheduler::UvScheduler(napi_env env) : env_(env) {
  if (napi_get_uv_event_loop(env, &loop_) != napi_ok) {
    spdlog::error("scheduler: no uv loop for this environment");
    loop_ = nullptr;
    return;
  }
  napi_value resource = MakeObject(env);
  napi_value resourceName = MakeString(env, "display-host:timer");
  if (resource == nullptr || resourceName == nullptr ||
      napi_create_reference(env, resource, 1, &resource_) != napi_ok ||
      napi_async_init(env, resource, resourceName, &asyncContext_) != napi_ok) {
    spdlog::warn("scheduler: async context unavailable, callbacks run without one");
    asyncContext_ = nullptr;
  }
}

UvScheduler::~UvScheduler() {
  for (auto& entry : timers_) {
    Release(entry.second);
  }
  timers_.clear();
  if (asyncContext_ != nullptr) {
    napi_async_destroy(env_, asyncContext_);
  }
  if (resource_ != nullptr) {
    napi_delete_reference(env_, resource_);
  }
}

TimerId UvScheduler::SetInterval(uint64_t periodMs, std::function<void()> fn) {
  return Start(periodMs, true, std::move(fn));
}

TimerId UvScheduler::SetTimeout(uint64_t delayMs, std::function<void()> fn) {
  return Start(delayMs, false, std::move(fn));
}

TimerId UvScheduler::Start(uint64_t ms, bool repeat, std::function<void()> fn) {
  if (loop_ == nullptr) {
    return kNoTimer;
  }
  auto timer = std::make_unique<Timer>();
  timer->id = nextId_++;
  timer->repeat = repeat;
  timer->fn = std::move(fn);
  timer->owner = this;
  timer->handle.data = timer.get();
  if (uv_timer_init(loop_, &timer->handle) != 0) {
    spdlog::error("scheduler: uv_timer_init failed");
    return kNoTimer;
  }
  // From here the handle owns the timer until OnClosed.
  Timer* started = timer.release();
  if (uv_timer_start(&started->handle, &UvScheduler::OnTimer, ms, repeat ? ms : 0) != 0) {
    spdlog::error("scheduler: uv_timer_start failed");
    Release(started);
    return kNoTimer;
  }
  timers_[started->id] = started;
  return started->id;
}

void UvScheduler::Clear(TimerId id) {
  const auto it = timers_.find(id);
  if (it == timers_.end()) {
    return;
  }
  Timer* timer = it->second;
  timers_.erase(it);
  Release(timer);
}

void UvScheduler::OnTimer(uv_timer_t* handle) {
  Timer* timer = static_cast<Timer*>(handle->data);
  if (timer == nullptr || timer->owner == nullptr) {
    return;
  }
  timer->owner->Fire(timer);
}

void UvScheduler::Fire(Timer* timer) {
  const TimerId id = timer->id;
  napi_handle_scope scope = nullptr;
  if (napi_open_handle_scope(env_, &scope) != napi_ok) {
    spdlog::error("scheduler: cannot open handle scope for timer {}", id);
    return;
  }
  napi_callback_scope callbackScope = nullptr;
  napi_value resource = nullptr;
  if (asyncContext_ != nullptr && napi_get_reference_value(env_, resource_, &resource) == napi_ok) {
    if (napi_open_callback_scope(env_, resource, asyncContext_, &callbackScope) != napi_ok) {
      callbackScope = nullptr;
    }
  }

  // The timer stays allocated until its close callback, so fn is safe to
  // run even if it clears its own timer.
  if (timer->fn) {
    timer->fn();
  }
  const std::string leaked = TakePendingException(env_);
  if (!leaked.empty()) {
    spdlog::error("scheduler: timer {} left a pending exception: {}", id, leaked);
  }

  if (callbackScope != nullptr) {
    napi_close_callback_scope(env_, callbackScope);
  }
  napi_close_handle_scope(env_, scope);

  if (!timer->repeat) {
    const auto it = timers_.find(id);
    if (it != timers_.end()) {
      timers_.erase(it);
      Release(timer);
    }
  }
}

void UvScheduler::Release(Timer* timer) {
  timer->owner = nullptr;
  uv_timer_stop(&timer->handle);
  uv_close(reinterpret_cast<uv_handle_t*>(&timer->handle), &UvScheduler::OnClosed);
}

void UvScheduler::OnClosed(uv_handle_t* handle) {
  std::unique_ptr<Timer> timer(static_cast<Timer*>(handle->data));
}

}  // namespace display_host
