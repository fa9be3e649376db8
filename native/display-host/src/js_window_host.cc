#include "js_window_host.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstring>
#include <utility>

namespace display_host {

bool JsWindowHost::Call(const char* method, const std::vector<napi_value>& args, napi_value* result) {
  std::string error;
  if (!CallMethod(env_, host_.Value(), method, args, result, &error)) {
    spdlog::warn("window host: {}", error);
    return false;
  }
  return true;
}

int32_t JsWindowHost::CurrentWindowId() {
  napi_value result = nullptr;
  int32_t id = 0;
  if (!Call("getCurrentWindowId", {}, &result) || napi_get_value_int32(env_, result, &id) != napi_ok) {
    return 0;
  }
  return id;
}

bool JsWindowHost::ResolveWindow(int32_t windowId, NativeWindowHandle* handle) {
  napi_value result = nullptr;
  if (!Call("getNativeWindowHandle", {MakeInt32(env_, windowId)}, &result)) {
    return false;
  }
  bool isBuffer = false;
  if (result == nullptr || napi_is_buffer(env_, result, &isBuffer) != napi_ok || !isBuffer) {
    return false;
  }
  void* data = nullptr;
  size_t length = 0;
  if (napi_get_buffer_info(env_, result, &data, &length) != napi_ok || length == 0) {
    return false;
  }
  handle->resize(length);
  std::memcpy(handle->data(), data, length);
  return true;
}

bool JsWindowHost::GetBounds(int32_t windowId, Rect* bounds) {
  napi_value result = nullptr;
  if (!Call("getBounds", {MakeInt32(env_, windowId)}, &result) || !IsType(env_, result, napi_object)) {
    return false;
  }
  bounds->x = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "x", 0.0)));
  bounds->y = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "y", 0.0)));
  bounds->width = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "width", 0.0)));
  bounds->height = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "height", 0.0)));
  return true;
}

ListenerId JsWindowHost::AddWindowListener(int32_t windowId, WindowEvent event, std::function<void()> fn) {
  return listeners_.Add(WindowChannel(windowId, event), std::move(fn));
}

ListenerId JsWindowHost::AddDocumentListener(std::function<void()> fn) {
  return listeners_.Add(kDocumentPointerDownChannel, std::move(fn));
}

void JsWindowHost::RemoveListener(ListenerId id) {
  listeners_.Remove(id);
}

double JsWindowHost::ScaleFactor(const std::string& windowId) {
  napi_value result = nullptr;
  double factor = 1.0;
  if (!Call("getScaleFactor", {MakeString(env_, windowId)}, &result) ||
      napi_get_value_double(env_, result, &factor) != napi_ok || !std::isfinite(factor) || factor <= 0.0) {
    return 1.0;
  }
  return factor;
}

bool JsWindowHost::StyleBlockersHidden(const std::string& windowId) {
  napi_value result = nullptr;
  bool hidden = false;
  if (!Call("isStyleBlockerHidden", {MakeString(env_, windowId)}, &result) ||
      napi_get_value_bool(env_, result, &hidden) != napi_ok) {
    return false;
  }
  return hidden;
}

void JsWindowHost::UpdateStyleBlockers(const std::string& windowId, bool hidden) {
  if (!Call("updateStyleBlockers", {MakeString(env_, windowId), MakeBool(env_, hidden)}, nullptr)) {
    spdlog::warn("window host: style blockers for {} left {}", windowId, hidden ? "visible" : "hidden");
  }
}

bool JsWindowHost::MoveInProgress() {
  napi_value result = nullptr;
  bool inProgress = false;
  if (!Call("isMoveInProgress", {}, &result) || napi_get_value_bool(env_, result, &inProgress) != napi_ok) {
    return false;
  }
  return inProgress;
}

size_t JsWindowHost::DispatchWindowEvent(int32_t windowId, WindowEvent event) {
  return listeners_.Dispatch(WindowChannel(windowId, event));
}

size_t JsWindowHost::DispatchDocumentPointerDown() {
  return listeners_.Dispatch(kDocumentPointerDownChannel);
}

}  // namespace display_host
