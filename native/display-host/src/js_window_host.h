#pragma once

#include <node_api.h>

#include <functional>
#include <string>

#include "listener_registry.h"
#include "napi_util.h"
#include "window_host.h"

namespace display_host {

// Window host and per-window app state served by a JS host object running in
// the renderer. Window and document events do not originate here: the
// renderer forwards them through Dispatch*().
//
// Expected host methods:
//   getCurrentWindowId() -> number
//   getNativeWindowHandle(id) -> Buffer | null
//   getBounds(id) -> { x, y, width, height } | null
//   getScaleFactor(appWindowId) -> number
//   isStyleBlockerHidden(appWindowId) -> boolean
//   updateStyleBlockers(appWindowId, hidden)
//   isMoveInProgress() -> boolean
class JsWindowHost : public WindowHost, public WindowsService {
 public:
  JsWindowHost(napi_env env, napi_value host) : env_(env), host_(env, host) {}

  int32_t CurrentWindowId() override;
  bool ResolveWindow(int32_t windowId, NativeWindowHandle* handle) override;
  bool GetBounds(int32_t windowId, Rect* bounds) override;
  ListenerId AddWindowListener(int32_t windowId, WindowEvent event, std::function<void()> fn) override;
  ListenerId AddDocumentListener(std::function<void()> fn) override;
  void RemoveListener(ListenerId id) override;

  double ScaleFactor(const std::string& windowId) override;
  bool StyleBlockersHidden(const std::string& windowId) override;
  void UpdateStyleBlockers(const std::string& windowId, bool hidden) override;
  bool MoveInProgress() override;

  size_t DispatchWindowEvent(int32_t windowId, WindowEvent event);
  size_t DispatchDocumentPointerDown();

 private:
  bool Call(const char* method, const std::vector<napi_value>& args, napi_value* result);

  napi_env env_;
  JsRef host_;
  ListenerRegistry listeners_;
};

}  // namespace display_host
