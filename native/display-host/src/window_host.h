#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "geometry.h"
#include "listener_registry.h"
#include "render_engine.h"

namespace display_host {

enum class WindowEvent {
  kClose,
  kFocus,
  kBlur,
  kMoved,
};

// Host window system: window lookup, bounds and event subscription.
class WindowHost {
 public:
  virtual ~WindowHost() = default;

  virtual int32_t CurrentWindowId() = 0;
  // Returns false when no window with this id exists.
  virtual bool ResolveWindow(int32_t windowId, NativeWindowHandle* handle) = 0;
  virtual bool GetBounds(int32_t windowId, Rect* bounds) = 0;

  virtual ListenerId AddWindowListener(int32_t windowId, WindowEvent event, std::function<void()> fn) = 0;
  // Pointer-down anywhere in the renderer document.
  virtual ListenerId AddDocumentListener(std::function<void()> fn) = 0;
  virtual void RemoveListener(ListenerId id) = 0;
};

// Per-window application state kept by the window manager of the app.
class WindowsService {
 public:
  virtual ~WindowsService() = default;

  virtual double ScaleFactor(const std::string& windowId) = 0;
  virtual bool StyleBlockersHidden(const std::string& windowId) = 0;
  virtual void UpdateStyleBlockers(const std::string& windowId, bool hidden) = 0;
  // True while the title bar drives a window move of its own.
  virtual bool MoveInProgress() = 0;
};

constexpr const char* kDocumentPointerDownChannel = "document:mousedown";

const char* WindowEventName(WindowEvent event);
bool ParseWindowEvent(const std::string& name, WindowEvent* event);
// Registry channel carrying `event` for one host window.
std::string WindowChannel(int32_t windowId, WindowEvent event);

}  // namespace display_host
