#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "listener_registry.h"
#include "render_engine.h"
#include "scheduler.h"
#include "settings_store.h"
#include "window_host.h"

namespace display_host {
namespace fakes {

// Records every engine call as "<method> <name> <args...>".
class FakeRenderEngine : public RenderEngine {
 public:
  bool CreateDisplay(const NativeWindowHandle& window, const std::string& name, RenderingMode mode) override;
  bool CreateSourcePreviewDisplay(const NativeWindowHandle& window,
                                  const std::string& sourceId,
                                  const std::string& name) override;
  bool DestroyDisplay(const std::string& name) override;
  bool MoveDisplay(const std::string& name, int32_t x, int32_t y) override;
  bool ResizeDisplay(const std::string& name, int32_t width, int32_t height) override;
  bool SetPaddingColor(const std::string& name, const Color& color) override;
  bool SetPaddingSize(const std::string& name, int32_t size) override;
  bool SetDrawGuideLines(const std::string& name, bool enabled) override;
  bool SetFocused(const std::string& name, bool focused) override;
  bool SetDisplayScale(const std::string& name, double scaleFactor) override;
  bool SetShouldDrawUI(const std::string& name, bool drawUI) override;
  bool GetPreviewOffset(const std::string& name, Vec2* offset) override;
  bool GetPreviewSize(const std::string& name, Size* size) override;

  size_t Count(const std::string& method) const;
  std::vector<std::string> CallsTo(const std::string& method) const;
  void Fail(const std::string& method) { failing.insert(method); }

  std::vector<std::string> calls;
  std::set<std::string> failing;
  NativeWindowHandle lastWindow;
  Vec2 previewOffset{4, 8};
  Size previewSize{640, 360};

 private:
  bool Record(const std::string& method, const std::string& line);
};

class FakeWindowHost : public WindowHost, public WindowsService {
 public:
  int32_t CurrentWindowId() override { return currentWindowId; }
  bool ResolveWindow(int32_t windowId, NativeWindowHandle* handle) override;
  bool GetBounds(int32_t windowId, Rect* bounds) override;
  ListenerId AddWindowListener(int32_t windowId, WindowEvent event, std::function<void()> fn) override;
  ListenerId AddDocumentListener(std::function<void()> fn) override;
  void RemoveListener(ListenerId id) override { listeners.Remove(id); }

  double ScaleFactor(const std::string& /*windowId*/) override { return scaleFactor; }
  bool StyleBlockersHidden(const std::string& /*windowId*/) override { return styleBlockersHidden; }
  void UpdateStyleBlockers(const std::string& windowId, bool hidden) override;
  bool MoveInProgress() override { return moveInProgress; }

  size_t Emit(int32_t windowId, WindowEvent event) { return listeners.Dispatch(WindowChannel(windowId, event)); }
  size_t EmitPointerDown() { return listeners.Dispatch(kDocumentPointerDownChannel); }

  int32_t currentWindowId = 1;
  std::map<int32_t, Rect> windows{{1, Rect{100, 50, 1280, 720}}};
  double scaleFactor = 1.0;
  bool styleBlockersHidden = false;
  bool moveInProgress = false;
  // (timestamp from the scheduler clock, hidden)
  std::vector<std::pair<uint64_t, bool>> styleBlockerUpdates;
  std::function<uint64_t()> clock;
  ListenerRegistry listeners;
};

// Virtual-time scheduler: nothing fires until AdvanceBy().
class ManualScheduler : public Scheduler {
 public:
  TimerId SetInterval(uint64_t periodMs, std::function<void()> fn) override;
  TimerId SetTimeout(uint64_t delayMs, std::function<void()> fn) override;
  void Clear(TimerId id) override;

  void AdvanceBy(uint64_t ms);
  uint64_t now() const { return now_; }
  size_t pending() const { return timers_.size(); }

 private:
  struct Timer {
    uint64_t due = 0;
    uint64_t period = 0;
    bool repeat = false;
    std::function<void()> fn;
  };

  TimerId Add(uint64_t ms, bool repeat, std::function<void()> fn);

  uint64_t now_ = 0;
  TimerId nextId_ = 1;
  std::map<TimerId, Timer> timers_;
};

class MemorySettingsStore : public SettingsStore {
 public:
  bool Load() override { return true; }
  bool GetValue(const std::string& category, const std::string& key, std::string* value) const override;
  bool SetValue(const std::string& category, const std::string& key, const std::string& value) override;

  std::map<std::string, std::string> values;
  bool failWrites = false;
};

}  // namespace fakes
}  // namespace display_host
