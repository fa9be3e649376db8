#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "errors.h"
#include "geometry.h"
#include "listener_registry.h"
#include "render_engine.h"
#include "scheduler.h"
#include "selection_state.h"
#include "video_service.h"
#include "window_host.h"

namespace display_host {

constexpr Color kDefaultPaddingColor{11, 22, 28};
constexpr uint64_t kDefaultPollingIntervalMs = 500;
constexpr uint64_t kDefaultMoveDebounceMs = 500;
constexpr const char* kDefaultAppWindowId = "main";

struct DisplayOptions {
  std::string sourceId;
  std::optional<int32_t> paddingSize;
  // 0 selects the host's current window.
  int32_t electronWindowId = 0;
  std::string appWindowId = kDefaultAppWindowId;
  std::optional<Color> paddingColor;
  RenderingMode renderingMode = RenderingMode::kMain;
};

struct DisplayTiming {
  uint64_t pollingIntervalMs = kDefaultPollingIntervalMs;
  uint64_t moveDebounceMs = kDefaultMoveDebounceMs;
};

constexpr uint64_t kMaxTimingMs = 60000;

// Millisecond setting from a JS number: `fallback` when it is not finite or
// below `minimum`, otherwise truncated and capped at kMaxTimingMs.
uint64_t ResolveTimingMs(double requested, uint64_t fallback, uint64_t minimum);

// Fills the element's current client rect. Returns false if the element is
// gone, in which case the tracking step is skipped.
using ElementRectProvider = std::function<bool(ClientRect*)>;
using OutputRegionObserver = std::function<void(const Rect&)>;

// One on-screen viewport bound to a named native surface. Owns its window
// and document listeners, its selection subscription and its timers; all of
// them are released by Close()/Destroy() or on destruction.
class Display {
  struct ConstructionToken {
    explicit ConstructionToken() = default;
  };

 public:
  // Returns nullptr with kEngineCallFailed if the engine cannot create the
  // surface. When the owning window does not resolve, a non-interactive
  // display is returned with kWindowNotFound: it has no surface and no
  // listeners, and its operations only update local state.
  static std::unique_ptr<Display> Create(const std::string& name,
                                         const DisplayOptions& options,
                                         VideoService& video,
                                         WindowHost& host,
                                         WindowsService& windows,
                                         SelectionState& selection,
                                         Scheduler& scheduler,
                                         const DisplayTiming& timing,
                                         DisplayError* error);

  // Use Create().
  Display(ConstructionToken token,
          const std::string& name,
          const DisplayOptions& options,
          VideoService& video,
          WindowHost& host,
          WindowsService& windows,
          SelectionState& selection,
          Scheduler& scheduler,
          const DisplayTiming& timing);
  ~Display();

  Display(const Display&) = delete;
  Display& operator=(const Display&) = delete;

  // Keeps the display on top of an element. Runs one step now, then polls.
  // Replaces any running tracker. The provider may close the display; the
  // step then ends and kAlreadyDestroyed is returned.
  DisplayError TrackElement(ElementRectProvider provider);
  void StopTracking();

  DisplayError Move(int32_t x, int32_t y);
  DisplayError Resize(int32_t width, int32_t height);

  void OnOutputResize(OutputRegionObserver observer);
  DisplayError RefreshOutputRegion();

  DisplayError SetShouldDrawUI(bool drawUI);
  // Ignored while the display is not drawing UI.
  DisplayError SwitchGridlines(bool enabled);
  DisplayError SetFocused(bool focused);

  // Both are idempotent; the surface is destroyed at most once.
  void Close();
  void Destroy();

  const std::string& name() const { return name_; }
  const std::string& sourceId() const { return sourceId_; }
  RenderingMode renderingMode() const { return renderingMode_; }
  int32_t electronWindowId() const { return electronWindowId_; }
  const std::string& appWindowId() const { return appWindowId_; }
  const Rect& currentPosition() const { return currentPosition_; }
  const Rect& outputRegion() const { return outputRegion_; }
  size_t outputObserverCount() const { return outputObservers_.size(); }
  bool isInteractive() const { return interactive_; }
  bool isClosed() const { return closed_; }
  bool isTracking() const { return trackingTimer_ != kNoTimer; }
  bool drawingUI() const { return drawingUI_; }

 private:
  DisplayError Initialize(const DisplayOptions& options);
  void AttachListeners();
  void DetachListeners();
  void TrackingStep();
  Rect ScaledRectangle(const ClientRect& rect, const Rect& windowBounds) const;
  void OnWindowMoved();

  std::string name_;
  std::string sourceId_;
  RenderingMode renderingMode_;
  int32_t electronWindowId_;
  std::string appWindowId_;

  VideoService& video_;
  WindowHost& host_;
  WindowsService& windows_;
  SelectionState& selection_;
  Scheduler& scheduler_;
  DisplayTiming timing_;

  Rect currentPosition_;
  Rect outputRegion_;
  std::vector<OutputRegionObserver> outputObservers_;
  ElementRectProvider trackedElement_;

  bool interactive_ = false;
  bool surfaceCreated_ = false;
  bool surfaceDestroyed_ = false;
  bool closed_ = false;
  bool drawingUI_ = true;

  TimerId trackingTimer_ = kNoTimer;
  TimerId moveTimeout_ = kNoTimer;
  SubscriptionId selectionSubscription_ = kNoSubscription;
  ListenerId closeListener_ = kNoListener;
  ListenerId focusListener_ = kNoListener;
  ListenerId blurListener_ = kNoListener;
  ListenerId movedListener_ = kNoListener;
  ListenerId pointerDownListener_ = kNoListener;
};

}  // namespace display_host
