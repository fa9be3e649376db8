#include "display.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace display_host {

namespace {

int32_t RoundToInt(double value) {
  if (!std::isfinite(value)) {
    return 0;
  }
  return static_cast<int32_t>(std::lround(value));
}

}  // namespace

uint64_t ResolveTimingMs(double requested, uint64_t fallback, uint64_t minimum) {
  if (!std::isfinite(requested) || requested < static_cast<double>(minimum)) {
    return fallback;
  }
  return static_cast<uint64_t>(std::min(requested, static_cast<double>(kMaxTimingMs)));
}

std::unique_ptr<Display> Display::Create(const std::string& name,
                                         const DisplayOptions& options,
                                         VideoService& video,
                                         WindowHost& host,
                                         WindowsService& windows,
                                         SelectionState& selection,
                                         Scheduler& scheduler,
                                         const DisplayTiming& timing,
                                         DisplayError* error) {
  auto display = std::make_unique<Display>(ConstructionToken(), name, options, video, host, windows, selection,
                                          scheduler, timing);
  const DisplayError status = display->Initialize(options);
  if (error) {
    *error = status;
  }
  if (status == DisplayError::kEngineCallFailed) {
    return nullptr;
  }
  return display;
}

Display::Display(ConstructionToken /*token*/,
                 const std::string& name,
                 const DisplayOptions& options,
                 VideoService& video,
                 WindowHost& host,
                 WindowsService& windows,
                 SelectionState& selection,
                 Scheduler& scheduler,
                 const DisplayTiming& timing)
    : name_(name),
      sourceId_(options.sourceId),
      renderingMode_(options.renderingMode),
      electronWindowId_(options.electronWindowId != 0 ? options.electronWindowId : host.CurrentWindowId()),
      appWindowId_(options.appWindowId.empty() ? std::string(kDefaultAppWindowId) : options.appWindowId),
      video_(video),
      host_(host),
      windows_(windows),
      selection_(selection),
      scheduler_(scheduler),
      timing_(timing) {}

Display::~Display() {
  Destroy();
}

DisplayError Display::Initialize(const DisplayOptions& options) {
  NativeWindowHandle window;
  if (!host_.ResolveWindow(electronWindowId_, &window)) {
    spdlog::warn("display {}: window {} not found, display is not interactive", name_, electronWindowId_);
    interactive_ = false;
    return DisplayError::kWindowNotFound;
  }
  interactive_ = true;

  if (!video_.CreateDisplay(window, name_, renderingMode_, sourceId_)) {
    spdlog::error("display {}: engine failed to create surface", name_);
    // Nothing to release; keep the destructor from touching the engine.
    surfaceDestroyed_ = true;
    closed_ = true;
    interactive_ = false;
    return DisplayError::kEngineCallFailed;
  }
  surfaceCreated_ = true;
  spdlog::info("display {}: created on window {} (source '{}', mode {})", name_, electronWindowId_, sourceId_,
               static_cast<int32_t>(renderingMode_));

  // Guide lines are on by default; multi-selection turns them off.
  if (selection_.Size() > 1) {
    SwitchGridlines(false);
  }
  selectionSubscription_ = selection_.Subscribe(
      [this](const SelectionSnapshot& state) { SwitchGridlines(state.selectedIds.size() <= 1); });

  const Color padding = options.paddingColor ? *options.paddingColor : kDefaultPaddingColor;
  if (!video_.SetPaddingColor(name_, padding)) {
    spdlog::error("display {}: failed to set padding color", name_);
  }
  if (options.paddingSize && !video_.SetPaddingSize(name_, *options.paddingSize)) {
    spdlog::error("display {}: failed to set padding size {}", name_, *options.paddingSize);
  }

  AttachListeners();
  return DisplayError::kNone;
}

void Display::AttachListeners() {
  closeListener_ = host_.AddWindowListener(electronWindowId_, WindowEvent::kClose, [this]() { Close(); });
  focusListener_ = host_.AddWindowListener(electronWindowId_, WindowEvent::kFocus, [this]() { SetFocused(true); });
  blurListener_ = host_.AddWindowListener(electronWindowId_, WindowEvent::kBlur, [this]() { SetFocused(false); });
  movedListener_ = host_.AddWindowListener(electronWindowId_, WindowEvent::kMoved, [this]() { OnWindowMoved(); });
  pointerDownListener_ = host_.AddDocumentListener([this]() { SetFocused(true); });
}

void Display::DetachListeners() {
  ListenerId* listeners[] = {&closeListener_, &focusListener_, &blurListener_, &movedListener_,
                             &pointerDownListener_};
  for (ListenerId* listener : listeners) {
    if (*listener != kNoListener) {
      host_.RemoveListener(*listener);
      *listener = kNoListener;
    }
  }
}

DisplayError Display::TrackElement(ElementRectProvider provider) {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  StopTracking();
  trackedElement_ = std::move(provider);
  TrackingStep();
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  trackingTimer_ = scheduler_.SetInterval(timing_.pollingIntervalMs, [this]() { TrackingStep(); });
  return DisplayError::kNone;
}

void Display::StopTracking() {
  if (trackingTimer_ != kNoTimer) {
    scheduler_.Clear(trackingTimer_);
    trackingTimer_ = kNoTimer;
  }
}

void Display::TrackingStep() {
  if (closed_ || !trackedElement_) {
    return;
  }
  // Close() drops trackedElement_, and the provider may close this display.
  const ElementRectProvider provider = trackedElement_;
  ClientRect client;
  const bool found = provider(&client);
  if (closed_) {
    return;
  }
  if (!found) {
    spdlog::trace("display {}: tracked element unavailable", name_);
    return;
  }
  Rect bounds;
  const bool hasBounds = host_.GetBounds(electronWindowId_, &bounds);
  if (closed_) {
    return;
  }
  if (!hasBounds) {
    spdlog::trace("display {}: window {} bounds unavailable", name_, electronWindowId_);
    return;
  }

  const Rect rect = ScaledRectangle(client, bounds);
  if (rect == currentPosition_) {
    return;
  }
  spdlog::debug("display {}: tracking -> {},{} {}x{}", name_, rect.x, rect.y, rect.width, rect.height);
  if (interactive_) {
    const double scale = windows_.ScaleFactor(appWindowId_);
    if (closed_) {
      return;
    }
    if (!video_.SetDisplayScale(name_, scale)) {
      spdlog::error("display {}: failed to set display scale", name_);
    }
  }
  if (Move(rect.x, rect.y) == DisplayError::kAlreadyDestroyed) {
    return;
  }
  Resize(rect.width, rect.height);
}

Rect Display::ScaledRectangle(const ClientRect& rect, const Rect& windowBounds) const {
  // The engine scales by the display scale factor itself; surface origin is
  // bottom-left, so y follows the element's bottom edge.
  Rect out;
  out.x = windowBounds.x + RoundToInt(rect.left);
  out.y = windowBounds.y + RoundToInt(rect.bottom);
  out.width = RoundToInt(rect.width);
  out.height = RoundToInt(rect.height);
  return out;
}

DisplayError Display::Move(int32_t x, int32_t y) {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  currentPosition_.x = x;
  currentPosition_.y = y;
  if (!interactive_) {
    return DisplayError::kNone;
  }
  if (!video_.MoveDisplay(name_, x, y)) {
    spdlog::error("display {}: move to {},{} failed", name_, x, y);
    return DisplayError::kEngineCallFailed;
  }
  return DisplayError::kNone;
}

DisplayError Display::Resize(int32_t width, int32_t height) {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  currentPosition_.width = width;
  currentPosition_.height = height;
  if (!interactive_) {
    return DisplayError::kNone;
  }
  if (!video_.ResizeDisplay(name_, width, height)) {
    spdlog::error("display {}: resize to {}x{} failed", name_, width, height);
    return DisplayError::kEngineCallFailed;
  }
  if (!outputObservers_.empty()) {
    return RefreshOutputRegion();
  }
  return DisplayError::kNone;
}

void Display::OnOutputResize(OutputRegionObserver observer) {
  outputObservers_.push_back(std::move(observer));
}

DisplayError Display::RefreshOutputRegion() {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  if (!interactive_) {
    return DisplayError::kNone;
  }
  Vec2 offset;
  Size size;
  if (!video_.GetPreviewOffset(name_, &offset) || !video_.GetPreviewSize(name_, &size)) {
    spdlog::error("display {}: output region query failed", name_);
    return DisplayError::kEngineCallFailed;
  }
  outputRegion_ = Rect{offset.x, offset.y, size.width, size.height};

  const std::vector<OutputRegionObserver> observers = outputObservers_;
  for (const OutputRegionObserver& observer : observers) {
    observer(outputRegion_);
  }
  return DisplayError::kNone;
}

DisplayError Display::SetShouldDrawUI(bool drawUI) {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  drawingUI_ = drawUI;
  if (interactive_ && !video_.SetShouldDrawUI(name_, drawUI)) {
    return DisplayError::kEngineCallFailed;
  }
  return DisplayError::kNone;
}

DisplayError Display::SwitchGridlines(bool enabled) {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  if (!drawingUI_ || !interactive_) {
    return DisplayError::kNone;
  }
  if (!video_.SetDrawGuideLines(name_, enabled)) {
    spdlog::error("display {}: failed to switch guide lines {}", name_, enabled ? "on" : "off");
    return DisplayError::kEngineCallFailed;
  }
  return DisplayError::kNone;
}

DisplayError Display::SetFocused(bool focused) {
  if (closed_) {
    return DisplayError::kAlreadyDestroyed;
  }
  spdlog::debug("display {}: focused={}", name_, focused);
  if (interactive_ && !video_.SetFocused(name_, focused)) {
    return DisplayError::kEngineCallFailed;
  }
  return DisplayError::kNone;
}

void Display::OnWindowMoved() {
  // The title bar already reported this move.
  if (windows_.MoveInProgress()) {
    return;
  }
  if (!windows_.StyleBlockersHidden(appWindowId_)) {
    windows_.UpdateStyleBlockers(appWindowId_, true);
  }
  if (moveTimeout_ != kNoTimer) {
    scheduler_.Clear(moveTimeout_);
  }
  moveTimeout_ = scheduler_.SetTimeout(timing_.moveDebounceMs, [this]() {
    moveTimeout_ = kNoTimer;
    windows_.UpdateStyleBlockers(appWindowId_, false);
  });
}

void Display::Close() {
  outputObservers_.clear();
  StopTracking();
  trackedElement_ = nullptr;
  if (moveTimeout_ != kNoTimer) {
    scheduler_.Clear(moveTimeout_);
    moveTimeout_ = kNoTimer;
  }
  if (selectionSubscription_ != kNoSubscription) {
    selection_.Unsubscribe(selectionSubscription_);
    selectionSubscription_ = kNoSubscription;
  }
  if (!surfaceDestroyed_) {
    surfaceDestroyed_ = true;
    if (surfaceCreated_) {
      if (video_.DestroyDisplay(name_)) {
        spdlog::info("display {}: surface destroyed", name_);
      } else {
        spdlog::error("display {}: engine failed to destroy surface", name_);
      }
    }
  }
  closed_ = true;
}

void Display::Destroy() {
  DetachListeners();
  Close();
}

}  // namespace display_host
