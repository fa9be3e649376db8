#include <node_api.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "display.h"
#include "display_registry.h"
#include "errors.h"
#include "js_render_engine.h"
#include "js_window_host.h"
#include "logging.h"
#include "napi_util.h"
#include "selection_state.h"
#include "settings_store.h"
#include "uv_scheduler.h"
#include "video_service.h"

namespace display_host {

namespace {

constexpr uint64_t kMinPollingIntervalMs = 16;
constexpr const char* kDefaultLogLevel = "info";

struct AddonState {
  DisplayTiming timing;
  std::unique_ptr<IniSettingsStore> settings;
  std::unique_ptr<JsRenderEngine> engine;
  std::unique_ptr<JsWindowHost> host;
  std::unique_ptr<UvScheduler> scheduler;
  std::unique_ptr<VideoService> video;
  std::unique_ptr<SelectionState> selection;
  std::unique_ptr<DisplayRegistry> displays;

  bool initialized() const { return video != nullptr; }

  void Reset() {
    // Displays hold references into everything below.
    displays.reset();
    video.reset();
    scheduler.reset();
    host.reset();
    engine.reset();
    settings.reset();
    selection.reset();
  }
};

void FinalizeState(napi_env /*env*/, void* data, void* /*hint*/) {
  std::unique_ptr<AddonState> state(static_cast<AddonState*>(data));
  state->Reset();
}

AddonState* GetState(napi_env env) {
  void* data = nullptr;
  if (napi_get_instance_data(env, &data) != napi_ok) {
    return nullptr;
  }
  return static_cast<AddonState*>(data);
}

AddonState* RequireState(napi_env env, napi_value out) {
  AddonState* state = GetState(env);
  if (!state || !state->initialized()) {
    SetFailure(env, out, DisplayError::kNotInitialized, "Call init() first.");
    return nullptr;
  }
  return state;
}

Display* RequireDisplay(napi_env env, AddonState* state, napi_value payload, napi_value out) {
  const std::string name = GetNamedString(env, payload, "name", "");
  if (name.empty()) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Missing display name.");
    return nullptr;
  }
  Display* display = state->displays->Find(name);
  if (!display) {
    SetFailure(env, out, DisplayError::kDisplayNotFound, "No display named " + name + ".");
    return nullptr;
  }
  return display;
}

void SetRect(napi_env env, napi_value obj, const Rect& rect) {
  SetNamed(env, obj, "x", MakeInt32(env, rect.x));
  SetNamed(env, obj, "y", MakeInt32(env, rect.y));
  SetNamed(env, obj, "width", MakeInt32(env, rect.width));
  SetNamed(env, obj, "height", MakeInt32(env, rect.height));
}

void SetStatus(napi_env env, napi_value out, DisplayError error) {
  if (error == DisplayError::kNone) {
    SetNamed(env, out, "ok", MakeBool(env, true));
    return;
  }
  SetFailure(env, out, error, "");
}

uint8_t ClampByte(int32_t value) {
  return static_cast<uint8_t>(std::max(0, std::min(255, value)));
}

uint64_t ResolveTiming(napi_env env, napi_value payload, const char* key, uint64_t fallback, uint64_t minimum) {
  return ResolveTimingMs(GetNamedNumber(env, payload, key, static_cast<double>(fallback)), fallback, minimum);
}

bool ResolveDisplayOptions(napi_env env, napi_value payload, DisplayOptions* options, std::string* error) {
  options->sourceId = GetNamedString(env, payload, "sourceId", "");
  options->electronWindowId = GetNamedInt32(env, payload, "electronWindowId", 0);
  options->appWindowId = GetNamedString(env, payload, "slobsWindowId", kDefaultAppWindowId);

  napi_value value;
  if (GetNamedProperty(env, payload, "paddingSize", &value) && IsType(env, value, napi_number)) {
    options->paddingSize = GetNamedInt32(env, payload, "paddingSize", 0);
  }
  napi_value color;
  if (GetNamedProperty(env, payload, "paddingColor", &color) && IsType(env, color, napi_object)) {
    Color padding;
    padding.r = ClampByte(GetNamedInt32(env, color, "r", 0));
    padding.g = ClampByte(GetNamedInt32(env, color, "g", 0));
    padding.b = ClampByte(GetNamedInt32(env, color, "b", 0));
    options->paddingColor = padding;
  }

  // 0 is the engine's main rendering mode, same as leaving it out.
  const int32_t mode = GetNamedInt32(env, payload, "renderingMode", static_cast<int32_t>(RenderingMode::kMain));
  if (mode < static_cast<int32_t>(RenderingMode::kMain) || mode > static_cast<int32_t>(RenderingMode::kRecording)) {
    *error = "Unknown rendering mode " + std::to_string(mode) + ".";
    return false;
  }
  options->renderingMode = static_cast<RenderingMode>(mode);
  return true;
}

napi_value InitHost(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = GetState(env);
  napi_value payload = GetFirstArgObject(env, info);
  if (!state || !payload) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Expected an init payload object.");
    return out;
  }

  ConfigureLogging(GetNamedString(env, payload, "logLevel", kDefaultLogLevel));

  napi_value nodeObs;
  napi_value host;
  if (!GetNamedProperty(env, payload, "nodeObs", &nodeObs) || !IsType(env, nodeObs, napi_object) ||
      !GetNamedProperty(env, payload, "host", &host) || !IsType(env, host, napi_object)) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "init() needs `nodeObs` and `host` objects.");
    return out;
  }
  const std::string settingsPath = GetNamedString(env, payload, "settingsPath", "");
  if (settingsPath.empty()) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "init() needs a `settingsPath`.");
    return out;
  }

  state->Reset();
  state->timing.pollingIntervalMs =
      ResolveTiming(env, payload, "pollingIntervalMs", kDefaultPollingIntervalMs, kMinPollingIntervalMs);
  state->timing.moveDebounceMs = ResolveTiming(env, payload, "moveDebounceMs", kDefaultMoveDebounceMs, 0);

  auto scheduler = std::make_unique<UvScheduler>(env);
  if (!scheduler->valid()) {
    SetFailure(env, out, DisplayError::kNotInitialized, "No event loop available.");
    return out;
  }
  auto settings = std::make_unique<IniSettingsStore>(settingsPath);
  auto engine = std::make_unique<JsRenderEngine>(env, nodeObs);
  auto video = std::make_unique<VideoService>(*engine, *settings);
  if (!video->Init()) {
    SetFailure(env, out, DisplayError::kInvalidSetting, "Failed to load " + settingsPath + ".");
    return out;
  }

  state->settings = std::move(settings);
  state->engine = std::move(engine);
  state->host = std::make_unique<JsWindowHost>(env, host);
  state->scheduler = std::move(scheduler);
  state->displays = std::make_unique<DisplayRegistry>(*state->scheduler);
  state->video = std::move(video);
  state->selection = std::make_unique<SelectionState>();

  spdlog::info("display host ready (settings {}, polling {}ms, move debounce {}ms)", settingsPath,
               state->timing.pollingIntervalMs, state->timing.moveDebounceMs);
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "settingsPath", MakeString(env, settingsPath));
  SetNamed(env, out, "pollingIntervalMs", MakeDouble(env, static_cast<double>(state->timing.pollingIntervalMs)));
  SetNamed(env, out, "moveDebounceMs", MakeDouble(env, static_cast<double>(state->timing.moveDebounceMs)));
  return out;
}

napi_value CreateDisplay(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  if (!payload) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Expected a display payload object.");
    return out;
  }

  std::string name = GetNamedString(env, payload, "name", "");
  if (name.empty()) {
    name = state->video->RandomDisplayId();
  }
  if (state->displays->Contains(name)) {
    SetFailure(env, out, DisplayError::kDuplicateDisplay, "Display " + name + " already exists.");
    return out;
  }

  DisplayOptions options;
  std::string error;
  if (!ResolveDisplayOptions(env, payload, &options, &error)) {
    SetFailure(env, out, DisplayError::kInvalidPayload, error);
    return out;
  }

  DisplayError status = DisplayError::kNone;
  std::unique_ptr<Display> display = Display::Create(name, options, *state->video, *state->host, *state->host,
                                                     *state->selection, *state->scheduler, state->timing, &status);
  if (!display) {
    SetFailure(env, out, status, state->engine->lastError());
    return out;
  }

  const bool interactive = display->isInteractive();
  const int32_t windowId = display->electronWindowId();
  state->displays->Add(std::move(display));

  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "name", MakeString(env, name));
  SetNamed(env, out, "interactive", MakeBool(env, interactive));
  SetNamed(env, out, "electronWindowId", MakeInt32(env, windowId));
  if (status != DisplayError::kNone) {
    SetNamed(env, out, "reason", MakeString(env, ReasonCode(status)));
  }
  return out;
}

napi_value TrackElement(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  napi_value fn;
  if (!GetNamedProperty(env, payload, "getRect", &fn) || !IsType(env, fn, napi_function)) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "trackElement() needs a `getRect` function.");
    return out;
  }

  auto getRect = std::make_shared<JsRef>(env, fn);
  const std::string name = display->name();
  const DisplayError status = display->TrackElement([env, getRect, name](ClientRect* rect) {
    napi_value result = nullptr;
    std::string error;
    if (!CallFunction(env, getRect->Value(), {}, &result, &error)) {
      spdlog::warn("display {}: getRect threw: {}", name, error);
      return false;
    }
    if (!IsType(env, result, napi_object)) {
      return false;
    }
    rect->left = GetNamedNumber(env, result, "left", 0.0);
    rect->top = GetNamedNumber(env, result, "top", 0.0);
    rect->right = GetNamedNumber(env, result, "right", 0.0);
    rect->bottom = GetNamedNumber(env, result, "bottom", 0.0);
    rect->width = GetNamedNumber(env, result, "width", 0.0);
    rect->height = GetNamedNumber(env, result, "height", 0.0);
    return true;
  });
  SetStatus(env, out, status);
  napi_value position = MakeObject(env);
  SetRect(env, position, display->currentPosition());
  SetNamed(env, out, "position", position);
  return out;
}

napi_value StopTracking(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  Display* display = RequireDisplay(env, state, GetFirstArgObject(env, info), out);
  if (!display) {
    return out;
  }
  display->StopTracking();
  SetNamed(env, out, "ok", MakeBool(env, true));
  return out;
}

napi_value MoveDisplay(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  const Rect& current = display->currentPosition();
  const int32_t x = GetNamedInt32(env, payload, "x", current.x);
  const int32_t y = GetNamedInt32(env, payload, "y", current.y);
  SetStatus(env, out, display->Move(x, y));
  napi_value position = MakeObject(env);
  SetRect(env, position, display->currentPosition());
  SetNamed(env, out, "position", position);
  return out;
}

napi_value ResizeDisplay(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  const Rect& current = display->currentPosition();
  const int32_t width = GetNamedInt32(env, payload, "width", current.width);
  const int32_t height = GetNamedInt32(env, payload, "height", current.height);
  if (width < 0 || height < 0) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Display size must not be negative.");
    return out;
  }
  SetStatus(env, out, display->Resize(width, height));
  napi_value position = MakeObject(env);
  SetRect(env, position, display->currentPosition());
  SetNamed(env, out, "position", position);
  return out;
}

napi_value OnOutputResize(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  if (display->isClosed()) {
    SetFailure(env, out, DisplayError::kAlreadyDestroyed, "");
    return out;
  }
  napi_value fn;
  if (!GetNamedProperty(env, payload, "callback", &fn) || !IsType(env, fn, napi_function)) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "onOutputResize() needs a `callback` function.");
    return out;
  }

  auto callback = std::make_shared<JsRef>(env, fn);
  const std::string name = display->name();
  display->OnOutputResize([env, callback, name](const Rect& region) {
    napi_value arg = MakeObject(env);
    SetRect(env, arg, region);
    std::string error;
    if (!CallFunction(env, callback->Value(), {arg}, nullptr, &error)) {
      spdlog::error("display {}: output resize callback threw: {}", name, error);
    }
  });
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "observers", MakeInt32(env, static_cast<int32_t>(display->outputObserverCount())));
  return out;
}

napi_value RefreshOutputRegion(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  Display* display = RequireDisplay(env, state, GetFirstArgObject(env, info), out);
  if (!display) {
    return out;
  }
  SetStatus(env, out, display->RefreshOutputRegion());
  napi_value region = MakeObject(env);
  SetRect(env, region, display->outputRegion());
  SetNamed(env, out, "region", region);
  return out;
}

napi_value SetShouldDrawUI(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  SetStatus(env, out, display->SetShouldDrawUI(GetNamedBool(env, payload, "drawUI", true)));
  return out;
}

napi_value SwitchGridlines(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  SetStatus(env, out, display->SwitchGridlines(GetNamedBool(env, payload, "enabled", true)));
  return out;
}

napi_value SetFocused(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Display* display = RequireDisplay(env, state, payload, out);
  if (!display) {
    return out;
  }
  SetStatus(env, out, display->SetFocused(GetNamedBool(env, payload, "focused", true)));
  return out;
}

napi_value CloseDisplay(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  Display* display = RequireDisplay(env, state, GetFirstArgObject(env, info), out);
  if (!display) {
    return out;
  }
  const bool wasClosed = display->isClosed();
  display->Close();
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "skipped", MakeBool(env, wasClosed));
  return out;
}

napi_value DestroyDisplay(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  const std::string name = GetNamedString(env, GetFirstArgObject(env, info), "name", "");
  if (name.empty()) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Missing display name.");
    return out;
  }
  // Unknown names were already destroyed (or never created).
  const bool removed = state->displays->Remove(name);
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "skipped", MakeBool(env, !removed));
  return out;
}

napi_value DispatchWindowEvent(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  WindowEvent event = WindowEvent::kClose;
  const std::string eventName = GetNamedString(env, payload, "event", "");
  if (!payload || !ParseWindowEvent(eventName, &event)) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Unknown window event '" + eventName + "'.");
    return out;
  }
  const int32_t windowId = GetNamedInt32(env, payload, "electronWindowId", state->host->CurrentWindowId());
  const size_t delivered = state->host->DispatchWindowEvent(windowId, event);
  spdlog::trace("window {} {} -> {} listeners", windowId, eventName, delivered);
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "delivered", MakeInt32(env, static_cast<int32_t>(delivered)));
  return out;
}

napi_value DispatchDocumentEvent(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  const std::string eventName = GetNamedString(env, GetFirstArgObject(env, info), "event", "mousedown");
  if (eventName != "mousedown" && eventName != "pointerdown") {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Unknown document event '" + eventName + "'.");
    return out;
  }
  const size_t delivered = state->host->DispatchDocumentPointerDown();
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "delivered", MakeInt32(env, static_cast<int32_t>(delivered)));
  return out;
}

napi_value UpdateSelection(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  napi_value ids;
  std::vector<std::string> selectedIds;
  if (!GetNamedProperty(env, payload, "selectedIds", &ids) || !GetStringArray(env, ids, &selectedIds)) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "updateSelection() needs a `selectedIds` string array.");
    return out;
  }
  const int32_t count = static_cast<int32_t>(selectedIds.size());
  state->selection->Update(std::move(selectedIds));
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "size", MakeInt32(env, count));
  return out;
}

napi_value GetBaseResolution(napi_env env, napi_callback_info /*info*/) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  Resolution resolution;
  if (!state->video->GetBaseResolution(&resolution)) {
    SetFailure(env, out, DisplayError::kInvalidSetting, "Stored Video/Base value is not <width>x<height>.");
    return out;
  }
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "width", MakeInt32(env, resolution.width));
  SetNamed(env, out, "height", MakeInt32(env, resolution.height));
  return out;
}

napi_value SetBaseResolution(napi_env env, napi_callback_info info) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value payload = GetFirstArgObject(env, info);
  Resolution resolution;
  resolution.width = GetNamedInt32(env, payload, "width", 0);
  resolution.height = GetNamedInt32(env, payload, "height", 0);
  if (resolution.width <= 0 || resolution.height <= 0) {
    SetFailure(env, out, DisplayError::kInvalidPayload, "Resolution needs positive width and height.");
    return out;
  }
  if (!state->video->SetBaseResolution(resolution)) {
    SetFailure(env, out, DisplayError::kSettingsWriteFailed, "Could not persist " + FormatResolution(resolution) + ".");
    return out;
  }
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "value", MakeString(env, FormatResolution(resolution)));
  return out;
}

napi_value GetScreenRectangle(napi_env env, napi_callback_info /*info*/) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetRect(env, out, state->video->ScreenRectangle());
  return out;
}

napi_value GetRandomDisplayId(napi_env env, napi_callback_info /*info*/) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "id", MakeString(env, state->video->RandomDisplayId()));
  return out;
}

napi_value ListDisplays(napi_env env, napi_callback_info /*info*/) {
  napi_value out = MakeObject(env);
  AddonState* state = RequireState(env, out);
  if (!state) {
    return out;
  }
  napi_value list = MakeArray(env);
  uint32_t index = 0;
  for (const auto& entry : state->displays->displays()) {
    const Display& display = *entry.second;
    napi_value item = MakeObject(env);
    SetNamed(env, item, "name", MakeString(env, display.name()));
    SetNamed(env, item, "sourceId", MakeString(env, display.sourceId()));
    SetNamed(env, item, "renderingMode", MakeInt32(env, static_cast<int32_t>(display.renderingMode())));
    SetNamed(env, item, "slobsWindowId", MakeString(env, display.appWindowId()));
    SetNamed(env, item, "interactive", MakeBool(env, display.isInteractive()));
    SetNamed(env, item, "closed", MakeBool(env, display.isClosed()));
    SetNamed(env, item, "tracking", MakeBool(env, display.isTracking()));
    SetNamed(env, item, "drawingUI", MakeBool(env, display.drawingUI()));
    SetRect(env, item, display.currentPosition());
    if (list == nullptr || item == nullptr || napi_set_element(env, list, index, item) != napi_ok) {
      spdlog::error("listDisplays: cannot append display {}", display.name());
      SetFailure(env, out, DisplayError::kInternalError, "Failed to build display list.");
      return out;
    }
    index += 1;
  }
  SetNamed(env, out, "ok", MakeBool(env, true));
  SetNamed(env, out, "displays", list);
  return out;
}

}  // namespace

napi_value Init(napi_env env, napi_value exports) {
  auto state = std::make_unique<AddonState>();
  if (napi_set_instance_data(env, state.get(), FinalizeState, nullptr) != napi_ok) {
    napi_throw_error(env, "INIT_FAILED", "display-host: cannot attach instance data");
    return nullptr;
  }
  // Owned by the environment from here on.
  state.release();

  napi_property_descriptor desc[] = {
      {"init", nullptr, InitHost, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"createDisplay", nullptr, CreateDisplay, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"trackElement", nullptr, TrackElement, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"stopTracking", nullptr, StopTracking, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"moveDisplay", nullptr, MoveDisplay, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"resizeDisplay", nullptr, ResizeDisplay, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"onOutputResize", nullptr, OnOutputResize, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"refreshOutputRegion", nullptr, RefreshOutputRegion, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"setShouldDrawUI", nullptr, SetShouldDrawUI, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"switchGridlines", nullptr, SwitchGridlines, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"setFocused", nullptr, SetFocused, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"closeDisplay", nullptr, CloseDisplay, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"destroyDisplay", nullptr, DestroyDisplay, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"dispatchWindowEvent", nullptr, DispatchWindowEvent, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"dispatchDocumentEvent", nullptr, DispatchDocumentEvent, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"updateSelection", nullptr, UpdateSelection, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"getBaseResolution", nullptr, GetBaseResolution, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"setBaseResolution", nullptr, SetBaseResolution, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"getScreenRectangle", nullptr, GetScreenRectangle, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"getRandomDisplayId", nullptr, GetRandomDisplayId, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"listDisplays", nullptr, ListDisplays, nullptr, nullptr, nullptr, napi_default, nullptr},
  };

  if (napi_define_properties(env, exports, sizeof(desc) / sizeof(desc[0]), desc) != napi_ok) {
    return nullptr;
  }
  return exports;
}

}  // namespace display_host

NAPI_MODULE(NODE_GYP_MODULE_NAME, display_host::Init)
