#include "js_render_engine.h"

#include <spdlog/spdlog.h>

#include <cmath>

namespace display_host {

bool JsRenderEngine::Invoke(const char* method, const std::vector<napi_value>& args, napi_value* result) {
  for (const napi_value arg : args) {
    if (arg == nullptr) {
      lastError_ = std::string(method) + ": argument conversion failed";
      spdlog::error("engine: {}", lastError_);
      return false;
    }
  }
  std::string error;
  if (!CallMethod(env_, nodeObs_.Value(), method, args, result, &error)) {
    lastError_ = std::string(method) + ": " + error;
    spdlog::error("engine: {}", lastError_);
    return false;
  }
  return true;
}

napi_value JsRenderEngine::MakeWindowBuffer(const NativeWindowHandle& window) {
  void* data = nullptr;
  napi_value buffer = nullptr;
  if (napi_create_buffer_copy(env_, window.size(), window.data(), &data, &buffer) != napi_ok) {
    return nullptr;
  }
  return buffer;
}

bool JsRenderEngine::CreateDisplay(const NativeWindowHandle& window, const std::string& name, RenderingMode mode) {
  return Invoke("OBS_content_createDisplay",
                {MakeWindowBuffer(window), MakeString(env_, name), MakeInt32(env_, static_cast<int32_t>(mode))});
}

bool JsRenderEngine::CreateSourcePreviewDisplay(const NativeWindowHandle& window,
                                                const std::string& sourceId,
                                                const std::string& name) {
  return Invoke("OBS_content_createSourcePreviewDisplay",
                {MakeWindowBuffer(window), MakeString(env_, sourceId), MakeString(env_, name)});
}

bool JsRenderEngine::DestroyDisplay(const std::string& name) {
  return Invoke("OBS_content_destroyDisplay", {MakeString(env_, name)});
}

bool JsRenderEngine::MoveDisplay(const std::string& name, int32_t x, int32_t y) {
  return Invoke("OBS_content_moveDisplay", {MakeString(env_, name), MakeInt32(env_, x), MakeInt32(env_, y)});
}

bool JsRenderEngine::ResizeDisplay(const std::string& name, int32_t width, int32_t height) {
  return Invoke("OBS_content_resizeDisplay",
                {MakeString(env_, name), MakeInt32(env_, width), MakeInt32(env_, height)});
}

bool JsRenderEngine::SetPaddingColor(const std::string& name, const Color& color) {
  return Invoke("OBS_content_setPaddingColor",
                {MakeString(env_, name), MakeInt32(env_, color.r), MakeInt32(env_, color.g), MakeInt32(env_, color.b)});
}

bool JsRenderEngine::SetPaddingSize(const std::string& name, int32_t size) {
  return Invoke("OBS_content_setPaddingSize", {MakeString(env_, name), MakeInt32(env_, size)});
}

bool JsRenderEngine::SetDrawGuideLines(const std::string& name, bool enabled) {
  return Invoke("OBS_content_setDrawGuideLines", {MakeString(env_, name), MakeBool(env_, enabled)});
}

bool JsRenderEngine::SetFocused(const std::string& name, bool focused) {
  return Invoke("OBS_content_setFocused", {MakeString(env_, name), MakeBool(env_, focused)});
}

bool JsRenderEngine::SetDisplayScale(const std::string& name, double scaleFactor) {
  return Invoke("OBS_content_setDisplayScale", {MakeString(env_, name), MakeDouble(env_, scaleFactor)});
}

bool JsRenderEngine::SetShouldDrawUI(const std::string& name, bool drawUI) {
  return Invoke("OBS_content_setShouldDrawUI", {MakeString(env_, name), MakeBool(env_, drawUI)});
}

bool JsRenderEngine::GetPreviewOffset(const std::string& name, Vec2* offset) {
  napi_value result = nullptr;
  if (!Invoke("OBS_content_getDisplayPreviewOffset", {MakeString(env_, name)}, &result)) {
    return false;
  }
  if (!IsType(env_, result, napi_object)) {
    lastError_ = "OBS_content_getDisplayPreviewOffset: result is not an object";
    spdlog::error("engine: {}", lastError_);
    return false;
  }
  offset->x = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "x", 0.0)));
  offset->y = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "y", 0.0)));
  return true;
}

bool JsRenderEngine::GetPreviewSize(const std::string& name, Size* size) {
  napi_value result = nullptr;
  if (!Invoke("OBS_content_getDisplayPreviewSize", {MakeString(env_, name)}, &result)) {
    return false;
  }
  if (!IsType(env_, result, napi_object)) {
    lastError_ = "OBS_content_getDisplayPreviewSize: result is not an object";
    spdlog::error("engine: {}", lastError_);
    return false;
  }
  size->width = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "width", 0.0)));
  size->height = static_cast<int32_t>(std::lround(GetNamedNumber(env_, result, "height", 0.0)));
  return true;
}

}  // namespace display_host
