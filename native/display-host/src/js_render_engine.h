#pragma once

#include <node_api.h>

#include <string>
#include <vector>

#include "napi_util.h"
#include "render_engine.h"

namespace display_host {

// RenderEngine backed by the `NodeObs` object of the engine's own Node
// module. Each call maps to one `OBS_content_*` method; a thrown exception
// is cleared, logged and reported as a failed call.
class JsRenderEngine : public RenderEngine {
 public:
  JsRenderEngine(napi_env env, napi_value nodeObs) : env_(env), nodeObs_(env, nodeObs) {}

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

  const std::string& lastError() const { return lastError_; }

 private:
  bool Invoke(const char* method, const std::vector<napi_value>& args, napi_value* result = nullptr);
  napi_value MakeWindowBuffer(const NativeWindowHandle& window);

  napi_env env_;
  JsRef nodeObs_;
  std::string lastError_;
};

}  // namespace display_host
