#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "geometry.h"

namespace display_host {

// Opaque window handle bytes as handed out by the host window system.
using NativeWindowHandle = std::vector<uint8_t>;

enum class RenderingMode : int32_t {
  kMain = 0,
  kStreaming = 1,
  kRecording = 2,
};

// Display operations of the external rendering engine. Every call is
// synchronous; a false return means the engine call failed.
class RenderEngine {
 public:
  virtual ~RenderEngine() = default;

  virtual bool CreateDisplay(const NativeWindowHandle& window, const std::string& name, RenderingMode mode) = 0;
  virtual bool CreateSourcePreviewDisplay(const NativeWindowHandle& window,
                                          const std::string& sourceId,
                                          const std::string& name) = 0;
  virtual bool DestroyDisplay(const std::string& name) = 0;
  virtual bool MoveDisplay(const std::string& name, int32_t x, int32_t y) = 0;
  virtual bool ResizeDisplay(const std::string& name, int32_t width, int32_t height) = 0;
  virtual bool SetPaddingColor(const std::string& name, const Color& color) = 0;
  virtual bool SetPaddingSize(const std::string& name, int32_t size) = 0;
  virtual bool SetDrawGuideLines(const std::string& name, bool enabled) = 0;
  virtual bool SetFocused(const std::string& name, bool focused) = 0;
  virtual bool SetDisplayScale(const std::string& name, double scaleFactor) = 0;
  virtual bool SetShouldDrawUI(const std::string& name, bool drawUI) = 0;
  virtual bool GetPreviewOffset(const std::string& name, Vec2* offset) = 0;
  virtual bool GetPreviewSize(const std::string& name, Size* size) = 0;
};

}  // namespace display_host
