#pragma once

#include <cstdint>
#include <string>

#include "geometry.h"
#include "render_engine.h"
#include "settings_store.h"

namespace display_host {

struct Resolution {
  int32_t width = 0;
  int32_t height = 0;
};

constexpr const char* kVideoCategory = "Video";
constexpr const char* kBaseResolutionKey = "Base";
constexpr Resolution kDefaultBaseResolution{1920, 1080};

// Parses "<width>x<height>". Both parts must be positive integers.
bool ParseResolution(const std::string& text, Resolution* out);
std::string FormatResolution(const Resolution& resolution);

// Base resolution settings plus one forward per engine display operation.
// Forwards do no validation or retry; the bool is the engine's result.
class VideoService {
 public:
  VideoService(RenderEngine& engine, SettingsStore& settings) : engine_(engine), settings_(settings) {}

  bool Init();

  // Falls back to kDefaultBaseResolution when the setting is absent. Returns
  // false if the stored value does not parse.
  bool GetBaseResolution(Resolution* out) const;
  bool SetBaseResolution(const Resolution& resolution);
  int32_t BaseWidth() const;
  int32_t BaseHeight() const;
  Rect ScreenRectangle() const;

  std::string RandomDisplayId() const;

  bool CreateDisplay(const NativeWindowHandle& window, const std::string& name, RenderingMode mode,
                     const std::string& sourceId);
  bool SetPaddingColor(const std::string& name, const Color& color) { return engine_.SetPaddingColor(name, color); }
  bool SetPaddingSize(const std::string& name, int32_t size) { return engine_.SetPaddingSize(name, size); }
  bool MoveDisplay(const std::string& name, int32_t x, int32_t y) { return engine_.MoveDisplay(name, x, y); }
  bool ResizeDisplay(const std::string& name, int32_t width, int32_t height) {
    return engine_.ResizeDisplay(name, width, height);
  }
  bool DestroyDisplay(const std::string& name) { return engine_.DestroyDisplay(name); }
  bool GetPreviewOffset(const std::string& name, Vec2* offset) { return engine_.GetPreviewOffset(name, offset); }
  bool GetPreviewSize(const std::string& name, Size* size) { return engine_.GetPreviewSize(name, size); }
  bool SetShouldDrawUI(const std::string& name, bool drawUI) { return engine_.SetShouldDrawUI(name, drawUI); }
  bool SetDrawGuideLines(const std::string& name, bool enabled) { return engine_.SetDrawGuideLines(name, enabled); }
  bool SetFocused(const std::string& name, bool focused) { return engine_.SetFocused(name, focused); }
  bool SetDisplayScale(const std::string& name, double scaleFactor) {
    return engine_.SetDisplayScale(name, scaleFactor);
  }

 private:
  RenderEngine& engine_;
  SettingsStore& settings_;
};

}  // namespace display_host
