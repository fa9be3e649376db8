#include "video_service.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <random>

namespace display_host {

namespace {

constexpr size_t kDisplayIdLength = 26;
constexpr const char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

bool ParsePositiveInt(const std::string& text, int32_t* out) {
  if (text.empty() || text.size() > 9) {
    return false;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  const long value = std::strtol(text.c_str(), nullptr, 10);
  if (value <= 0) {
    return false;
  }
  *out = static_cast<int32_t>(value);
  return true;
}

}  // namespace

bool ParseResolution(const std::string& text, Resolution* out) {
  const size_t sep = text.find('x');
  if (sep == std::string::npos) {
    return false;
  }
  Resolution parsed;
  if (!ParsePositiveInt(text.substr(0, sep), &parsed.width) ||
      !ParsePositiveInt(text.substr(sep + 1), &parsed.height)) {
    return false;
  }
  *out = parsed;
  return true;
}

std::string FormatResolution(const Resolution& resolution) {
  return std::to_string(resolution.width) + "x" + std::to_string(resolution.height);
}

bool VideoService::Init() {
  if (!settings_.Load()) {
    spdlog::error("video service: failed to load settings");
    return false;
  }
  return true;
}

bool VideoService::GetBaseResolution(Resolution* out) const {
  std::string text;
  if (!settings_.GetValue(kVideoCategory, kBaseResolutionKey, &text)) {
    *out = kDefaultBaseResolution;
    return true;
  }
  if (!ParseResolution(text, out)) {
    spdlog::warn("video service: unparsable base resolution '{}'", text);
    return false;
  }
  return true;
}

bool VideoService::SetBaseResolution(const Resolution& resolution) {
  const std::string text = FormatResolution(resolution);
  spdlog::info("video service: base resolution -> {}", text);
  return settings_.SetValue(kVideoCategory, kBaseResolutionKey, text);
}

int32_t VideoService::BaseWidth() const {
  Resolution resolution;
  return GetBaseResolution(&resolution) ? resolution.width : 0;
}

int32_t VideoService::BaseHeight() const {
  Resolution resolution;
  return GetBaseResolution(&resolution) ? resolution.height : 0;
}

Rect VideoService::ScreenRectangle() const {
  Rect rect;
  Resolution resolution;
  if (GetBaseResolution(&resolution)) {
    rect.width = resolution.width;
    rect.height = resolution.height;
  }
  return rect;
}

std::string VideoService::RandomDisplayId() const {
  static std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<size_t> pick(0, sizeof(kBase36) - 2);
  std::string id(kDisplayIdLength, '0');
  for (char& c : id) {
    c = kBase36[pick(rng)];
  }
  return id;
}

bool VideoService::CreateDisplay(const NativeWindowHandle& window,
                                 const std::string& name,
                                 RenderingMode mode,
                                 const std::string& sourceId) {
  if (!sourceId.empty()) {
    return engine_.CreateSourcePreviewDisplay(window, sourceId, name);
  }
  return engine_.CreateDisplay(window, name, mode);
}

}  // namespace display_host
