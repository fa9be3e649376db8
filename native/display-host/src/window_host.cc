#include "window_host.h"

namespace display_host {

const char* WindowEventName(WindowEvent event) {
  switch (event) {
    case WindowEvent::kClose:
      return "close";
    case WindowEvent::kFocus:
      return "focus";
    case WindowEvent::kBlur:
      return "blur";
    case WindowEvent::kMoved:
      return "moved";
  }
  return "unknown";
}

bool ParseWindowEvent(const std::string& name, WindowEvent* event) {
  if (name == "close") {
    *event = WindowEvent::kClose;
  } else if (name == "focus") {
    *event = WindowEvent::kFocus;
  } else if (name == "blur") {
    *event = WindowEvent::kBlur;
  } else if (name == "moved") {
    *event = WindowEvent::kMoved;
  } else {
    return false;
  }
  return true;
}

std::string WindowChannel(int32_t windowId, WindowEvent event) {
  return "window:" + std::to_string(windowId) + ":" + WindowEventName(event);
}

}  // namespace display_host
