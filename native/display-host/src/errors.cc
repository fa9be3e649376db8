#include "errors.h"

namespace display_host {

const char* ReasonCode(DisplayError error) {
  switch (error) {
    case DisplayError::kNone:
      return "OK";
    case DisplayError::kWindowNotFound:
      return "WINDOW_NOT_FOUND";
    case DisplayError::kAlreadyDestroyed:
      return "ALREADY_DESTROYED";
    case DisplayError::kEngineCallFailed:
      return "ENGINE_CALL_FAILED";
    case DisplayError::kInvalidPayload:
      return "INVALID_PAYLOAD";
    case DisplayError::kDisplayNotFound:
      return "DISPLAY_NOT_FOUND";
    case DisplayError::kDuplicateDisplay:
      return "DUPLICATE_DISPLAY";
    case DisplayError::kNotInitialized:
      return "NOT_INITIALIZED";
    case DisplayError::kInvalidSetting:
      return "INVALID_SETTING";
    case DisplayError::kSettingsWriteFailed:
      return "SETTINGS_WRITE_FAILED";
    case DisplayError::kInternalError:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

}  // namespace display_host
