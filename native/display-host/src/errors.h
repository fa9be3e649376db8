#pragma once

namespace display_host {

enum class DisplayError {
  kNone = 0,
  kWindowNotFound,
  kAlreadyDestroyed,
  kEngineCallFailed,
  kInvalidPayload,
  kDisplayNotFound,
  kDuplicateDisplay,
  kNotInitialized,
  kInvalidSetting,
  kSettingsWriteFailed,
  kInternalError,
};

// Reason code reported to JS in the `reason` field.
const char* ReasonCode(DisplayError error);

}  // namespace display_host
