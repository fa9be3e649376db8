#include "settings_store.h"

#include <spdlog/spdlog.h>

namespace display_host {

bool IniSettingsStore::Load() {
  config_t* config = nullptr;
  const int result = config_open(&config, path_.c_str(), CONFIG_OPEN_ALWAYS);
  if (result != CONFIG_SUCCESS) {
    spdlog::error("settings: cannot open {} (config error {})", path_, result);
    config_close(config);
    return false;
  }
  config_.reset(config);
  spdlog::debug("settings: loaded {}", path_);
  return true;
}

bool IniSettingsStore::GetValue(const std::string& category, const std::string& key, std::string* value) const {
  if (!config_) {
    return false;
  }
  const char* stored = config_get_string(config_.get(), category.c_str(), key.c_str());
  if (stored == nullptr) {
    return false;
  }
  *value = stored;
  return true;
}

bool IniSettingsStore::SetValue(const std::string& category, const std::string& key, const std::string& value) {
  if (!config_) {
    spdlog::error("settings: {}/{} written before {} was loaded", category, key, path_);
    return false;
  }
  config_set_string(config_.get(), category.c_str(), key.c_str(), value.c_str());
  const int result = config_save_safe(config_.get(), "tmp", nullptr);
  if (result != CONFIG_SUCCESS) {
    spdlog::error("settings: failed saving {} (config error {})", path_, result);
    return false;
  }
  return true;
}

}  // namespace display_host
