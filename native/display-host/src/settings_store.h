#pragma once

#include <util/config-file.h>

#include <memory>
#include <string>
#include <utility>

namespace display_host {

// Persisted category/key string settings.
class SettingsStore {
 public:
  virtual ~SettingsStore() = default;

  virtual bool Load() = 0;
  virtual bool GetValue(const std::string& category, const std::string& key, std::string* value) const = 0;
  // Stores and persists the value. Returns false when it could not be written.
  virtual bool SetValue(const std::string& category, const std::string& key, const std::string& value) = 0;
};

struct ConfigCloser {
  void operator()(config_t* config) const { config_close(config); }
};

// INI file backed store on libobs config files:
//
//   [Video]
//   Base=1920x1080
//
// Load() creates a missing file. Every SetValue() is saved right away
// through a temp file.
class IniSettingsStore : public SettingsStore {
 public:
  explicit IniSettingsStore(std::string path) : path_(std::move(path)) {}

  bool Load() override;
  bool GetValue(const std::string& category, const std::string& key, std::string* value) const override;
  bool SetValue(const std::string& category, const std::string& key, const std::string& value) override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<config_t, ConfigCloser> config_;
};

}  // namespace display_host
