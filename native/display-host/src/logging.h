#pragma once

#include <string>

namespace display_host {

constexpr const char* kLoggerName = "display-host";

// Installs the `display-host` stderr logger as the default spdlog logger and
// applies `level` ("trace" .. "off"). Unknown levels fall back to info.
void ConfigureLogging(const std::string& level);

}  // namespace display_host
