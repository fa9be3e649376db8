#include "display_registry.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace display_host {

DisplayRegistry::~DisplayRegistry() {
  Clear();
}

Display* DisplayRegistry::Find(const std::string& name) const {
  const auto it = displays_.find(name);
  return it == displays_.end() ? nullptr : it->second.get();
}

bool DisplayRegistry::Add(std::unique_ptr<Display> display) {
  if (!display || Contains(display->name())) {
    return false;
  }
  const std::string name = display->name();
  displays_[name] = std::move(display);
  return true;
}

bool DisplayRegistry::Remove(const std::string& name) {
  const auto it = displays_.find(name);
  if (it == displays_.end()) {
    return false;
  }
  std::unique_ptr<Display> display = std::move(it->second);
  displays_.erase(it);
  display->Destroy();
  retired_.push_back(std::move(display));

  if (sweepTimer_ == kNoTimer) {
    sweepTimer_ = scheduler_.SetTimeout(0, [this]() {
      sweepTimer_ = kNoTimer;
      Sweep();
    });
    if (sweepTimer_ == kNoTimer) {
      spdlog::warn("display registry: cannot schedule sweep, {} retired displays kept", retired_.size());
    }
  }
  return true;
}

void DisplayRegistry::Clear() {
  if (sweepTimer_ != kNoTimer) {
    scheduler_.Clear(sweepTimer_);
    sweepTimer_ = kNoTimer;
  }
  displays_.clear();
  retired_.clear();
}

void DisplayRegistry::Sweep() {
  std::vector<std::unique_ptr<Display>> retired;
  retired.swap(retired_);
  spdlog::trace("display registry: freeing {} retired displays", retired.size());
}

}  // namespace display_host
