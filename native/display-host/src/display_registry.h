#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "display.h"
#include "scheduler.h"

namespace display_host {

// Displays by name. Remove() destroys a display at once but frees it on a
// later loop turn, so a display removed from inside one of its own callbacks
// (a tracked element's rect provider, an output observer) stays valid until
// that callback has returned.
class DisplayRegistry {
 public:
  using DisplayMap = std::map<std::string, std::unique_ptr<Display>>;

  explicit DisplayRegistry(Scheduler& scheduler) : scheduler_(scheduler) {}
  ~DisplayRegistry();

  DisplayRegistry(const DisplayRegistry&) = delete;
  DisplayRegistry& operator=(const DisplayRegistry&) = delete;

  bool Contains(const std::string& name) const { return displays_.count(name) > 0; }
  Display* Find(const std::string& name) const;
  // Keyed by display->name(). Returns false if that name is taken.
  bool Add(std::unique_ptr<Display> display);
  // Returns false when no display has this name.
  bool Remove(const std::string& name);
  void Clear();

  const DisplayMap& displays() const { return displays_; }
  size_t retiredCount() const { return retired_.size(); }

 private:
  void Sweep();

  Scheduler& scheduler_;
  DisplayMap displays_;
  std::vector<std::unique_ptr<Display>> retired_;
  TimerId sweepTimer_ = kNoTimer;
};

}  // namespace display_host
