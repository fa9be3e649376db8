#include "listener_registry.h"

#include <algorithm>
#include <utility>

namespace display_host {

ListenerId ListenerRegistry::Add(const std::string& channel, std::function<void()> fn) {
  Listener listener;
  listener.id = nextId_++;
  listener.channel = channel;
  listener.fn = std::move(fn);
  listeners_.push_back(std::move(listener));
  return listeners_.back().id;
}

bool ListenerRegistry::Remove(ListenerId id) {
  const auto it = std::find_if(listeners_.begin(), listeners_.end(),
                               [id](const Listener& listener) { return listener.id == id; });
  if (it == listeners_.end()) {
    return false;
  }
  listeners_.erase(it);
  return true;
}

size_t ListenerRegistry::Dispatch(const std::string& channel) {
  std::vector<ListenerId> targets;
  for (const Listener& listener : listeners_) {
    if (listener.channel == channel) {
      targets.push_back(listener.id);
    }
  }

  size_t invoked = 0;
  for (const ListenerId id : targets) {
    const auto it = std::find_if(listeners_.begin(), listeners_.end(),
                                 [id](const Listener& listener) { return listener.id == id; });
    if (it == listeners_.end() || !it->fn) {
      continue;
    }
    // Copy: the callback may add or remove listeners.
    std::function<void()> fn = it->fn;
    fn();
    invoked += 1;
  }
  return invoked;
}

size_t ListenerRegistry::Count(const std::string& channel) const {
  return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
                                           [&channel](const Listener& listener) { return listener.channel == channel; }));
}

}  // namespace display_host
