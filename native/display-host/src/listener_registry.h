#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace display_host {

using ListenerId = uint64_t;
constexpr ListenerId kNoListener = 0;

// Named-channel callbacks. A listener removed while its channel is being
// dispatched is not called afterwards.
class ListenerRegistry {
 public:
  ListenerId Add(const std::string& channel, std::function<void()> fn);
  bool Remove(ListenerId id);
  size_t Dispatch(const std::string& channel);
  size_t Count(const std::string& channel) const;
  size_t Size() const { return listeners_.size(); }

 private:
  struct Listener {
    ListenerId id = kNoListener;
    std::string channel;
    std::function<void()> fn;
  };

  std::vector<Listener> listeners_;
  ListenerId nextId_ = 1;
};

}  // namespace display_host
