#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace display_host {

using SubscriptionId = uint64_t;
constexpr SubscriptionId kNoSubscription = 0;

struct SelectionSnapshot {
  std::vector<std::string> selectedIds;
};

// Ids currently selected elsewhere in the application, with change
// notification.
class SelectionState {
 public:
  using Observer = std::function<void(const SelectionSnapshot&)>;

  size_t Size() const { return current_.selectedIds.size(); }
  const SelectionSnapshot& Current() const { return current_; }

  void Update(std::vector<std::string> selectedIds);

  SubscriptionId Subscribe(Observer observer);
  bool Unsubscribe(SubscriptionId id);
  size_t SubscriberCount() const { return observers_.size(); }

 private:
  struct Entry {
    SubscriptionId id = kNoSubscription;
    Observer observer;
  };

  SelectionSnapshot current_;
  std::vector<Entry> observers_;
  SubscriptionId nextId_ = 1;
};

}  // namespace display_host
