#include "selection_state.h"

#include <algorithm>
#include <utility>

namespace display_host {

void SelectionState::Update(std::vector<std::string> selectedIds) {
  current_.selectedIds = std::move(selectedIds);

  std::vector<SubscriptionId> targets;
  targets.reserve(observers_.size());
  for (const Entry& entry : observers_) {
    targets.push_back(entry.id);
  }
  const SelectionSnapshot snapshot = current_;
  for (const SubscriptionId id : targets) {
    const auto it = std::find_if(observers_.begin(), observers_.end(),
                                 [id](const Entry& entry) { return entry.id == id; });
    if (it == observers_.end()) {
      continue;
    }
    Observer observer = it->observer;
    observer(snapshot);
  }
}

SubscriptionId SelectionState::Subscribe(Observer observer) {
  Entry entry;
  entry.id = nextId_++;
  entry.observer = std::move(observer);
  observers_.push_back(std::move(entry));
  return observers_.back().id;
}

bool SelectionState::Unsubscribe(SubscriptionId id) {
  const auto it = std::find_if(observers_.begin(), observers_.end(),
                               [id](const Entry& entry) { return entry.id == id; });
  if (it == observers_.end()) {
    return false;
  }
  observers_.erase(it);
  return true;
}

}  // namespace display_host
