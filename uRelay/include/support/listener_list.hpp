#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace uRelay::Support {

// Ordered set of callbacks. Listeners are notified in registration order.
// Notification iterates over a snapshot, so listeners may add or remove
// entries (including themselves) while being notified.
template <typename... Args>
class ListenerList {
 public:
  using Callback = std::function<void(Args...)>;

  uint32_t add(Callback callback) {
    uint32_t id = next_id++;
    listeners.emplace_back(id, std::move(callback));
    return id;
  }

  bool remove(uint32_t id) {
    auto it = std::find_if(
        listeners.begin(), listeners.end(),
        [id](const std::pair<uint32_t, Callback>& l) { return l.first == id; });
    if (it == listeners.end()) {
      return false;
    }
    listeners.erase(it);
    return true;
  }

  void notify(Args... args) const {
    auto snapshot = listeners;
    for (const auto& listener : snapshot) {
      listener.second(args...);
    }
  }

  void clear() { listeners.clear(); }

  [[nodiscard]] size_t size() const { return listeners.size(); }

 private:
  std::vector<std::pair<uint32_t, Callback>> listeners;
  uint32_t next_id = 1;
};

}  // namespace uRelay::Support
