#include "freigent/bus/bus.hpp"

#include <algorithm>

namespace freigent {

void Bus::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [type_idx, handlers] : handlers_) {
    handlers.erase(std::remove_if(handlers.begin(), handlers.end(),
                                  [id](const HandlerEntry& entry) {
                                    return entry.id == id;
                                  }),
                   handlers.end());
  }
}

size_t Bus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [type_idx, handlers] : handlers_) {
    count += handlers.size();
  }
  return count;
}

}  // namespace freigent
