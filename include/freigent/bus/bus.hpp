#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace freigent {

// Type-safe event bus. Each Hub owns one; observers subscribe to hub events.
class Bus {
 public:
  using SubscriptionId = uint64_t;

  Bus() = default;

  Bus(const Bus&) = delete;
  Bus& operator=(const Bus&) = delete;

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T&)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any& event) {
                                     handler(std::any_cast<const T&>(event));
                                   }});

    return id;
  }

  // Unsubscribe
  void unsubscribe(SubscriptionId id);

  // Number of live subscriptions across all event types
  size_t subscriber_count() const;

  // Publish an event
  template <typename T>
  void publish(const T& event) {
    std::vector<std::function<void(const std::any&)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it == handlers_.end() || it->second.empty()) {
        return;
      }
      for (const auto& entry : it->second) {
        to_call.push_back(entry.handler);
      }
    }

    // Call handlers outside the lock
    std::any wrapped = event;
    for (const auto& handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any&)> handler;
  };

  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Hub events
namespace events {

struct AgentRegistered {
  std::string agent_id;
  std::string agent_type;
  bool replaced;  // an earlier registration was overwritten
};

struct MessageSent {
  std::string message_id;
  std::string from_agent_id;
  std::string to_agent_id;
  std::string payload_type;
};

struct MailboxDrained {
  std::string agent_id;
  size_t message_count;
};

}  // namespace events

}  // namespace freigent
