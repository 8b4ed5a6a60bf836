#pragma once

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "freigent/hub/message.hpp"

namespace freigent::hub {

// Registry of known agents, listed in first-seen order.
// Re-registering an id overwrites every field but keeps its original position.
class AgentDirectory {
 public:
  // Insert or overwrite. Returns true when the id was not known before.
  bool upsert(const AgentRecord& record);

  std::optional<AgentRecord> get(const AgentId& agent_id) const;

  std::vector<AgentRecord> list() const;

  bool contains(const AgentId& agent_id) const;

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<AgentRecord> records_;
  std::unordered_map<AgentId, size_t> index_;
};

}  // namespace freigent::hub
