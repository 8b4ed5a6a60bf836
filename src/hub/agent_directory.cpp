#include "freigent/hub/agent_directory.hpp"

namespace freigent::hub {

bool AgentDirectory::upsert(const AgentRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(record.agent_id);
  if (it != index_.end()) {
    records_[it->second] = record;
    return false;
  }

  index_.emplace(record.agent_id, records_.size());
  records_.push_back(record);
  return true;
}

std::optional<AgentRecord> AgentDirectory::get(const AgentId& agent_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(agent_id);
  if (it == index_.end()) {
    return std::nullopt;
  }
  return records_[it->second];
}

std::vector<AgentRecord> AgentDirectory::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

bool AgentDirectory::contains(const AgentId& agent_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.count(agent_id) > 0;
}

size_t AgentDirectory::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

}  // namespace freigent::hub
