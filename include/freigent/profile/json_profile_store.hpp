#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "freigent/profile/profile_store.hpp"

namespace freigent::profile {

// JSON file-based profile store
// Storage layout:
//   base_dir/
//     agents.json                    — persistent agent table, insertion ordered
//     profiles/{user_id}.json        — one profile per user
class JsonProfileStore : public ProfileStore {
 public:
  explicit JsonProfileStore(const std::filesystem::path& base_dir);

  std::optional<UserProfile> load(const UserId& user_id) override;
  void upsert(const UserId& user_id, const UserProfile& profile) override;
  void upsert_agent(const hub::AgentRecord& record) override;
  std::vector<UserId> list_peer_ids(const UserId& base_id, const std::string& agent_type) override;

  std::vector<hub::AgentRecord> list_agents() override;

 private:
  std::filesystem::path base_dir_;
  std::mutex mutex_;

  // Path helpers
  std::filesystem::path profiles_dir() const;
  std::filesystem::path profile_file(const UserId& user_id) const;
  std::filesystem::path agents_file() const;

  // Atomic write: write to .tmp then rename
  void atomic_write(const std::filesystem::path& path, const std::string& content);

  std::optional<UserProfile> load_profile(const UserId& user_id);
  std::vector<hub::AgentRecord> load_agents();
  void save_agents(const std::vector<hub::AgentRecord>& agents);
};

}  // namespace freigent::profile
