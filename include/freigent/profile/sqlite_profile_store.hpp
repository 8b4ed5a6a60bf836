#pragma once

#include <filesystem>
#include <memory>
#include <mutex>

#include "freigent/profile/profile_store.hpp"

namespace freigent::profile {

class SqliteDB;

// SQLite-backed store
// Schema:
//   agents(agent_id PK, agent_type, display_name, personality_summary)
//   profiles(user_id PK, name, personality, values_text)
//   experiences(id PK, user_id -> profiles, name, notes, rating)
class SqliteProfileStore : public ProfileStore {
 public:
  // Opens (creating if needed) the database and its tables. Throws StoreError.
  explicit SqliteProfileStore(const std::filesystem::path& path);
  ~SqliteProfileStore() override;

  std::optional<UserProfile> load(const UserId& user_id) override;
  void upsert(const UserId& user_id, const UserProfile& profile) override;
  void upsert_agent(const hub::AgentRecord& record) override;
  std::vector<hub::AgentRecord> list_agents() override;
  std::vector<UserId> list_peer_ids(const UserId& base_id, const std::string& agent_type) override;

 private:
  void create_schema();

  std::mutex mutex_;
  std::unique_ptr<SqliteDB> db_;
};

}  // namespace freigent::profile
