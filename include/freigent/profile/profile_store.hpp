#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "freigent/hub/message.hpp"
#include "freigent/profile/profile.hpp"

namespace freigent::profile {

// Raised by store backends on I/O or database failures
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Persistent profiles plus the persistent agent table used for peer discovery.
// This agent table is separate from the in-memory hub directory.
class ProfileStore {
 public:
  virtual ~ProfileStore() = default;

  virtual std::optional<UserProfile> load(const UserId& user_id) = 0;

  // Replace the profile and all of its experiences
  virtual void upsert(const UserId& user_id, const UserProfile& profile) = 0;

  virtual void upsert_agent(const hub::AgentRecord& record) = 0;

  // Persistent agents in insertion order
  virtual std::vector<hub::AgentRecord> list_agents() = 0;

  // Ids of stored agents of `agent_type`, other than `base_id`, that have a
  // profile. Ordered by first insertion of the agent.
  virtual std::vector<UserId> list_peer_ids(const UserId& base_id, const std::string& agent_type) = 0;
};

}  // namespace freigent::profile
