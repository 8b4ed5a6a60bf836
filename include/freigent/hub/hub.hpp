#pragma once

#include <optional>
#include <string>
#include <vector>

#include "freigent/bus/bus.hpp"
#include "freigent/hub/agent_directory.hpp"
#include "freigent/hub/mailbox_store.hpp"

namespace freigent::hub {

// In-process A2A hub: agent directory plus store-and-forward mailboxes.
//
// One Hub is built by the application and handed by reference to everything
// that talks to agents. Nothing survives the object; there is no global
// instance.
class Hub {
 public:
  Hub() = default;

  Hub(const Hub&) = delete;
  Hub& operator=(const Hub&) = delete;

  // Idempotent upsert of the directory entry; always leaves a mailbox for the id
  AgentRecord register_agent(const AgentId& agent_id, const std::string& agent_type, const std::string& display_name,
                             const std::string& personality_summary = "");

  std::optional<AgentRecord> get_agent(const AgentId& agent_id) const;

  std::vector<AgentRecord> list_agents() const;

  // Never fails; an unknown recipient gets a fresh mailbox
  Message send(const AgentId& from, const AgentId& to, json payload);

  // Drain (clear=true) or peek (clear=false) an agent's mailbox
  std::vector<Message> receive(const AgentId& agent_id, bool clear = true);

  size_t pending(const AgentId& agent_id) const {
    return mailboxes_.pending(agent_id);
  }

  // Observers for registrations, sends and drains
  Bus& bus() {
    return bus_;
  }

 private:
  AgentDirectory directory_;
  MailboxStore mailboxes_;
  Bus bus_;
};

}  // namespace freigent::hub
