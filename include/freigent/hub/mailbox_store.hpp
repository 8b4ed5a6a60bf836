#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "freigent/hub/message.hpp"

namespace freigent::hub {

// Per-agent FIFO mailboxes.
//
// Mailboxes are created lazily and never removed; a missing mailbox reads as
// an empty one. The map lock is only held to find or create a mailbox, and
// each mailbox carries its own lock, so traffic for different agents never
// contends beyond that lookup.
class MailboxStore {
 public:
  // Append a new message to `to`'s mailbox, creating the mailbox if needed.
  Message send(const AgentId& from, const AgentId& to, json payload);

  // Return the mailbox contents in arrival order. With clear=true the mailbox
  // is emptied in the same critical section (swap-and-clear), so concurrent
  // drains of one mailbox partition its messages.
  std::vector<Message> receive(const AgentId& agent_id, bool clear = true);

  // Create an empty mailbox if none exists
  void ensure(const AgentId& agent_id);

  bool has_mailbox(const AgentId& agent_id) const;

  size_t pending(const AgentId& agent_id) const;

 private:
  struct Mailbox {
    std::mutex mutex;
    std::deque<Message> messages;
  };

  std::shared_ptr<Mailbox> find(const AgentId& agent_id) const;
  std::shared_ptr<Mailbox> find_or_create(const AgentId& agent_id);

  mutable std::mutex map_mutex_;
  std::unordered_map<AgentId, std::shared_ptr<Mailbox>> mailboxes_;
};

}  // namespace freigent::hub
