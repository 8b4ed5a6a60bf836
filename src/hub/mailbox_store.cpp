#include "freigent/hub/mailbox_store.hpp"

#include "freigent/core/uuid.hpp"

namespace freigent::hub {

std::shared_ptr<MailboxStore::Mailbox> MailboxStore::find(const AgentId& agent_id) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = mailboxes_.find(agent_id);
  if (it == mailboxes_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<MailboxStore::Mailbox> MailboxStore::find_or_create(const AgentId& agent_id) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto& slot = mailboxes_[agent_id];
  if (!slot) {
    slot = std::make_shared<Mailbox>();
  }
  return slot;
}

Message MailboxStore::send(const AgentId& from, const AgentId& to, json payload) {
  Message msg(UUID::generate(), from, to, std::move(payload));

  auto mailbox = find_or_create(to);
  std::lock_guard<std::mutex> lock(mailbox->mutex);
  mailbox->messages.push_back(msg);
  return msg;
}

std::vector<Message> MailboxStore::receive(const AgentId& agent_id, bool clear) {
  auto mailbox = find(agent_id);
  if (!mailbox) {
    return {};
  }

  std::deque<Message> taken;
  {
    std::lock_guard<std::mutex> lock(mailbox->mutex);
    if (clear) {
      taken.swap(mailbox->messages);
    } else {
      taken = mailbox->messages;
    }
  }

  return std::vector<Message>(std::make_move_iterator(taken.begin()), std::make_move_iterator(taken.end()));
}

void MailboxStore::ensure(const AgentId& agent_id) {
  find_or_create(agent_id);
}

bool MailboxStore::has_mailbox(const AgentId& agent_id) const {
  return find(agent_id) != nullptr;
}

size_t MailboxStore::pending(const AgentId& agent_id) const {
  auto mailbox = find(agent_id);
  if (!mailbox) {
    return 0;
  }
  std::lock_guard<std::mutex> lock(mailbox->mutex);
  return mailbox->messages.size();
}

}  // namespace freigent::hub
