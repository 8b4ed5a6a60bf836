#include "freigent/hub/hub.hpp"

#include <spdlog/spdlog.h>

namespace freigent::hub {

AgentRecord Hub::register_agent(const AgentId& agent_id, const std::string& agent_type, const std::string& display_name,
                                const std::string& personality_summary) {
  AgentRecord record{agent_id, agent_type, display_name, personality_summary};

  bool inserted = directory_.upsert(record);
  mailboxes_.ensure(agent_id);

  spdlog::debug("hub: {} agent '{}' (type={})", inserted ? "registered" : "re-registered", agent_id, agent_type);
  bus_.publish(events::AgentRegistered{agent_id, agent_type, !inserted});
  return record;
}

std::optional<AgentRecord> Hub::get_agent(const AgentId& agent_id) const {
  return directory_.get(agent_id);
}

std::vector<AgentRecord> Hub::list_agents() const {
  return directory_.list();
}

Message Hub::send(const AgentId& from, const AgentId& to, json payload) {
  auto msg = mailboxes_.send(from, to, std::move(payload));

  spdlog::debug("hub: message {} '{}' -> '{}' type={}", msg.id(), from, to, msg.type());
  bus_.publish(events::MessageSent{msg.id(), from, to, msg.type()});
  return msg;
}

std::vector<Message> Hub::receive(const AgentId& agent_id, bool clear) {
  auto messages = mailboxes_.receive(agent_id, clear);

  if (clear) {
    spdlog::debug("hub: drained {} message(s) from '{}'", messages.size(), agent_id);
    bus_.publish(events::MailboxDrained{agent_id, messages.size()});
  }
  return messages;
}

}  // namespace freigent::hub
