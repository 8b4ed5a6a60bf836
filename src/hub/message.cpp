#include "freigent/hub/message.hpp"

namespace freigent::hub {

// --- AgentRecord ---

json AgentRecord::to_json() const {
  return {{"agent_id", agent_id},
          {"agent_type", agent_type},
          {"display_name", display_name},
          {"personality_summary", personality_summary}};
}

AgentRecord AgentRecord::from_json(const json &j) {
  AgentRecord record;
  record.agent_id = j.value("agent_id", "");
  record.agent_type = j.value("agent_type", kFreigentAgentType);
  record.display_name = j.value("display_name", "");
  record.personality_summary = j.value("personality_summary", "");
  return record;
}

// --- Message ---

Message::Message(MessageId id, AgentId from, AgentId to, json payload)
    : id_(std::move(id)), from_(std::move(from)), to_(std::move(to)), payload_(std::move(payload)) {
  if (payload_.is_null()) {
    payload_ = json::object();
  }
}

std::string Message::type() const {
  if (payload_.is_object()) {
    auto it = payload_.find("type");
    if (it != payload_.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return {};
}

json Message::to_json() const {
  return {{"message_id", id_}, {"from_agent_id", from_}, {"to_agent_id", to_}, {"payload", payload_}};
}

Message Message::from_json(const json &j) {
  return Message(j.value("message_id", ""), j.value("from_agent_id", ""), j.value("to_agent_id", ""),
                 j.contains("payload") ? j["payload"] : json::object());
}

}  // namespace freigent::hub
