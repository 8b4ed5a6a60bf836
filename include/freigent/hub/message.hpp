#pragma once

#include <string>

#include "freigent/core/types.hpp"

namespace freigent::hub {

// Payload type tags understood by the worker and orchestrator.
// The hub itself never looks inside a payload.
namespace payload_type {
inline constexpr const char *kRecommendationRequest = "recommendation_request";
inline constexpr const char *kRecommendationResponse = "recommendation_response";
inline constexpr const char *kRecommendationError = "recommendation_error";
}  // namespace payload_type

// Directory entry for one agent
struct AgentRecord {
  AgentId agent_id;
  std::string agent_type;
  std::string display_name;
  std::string personality_summary;

  json to_json() const;
  static AgentRecord from_json(const json &j);

  bool operator==(const AgentRecord &other) const = default;
};

// A2A message. Immutable once the mailbox store has created it.
class Message {
 public:
  Message(MessageId id, AgentId from, AgentId to, json payload);

  const MessageId &id() const {
    return id_;
  }

  const AgentId &from_agent_id() const {
    return from_;
  }

  const AgentId &to_agent_id() const {
    return to_;
  }

  const json &payload() const {
    return payload_;
  }

  // payload["type"] when it is a string, empty otherwise
  std::string type() const;

  json to_json() const;
  static Message from_json(const json &j);

 private:
  MessageId id_;
  AgentId from_;
  AgentId to_;
  json payload_;
};

}  // namespace freigent::hub
