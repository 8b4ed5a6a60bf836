#pragma once

#include <string>
#include <vector>

#include "freigent/hub/hub.hpp"
#include "freigent/profile/profile_store.hpp"
#include "freigent/recommend/recommender.hpp"

namespace freigent::worker {

enum class OutcomeStatus {
  Ok,       // recommendation_response sent
  Ignored,  // not a recommendation_request
  Error     // recommendation_error sent
};

std::string to_string(OutcomeStatus status);

// Per-message result of a worker pass
struct ProcessOutcome {
  MessageId request_message_id;
  OutcomeStatus status = OutcomeStatus::Ok;
  std::string reason;   // Ignored / Error
  AgentId sent_to;      // Ok

  json to_json() const;
};

// Serves recommendation requests addressed to one agent. Stateless between
// calls; every message it sends goes back to the requester.
class RecommendationWorker {
 public:
  static constexpr size_t kDefaultMaxMessages = 10;

  RecommendationWorker(hub::Hub& hub, profile::ProfileStore& store, recommend::Recommender& recommender);

  // Drains the whole mailbox of `agent_id` and handles at most `max_messages`
  // of it in arrival order. The rest of the batch is dropped.
  std::vector<ProcessOutcome> process(const AgentId& agent_id, size_t max_messages = kDefaultMaxMessages);

 private:
  ProcessOutcome handle(const AgentId& agent_id, const hub::Message& msg);

  hub::Hub& hub_;
  profile::ProfileStore& store_;
  recommend::Recommender& recommender_;
};

}  // namespace freigent::worker
