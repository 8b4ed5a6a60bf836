#include "freigent/worker/recommendation_worker.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>

namespace freigent::worker {

std::string to_string(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::Ok:
      return "ok";
    case OutcomeStatus::Ignored:
      return "ignored";
    case OutcomeStatus::Error:
      return "error";
  }
  return "error";
}

json ProcessOutcome::to_json() const {
  json j = {{"request_message_id", request_message_id}, {"status", to_string(status)}};
  switch (status) {
    case OutcomeStatus::Ok:
      j["sent_to"] = sent_to;
      break;
    case OutcomeStatus::Ignored:
      j["reason"] = reason;
      break;
    case OutcomeStatus::Error:
      j["error"] = reason;
      break;
  }
  return j;
}

RecommendationWorker::RecommendationWorker(hub::Hub& hub, profile::ProfileStore& store, recommend::Recommender& recommender)
    : hub_(hub), store_(store), recommender_(recommender) {}

std::vector<ProcessOutcome> RecommendationWorker::process(const AgentId& agent_id, size_t max_messages) {
  auto messages = hub_.receive(agent_id, true);

  if (messages.size() > max_messages) {
    spdlog::warn("worker '{}': dropping {} message(s) over the limit of {}", agent_id, messages.size() - max_messages,
                 max_messages);
    messages.erase(messages.begin() + static_cast<std::ptrdiff_t>(max_messages), messages.end());
  }

  std::vector<ProcessOutcome> outcomes;
  outcomes.reserve(messages.size());
  for (const auto& msg : messages) {
    outcomes.push_back(handle(agent_id, msg));
  }
  return outcomes;
}

ProcessOutcome RecommendationWorker::handle(const AgentId& agent_id, const hub::Message& msg) {
  ProcessOutcome outcome;
  outcome.request_message_id = msg.id();

  const auto& payload = msg.payload();
  auto type = msg.type();
  if (type != hub::payload_type::kRecommendationRequest) {
    outcome.status = OutcomeStatus::Ignored;
    std::string shown = "null";
    if (auto it = payload.find("type"); it != payload.end()) {
      shown = it->is_string() ? it->get<std::string>() : it->dump();
    }
    outcome.reason = "Unsupported payload.type '" + shown + "'";
    spdlog::debug("worker '{}': {}", agent_id, outcome.reason);
    return outcome;
  }

  UserId profile_id = msg.from_agent_id();
  if (auto it = payload.find("from_user_id"); it != payload.end() && it->is_string()) {
    profile_id = it->get<std::string>();
  }
  std::string query;
  if (auto it = payload.find("query"); it != payload.end() && it->is_string()) {
    query = it->get<std::string>();
  }

  std::optional<profile::UserProfile> profile;
  try {
    profile = store_.load(profile_id);
  } catch (const profile::StoreError& e) {
    spdlog::warn("worker '{}': loading profile '{}' failed: {}", agent_id, profile_id, e.what());
  }

  if (!profile) {
    outcome.status = OutcomeStatus::Error;
    outcome.reason = "No profile found for user_id '" + profile_id + "'";
    hub_.send(agent_id, msg.from_agent_id(),
              {{"type", hub::payload_type::kRecommendationError},
               {"reason", outcome.reason},
               {"original_message_id", msg.id()}});
    return outcome;
  }

  recommend::Recommendation result;
  try {
    result = recommender_.generate(*profile, query);
  } catch (const std::exception& e) {
    spdlog::warn("worker '{}': recommender threw for '{}': {}", agent_id, profile_id, e.what());
    result = recommend::fallback_recommendation(e.what());
  }
  hub_.send(agent_id, msg.from_agent_id(),
            {{"type", hub::payload_type::kRecommendationResponse},
             {"original_message_id", msg.id()},
             {"query", query},
             {"profile_user_id", profile_id},
             {"result", result.to_json()}});

  outcome.status = OutcomeStatus::Ok;
  outcome.sent_to = msg.from_agent_id();
  return outcome;
}

}  // namespace freigent::worker
