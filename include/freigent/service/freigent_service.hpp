#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "freigent/core/config.hpp"
#include "freigent/hub/hub.hpp"
#include "freigent/orchestrator/orchestrator.hpp"
#include "freigent/profile/profile_store.hpp"
#include "freigent/recommend/recommender.hpp"
#include "freigent/worker/recommendation_worker.hpp"

namespace freigent::service {

// Application-level operations over one hub, one profile store and one
// recommender. The request layer (CLI, or anything embedding the library)
// talks to this class only.
class FreigentService {
 public:
  struct Options {
    std::string agent_type = kFreigentAgentType;
    size_t worker_max_messages = worker::RecommendationWorker::kDefaultMaxMessages;

    static Options from_config(const Config& config);
  };

  FreigentService(Options options, hub::Hub& hub, profile::ProfileStore& store, recommend::Recommender& recommender);

  // Stores the profile, records the user as a persistent agent and registers
  // it with the hub
  Result<hub::AgentRecord> set_profile(const UserId& user_id, const profile::UserProfile& profile);

  // Single-agent recommendation for a stored profile
  Result<recommend::Recommendation> search(const UserId& user_id, const std::string& query);

  // Multi-agent recommendation; runs for the same user are serialized here
  Result<orchestrator::AutoSearchResult> auto_search(const UserId& user_id, const std::string& query);

  std::vector<worker::ProcessOutcome> process_inbox(const AgentId& agent_id, size_t max_messages);

  hub::AgentRecord register_agent(const AgentId& agent_id, const std::string& agent_type, const std::string& display_name,
                                  const std::string& personality_summary = "");

  std::vector<hub::AgentRecord> list_agents() const;

  hub::Message send(const AgentId& from, const AgentId& to, json payload);

  std::vector<hub::Message> inbox(const AgentId& agent_id, bool clear = true);

 private:
  std::shared_ptr<std::mutex> run_lock(const UserId& user_id);

  Options options_;
  hub::Hub& hub_;
  profile::ProfileStore& store_;
  recommend::Recommender& recommender_;
  worker::RecommendationWorker worker_;
  orchestrator::Orchestrator orchestrator_;

  std::mutex run_locks_mutex_;
  std::map<UserId, std::shared_ptr<std::mutex>> run_locks_;
};

}  // namespace freigent::service
