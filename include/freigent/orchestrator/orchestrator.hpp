#pragma once

#include <string>
#include <vector>

#include "freigent/hub/hub.hpp"
#include "freigent/profile/profile_store.hpp"
#include "freigent/recommend/recommender.hpp"
#include "freigent/worker/recommendation_worker.hpp"

namespace freigent::orchestrator {

// One helper's contribution, collected from the base agent's mailbox
struct HelperResult {
  AgentId agent_id;
  recommend::Recommendation result;

  json to_json() const;
};

struct AutoSearchResult {
  AgentId base_agent_id;
  std::vector<AgentId> helper_agent_ids;  // discovered peers, in discovery order
  recommend::Recommendation base_result;
  std::vector<HelperResult> helper_results;
  std::vector<recommend::Product> merged_products;
  std::string merged_summary_for_user;

  json to_json() const;
};

// Fan-out/fan-in over the hub: asks every peer agent for recommendations on
// behalf of a base user and merges the answers with the base user's own.
//
// Runs are independent. Two concurrent runs for the same base id would share
// its mailbox, so callers must serialize them.
class Orchestrator {
 public:
  struct Options {
    std::string agent_type = kFreigentAgentType;
    size_t worker_max_messages = worker::RecommendationWorker::kDefaultMaxMessages;
  };

  Orchestrator(hub::Hub& hub, profile::ProfileStore& store, recommend::Recommender& recommender, Options options);

  Orchestrator(hub::Hub& hub, profile::ProfileStore& store, recommend::Recommender& recommender)
      : Orchestrator(hub, store, recommender, Options{}) {}

  Result<AutoSearchResult> run(const UserId& base_id, const std::string& query);

  static std::string summarize(const AgentId& base_id, size_t helper_count, const std::vector<AgentId>& helper_ids);

 private:
  std::vector<UserId> discover_peers(const UserId& base_id);

  // Returns the peers that could still be loaded and were registered
  std::vector<UserId> register_peers(const std::vector<UserId>& peers);

  std::vector<HelperResult> collect_responses(const UserId& base_id);

  hub::Hub& hub_;
  profile::ProfileStore& store_;
  recommend::Recommender& recommender_;
  worker::RecommendationWorker worker_;
  Options options_;
};

}  // namespace freigent::orchestrator
