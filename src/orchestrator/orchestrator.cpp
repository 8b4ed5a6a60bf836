#include "freigent/orchestrator/orchestrator.hpp"

#include <spdlog/spdlog.h>

namespace freigent::orchestrator {

json HelperResult::to_json() const {
  return {{"agent_id", agent_id}, {"result", result.to_json()}};
}

json AutoSearchResult::to_json() const {
  json helpers = json::array();
  for (const auto& h : helper_results) {
    helpers.push_back(h.to_json());
  }
  json merged = json::array();
  for (const auto& p : merged_products) {
    merged.push_back(p.to_json());
  }

  return {{"base_agent_id", base_agent_id},
          {"helper_agent_ids", helper_agent_ids},
          {"base_result", base_result.to_json()},
          {"helper_results", helpers},
          {"merged_products", merged},
          {"merged_summary_for_user", merged_summary_for_user}};
}

Orchestrator::Orchestrator(hub::Hub& hub, profile::ProfileStore& store, recommend::Recommender& recommender, Options options)
    : hub_(hub), store_(store), recommender_(recommender), worker_(hub, store, recommender), options_(std::move(options)) {}

std::string Orchestrator::summarize(const AgentId& base_id, size_t helper_count, const std::vector<AgentId>& helper_ids) {
  std::string ids;
  for (const auto& id : helper_ids) {
    if (!ids.empty()) ids += ", ";
    ids += id;
  }
  if (ids.empty()) ids = "none";

  return "This response combines the base Freigent '" + base_id + "' recommendations with " + std::to_string(helper_count) +
         " helper Freigent(s): " + ids + ".";
}

Result<AutoSearchResult> Orchestrator::run(const UserId& base_id, const std::string& query) {
  std::optional<profile::UserProfile> base_profile;
  try {
    base_profile = store_.load(base_id);
  } catch (const profile::StoreError& e) {
    spdlog::error("orchestrator: loading base profile '{}' failed: {}", base_id, e.what());
    return Result<AutoSearchResult>::failure(ErrorCode::StoreFailure, e.what());
  }
  if (!base_profile) {
    return Result<AutoSearchResult>::failure(ErrorCode::ProfileNotFound, "No profile stored for user_id '" + base_id + "'");
  }

  AutoSearchResult out;
  out.base_agent_id = base_id;
  try {
    out.base_result = recommender_.generate(*base_profile, query);
  } catch (const std::exception& e) {
    spdlog::warn("orchestrator: recommender threw for base '{}': {}", base_id, e.what());
    out.base_result = recommend::fallback_recommendation(e.what());
  }

  out.helper_agent_ids = discover_peers(base_id);
  spdlog::info("orchestrator: '{}' fanning out to {} peer(s)", base_id, out.helper_agent_ids.size());

  // A peer whose profile vanished since discovery stays listed but is not asked
  auto reachable = register_peers(out.helper_agent_ids);

  for (const auto& peer : reachable) {
    hub_.send(base_id, peer,
              {{"type", hub::payload_type::kRecommendationRequest}, {"from_user_id", base_id}, {"query", query}});
  }

  // Sequential dispatch keeps fan-in order equal to discovery order
  for (const auto& peer : reachable) {
    auto outcomes = worker_.process(peer, options_.worker_max_messages);
    for (const auto& o : outcomes) {
      spdlog::debug("orchestrator: peer '{}' -> {}", peer, o.to_json().dump());
    }
  }

  out.helper_results = collect_responses(base_id);

  out.merged_products = out.base_result.products;
  for (const auto& h : out.helper_results) {
    out.merged_products.insert(out.merged_products.end(), h.result.products.begin(), h.result.products.end());
  }
  out.merged_summary_for_user = summarize(base_id, out.helper_results.size(), out.helper_agent_ids);

  return Result<AutoSearchResult>::success(std::move(out));
}

std::vector<UserId> Orchestrator::discover_peers(const UserId& base_id) {
  try {
    return store_.list_peer_ids(base_id, options_.agent_type);
  } catch (const profile::StoreError& e) {
    spdlog::warn("orchestrator: peer discovery for '{}' failed, continuing alone: {}", base_id, e.what());
    return {};
  }
}

std::vector<UserId> Orchestrator::register_peers(const std::vector<UserId>& peers) {
  std::vector<UserId> registered;
  for (const auto& peer : peers) {
    std::optional<profile::UserProfile> p;
    try {
      p = store_.load(peer);
    } catch (const profile::StoreError& e) {
      spdlog::warn("orchestrator: loading peer '{}' failed: {}", peer, e.what());
      continue;
    }
    if (!p) {
      spdlog::warn("orchestrator: peer '{}' has no profile anymore", peer);
      continue;
    }
    hub_.register_agent(peer, options_.agent_type, p->name, p->personality);
    registered.push_back(peer);
  }
  return registered;
}

std::vector<HelperResult> Orchestrator::collect_responses(const UserId& base_id) {
  std::vector<HelperResult> results;
  for (const auto& msg : hub_.receive(base_id, true)) {
    if (msg.type() != hub::payload_type::kRecommendationResponse) {
      spdlog::debug("orchestrator: skipping '{}' message {} from '{}'", msg.type(), msg.id(), msg.from_agent_id());
      continue;
    }
    auto it = msg.payload().find("result");
    auto result = it != msg.payload().end() ? recommend::Recommendation::from_json(*it)
                                            : recommend::Recommendation::from_json(json::object());
    results.push_back({msg.from_agent_id(), std::move(result)});
  }
  return results;
}

}  // namespace freigent::orchestrator
