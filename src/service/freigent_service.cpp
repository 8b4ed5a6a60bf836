#include "freigent/service/freigent_service.hpp"

#include <spdlog/spdlog.h>

namespace freigent::service {

FreigentService::Options FreigentService::Options::from_config(const Config& config) {
  Options options;
  options.agent_type = config.hub.agent_type;
  options.worker_max_messages = config.hub.worker_max_messages;
  return options;
}

FreigentService::FreigentService(Options options, hub::Hub& hub, profile::ProfileStore& store,
                                 recommend::Recommender& recommender)
    : options_(std::move(options)),
      hub_(hub),
      store_(store),
      recommender_(recommender),
      worker_(hub, store, recommender),
      orchestrator_(hub, store, recommender, {options_.agent_type, options_.worker_max_messages}) {}

Result<hub::AgentRecord> FreigentService::set_profile(const UserId& user_id, const profile::UserProfile& profile) {
  if (user_id.empty()) {
    return Result<hub::AgentRecord>::failure(ErrorCode::InvalidArgument, "user_id must not be empty");
  }

  hub::AgentRecord record{user_id, options_.agent_type, profile.name, profile.personality};
  try {
    store_.upsert(user_id, profile);
    store_.upsert_agent(record);
  } catch (const profile::StoreError& e) {
    spdlog::error("service: saving profile '{}' failed: {}", user_id, e.what());
    return Result<hub::AgentRecord>::failure(ErrorCode::StoreFailure, e.what());
  }

  spdlog::info("service: stored profile '{}' ({} experience(s))", user_id, profile.experiences.size());
  return Result<hub::AgentRecord>::success(
      hub_.register_agent(user_id, options_.agent_type, profile.name, profile.personality));
}

Result<recommend::Recommendation> FreigentService::search(const UserId& user_id, const std::string& query) {
  std::optional<profile::UserProfile> profile;
  try {
    profile = store_.load(user_id);
  } catch (const profile::StoreError& e) {
    spdlog::error("service: loading profile '{}' failed: {}", user_id, e.what());
    return Result<recommend::Recommendation>::failure(ErrorCode::StoreFailure, e.what());
  }
  if (!profile) {
    return Result<recommend::Recommendation>::failure(ErrorCode::ProfileNotFound,
                                                      "No profile stored for user_id '" + user_id + "'");
  }
  return Result<recommend::Recommendation>::success(recommender_.generate(*profile, query));
}

Result<orchestrator::AutoSearchResult> FreigentService::auto_search(const UserId& user_id, const std::string& query) {
  auto lock = run_lock(user_id);
  std::lock_guard<std::mutex> guard(*lock);
  return orchestrator_.run(user_id, query);
}

std::vector<worker::ProcessOutcome> FreigentService::process_inbox(const AgentId& agent_id, size_t max_messages) {
  return worker_.process(agent_id, max_messages);
}

hub::AgentRecord FreigentService::register_agent(const AgentId& agent_id, const std::string& agent_type,
                                                 const std::string& display_name, const std::string& personality_summary) {
  return hub_.register_agent(agent_id, agent_type, display_name, personality_summary);
}

std::vector<hub::AgentRecord> FreigentService::list_agents() const {
  return hub_.list_agents();
}

hub::Message FreigentService::send(const AgentId& from, const AgentId& to, json payload) {
  return hub_.send(from, to, std::move(payload));
}

std::vector<hub::Message> FreigentService::inbox(const AgentId& agent_id, bool clear) {
  return hub_.receive(agent_id, clear);
}

std::shared_ptr<std::mutex> FreigentService::run_lock(const UserId& user_id) {
  std::lock_guard<std::mutex> lock(run_locks_mutex_);
  auto& m = run_locks_[user_id];
  if (!m) {
    m = std::make_shared<std::mutex>();
  }
  return m;
}

}  // namespace freigent::service
