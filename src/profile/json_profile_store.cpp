#include "freigent/profile/json_profile_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace freigent::profile {

namespace fs = std::filesystem;

JsonProfileStore::JsonProfileStore(const fs::path& base_dir) : base_dir_(base_dir) {
  std::error_code ec;
  fs::create_directories(profiles_dir(), ec);
  if (ec) {
    throw StoreError("Failed to create profile directory " + profiles_dir().string() + ": " + ec.message());
  }
}

namespace {

// Ids become file names
bool is_valid_id(const UserId& id) {
  return !id.empty() && id.find_first_of("/\\") == std::string::npos && id != "." && id != "..";
}

}  // namespace

// --- Path helpers ---

fs::path JsonProfileStore::profiles_dir() const {
  return base_dir_ / "profiles";
}

fs::path JsonProfileStore::profile_file(const UserId& user_id) const {
  return profiles_dir() / (user_id + ".json");
}

fs::path JsonProfileStore::agents_file() const {
  return base_dir_ / "agents.json";
}

// --- Atomic write ---

void JsonProfileStore::atomic_write(const fs::path& path, const std::string& content) {
  auto tmp_path = path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file.is_open()) {
    throw StoreError("Failed to open temp file for writing: " + tmp_path.string());
  }

  file << content;
  file.close();

  std::error_code ec;
  if (file.fail()) {
    fs::remove(tmp_path, ec);
    throw StoreError("Failed to write temp file: " + tmp_path.string());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    auto msg = "Failed to rename " + tmp_path.string() + " -> " + path.string() + ": " + ec.message();
    fs::remove(tmp_path, ec);
    throw StoreError(msg);
  }
}

// --- Internal ---

std::optional<UserProfile> JsonProfileStore::load_profile(const UserId& user_id) {
  auto path = profile_file(user_id);
  if (!fs::exists(path)) {
    return std::nullopt;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open profile file: {}", path.string());
    return std::nullopt;
  }

  try {
    return UserProfile::from_json(json::parse(file));
  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse profile file {}: {}", path.string(), e.what());
    return std::nullopt;
  }
}

std::vector<hub::AgentRecord> JsonProfileStore::load_agents() {
  auto path = agents_file();
  if (!fs::exists(path)) {
    return {};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open agents file: {}", path.string());
    return {};
  }

  try {
    json j = json::parse(file);
    std::vector<hub::AgentRecord> agents;
    for (const auto& a : j) {
      agents.push_back(hub::AgentRecord::from_json(a));
    }
    return agents;
  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse agents file: {}", e.what());
    return {};
  }
}

void JsonProfileStore::save_agents(const std::vector<hub::AgentRecord>& agents) {
  json j = json::array();
  for (const auto& a : agents) {
    j.push_back(a.to_json());
  }
  atomic_write(agents_file(), j.dump(2));
}

// --- ProfileStore interface ---

std::optional<UserProfile> JsonProfileStore::load(const UserId& user_id) {
  if (!is_valid_id(user_id)) {
    return std::nullopt;
  }

  std::lock_guard lock(mutex_);
  return load_profile(user_id);
}

void JsonProfileStore::upsert(const UserId& user_id, const UserProfile& profile) {
  if (!is_valid_id(user_id)) {
    throw StoreError("Invalid user_id for file storage: '" + user_id + "'");
  }

  std::lock_guard lock(mutex_);
  atomic_write(profile_file(user_id), profile.to_json().dump(2));
}

void JsonProfileStore::upsert_agent(const hub::AgentRecord& record) {
  std::lock_guard lock(mutex_);

  auto agents = load_agents();

  // Update existing or append
  bool found = false;
  for (auto& a : agents) {
    if (a.agent_id == record.agent_id) {
      a = record;
      found = true;
      break;
    }
  }

  if (!found) {
    agents.push_back(record);
  }

  save_agents(agents);
}

std::vector<UserId> JsonProfileStore::list_peer_ids(const UserId& base_id, const std::string& agent_type) {
  std::lock_guard lock(mutex_);

  std::vector<UserId> ids;
  for (const auto& a : load_agents()) {
    if (a.agent_type != agent_type || a.agent_id == base_id) continue;
    if (!fs::exists(profile_file(a.agent_id))) continue;
    ids.push_back(a.agent_id);
  }
  return ids;
}

std::vector<hub::AgentRecord> JsonProfileStore::list_agents() {
  std::lock_guard lock(mutex_);
  return load_agents();
}

}  // namespace freigent::profile
