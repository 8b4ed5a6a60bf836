#include "freigent/profile/sqlite_profile_store.hpp"

#include <spdlog/spdlog.h>

#include "profile/sqlite_db.hpp"

namespace freigent::profile {

SqliteProfileStore::SqliteProfileStore(const std::filesystem::path& path) : db_(std::make_unique<SqliteDB>(path.string())) {
  create_schema();
  spdlog::info("Profile store opened: {}", path.string());
}

SqliteProfileStore::~SqliteProfileStore() = default;

void SqliteProfileStore::create_schema() {
  db_->exec(
      "CREATE TABLE IF NOT EXISTS agents ("
      "  agent_id TEXT PRIMARY KEY,"
      "  agent_type TEXT NOT NULL,"
      "  display_name TEXT NOT NULL,"
      "  personality_summary TEXT DEFAULT ''"
      ");");

  // 'values' is a reserved word, hence values_text
  db_->exec(
      "CREATE TABLE IF NOT EXISTS profiles ("
      "  user_id TEXT PRIMARY KEY,"
      "  name TEXT NOT NULL,"
      "  personality TEXT NOT NULL,"
      "  values_text TEXT NOT NULL"
      ");");

  db_->exec(
      "CREATE TABLE IF NOT EXISTS experiences ("
      "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
      "  user_id TEXT NOT NULL,"
      "  name TEXT NOT NULL,"
      "  notes TEXT NOT NULL,"
      "  rating INTEGER NOT NULL,"
      "  FOREIGN KEY(user_id) REFERENCES profiles(user_id)"
      ");");
}

std::optional<UserProfile> SqliteProfileStore::load(const UserId& user_id) {
  std::lock_guard lock(mutex_);

  auto stmt = db_->prepare("SELECT name, personality, values_text FROM profiles WHERE user_id = ?;");
  stmt.bind(1, user_id);
  if (!stmt.step()) {
    return std::nullopt;
  }

  UserProfile profile;
  profile.name = stmt.column_text(0);
  profile.personality = stmt.column_text(1);
  profile.values = stmt.column_text(2);

  auto exps = db_->prepare("SELECT name, notes, rating FROM experiences WHERE user_id = ? ORDER BY id;");
  exps.bind(1, user_id);
  while (exps.step()) {
    profile.experiences.push_back({exps.column_text(0), exps.column_text(1), static_cast<int>(exps.column_int(2))});
  }

  return profile;
}

void SqliteProfileStore::upsert(const UserId& user_id, const UserProfile& profile) {
  std::lock_guard lock(mutex_);

  SqliteTransaction tx(*db_);

  auto stmt = db_->prepare(
      "INSERT INTO profiles (user_id, name, personality, values_text) VALUES (?, ?, ?, ?) "
      "ON CONFLICT(user_id) DO UPDATE SET "
      "  name = excluded.name,"
      "  personality = excluded.personality,"
      "  values_text = excluded.values_text;");
  stmt.bind(1, user_id);
  stmt.bind(2, profile.name);
  stmt.bind(3, profile.personality);
  stmt.bind(4, profile.values);
  stmt.run();

  auto del = db_->prepare("DELETE FROM experiences WHERE user_id = ?;");
  del.bind(1, user_id);
  del.run();

  for (const auto& e : profile.experiences) {
    auto ins = db_->prepare("INSERT INTO experiences (user_id, name, notes, rating) VALUES (?, ?, ?, ?);");
    ins.bind(1, user_id);
    ins.bind(2, e.name);
    ins.bind(3, e.notes);
    ins.bind(4, static_cast<int64_t>(e.rating));
    ins.run();
  }

  tx.commit();
  spdlog::debug("Stored profile for '{}' ({} experiences)", user_id, profile.experiences.size());
}

void SqliteProfileStore::upsert_agent(const hub::AgentRecord& record) {
  std::lock_guard lock(mutex_);

  auto stmt = db_->prepare(
      "INSERT INTO agents (agent_id, agent_type, display_name, personality_summary) VALUES (?, ?, ?, ?) "
      "ON CONFLICT(agent_id) DO UPDATE SET "
      "  agent_type = excluded.agent_type,"
      "  display_name = excluded.display_name,"
      "  personality_summary = excluded.personality_summary;");
  stmt.bind(1, record.agent_id);
  stmt.bind(2, record.agent_type);
  stmt.bind(3, record.display_name);
  stmt.bind(4, record.personality_summary);
  stmt.run();
}

std::vector<hub::AgentRecord> SqliteProfileStore::list_agents() {
  std::lock_guard lock(mutex_);

  auto stmt = db_->prepare("SELECT agent_id, agent_type, display_name, personality_summary FROM agents ORDER BY rowid;");

  std::vector<hub::AgentRecord> agents;
  while (stmt.step()) {
    agents.push_back({stmt.column_text(0), stmt.column_text(1), stmt.column_text(2), stmt.column_text(3)});
  }
  return agents;
}

std::vector<UserId> SqliteProfileStore::list_peer_ids(const UserId& base_id, const std::string& agent_type) {
  std::lock_guard lock(mutex_);

  auto stmt = db_->prepare(
      "SELECT a.agent_id FROM agents a "
      "JOIN profiles p ON a.agent_id = p.user_id "
      "WHERE a.agent_type = ? AND a.agent_id != ? "
      "ORDER BY a.rowid;");
  stmt.bind(1, agent_type);
  stmt.bind(2, base_id);

  std::vector<UserId> ids;
  while (stmt.step()) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

}  // namespace freigent::profile
