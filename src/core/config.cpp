#include "freigent/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace freigent {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file: {}", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    // Load providers
    if (j.contains("providers")) {
      for (auto& [name, provider_json] : j["providers"].items()) {
        ProviderConfig provider;
        provider.name = name;
        provider.api_key = provider_json.value("api_key", "");
        provider.base_url = provider_json.value("base_url", "");
        if (provider_json.contains("organization")) {
          provider.organization = provider_json["organization"].get<std::string>();
        }
        if (provider_json.contains("headers")) {
          for (auto& [k, v] : provider_json["headers"].items()) {
            provider.headers[k] = v.get<std::string>();
          }
        }
        config.providers[name] = provider;
      }
    }

    config.default_provider = j.value("default_provider", "anthropic");
    config.default_model = j.value("default_model", "claude-3-haiku-20240307");

    if (j.contains("store")) {
      const auto& s = j["store"];
      config.store.backend = s.value("backend", "sqlite");
      config.store.path = s.value("path", "freigent.db");
    }

    if (j.contains("hub")) {
      const auto& h = j["hub"];
      config.hub.agent_type = h.value("agent_type", kFreigentAgentType);
      config.hub.worker_max_messages = h.value("worker_max_messages", size_t(10));
    }

    if (j.contains("recommender")) {
      const auto& r = j["recommender"];
      config.recommender.max_tokens = r.value("max_tokens", 2048);
      config.recommender.request_timeout = std::chrono::seconds(r.value("request_timeout_seconds", int64_t(60)));
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  const char* anthropic_key = std::getenv("ANTHROPIC_API_KEY");
  if (!anthropic_key) {
    anthropic_key = std::getenv("ANTHROPIC_AUTH_TOKEN");
  }

  if (anthropic_key) {
    const char* base_url = std::getenv("ANTHROPIC_BASE_URL");
    const char* model = std::getenv("ANTHROPIC_MODEL");

    ProviderConfig provider;
    provider.name = "anthropic";
    provider.api_key = anthropic_key;
    provider.base_url = base_url ? base_url : "https://api.anthropic.com";

    config.providers["anthropic"] = provider;
    config.default_provider = "anthropic";

    if (model) {
      config.default_model = model;
    }
  }

  const char* openai_key = std::getenv("OPENAI_API_KEY");
  if (openai_key) {
    const char* base_url = std::getenv("OPENAI_BASE_URL");
    const char* model = std::getenv("OPENAI_MODEL");

    ProviderConfig provider;
    provider.name = "openai";
    provider.api_key = openai_key;
    provider.base_url = base_url ? base_url : "https://api.openai.com";

    config.providers["openai"] = provider;

    if (!anthropic_key) {
      config.default_provider = "openai";
      config.default_model = model ? model : "gpt-4o-mini";
    }
  }

  if (const char* db_path = std::getenv("FREIGENT_DB_PATH")) {
    config.store.path = db_path;
  }

  if (const char* level = std::getenv("FREIGENT_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  json providers_json = json::object();
  for (const auto& [name, provider] : providers) {
    json p;
    p["api_key"] = provider.api_key;
    p["base_url"] = provider.base_url;
    if (provider.organization) {
      p["organization"] = *provider.organization;
    }
    if (!provider.headers.empty()) {
      p["headers"] = provider.headers;
    }
    providers_json[name] = p;
  }
  j["providers"] = providers_json;

  j["default_provider"] = default_provider;
  j["default_model"] = default_model;

  j["store"] = {{"backend", store.backend}, {"path", store.path.string()}};
  j["hub"] = {{"agent_type", hub.agent_type}, {"worker_max_messages", hub.worker_max_messages}};
  j["recommender"] = {{"max_tokens", recommender.max_tokens},
                      {"request_timeout_seconds", recommender.request_timeout.count()}};

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to write config file: {}", path.string());
    return;
  }
  file << j.dump(2);
}

std::optional<ProviderConfig> Config::get_provider(const std::string& name) const {
  auto it = providers.find(name);
  if (it != providers.end()) {
    return it->second;
  }
  return std::nullopt;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "freigent";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".freigent" / "config.json";
}

}  // namespace config_paths

}  // namespace freigent
