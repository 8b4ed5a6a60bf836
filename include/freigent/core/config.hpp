#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "freigent/core/types.hpp"

namespace freigent {

// Profile store backend selection
struct StoreConfig {
  std::string backend = "sqlite";  // "sqlite" or "json"
  std::filesystem::path path = "freigent.db";
};

// Messaging hub / worker settings
struct HubConfig {
  std::string agent_type = kFreigentAgentType;
  size_t worker_max_messages = 10;
};

// Recommendation generation settings
struct RecommenderConfig {
  int max_tokens = 2048;
  std::chrono::seconds request_timeout{60};
};

// Application configuration
struct Config {
  // Provider configs
  std::map<std::string, ProviderConfig> providers;

  // Provider used for recommendations
  std::string default_provider = "anthropic";

  // Default model
  std::string default_model = "claude-3-haiku-20240307";

  StoreConfig store;
  HubConfig hub;
  RecommenderConfig recommender;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: ANTHROPIC_API_KEY/AUTH_TOKEN, ANTHROPIC_BASE_URL, ANTHROPIC_MODEL
  //        OPENAI_API_KEY, OPENAI_BASE_URL, OPENAI_MODEL
  //        FREIGENT_DB_PATH, FREIGENT_LOG_LEVEL
  // Note: Anthropic is preferred when both API keys are set
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Get provider config
  std::optional<ProviderConfig> get_provider(const std::string& name) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();
}  // namespace config_paths

}  // namespace freigent
