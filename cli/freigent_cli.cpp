// freigent_cli: profile registration and (multi-agent) product search from the shell.
// 所有结果以 JSON 输出到 stdout，错误信息输出到 stderr

#include <asio.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "freigent/core/config.hpp"
#include "freigent/hub/hub.hpp"
#include "freigent/llm/provider.hpp"
#include "freigent/profile/json_profile_store.hpp"
#include "freigent/profile/sqlite_profile_store.hpp"
#include "freigent/recommend/recommender.hpp"
#include "freigent/service/freigent_service.hpp"
#include "log/log.h"

using namespace freigent;

namespace {

struct Args {
  std::optional<std::string> config_path;
  std::optional<std::string> db_path;
  std::optional<std::string> log_level;
  std::string command;
  std::vector<std::string> positional;
};

void print_usage() {
  std::cerr << "Usage: freigent_cli [--config <path>] [--db <path>] [--log-level <level>] <command> [args]\n"
               "\n"
               "Commands:\n"
               "  set-profile <user_id> <profile.json>   Store a profile and register the user as an agent\n"
               "  search <user_id> <query>               Recommendations for one user\n"
               "  auto-search <user_id> <query>          Recommendations merged across all peer agents\n"
               "  agents                                 List stored agents\n";
}

bool parse_args(int argc, char* argv[], Args& args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto take_value = [&](std::optional<std::string>& out) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a value\n";
        return false;
      }
      out = argv[++i];
      return true;
    };

    if (arg == "--config") {
      if (!take_value(args.config_path)) return false;
    } else if (arg == "--db") {
      if (!take_value(args.db_path)) return false;
    } else if (arg == "--log-level") {
      if (!take_value(args.log_level)) return false;
    } else if (arg == "-h" || arg == "--help") {
      return false;
    } else if (args.command.empty()) {
      args.command = arg;
    } else {
      args.positional.push_back(arg);
    }
  }
  return !args.command.empty();
}

// Query words may be passed unquoted
std::string join_from(const std::vector<std::string>& parts, size_t start) {
  std::string out;
  for (size_t i = start; i < parts.size(); ++i) {
    if (!out.empty()) out += " ";
    out += parts[i];
  }
  return out;
}

std::unique_ptr<profile::ProfileStore> open_store(const Config& config) {
  if (config.store.backend == "json") {
    return std::make_unique<profile::JsonProfileStore>(config.store.path);
  }
  return std::make_unique<profile::SqliteProfileStore>(config.store.path);
}

template <typename T>
int report_failure(const Result<T>& result) {
  std::cerr << "Error (" << to_string(result.code) << "): " << result.error.value_or("unknown error") << "\n";
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  Args args;
  if (!parse_args(argc, argv, args)) {
    print_usage();
    return 1;
  }

  Config config = args.config_path ? Config::load(*args.config_path) : Config::from_env();
  if (args.db_path) config.store.path = *args.db_path;
  if (args.log_level) config.log_level = *args.log_level;

  init_log(config.log_file ? config.log_file->string() : "", 10, config.log_level);

  std::unique_ptr<profile::ProfileStore> store;
  try {
    store = open_store(config);
  } catch (const profile::StoreError& e) {
    std::cerr << "Error: cannot open profile store " << config.store.path << ": " << e.what() << "\n";
    return 1;
  }

  if (args.command == "agents") {
    json out = json::array();
    try {
      for (const auto& a : store->list_agents()) {
        out.push_back(a.to_json());
      }
    } catch (const profile::StoreError& e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  asio::io_context io_ctx;
  std::shared_ptr<llm::Provider> provider;
  if (auto provider_config = config.get_provider(config.default_provider)) {
    provider = llm::ProviderFactory::instance().create(config.default_provider, *provider_config, io_ctx);
  }

  // Without a provider searches still run and every result is the fallback
  if (!provider && args.command != "set-profile") {
    std::cerr << "Warning: no provider '" << config.default_provider
              << "' configured. Set ANTHROPIC_API_KEY or OPENAI_API_KEY\n";
  }

  recommend::LlmRecommender recommender(provider, {config.default_model, config.recommender.max_tokens,
                                                   config.recommender.request_timeout});
  hub::Hub hub;
  service::FreigentService service(service::FreigentService::Options::from_config(config), hub, *store, recommender);

  // Run IO context in background thread
  std::thread io_thread([&io_ctx]() {
    auto work = asio::make_work_guard(io_ctx);
    io_ctx.run();
  });

  int rc = 0;
  if (args.command == "set-profile" && args.positional.size() == 2) {
    std::ifstream file(args.positional[1]);
    json j = file.is_open() ? json::parse(file, nullptr, false) : json();
    if (j.is_discarded() || !j.is_object()) {
      std::cerr << "Error: cannot read profile JSON from " << args.positional[1] << "\n";
      rc = 1;
    } else {
      try {
        auto result = service.set_profile(args.positional[0], profile::UserProfile::from_json(j));
        if (result.ok()) {
          std::cout << result.value->to_json().dump(2) << "\n";
        } else {
          rc = report_failure(result);
        }
      } catch (const json::exception& e) {
        std::cerr << "Error: invalid profile in " << args.positional[1] << ": " << e.what() << "\n";
        rc = 1;
      }
    }
  } else if (args.command == "search" && args.positional.size() >= 2) {
    auto result = service.search(args.positional[0], join_from(args.positional, 1));
    if (result.ok()) {
      std::cout << result.value->to_json().dump(2) << "\n";
    } else {
      rc = report_failure(result);
    }
  } else if (args.command == "auto-search" && args.positional.size() >= 2) {
    auto result = service.auto_search(args.positional[0], join_from(args.positional, 1));
    if (result.ok()) {
      std::cout << result.value->to_json().dump(2) << "\n";
    } else {
      rc = report_failure(result);
    }
  } else {
    print_usage();
    rc = 1;
  }

  io_ctx.stop();
  io_thread.join();
  return rc;
}
