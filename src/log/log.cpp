#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "freigent/core/config.hpp"

namespace freigent {

namespace {

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

// 每次启动时轮转日志文件
// 策略：<stem>.log -> <stem>.0.log -> ... -> <stem>.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  if (max_files == 0 || !fs::exists(current_log)) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto backup = [&](size_t i) {
    return log_dir / (stem + "." + std::to_string(i) + ".log");
  };

  std::error_code ec;
  fs::remove(backup(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup(static_cast<size_t>(i) + 1), ec);
      if (ec) {
        std::cerr << "Failed to rotate " << old_name.string() << ": " << ec.message() << "\n";
      }
    }
  }

  fs::rename(current_log, backup(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate " << current_log.string() << ": " << ec.message() << "\n";
  }
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "freigent.log" : fs::path(log_path);
    auto log_dir = actual_path.parent_path();

    // 确保日志目录存在
    std::error_code ec;
    if (!log_dir.empty()) {
      fs::create_directories(log_dir, ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    // 每次启动都是新的干净文件
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("freigent", file_sink);

    logger->set_level(parse_level(level));

    // 日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("freigent");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== freigent started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace freigent
