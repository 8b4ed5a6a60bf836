#ifndef FREIGENT_LOG_H
#define FREIGENT_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace freigent {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动时，当前的 freigent.log 会被清空
 * - 上次的日志重命名为 freigent.0.log
 * - 历史日志依次向后移动：freigent.0.log -> freigent.1.log -> ... -> freigent.9.log
 * - 最旧的日志被删除
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/freigent/log/freigent.log）
 * @param max_files 保留的历史日志文件数量，默认 10 个
 * @param level 日志级别：trace/debug/info/warn/err/critical/off
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "info");

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace freigent

#endif  // FREIGENT_LOG_H
