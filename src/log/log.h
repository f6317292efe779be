#ifndef RELAY_LOG_H
#define RELAY_LOG_H

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace relay {

/**
 * 初始化日志系统
 *
 * 未指定 log_path 时输出到 stderr（彩色）。
 *
 * 指定 log_path 时写文件，按启动次数轮转：
 * - 上次的 relay.log 重命名为 relay.0.log
 * - 历史日志依次向后移动：relay.0.log -> relay.1.log -> ... -> relay.9.log
 * - 最旧的日志被删除
 *
 * @param log_path 日志文件路径（可选）
 * @param level 日志级别：trace/debug/info/warn/err/critical/off，默认 info
 * @param max_files 保留的历史日志文件数量，默认 10 个
 */
void init_log(const std::string& log_path = "", const std::string& level = "info", size_t max_files = 10);

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace relay

#endif  // RELAY_LOG_H
