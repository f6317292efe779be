#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "core/version.hpp"

namespace relay {

namespace {

// 每次启动时轮转日志文件
// 策略：<stem>.log -> <stem>.0.log -> ... -> <stem>.9.log（最旧的被删除）
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  // 当前日志文件不存在或不保留历史，无需轮转
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  fs::path log_dir = current_log.parent_path();
  std::string stem = current_log.stem().string();
  std::string ext = current_log.extension().string();
  auto backup = [&](size_t i) {
    return log_dir / (stem + "." + std::to_string(i) + ext);
  };

  std::error_code ec;

  // 删除最旧的日志文件
  fs::remove(backup(max_files - 1), ec);

  // 从后往前依次重命名：relay.8.log -> relay.9.log, ...
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = backup(static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, backup(static_cast<size_t>(i) + 1), ec);
    }
  }

  // 把当前日志文件重命名为 relay.0.log
  fs::rename(current_log, backup(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, const std::string& level, size_t max_files) {
  try {
    namespace fs = std::filesystem;

    spdlog::sink_ptr sink;
    if (log_path.empty()) {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
      fs::path actual_path = log_path;

      // 确保日志目录存在
      std::error_code ec;
      if (actual_path.has_parent_path()) {
        fs::create_directories(actual_path.parent_path(), ec);
      }

      // 每次启动时轮转日志
      rotate_logs_on_startup(actual_path, max_files);

      // 创建 basic file sink（每次启动都是新的干净文件）
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    }

    // 替换已存在的同名 logger（重复初始化时）
    spdlog::drop("relay");
    auto logger = std::make_shared<spdlog::logger>("relay", sink);

    // 设置日志级别，无法识别的名称回退到 info
    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // 设置日志格式：[时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 每条日志都立即刷新，避免缓存导致日志不及时
    logger->flush_on(spdlog::level::trace);

    // 注册并设为默认 logger
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== relay {} started (log: {}) ===", RELAY_VERSION_STRING, log_path.empty() ? "stderr" : log_path);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace relay
