#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "types.hpp"

namespace relay {

// Gateway configuration
struct ProxyConfig {
  // Provider endpoint, e.g. "https://api.openai.com" or "http://localhost:11434/v1"
  std::string target_base_url;
  std::string target_api_key;

  // Caller model name -> provider model name (unlisted names pass through)
  std::map<std::string, std::string> model_mapping;

  // Listening socket; port 0 picks an ephemeral port
  std::string listen_host = "127.0.0.1";
  uint16_t listen_port = 0;

  // Upper bound for a whole non-streaming exchange / a whole stream
  std::chrono::seconds request_timeout{120};
  std::chrono::seconds stream_timeout{600};

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Provider model for a caller model name
  std::string map_model(const std::string &model) const;

  // Error text if the config cannot be used to start a proxy
  std::optional<std::string> validate() const;

  // Load from file (missing or malformed file yields defaults)
  static ProxyConfig load(const std::filesystem::path &path);

  // Overlay environment variables on a base config
  // Reads: RELAY_TARGET_BASE_URL (or OPENAI_BASE_URL), RELAY_TARGET_API_KEY (or OPENAI_API_KEY),
  //        RELAY_LISTEN_PORT, RELAY_LOG_LEVEL
  static ProxyConfig from_env(ProxyConfig base);
  static ProxyConfig from_env();

  // Save to file
  void save(const std::filesystem::path &path) const;
};

inline ProxyConfig ProxyConfig::from_env() { return from_env(ProxyConfig{}); }

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();
}  // namespace config_paths

}  // namespace relay
