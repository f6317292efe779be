#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace relay {

namespace fs = std::filesystem;

namespace {

const char *env_or(const char *name, const char *fallback) {
  const char *value = std::getenv(name);
  if (value && *value) {
    return value;
  }
  value = std::getenv(fallback);
  return (value && *value) ? value : nullptr;
}

}  // namespace

std::string ProxyConfig::map_model(const std::string &model) const {
  auto it = model_mapping.find(model);
  if (it != model_mapping.end()) {
    return it->second;
  }
  return model;
}

std::optional<std::string> ProxyConfig::validate() const {
  if (target_base_url.empty()) {
    return "target_base_url is not set";
  }
  if (!target_base_url.starts_with("http://") && !target_base_url.starts_with("https://")) {
    return "target_base_url must start with http:// or https://: " + target_base_url;
  }
  if (request_timeout.count() <= 0 || stream_timeout.count() <= 0) {
    return "timeouts must be positive";
  }
  return std::nullopt;
}

ProxyConfig ProxyConfig::load(const fs::path &path) {
  ProxyConfig config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return config;
  }

  try {
    json j = json::parse(file);

    config.target_base_url = j.value("target_base_url", "");
    config.target_api_key = j.value("target_api_key", "");

    if (j.contains("model_mapping")) {
      for (auto &[from, to] : j["model_mapping"].items()) {
        config.model_mapping[from] = to.get<std::string>();
      }
    }

    config.listen_host = j.value("listen_host", "127.0.0.1");
    config.listen_port = j.value("listen_port", uint16_t{0});
    config.request_timeout = std::chrono::seconds(j.value("request_timeout_seconds", 120));
    config.stream_timeout = std::chrono::seconds(j.value("stream_timeout_seconds", 600));

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const std::exception &e) {
    spdlog::warn("Ignoring malformed config {}: {}", path.string(), e.what());
    return ProxyConfig{};
  }

  return config;
}

ProxyConfig ProxyConfig::from_env(ProxyConfig base) {
  ProxyConfig config = std::move(base);

  if (const char *base_url = env_or("RELAY_TARGET_BASE_URL", "OPENAI_BASE_URL")) {
    config.target_base_url = base_url;
  }
  if (const char *api_key = env_or("RELAY_TARGET_API_KEY", "OPENAI_API_KEY")) {
    config.target_api_key = api_key;
  }

  if (const char *port = std::getenv("RELAY_LISTEN_PORT")) {
    try {
      int value = std::stoi(port);
      if (value >= 0 && value <= 65535) {
        config.listen_port = static_cast<uint16_t>(value);
      } else {
        spdlog::warn("RELAY_LISTEN_PORT out of range: {}", port);
      }
    } catch (const std::exception &) {
      spdlog::warn("RELAY_LISTEN_PORT is not a number: {}", port);
    }
  }

  if (const char *level = std::getenv("RELAY_LOG_LEVEL")) {
    config.log_level = level;
  }

  return config;
}

void ProxyConfig::save(const fs::path &path) const {
  json j;
  j["target_base_url"] = target_base_url;
  j["target_api_key"] = target_api_key;
  j["model_mapping"] = model_mapping;
  j["listen_host"] = listen_host;
  j["listen_port"] = listen_port;
  j["request_timeout_seconds"] = request_timeout.count();
  j["stream_timeout_seconds"] = stream_timeout.count();

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (file.is_open()) {
    file << j.dump(2);
  }
}

namespace config_paths {

fs::path home_dir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char *userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "relay";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace relay
