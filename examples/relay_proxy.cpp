// relay_proxy [config.json]
//
// Runs the gateway until SIGINT/SIGTERM. Point an Anthropic client at the printed URL:
//   ANTHROPIC_BASE_URL=$(relay_proxy ...)
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include "core/version.hpp"
#include "log/log.h"
#include "relay/relay.hpp"
#include "spdlog/cfg/env.h"

using namespace relay;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) {
  g_running = false;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::cerr << "relay " << RELAY_VERSION_STRING << " - Anthropic Messages to OpenAI Chat Completions gateway\n";

  // Config file (optional), then environment on top
  std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1]) : config_paths::default_config_file();
  ProxyConfig config = ProxyConfig::from_env(ProxyConfig::load(config_path));

  // Log
  init_log(config.log_file ? config.log_file->string() : "", config.log_level);
  spdlog::cfg::load_env_levels();

  if (auto error = config.validate()) {
    std::cerr << "Error: " << *error << "\n";
    std::cerr << "Set target_base_url in " << config_path.string() << " or RELAY_TARGET_BASE_URL / OPENAI_BASE_URL\n";
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  std::unique_ptr<proxy::ProxyServer> server;
  try {
    server = proxy::ProxyServer::start(config);
  } catch (const std::exception& e) {
    std::cerr << "Failed to start proxy: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Forwarding to " << proxy::completions_url(config.target_base_url) << "\n";
  std::cout << server->base_url() << std::endl;

  while (g_running.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  spdlog::info("Shutting down");
  server->stop();
  return 0;
}
