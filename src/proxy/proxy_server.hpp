#pragma once

#include <asio.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "net/http_client.hpp"
#include "net/http_server.hpp"
#include "wire/anthropic.hpp"

namespace relay::proxy {

/**
 * Local gateway that accepts Anthropic Messages API requests and serves them
 * from an OpenAI Chat Completions provider.
 *
 * Routes:
 *   GET  /             health check, {"status":"ok"}
 *   POST /v1/messages  translated request, streaming or not (query string ignored)
 *
 * One io_context on one background thread serves every connection; each request is an
 * independent async chain with its own upstream connection and stream state.
 */
class ProxyServer {
 public:
  // Bind the listening socket and start serving.
  // Throws std::invalid_argument for an unusable config and std::system_error if binding fails.
  static std::unique_ptr<ProxyServer> start(const ProxyConfig &config);

  ~ProxyServer();

  ProxyServer(const ProxyServer &) = delete;
  ProxyServer &operator=(const ProxyServer &) = delete;

  uint16_t port() const {
    return http_server_.port();
  }

  // "http://<listen_host>:<port>"
  std::string base_url() const;

  // Release the listening socket and stop serving. Requests still in flight are
  // abandoned without a response. Idempotent; must not be called from a request handler.
  void stop();

 private:
  explicit ProxyServer(ProxyConfig config);

  void handle(const net::HttpRequest &request, std::shared_ptr<net::HttpSession> session);
  void handle_messages(const net::HttpRequest &request, const std::shared_ptr<net::HttpSession> &session);

  void forward(const anthropic::Request &request, const std::string &payload, std::shared_ptr<net::HttpSession> session);
  void forward_stream(const anthropic::Request &request, const std::string &payload, std::shared_ptr<net::HttpSession> session);

  net::HttpOptions upstream_options(const std::string &payload, bool stream) const;

  ProxyConfig config_;
  std::string upstream_url_;

  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
  net::HttpClient http_client_;
  net::HttpServer http_server_;
  std::thread io_thread_;
  std::atomic<bool> stopped_{false};
};

// Provider API base: trailing slashes and "/chat/completions" removed, "/v1" appended
// unless the path already ends in a version segment ("/v1", "/v4", ...)
std::string normalize_base_url(const std::string &base_url);

// Full Chat Completions endpoint for a configured base URL
std::string completions_url(const std::string &base_url);

// {"type":"error","error":{"type":<type>,"message":<message>}}
json error_body(const std::string &type, const std::string &message);

}  // namespace relay::proxy
