#include "proxy/proxy_server.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <stdexcept>

#include "net/sse_line_reader.hpp"
#include "translate/request_transformer.hpp"
#include "translate/response_transformer.hpp"
#include "translate/stream_transformer.hpp"

namespace relay::proxy {

namespace {

void send_json(const std::shared_ptr<net::HttpSession> &session, int status, const json &body) {
  session->send(status, "application/json", dump_json(body));
}

void send_error(const std::shared_ptr<net::HttpSession> &session, int status, const std::string &type, const std::string &message) {
  send_json(session, status, error_body(type, message));
}

// Per-request streaming state, shared by the upstream callbacks
struct StreamContext {
  explicit StreamContext(std::string model) : transformer(std::move(model)) {}

  translate::StreamTransformer transformer;
  net::SseLineReader reader;
  bool started = false;
  size_t chunk_count = 0;
  size_t event_count = 0;
};

void begin_event_stream(StreamContext &ctx, net::HttpSession &session) {
  if (ctx.started) return;
  ctx.started = true;
  session.begin_stream(200, {{"Content-Type", "text/event-stream"}, {"Cache-Control", "no-cache"}});
}

void emit(StreamContext &ctx, net::HttpSession &session, const std::vector<translate::StreamEvent> &events) {
  for (const auto &event : events) {
    ++ctx.event_count;
    session.write(event.to_sse());
  }
}

void process_line(StreamContext &ctx, net::HttpSession &session, const std::string &line) {
  auto chunk = translate::parse_chunk_line(line);
  if (!chunk) return;
  ++ctx.chunk_count;
  emit(ctx, session, ctx.transformer.transform(*chunk));
}

}  // namespace

std::string normalize_base_url(const std::string &base_url) {
  std::string url = base_url;
  auto strip_slashes = [&url] {
    while (!url.empty() && url.back() == '/') {
      url.pop_back();
    }
  };

  strip_slashes();

  // Users often paste the full endpoint
  const std::string endpoint = "/chat/completions";
  if (url.ends_with(endpoint)) {
    url.erase(url.size() - endpoint.size());
    strip_slashes();
  }

  static const std::regex version_suffix(R"(/v\d+$)");
  if (!std::regex_search(url, version_suffix)) {
    url += "/v1";
  }
  return url;
}

std::string completions_url(const std::string &base_url) {
  return normalize_base_url(base_url) + "/chat/completions";
}

json error_body(const std::string &type, const std::string &message) {
  return {{"type", "error"}, {"error", {{"type", type}, {"message", message}}}};
}

std::unique_ptr<ProxyServer> ProxyServer::start(const ProxyConfig &config) {
  if (auto error = config.validate()) {
    throw std::invalid_argument("Invalid proxy config: " + *error);
  }

  std::unique_ptr<ProxyServer> server(new ProxyServer(config));
  server->http_server_.listen(server->config_.listen_host, server->config_.listen_port);

  server->io_thread_ = std::thread([srv = server.get()] {
    // Handlers guard their own work; keep serving if one escapes anyway
    while (true) {
      try {
        srv->io_ctx_.run();
        break;
      } catch (const std::exception &e) {
        spdlog::error("Unhandled exception on proxy io thread: {}", e.what());
      }
    }
  });

  spdlog::info("Proxy listening on {} -> {}", server->base_url(), server->upstream_url_);
  return server;
}

ProxyServer::ProxyServer(ProxyConfig config)
    : config_(std::move(config)),
      upstream_url_(completions_url(config_.target_base_url)),
      work_guard_(asio::make_work_guard(io_ctx_)),
      http_client_(io_ctx_),
      http_server_(io_ctx_, [this](const net::HttpRequest &request, std::shared_ptr<net::HttpSession> session) {
        handle(request, std::move(session));
      }) {
}

ProxyServer::~ProxyServer() {
  stop();
}

std::string ProxyServer::base_url() const {
  return "http://" + config_.listen_host + ":" + std::to_string(port());
}

void ProxyServer::stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  work_guard_.reset();
  io_ctx_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  // The io thread is gone, so the acceptor can be closed from here
  http_server_.close();
  spdlog::info("Proxy on port {} stopped", port());
}

void ProxyServer::handle(const net::HttpRequest &request, std::shared_ptr<net::HttpSession> session) {
  spdlog::info("{} {} from {}", request.method, request.target, session->remote());

  try {
    if (request.method == "GET" && request.path == "/") {
      send_json(session, 200, {{"status", "ok"}});
      return;
    }

    if (request.method == "POST" && request.path == "/v1/messages") {
      handle_messages(request, session);
      return;
    }

    send_error(session, 404, "not_found_error", "Not found: " + request.method + " " + request.target);
  } catch (const std::exception &e) {
    spdlog::error("Request {} {} failed: {}", request.method, request.target, e.what());
    if (session->is_open()) {
      send_error(session, 500, "api_error", e.what());
    }
  }
}

void ProxyServer::handle_messages(const net::HttpRequest &request, const std::shared_ptr<net::HttpSession> &session) {
  json body = json::parse(request.body, nullptr, false);
  if (body.is_discarded()) {
    send_error(session, 400, "invalid_request_error", "Invalid JSON body");
    return;
  }

  anthropic::Request caller_request;
  try {
    caller_request = anthropic::Request::from_json(body);
  } catch (const json::exception &e) {
    send_error(session, 400, "invalid_request_error", std::string("Invalid request: ") + e.what());
    return;
  } catch (const std::invalid_argument &e) {
    send_error(session, 400, "invalid_request_error", std::string("Invalid request: ") + e.what());
    return;
  }

  spdlog::info("model={}, stream={}, messages={}", caller_request.model, caller_request.stream, caller_request.messages.size());

  std::string mapped = config_.map_model(caller_request.model);
  if (mapped != caller_request.model) {
    spdlog::debug("Model {} mapped to {}", caller_request.model, mapped);
    caller_request.model = mapped;
  }

  openai::Request provider_request = translate::to_provider_format(caller_request);
  std::string payload = dump_json(provider_request.to_json());

  spdlog::info("Forwarding to {} (stream={})", upstream_url_, caller_request.stream);
  spdlog::debug("Provider request body: {}", payload);

  if (caller_request.stream) {
    forward_stream(caller_request, payload, session);
  } else {
    forward(caller_request, payload, session);
  }
}

net::HttpOptions ProxyServer::upstream_options(const std::string &payload, bool stream) const {
  net::HttpOptions options;
  options.method = "POST";
  options.body = payload;
  options.headers["Content-Type"] = "application/json";
  options.headers["Authorization"] = "Bearer " + config_.target_api_key;
  if (stream) {
    options.headers["Accept"] = "text/event-stream";
  }
  options.timeout = stream ? config_.stream_timeout : config_.request_timeout;
  return options;
}

void ProxyServer::forward(const anthropic::Request &request, const std::string &payload, std::shared_ptr<net::HttpSession> session) {
  http_client_.request(upstream_url_, upstream_options(payload, false), [session, model = request.model](net::HttpResponse response) {
    try {
      if (response.status_code == 0) {
        spdlog::warn("Provider request failed: {}", response.error);
        send_error(session, 502, "api_error", "Failed to reach provider: " + response.error);
        return;
      }

      spdlog::info("Provider responded: {}", response.status_code);

      if (!response.ok()) {
        spdlog::error("Provider error {}: {}", response.status_code, response.body);
        send_error(session, response.status_code, "api_error",
                   "Provider returned " + std::to_string(response.status_code) + ": " + response.body);
        return;
      }

      if (!response.error.empty()) {
        spdlog::warn("Provider response incomplete: {}", response.error);
        send_error(session, 502, "api_error", "Failed to reach provider: " + response.error);
        return;
      }

      spdlog::debug("Provider response body: {}", response.body);

      json body = json::parse(response.body, nullptr, false);
      if (body.is_discarded() || !body.is_object()) {
        send_error(session, 502, "api_error", "Provider returned invalid JSON");
        return;
      }

      auto caller_response = translate::to_caller_response(openai::Response::from_json(body), model);
      send_json(session, 200, caller_response.to_json());
    } catch (const std::exception &e) {
      spdlog::error("Failed to translate provider response: {}", e.what());
      if (session->is_open()) {
        send_error(session, 500, "api_error", e.what());
      }
    }
  });
}

void ProxyServer::forward_stream(const anthropic::Request &request, const std::string &payload, std::shared_ptr<net::HttpSession> session) {
  auto ctx = std::make_shared<StreamContext>(request.model);

  http_client_.request_stream(
      upstream_url_, upstream_options(payload, true),
      [ctx, session](const std::string &data) {
        begin_event_stream(*ctx, *session);

        ctx->reader.feed(data);
        while (auto line = ctx->reader.next_line()) {
          process_line(*ctx, *session, *line);
        }
      },
      [ctx, session](int status_code, const std::string &error) {
        if (!ctx->started) {
          if (status_code == 0) {
            spdlog::warn("Provider stream request failed: {}", error);
            send_error(session, 502, "api_error", "Failed to reach provider: " + error);
            return;
          }

          spdlog::info("Provider responded: {}", status_code);
          if (status_code < 200 || status_code >= 300) {
            spdlog::error("Provider error {}: {}", status_code, error);
            send_error(session, status_code, "api_error", "Provider returned " + std::to_string(status_code) + ": " + error);
            return;
          }

          // 2xx with an empty body
          begin_event_stream(*ctx, *session);
        } else if (!error.empty()) {
          spdlog::warn("Provider stream ended early: {}", error);
        }

        // A final line without a terminator still counts
        if (auto rest = ctx->reader.take_remainder()) {
          process_line(*ctx, *session, *rest);
        }
        emit(*ctx, *session, ctx->transformer.finish());

        spdlog::info("Stream complete: {} provider chunks -> {} events", ctx->chunk_count, ctx->event_count);
        session->end();
      });
}

}  // namespace relay::proxy
