#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <sstream>
#include <thread>

#include "net/http_client.hpp"
#include "net/http_server.hpp"
#include "proxy/proxy_server.hpp"

using namespace relay;
using namespace relay::proxy;

TEST(NormalizeBaseUrlTest, Table) {
  EXPECT_EQ(normalize_base_url("https://api.openai.com"), "https://api.openai.com/v1");
  EXPECT_EQ(normalize_base_url("https://api.openai.com/"), "https://api.openai.com/v1");
  EXPECT_EQ(normalize_base_url("https://api.openai.com/v1"), "https://api.openai.com/v1");
  EXPECT_EQ(normalize_base_url("https://api.openai.com/v1/"), "https://api.openai.com/v1");
  EXPECT_EQ(normalize_base_url("https://api.openai.com/v1/chat/completions"), "https://api.openai.com/v1");
  EXPECT_EQ(normalize_base_url("https://open.bigmodel.cn/api/paas/v4"), "https://open.bigmodel.cn/api/paas/v4");
  EXPECT_EQ(normalize_base_url("http://localhost:11434"), "http://localhost:11434/v1");
  EXPECT_EQ(normalize_base_url("http://localhost:8000/openai//"), "http://localhost:8000/openai/v1");

  EXPECT_EQ(completions_url("http://localhost:11434/v1/"), "http://localhost:11434/v1/chat/completions");
}

TEST(ErrorBodyTest, Shape) {
  EXPECT_EQ(error_body("api_error", "boom"), json({{"type", "error"}, {"error", {{"type", "api_error"}, {"message", "boom"}}}}));
}

namespace {

// Canned answer of the stub provider
struct UpstreamReply {
  int status = 200;
  std::string body;
  std::vector<std::string> stream_pieces;  // non-empty: answer as a close-delimited event stream
};

std::vector<std::string> event_types(const std::string &sse) {
  std::vector<std::string> types;
  std::istringstream stream(sse);
  std::string line;
  while (std::getline(stream, line)) {
    if (line.starts_with("event: ")) {
      types.push_back(line.substr(7));
    }
  }
  return types;
}

std::vector<json> event_payloads(const std::string &sse) {
  std::vector<json> payloads;
  std::istringstream stream(sse);
  std::string line;
  while (std::getline(stream, line)) {
    if (line.starts_with("data: ")) {
      payloads.push_back(json::parse(line.substr(6)));
    }
  }
  return payloads;
}

const char *kTextCompletion = R"({
  "id": "chatcmpl-1",
  "model": "gpt-4o",
  "choices": [{"index": 0, "message": {"role": "assistant", "content": "hello"}, "finish_reason": "stop"}],
  "usage": {"prompt_tokens": 1, "completion_tokens": 1, "total_tokens": 2}
})";

}  // namespace

class ProxyServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    upstream_ = std::make_unique<net::HttpServer>(upstream_io_, [this](const net::HttpRequest &request, std::shared_ptr<net::HttpSession> session) {
      UpstreamReply reply;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(request);
        reply = reply_;
      }

      if (reply.stream_pieces.empty()) {
        session->send(reply.status, "application/json", reply.body);
        return;
      }
      session->begin_stream(reply.status, {{"Content-Type", "text/event-stream"}});
      for (const auto &piece : reply.stream_pieces) {
        session->write(piece);
      }
      session->end();
    });
    upstream_->listen("127.0.0.1", 0);
    upstream_thread_ = std::thread([this] { upstream_io_.run(); });

    client_ = std::make_unique<net::HttpClient>(client_io_);
    client_thread_ = std::thread([this] { client_io_.run(); });
  }

  void TearDown() override {
    proxy_.reset();

    upstream_guard_.reset();
    upstream_io_.stop();
    upstream_thread_.join();

    client_guard_.reset();
    client_io_.stop();
    client_thread_.join();
  }

  void start_proxy(const std::string &target_base_url) {
    ProxyConfig config;
    config.target_base_url = target_base_url;
    config.target_api_key = "sk-test";
    config.model_mapping = {{"claude-3-5-sonnet", "gpt-4o"}};
    config.request_timeout = std::chrono::seconds(10);
    config.stream_timeout = std::chrono::seconds(10);
    proxy_ = ProxyServer::start(config);
  }

  void start_proxy() {
    start_proxy("http://127.0.0.1:" + std::to_string(upstream_->port()));
  }

  void set_reply(UpstreamReply reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    reply_ = std::move(reply);
  }

  std::vector<net::HttpRequest> received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  net::HttpResponse post_messages(const json &body) {
    return client_->post(proxy_->base_url() + "/v1/messages", body.dump(), {{"Content-Type", "application/json"}}).get();
  }

  asio::io_context upstream_io_;
  asio::executor_work_guard<asio::io_context::executor_type> upstream_guard_ = asio::make_work_guard(upstream_io_);
  std::unique_ptr<net::HttpServer> upstream_;
  std::thread upstream_thread_;

  asio::io_context client_io_;
  asio::executor_work_guard<asio::io_context::executor_type> client_guard_ = asio::make_work_guard(client_io_);
  std::unique_ptr<net::HttpClient> client_;
  std::thread client_thread_;

  std::unique_ptr<ProxyServer> proxy_;

  std::mutex mutex_;
  UpstreamReply reply_;
  std::vector<net::HttpRequest> received_;
};

TEST_F(ProxyServerTest, HealthCheck) {
  start_proxy();

  auto response = client_->get(proxy_->base_url() + "/").get();

  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(json::parse(response.body), json({{"status", "ok"}}));
  EXPECT_TRUE(received().empty());
}

TEST_F(ProxyServerTest, UnknownRouteIsNotFound) {
  start_proxy();

  auto response = client_->get(proxy_->base_url() + "/v1/models").get();

  EXPECT_EQ(response.status_code, 404);
  json body = json::parse(response.body);
  EXPECT_EQ(body["type"], "error");
  EXPECT_EQ(body["error"]["type"], "not_found_error");
  EXPECT_EQ(body["error"]["message"], "Not found: GET /v1/models");
}

TEST_F(ProxyServerTest, InvalidJsonBody) {
  start_proxy();

  auto response = client_->post(proxy_->base_url() + "/v1/messages", "{nope", {{"Content-Type", "application/json"}}).get();

  EXPECT_EQ(response.status_code, 400);
  json body = json::parse(response.body);
  EXPECT_EQ(body["error"]["type"], "invalid_request_error");
  EXPECT_EQ(body["error"]["message"], "Invalid JSON body");
  EXPECT_TRUE(received().empty());
}

TEST_F(ProxyServerTest, MissingMessagesIsInvalidRequest) {
  start_proxy();

  auto response = post_messages({{"model", "claude-3-5-sonnet"}});

  EXPECT_EQ(response.status_code, 400);
  json body = json::parse(response.body);
  EXPECT_EQ(body["error"]["type"], "invalid_request_error");
  EXPECT_TRUE(body["error"]["message"].get<std::string>().starts_with("Invalid request: "));
}

TEST_F(ProxyServerTest, NonStreamingRoundTrip) {
  set_reply({200, kTextCompletion, {}});
  start_proxy();

  auto response = post_messages(
      {{"model", "claude-3-5-sonnet"}, {"max_tokens", 16}, {"system", "Be brief."}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  ASSERT_EQ(response.status_code, 200);
  EXPECT_EQ(response.headers["content-type"], "application/json");

  json body = json::parse(response.body);
  EXPECT_EQ(body["type"], "message");
  EXPECT_EQ(body["role"], "assistant");
  EXPECT_EQ(body["content"], json::array({{{"type", "text"}, {"text", "hello"}}}));
  EXPECT_EQ(body["stop_reason"], "end_turn");
  EXPECT_EQ(body["usage"]["input_tokens"], 1);
  EXPECT_EQ(body["usage"]["output_tokens"], 1);

  // 上游收到的是翻译后的 Chat Completions 请求
  auto requests = received();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].method, "POST");
  EXPECT_EQ(requests[0].path, "/v1/chat/completions");
  EXPECT_EQ(requests[0].header("authorization"), "Bearer sk-test");

  json upstream_body = json::parse(requests[0].body);
  EXPECT_EQ(upstream_body["model"], "gpt-4o");
  EXPECT_EQ(upstream_body["stream"], false);
  EXPECT_EQ(upstream_body["max_tokens"], 16);
  ASSERT_EQ(upstream_body["messages"].size(), 2u);
  EXPECT_EQ(upstream_body["messages"][0], json({{"role", "system"}, {"content", "Be brief."}}));
  EXPECT_EQ(upstream_body["messages"][1], json({{"role", "user"}, {"content", "hi"}}));
}

TEST_F(ProxyServerTest, QueryStringIsAccepted) {
  set_reply({200, kTextCompletion, {}});
  start_proxy();

  auto response = client_->post(proxy_->base_url() + "/v1/messages?beta=true",
                                json({{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}}).dump(),
                                {{"Content-Type", "application/json"}})
                      .get();

  EXPECT_EQ(response.status_code, 200);
  // 未映射的模型原样转发
  ASSERT_EQ(received().size(), 1u);
  EXPECT_EQ(json::parse(received()[0].body)["model"], "m");
}

TEST_F(ProxyServerTest, StreamingRoundTrip) {
  // Provider events split across writes at awkward places
  set_reply({200,
             "",
             {"data: {\"id\":\"c\",\"model\":\"gpt-4o\",\"choices\":[{\"index\":0,\"delta\":{\"role\":\"assistant\",\"content\":\"Hel\"}}]}\n\nda",
              "ta: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"lo\"},\"finish_reason\":\"stop\"}]}\r\n\r\n",
              ": keep-alive\n\n",
              "data: {\"id\":\"c\",\"choices\":[],\"usage\":{\"prompt_tokens\":3,\"completion_tokens\":2}}\n\n",
              "data: [DONE]\n\n"}});
  start_proxy();

  auto response = post_messages({{"model", "claude-3-5-sonnet"},
                                 {"max_tokens", 16},
                                 {"stream", true},
                                 {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  ASSERT_EQ(response.status_code, 200);
  EXPECT_EQ(response.headers["content-type"], "text/event-stream");
  EXPECT_EQ(response.headers["cache-control"], "no-cache");

  std::vector<std::string> expected = {"message_start",      "content_block_start", "content_block_delta", "content_block_delta",
                                       "content_block_stop", "message_delta",       "message_stop"};
  EXPECT_EQ(event_types(response.body), expected);

  auto payloads = event_payloads(response.body);
  ASSERT_EQ(payloads.size(), expected.size());
  EXPECT_EQ(payloads[0]["message"]["model"], "gpt-4o");
  EXPECT_EQ(payloads[2]["delta"]["text"], "Hel");
  EXPECT_EQ(payloads[3]["delta"]["text"], "lo");
  EXPECT_EQ(payloads[5]["delta"]["stop_reason"], "end_turn");
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(payloads[i]["type"], expected[i]);
  }

  auto requests = received();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].header("accept"), "text/event-stream");
  json upstream_body = json::parse(requests[0].body);
  EXPECT_EQ(upstream_body["stream"], true);
  EXPECT_EQ(upstream_body["stream_options"]["include_usage"], true);
}

TEST_F(ProxyServerTest, StreamingToolCallRoundTrip) {
  auto tool_piece = [](const json &call) {
    json chunk = {{"id", "c"}, {"choices", json::array({{{"index", 0}, {"delta", {{"tool_calls", json::array({call})}}}}})}};
    return "data: " + chunk.dump() + "\n\n";
  };
  json finish = {{"id", "c"}, {"choices", json::array({{{"index", 0}, {"delta", json::object()}, {"finish_reason", "tool_calls"}}})}};

  // Two parallel calls whose argument fragments interleave
  set_reply({200,
             "",
             {tool_piece({{"index", 0}, {"id", "call_w"}, {"type", "function"}, {"function", {{"name", "get_weather"}, {"arguments", "{\"city\":"}}}}),
              tool_piece({{"index", 1}, {"id", "call_t"}, {"type", "function"}, {"function", {{"name", "get_time"}, {"arguments", "{\"tz\":"}}}}),
              tool_piece({{"index", 0}, {"function", {{"arguments", "\"Oslo\"}"}}}}),
              tool_piece({{"index", 1}, {"function", {{"arguments", "\"UTC\"}"}}}}),
              "data: " + finish.dump() + "\n\ndata: [DONE]\n\n"}});
  start_proxy();

  json tool = {{"name", "get_weather"}, {"input_schema", {{"type", "object"}}}};
  auto response = post_messages({{"model", "claude-3-5-sonnet"},
                                 {"stream", true},
                                 {"tools", json::array({tool})},
                                 {"messages", json::array({{{"role", "user"}, {"content", "weather and time?"}}})}});

  ASSERT_EQ(response.status_code, 200);
  EXPECT_EQ(response.headers["content-type"], "text/event-stream");

  std::map<int, json> starts;
  std::map<int, std::string> arguments;
  std::vector<int> stops;
  json message_delta;
  for (const auto &payload : event_payloads(response.body)) {
    std::string type = payload["type"].get<std::string>();
    if (type == "content_block_start") {
      starts[payload["index"].get<int>()] = payload["content_block"];
    } else if (type == "content_block_delta") {
      EXPECT_EQ(payload["delta"]["type"], "input_json_delta");
      arguments[payload["index"].get<int>()] += payload["delta"]["partial_json"].get<std::string>();
    } else if (type == "content_block_stop") {
      stops.push_back(payload["index"].get<int>());
    } else if (type == "message_delta") {
      message_delta = payload;
    }
  }

  ASSERT_EQ(starts.size(), 2u);
  EXPECT_EQ(starts[0], json({{"type", "tool_use"}, {"id", "call_w"}, {"name", "get_weather"}, {"input", json::object()}}));
  EXPECT_EQ(starts[1]["id"], "call_t");
  EXPECT_EQ(starts[1]["name"], "get_time");
  EXPECT_EQ(arguments[0], "{\"city\":\"Oslo\"}");
  EXPECT_EQ(arguments[1], "{\"tz\":\"UTC\"}");
  EXPECT_EQ(stops, (std::vector<int>{0, 1}));
  EXPECT_EQ(message_delta["delta"]["stop_reason"], "tool_use");

  auto types = event_types(response.body);
  ASSERT_FALSE(types.empty());
  EXPECT_EQ(types.front(), "message_start");
  EXPECT_EQ(types.back(), "message_stop");

  // 工具定义被翻译成 function 形式
  auto requests = received();
  ASSERT_EQ(requests.size(), 1u);
  json upstream_body = json::parse(requests[0].body);
  EXPECT_EQ(upstream_body["tools"][0]["type"], "function");
  EXPECT_EQ(upstream_body["tools"][0]["function"]["name"], "get_weather");
}

TEST_F(ProxyServerTest, StreamWithoutFinishReasonIsClosed) {
  set_reply({200, "", {"data: {\"id\":\"c\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"partial\"}}]}"}});
  start_proxy();

  auto response = post_messages({{"model", "m"}, {"stream", true}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  ASSERT_EQ(response.status_code, 200);
  // 最后一行没有换行符也会被处理，随后补齐结束事件
  std::vector<std::string> expected = {"message_start",      "content_block_start", "content_block_delta",
                                       "content_block_stop", "message_delta",       "message_stop"};
  EXPECT_EQ(event_types(response.body), expected);
}

TEST_F(ProxyServerTest, ProviderErrorIsPassedThrough) {
  set_reply({500, "{\"error\":\"boom\"}", {}});
  start_proxy();

  auto response = post_messages({{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  EXPECT_EQ(response.status_code, 500);
  json body = json::parse(response.body);
  EXPECT_EQ(body["type"], "error");
  EXPECT_EQ(body["error"]["type"], "api_error");
  EXPECT_EQ(body["error"]["message"], "Provider returned 500: {\"error\":\"boom\"}");
}

TEST_F(ProxyServerTest, ProviderErrorBeforeStreamIsPassedThrough) {
  set_reply({429, "{\"error\":\"slow down\"}", {}});
  start_proxy();

  auto response = post_messages({{"model", "m"}, {"stream", true}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  EXPECT_EQ(response.status_code, 429);
  json body = json::parse(response.body);
  EXPECT_EQ(body["error"]["type"], "api_error");
  EXPECT_EQ(body["error"]["message"], "Provider returned 429: {\"error\":\"slow down\"}");
}

TEST_F(ProxyServerTest, ProviderInvalidJsonIsBadGateway) {
  set_reply({200, "<html>oops</html>", {}});
  start_proxy();

  auto response = post_messages({{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  EXPECT_EQ(response.status_code, 502);
  EXPECT_EQ(json::parse(response.body)["error"]["message"], "Provider returned invalid JSON");
}

TEST_F(ProxyServerTest, UnreachableProviderIsBadGateway) {
  // Grab a free port, then release it so nothing listens there
  uint16_t closed_port = 0;
  {
    asio::io_context io;
    asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
    closed_port = acceptor.local_endpoint().port();
  }
  start_proxy("http://127.0.0.1:" + std::to_string(closed_port));

  auto response = post_messages({{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  EXPECT_EQ(response.status_code, 502);
  json body = json::parse(response.body);
  EXPECT_EQ(body["error"]["type"], "api_error");
  EXPECT_TRUE(body["error"]["message"].get<std::string>().starts_with("Failed to reach provider: "));

  auto stream_response =
      post_messages({{"model", "m"}, {"stream", true}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});
  EXPECT_EQ(stream_response.status_code, 502);
}

TEST_F(ProxyServerTest, ConcurrentRequestsAreIndependent) {
  set_reply({200, kTextCompletion, {}});
  start_proxy();

  json request = {{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}};
  std::vector<std::future<net::HttpResponse>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(client_->post(proxy_->base_url() + "/v1/messages", request.dump(), {{"Content-Type", "application/json"}}));
  }

  for (auto &future : futures) {
    auto response = future.get();
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(json::parse(response.body)["content"][0]["text"], "hello");
  }
  EXPECT_EQ(received().size(), 8u);
}

TEST_F(ProxyServerTest, StopIsIdempotentAndReleasesPort) {
  start_proxy();
  std::string base_url = proxy_->base_url();

  proxy_->stop();
  proxy_->stop();

  auto response = client_->get(base_url + "/").get();
  EXPECT_EQ(response.status_code, 0);
  EXPECT_FALSE(response.error.empty());
}

TEST_F(ProxyServerTest, InvalidConfigIsRejected) {
  ProxyConfig config;
  EXPECT_THROW(ProxyServer::start(config), std::invalid_argument);

  config.target_base_url = "api.openai.com";
  EXPECT_THROW(ProxyServer::start(config), std::invalid_argument);
}

TEST_F(ProxyServerTest, EphemeralPortIsReported) {
  start_proxy();

  EXPECT_NE(proxy_->port(), 0);
  EXPECT_EQ(proxy_->base_url(), "http://127.0.0.1:" + std::to_string(proxy_->port()));
}
