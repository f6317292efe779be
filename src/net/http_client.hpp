#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace relay::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;
  std::string error;  // transport failure; empty when a complete response was read

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Streaming data callback, invoked with decoded body bytes of a 2xx response
using StreamDataCallback = std::function<void(const std::string &chunk)>;

// Final callback of a streaming request.
// status_code is 0 on transport failure or timeout. For a non-2xx status the
// response body is delivered here as `error` instead of through on_data.
using StreamCompleteCallback = std::function<void(int status_code, const std::string &error)>;

// Async HTTP/1.1 client using ASIO (plain and TLS, one connection per request)
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient();

  // Async request with callback
  void request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback);

  // Async request returning future. Do not wait on it from the io_context thread.
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options);

  // Streaming request - calls on_data for each decoded piece of the body as it arrives
  void request_stream(const std::string &url, const HttpOptions &options, StreamDataCallback on_data, StreamCompleteCallback on_complete);

  // Convenience methods
  std::future<HttpResponse> get(const std::string &url, const std::map<std::string, std::string> &headers = {});

  std::future<HttpResponse> post(const std::string &url, const std::string &body, const std::map<std::string, std::string> &headers = {});

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// Incremental decoder for "Transfer-Encoding: chunked" bodies.
// Input may be split anywhere, including inside a size line or CRLF.
class ChunkedDecoder {
 public:
  // Decode the next slice of the wire body; returns the payload bytes it completes
  std::string feed(const std::string &data);

  // Terminal zero-size chunk and trailers consumed
  bool done() const {
    return state_ == State::Done;
  }

  bool failed() const {
    return state_ == State::Failed;
  }

 private:
  enum class State {
    Size,
    Data,
    DataEnd,
    Trailer,
    Done,
    Failed
  };

  // Collect bytes up to '\n' into line_; false if the line is still incomplete
  bool take_line(const std::string &data, size_t &pos);

  State state_ = State::Size;
  std::string line_;
  size_t remaining_ = 0;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  // Request target: path plus query
  std::string target() const {
    return path + query;
  }

  static std::optional<ParsedUrl> parse(const std::string &url);
};

}  // namespace relay::net
