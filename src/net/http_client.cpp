#include "net/http_client.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <type_traits>

#include "core/version.hpp"

namespace relay::net {

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  // Simple regex-based URL parser
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

// Chunked transfer decoding
bool ChunkedDecoder::take_line(const std::string &data, size_t &pos) {
  auto eol = data.find('\n', pos);
  if (eol == std::string::npos) {
    line_.append(data, pos, std::string::npos);
    pos = data.size();
    return false;
  }
  line_.append(data, pos, eol - pos);
  pos = eol + 1;
  if (!line_.empty() && line_.back() == '\r') {
    line_.pop_back();
  }
  return true;
}

std::string ChunkedDecoder::feed(const std::string &data) {
  std::string out;
  size_t pos = 0;

  while (pos < data.size() && state_ != State::Done && state_ != State::Failed) {
    switch (state_) {
      case State::Size: {
        if (!take_line(data, pos)) break;

        // "<hex>[;extensions]"
        std::string hex = line_.substr(0, line_.find(';'));
        hex.erase(hex.find_last_not_of(" \t") + 1);
        line_.clear();

        size_t size = 0;
        auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), size, 16);
        if (hex.empty() || ec != std::errc() || ptr != hex.data() + hex.size()) {
          state_ = State::Failed;
          break;
        }
        if (size == 0) {
          state_ = State::Trailer;
        } else {
          remaining_ = size;
          state_ = State::Data;
        }
        break;
      }
      case State::Data: {
        size_t n = std::min(remaining_, data.size() - pos);
        out.append(data, pos, n);
        pos += n;
        remaining_ -= n;
        if (remaining_ == 0) {
          state_ = State::DataEnd;
        }
        break;
      }
      case State::DataEnd: {
        if (!take_line(data, pos)) break;
        state_ = line_.empty() ? State::Size : State::Failed;
        line_.clear();
        break;
      }
      case State::Trailer: {
        if (!take_line(data, pos)) break;
        // Trailer section ends with an empty line
        if (line_.empty()) {
          state_ = State::Done;
        }
        line_.clear();
        break;
      }
      case State::Done:
      case State::Failed:
        break;
    }
  }
  return out;
}

namespace {

using SslSocket = asio::ssl::stream<asio::ip::tcp::socket>;

// State of one request/response exchange, shared by its async handlers
struct Exchange {
  std::string request;
  asio::streambuf buffer;
  HttpResponse response;

  bool chunked = false;
  std::optional<size_t> content_length;
  size_t received = 0;  // body bytes on the wire
  ChunkedDecoder decoder;

  StreamDataCallback on_data;  // empty for buffered requests
  std::function<void(HttpResponse)> on_done;
  bool done = false;

  std::shared_ptr<asio::steady_timer> timer;
  std::shared_ptr<bool> timed_out = std::make_shared<bool>(false);
};

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

std::string build_request(const ParsedUrl &url, const HttpOptions &options) {
  std::ostringstream req;
  req << options.method << " " << url.target() << " HTTP/1.1\r\n";
  req << "Host: " << url.host;
  if (!url.port.empty()) {
    req << ":" << url.port;
  }
  req << "\r\n";
  req << "User-Agent: relay/" << RELAY_VERSION_STRING << "\r\n";
  req << "Connection: close\r\n";

  for (const auto &[key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method != "GET") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

// Parse status line and headers; false if the status line is not HTTP
bool parse_head(const std::string &head, HttpResponse &response) {
  std::istringstream stream(head);
  std::string status_line;
  std::getline(stream, status_line);

  std::regex status_regex(R"(^HTTP/[\d.]+ (\d{3}))");
  std::smatch match;
  if (!std::regex_search(status_line, match, status_regex)) {
    return false;
  }
  response.status_code = std::stoi(match[1].str());

  std::string header_line;
  while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
    auto colon = header_line.find(':');
    if (colon != std::string::npos) {
      std::string key = to_lower(header_line.substr(0, colon));
      std::string value = header_line.substr(colon + 1);
      // Trim whitespace
      value.erase(0, value.find_first_not_of(" \t"));
      value.erase(value.find_last_not_of(" \t\r\n") + 1);
      response.headers[key] = value;
    }
  }
  return true;
}

std::string drain(asio::streambuf &buffer) {
  std::string data(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
  buffer.consume(buffer.size());
  return data;
}

void finish(const std::shared_ptr<Exchange> &ex, const std::string &error) {
  if (ex->done) return;
  ex->done = true;

  if (ex->timer) {
    ex->timer->cancel();
  }

  HttpResponse response = std::move(ex->response);
  if (*ex->timed_out) {
    response.error = "Request timed out";
    response.status_code = 0;
  } else if (!error.empty()) {
    response.error = error;
  }

  auto on_done = std::move(ex->on_done);
  on_done(std::move(response));
}

// Hand decoded body bytes to the stream callback (2xx) or collect them
void deliver(const std::shared_ptr<Exchange> &ex, const std::string &wire) {
  ex->received += wire.size();
  std::string data = ex->chunked ? ex->decoder.feed(wire) : wire;
  if (data.empty()) return;

  if (ex->on_data && ex->response.ok()) {
    ex->on_data(data);
  } else {
    ex->response.body += data;
  }
}

bool body_complete(const Exchange &ex) {
  int status = ex.response.status_code;
  if (status == 204 || status == 304 || (status >= 100 && status < 200)) {
    return true;
  }
  if (ex.chunked) {
    return ex.decoder.done();
  }
  return ex.content_length && ex.received >= *ex.content_length;
}

// Helper: close the lowest-layer socket, ignoring errors
template <typename Socket>
void close_socket(std::shared_ptr<Socket> socket) {
  asio::error_code ignored;
  socket->lowest_layer().close(ignored);
}

// Start a timeout timer. When it fires, set the timed_out flag and close the socket.
template <typename Socket>
std::shared_ptr<asio::steady_timer> start_timeout(asio::io_context &io_ctx, std::chrono::seconds timeout, std::shared_ptr<Socket> socket,
                                                  std::shared_ptr<bool> timed_out) {
  auto timer = std::make_shared<asio::steady_timer>(io_ctx);
  timer->expires_after(timeout);
  timer->async_wait([socket, timed_out, timer](const asio::error_code &ec) {
    if (!ec) {
      // Timer fired (not cancelled), mark as timed out and close socket
      *timed_out = true;
      close_socket(socket);
    }
  });
  return timer;
}

template <typename Socket>
void read_body(std::shared_ptr<Socket> socket, std::shared_ptr<Exchange> ex) {
  asio::async_read(*socket, ex->buffer, asio::transfer_at_least(1), [socket, ex](const asio::error_code &ec, size_t) {
    // SSL connections may return various errors on close
    // Treat any SSL category error as potential EOF
    bool is_eof = (ec == asio::error::eof) || (ec.category() == asio::error::get_ssl_category()) || ec == asio::ssl::error::stream_truncated;

    if (ex->buffer.size() > 0) {
      deliver(ex, drain(ex->buffer));
    }

    if (ex->decoder.failed()) {
      finish(ex, "Invalid chunked encoding");
      close_socket(socket);
      return;
    }
    if (body_complete(*ex)) {
      finish(ex, "");
      close_socket(socket);
      return;
    }
    if (ec && !is_eof) {
      finish(ex, "Read failed: " + ec.message());
      return;
    }
    if (is_eof) {
      // Without framing the body is delimited by connection close
      bool framed = ex->chunked || ex->content_length;
      finish(ex, framed ? "Connection closed before end of body" : "");
      return;
    }

    read_body(socket, ex);
  });
}

template <typename Socket>
void read_headers(std::shared_ptr<Socket> socket, std::shared_ptr<Exchange> ex) {
  asio::async_read_until(*socket, ex->buffer, "\r\n\r\n", [socket, ex](const asio::error_code &ec, size_t header_bytes) {
    if (ec) {
      finish(ex, "Read headers failed: " + ec.message());
      return;
    }

    std::string head(asio::buffers_begin(ex->buffer.data()), asio::buffers_begin(ex->buffer.data()) + header_bytes);
    ex->buffer.consume(header_bytes);

    if (!parse_head(head, ex->response)) {
      finish(ex, "Invalid HTTP response: cannot parse status line");
      return;
    }

    const auto &headers = ex->response.headers;
    if (auto it = headers.find("transfer-encoding"); it != headers.end()) {
      ex->chunked = to_lower(it->second).find("chunked") != std::string::npos;
    }
    if (auto it = headers.find("content-length"); it != headers.end() && !ex->chunked) {
      try {
        ex->content_length = std::stoull(it->second);
      } catch (const std::exception &) {
        // Invalid Content-Length, read until close
      }
    }

    spdlog::debug("HTTP {} (chunked={}, content-length={})", ex->response.status_code, ex->chunked,
                  ex->content_length ? std::to_string(*ex->content_length) : "none");

    // Body bytes that arrived together with the headers
    if (ex->buffer.size() > 0) {
      deliver(ex, drain(ex->buffer));
    }

    if (ex->decoder.failed()) {
      finish(ex, "Invalid chunked encoding");
      close_socket(socket);
      return;
    }
    if (body_complete(*ex)) {
      finish(ex, "");
      close_socket(socket);
      return;
    }

    read_body(socket, ex);
  });
}

template <typename Socket>
void send_request(std::shared_ptr<Socket> socket, std::shared_ptr<Exchange> ex) {
  asio::async_write(*socket, asio::buffer(ex->request), [socket, ex](const asio::error_code &ec, size_t) {
    if (ec) {
      finish(ex, "Write failed: " + ec.message());
      return;
    }

    read_headers(socket, ex);
  });
}

}  // namespace

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context &io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      callback(HttpResponse{0, {}, "", "Invalid URL"});
      return;
    }

    auto ex = std::make_shared<Exchange>();
    ex->request = build_request(*parsed, options);
    ex->on_done = std::move(callback);
    start(*parsed, options, ex);
  }

  void request_stream(const std::string &url, const HttpOptions &options, StreamDataCallback on_data, StreamCompleteCallback on_complete) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      on_complete(0, "Invalid URL");
      return;
    }

    auto ex = std::make_shared<Exchange>();
    ex->request = build_request(*parsed, options);
    ex->on_data = std::move(on_data);
    ex->on_done = [on_complete = std::move(on_complete)](HttpResponse response) {
      if (!response.error.empty()) {
        on_complete(response.status_code, response.error);
      } else if (!response.ok()) {
        on_complete(response.status_code, response.body);
      } else {
        on_complete(response.status_code, "");
      }
    };
    start(*parsed, options, ex);
  }

 private:
  void start(const ParsedUrl &url, const HttpOptions &options, std::shared_ptr<Exchange> ex) {
    if (url.is_https()) {
      auto socket = std::make_shared<SslSocket>(io_ctx_, ssl_ctx_);

      // Set SNI hostname and verify the certificate against it
      SSL_set_tlsext_host_name(socket->native_handle(), url.host.c_str());
      SSL_set1_host(socket->native_handle(), url.host.c_str());

      ex->timer = start_timeout(io_ctx_, options.timeout, socket, ex->timed_out);
      connect(socket, url, ex);
    } else {
      auto socket = std::make_shared<asio::ip::tcp::socket>(io_ctx_);
      ex->timer = start_timeout(io_ctx_, options.timeout, socket, ex->timed_out);
      connect(socket, url, ex);
    }
  }

  // Resolve and connect. Each request owns its resolver so concurrent requests never share one.
  template <typename Socket>
  void connect(std::shared_ptr<Socket> socket, const ParsedUrl &url, std::shared_ptr<Exchange> ex) {
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);
    resolver->async_resolve(url.host, url.port_or_default(),
                            [socket, resolver, ex](const asio::error_code &ec, asio::ip::tcp::resolver::results_type results) {
                              if (ec) {
                                finish(ex, "DNS resolution failed: " + ec.message());
                                return;
                              }
                              if (*ex->timed_out) {
                                finish(ex, "");
                                return;
                              }

                              asio::async_connect(socket->lowest_layer(), results, [socket, ex](const asio::error_code &ec, const asio::ip::tcp::endpoint &) {
                                if (ec) {
                                  finish(ex, "Connection failed: " + ec.message());
                                  return;
                                }

                                if constexpr (std::is_same_v<Socket, SslSocket>) {
                                  socket->async_handshake(asio::ssl::stream_base::client, [socket, ex](const asio::error_code &ec) {
                                    if (ec) {
                                      finish(ex, "SSL handshake failed: " + ec.message());
                                      return;
                                    }
                                    send_request(socket, ex);
                                  });
                                } else {
                                  send_request(socket, ex);
                                }
                              });
                            });
  }

  asio::io_context &io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context &io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string &url, const HttpOptions &options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

void HttpClient::request_stream(const std::string &url, const HttpOptions &options, StreamDataCallback on_data, StreamCompleteCallback on_complete) {
  impl_->request_stream(url, options, std::move(on_data), std::move(on_complete));
}

std::future<HttpResponse> HttpClient::get(const std::string &url, const std::map<std::string, std::string> &headers) {
  HttpOptions options;
  options.method = "GET";
  options.headers = headers;
  return request(url, options);
}

std::future<HttpResponse> HttpClient::post(const std::string &url, const std::string &body, const std::map<std::string, std::string> &headers) {
  HttpOptions options;
  options.method = "POST";
  options.body = body;
  options.headers = headers;
  return request(url, options);
}

}  // namespace relay::net
