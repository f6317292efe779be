#pragma once

#include <array>
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "net/http_client.hpp"

namespace relay::net {

// Inbound HTTP request
struct HttpRequest {
  std::string method;
  std::string target;  // as received, path plus query
  std::string path;
  std::string query;   // without the leading '?'
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;

  std::string header(const std::string &name) const;
};

// One accepted connection: reads a single request, then carries its response.
// All response methods must be called on the io_context thread.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Handler = std::function<void(const HttpRequest &, std::shared_ptr<HttpSession>)>;

  HttpSession(asio::ip::tcp::socket socket, Handler handler);

  void start();

  // Complete response with Content-Length, then close the connection
  void send(int status, const std::string &content_type, const std::string &body);

  // Status line and headers of a close-delimited response; body follows through write()
  void begin_stream(int status, const std::map<std::string, std::string> &headers);

  // Queue body bytes; writes go out in order, one at a time
  void write(std::string data);

  // Close after every queued write has been flushed
  void end();

  // False once the peer has gone away or the response has ended
  bool is_open() const {
    return !closed_ && !ending_;
  }

  const std::string &remote() const {
    return remote_;
  }

 private:
  void read_head();
  void read_body(size_t remaining);
  void read_chunked_body();
  void dispatch();
  void reject(int status, const std::string &message);

  void do_write();
  void shutdown();

  asio::ip::tcp::socket socket_;
  Handler handler_;
  std::string remote_;

  asio::streambuf head_buffer_;
  std::array<char, 8192> read_buffer_{};
  ChunkedDecoder body_decoder_;
  HttpRequest request_;
  asio::steady_timer read_timer_;

  std::deque<std::string> write_queue_;
  bool writing_ = false;
  bool ending_ = false;
  bool closed_ = false;
};

// Minimal HTTP/1.1 server: one request per connection, handlers run on the io_context thread
class HttpServer {
 public:
  HttpServer(asio::io_context &io_ctx, HttpSession::Handler handler);

  ~HttpServer();

  // Bind and start accepting; throws std::system_error if the address cannot be bound
  void listen(const std::string &host, uint16_t port);

  // Actual bound port (useful with port 0)
  uint16_t port() const {
    return port_;
  }

  // Stop accepting new connections
  void close();

 private:
  void do_accept();

  asio::io_context &io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer accept_retry_timer_;  // backoff after a failed accept (e.g. EMFILE)
  HttpSession::Handler handler_;
  uint16_t port_ = 0;
};

// "OK", "Not Found", ... for a status code
const char *status_reason(int status);

}  // namespace relay::net
