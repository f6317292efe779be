#include "net/http_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace relay::net {

namespace {

constexpr size_t kMaxHeadBytes = 64 * 1024;
constexpr size_t kMaxBodyBytes = 32 * 1024 * 1024;
constexpr std::chrono::seconds kReadTimeout{30};
constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

std::string trim(const std::string &str) {
  auto begin = str.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(begin, end - begin + 1);
}

// Parse request line and headers; false on a malformed request line
bool parse_request_head(const std::string &head, HttpRequest &request) {
  std::istringstream stream(head);
  std::string request_line;
  std::getline(stream, request_line);
  if (!request_line.empty() && request_line.back() == '\r') {
    request_line.pop_back();
  }

  std::istringstream line(request_line);
  std::string version;
  if (!(line >> request.method >> request.target >> version) || !version.starts_with("HTTP/")) {
    return false;
  }

  auto qmark = request.target.find('?');
  request.path = request.target.substr(0, qmark);
  request.query = qmark == std::string::npos ? "" : request.target.substr(qmark + 1);

  std::string header_line;
  while (std::getline(stream, header_line) && header_line != "\r" && !header_line.empty()) {
    auto colon = header_line.find(':');
    if (colon != std::string::npos) {
      request.headers[to_lower(header_line.substr(0, colon))] = trim(header_line.substr(colon + 1));
    }
  }
  return true;
}

}  // namespace

std::string HttpRequest::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  return it != headers.end() ? it->second : "";
}

const char *status_reason(int status) {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 429: return "Too Many Requests";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "Unknown";
  }
}

// HttpSession

HttpSession::HttpSession(asio::ip::tcp::socket socket, Handler handler)
    : socket_(std::move(socket)), handler_(std::move(handler)), head_buffer_(kMaxHeadBytes), read_timer_(socket_.get_executor()) {
  asio::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  remote_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

void HttpSession::start() {
  // Bound the time a client may take to deliver its request
  read_timer_.expires_after(kReadTimeout);
  read_timer_.async_wait([weak = weak_from_this()](const asio::error_code &ec) {
    if (ec) return;
    if (auto self = weak.lock()) {
      spdlog::warn("Closing {}: request not received within {}s", self->remote_, kReadTimeout.count());
      self->shutdown();
    }
  });

  read_head();
}

void HttpSession::read_head() {
  asio::async_read_until(socket_, head_buffer_, "\r\n\r\n", [self = shared_from_this()](const asio::error_code &ec, size_t head_bytes) {
    if (ec == asio::error::not_found) {
      self->reject(431, "Request header too large");
      return;
    }
    if (ec) {
      if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
        spdlog::debug("Read request from {} failed: {}", self->remote_, ec.message());
      }
      self->shutdown();
      return;
    }

    std::string head(asio::buffers_begin(self->head_buffer_.data()), asio::buffers_begin(self->head_buffer_.data()) + head_bytes);
    self->head_buffer_.consume(head_bytes);

    if (!parse_request_head(head, self->request_)) {
      self->reject(400, "Malformed request line");
      return;
    }

    // Bytes already read past the head belong to the body
    std::string leftover(asio::buffers_begin(self->head_buffer_.data()), asio::buffers_end(self->head_buffer_.data()));
    self->head_buffer_.consume(self->head_buffer_.size());

    if (to_lower(self->request_.header("transfer-encoding")).find("chunked") != std::string::npos) {
      self->request_.body = self->body_decoder_.feed(leftover);
      if (self->body_decoder_.failed()) {
        self->reject(400, "Invalid chunked body");
      } else if (self->body_decoder_.done()) {
        self->dispatch();
      } else {
        self->read_chunked_body();
      }
      return;
    }

    size_t content_length = 0;
    std::string length_header = self->request_.header("content-length");
    if (!length_header.empty()) {
      try {
        content_length = std::stoull(length_header);
      } catch (const std::exception &) {
        self->reject(400, "Invalid Content-Length");
        return;
      }
    }
    if (content_length > kMaxBodyBytes) {
      self->reject(413, "Request body too large");
      return;
    }

    leftover.resize(std::min(leftover.size(), content_length));
    self->request_.body = std::move(leftover);
    self->read_body(content_length - self->request_.body.size());
  });
}

void HttpSession::read_body(size_t remaining) {
  if (remaining == 0) {
    dispatch();
    return;
  }

  size_t offset = request_.body.size();
  request_.body.resize(offset + remaining);
  asio::async_read(socket_, asio::buffer(&request_.body[offset], remaining), [self = shared_from_this()](const asio::error_code &ec, size_t) {
    if (ec) {
      spdlog::debug("Read request body from {} failed: {}", self->remote_, ec.message());
      self->shutdown();
      return;
    }
    self->dispatch();
  });
}

void HttpSession::read_chunked_body() {
  socket_.async_read_some(asio::buffer(read_buffer_), [self = shared_from_this()](const asio::error_code &ec, size_t n) {
    if (ec) {
      spdlog::debug("Read chunked body from {} failed: {}", self->remote_, ec.message());
      self->shutdown();
      return;
    }

    self->request_.body += self->body_decoder_.feed(std::string(self->read_buffer_.data(), n));
    if (self->body_decoder_.failed()) {
      self->reject(400, "Invalid chunked body");
    } else if (self->request_.body.size() > kMaxBodyBytes) {
      self->reject(413, "Request body too large");
    } else if (self->body_decoder_.done()) {
      self->dispatch();
    } else {
      self->read_chunked_body();
    }
  });
}

void HttpSession::dispatch() {
  read_timer_.cancel();

  try {
    handler_(request_, shared_from_this());
  } catch (const std::exception &e) {
    spdlog::error("Unhandled error for {} {}: {}", request_.method, request_.target, e.what());
    if (is_open() && !writing_ && write_queue_.empty()) {
      send(500, "text/plain", "Internal Server Error");
    } else {
      end();
    }
  }
}

void HttpSession::reject(int status, const std::string &message) {
  read_timer_.cancel();
  spdlog::warn("Rejecting request from {}: {} {}", remote_, status, message);
  send(status, "text/plain", message);
}

void HttpSession::send(int status, const std::string &content_type, const std::string &body) {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n";
  out << "Content-Type: " << content_type << "\r\n";
  out << "Content-Length: " << body.size() << "\r\n";
  out << "Connection: close\r\n";
  out << "\r\n";
  out << body;

  write(out.str());
  end();
}

void HttpSession::begin_stream(int status, const std::map<std::string, std::string> &headers) {
  std::ostringstream out;
  out << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n";
  for (const auto &[key, value] : headers) {
    out << key << ": " << value << "\r\n";
  }
  out << "Connection: close\r\n";
  out << "\r\n";

  write(out.str());
}

void HttpSession::write(std::string data) {
  if (!is_open() || data.empty()) {
    return;
  }

  write_queue_.push_back(std::move(data));
  if (!writing_) {
    do_write();
  }
}

void HttpSession::end() {
  if (closed_ || ending_) {
    return;
  }

  ending_ = true;
  if (!writing_) {
    shutdown();
  }
}

void HttpSession::do_write() {
  writing_ = true;
  asio::async_write(socket_, asio::buffer(write_queue_.front()), [self = shared_from_this()](const asio::error_code &ec, size_t) {
    if (ec) {
      // Peer went away; drop whatever is still queued
      spdlog::debug("Write to {} failed: {}", self->remote_, ec.message());
      self->write_queue_.clear();
      self->writing_ = false;
      self->shutdown();
      return;
    }

    self->write_queue_.pop_front();
    if (!self->write_queue_.empty()) {
      self->do_write();
      return;
    }

    self->writing_ = false;
    if (self->ending_) {
      self->shutdown();
    }
  });
}

void HttpSession::shutdown() {
  if (closed_) {
    return;
  }
  closed_ = true;
  read_timer_.cancel();

  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

// HttpServer

HttpServer::HttpServer(asio::io_context &io_ctx, HttpSession::Handler handler)
    : io_ctx_(io_ctx), acceptor_(io_ctx), accept_retry_timer_(io_ctx), handler_(std::move(handler)) {
}

HttpServer::~HttpServer() {
  close();
}

void HttpServer::listen(const std::string &host, uint16_t port) {
  asio::ip::tcp::endpoint endpoint(asio::ip::make_address(host), port);

  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(asio::socket_base::max_listen_connections);

  port_ = acceptor_.local_endpoint().port();
  spdlog::debug("HTTP server listening on {}:{}", host, port_);

  do_accept();
}

void HttpServer::close() {
  accept_retry_timer_.cancel();
  if (!acceptor_.is_open()) {
    return;
  }
  asio::error_code ignored;
  acceptor_.close(ignored);
}

void HttpServer::do_accept() {
  acceptor_.async_accept([this](const asio::error_code &ec, asio::ip::tcp::socket socket) {
    if (!ec) {
      std::make_shared<HttpSession>(std::move(socket), handler_)->start();
      do_accept();
      return;
    }

    if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
      return;
    }

    // The pending connection stays queued, so retrying at once would spin
    spdlog::warn("Accept failed: {}, retrying in {}ms", ec.message(), kAcceptRetryDelay.count());
    accept_retry_timer_.expires_after(kAcceptRetryDelay);
    accept_retry_timer_.async_wait([this](const asio::error_code &wait_ec) {
      if (wait_ec || !acceptor_.is_open()) {
        return;
      }
      do_accept();
    });
  });
}

}  // namespace relay::net
