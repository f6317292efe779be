#pragma once

#include <optional>
#include <string>

namespace relay::net {

// Splits arbitrary byte reads into complete lines.
// A trailing partial line stays buffered until its terminator arrives.
// "\n" and "\r\n" both terminate a line; the terminator is not part of the returned line.
class SseLineReader {
 public:
  void feed(const std::string &data);

  // Next complete line, or nullopt when only a partial line (or nothing) is buffered
  std::optional<std::string> next_line();

  // Hand out the unterminated remainder at end of stream (nullopt if empty)
  std::optional<std::string> take_remainder();

  size_t buffered() const {
    return buffer_.size() - pos_;
  }

 private:
  std::string buffer_;
  size_t pos_ = 0;
};

}  // namespace relay::net
