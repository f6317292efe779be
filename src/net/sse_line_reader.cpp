#include "net/sse_line_reader.hpp"

namespace relay::net {

void SseLineReader::feed(const std::string &data) {
  // Compact once the consumed prefix dominates the buffer
  if (pos_ > 0 && pos_ * 2 >= buffer_.size()) {
    buffer_.erase(0, pos_);
    pos_ = 0;
  }
  buffer_ += data;
}

std::optional<std::string> SseLineReader::next_line() {
  auto eol = buffer_.find('\n', pos_);
  if (eol == std::string::npos) {
    return std::nullopt;
  }

  size_t end = eol;
  if (end > pos_ && buffer_[end - 1] == '\r') {
    --end;
  }
  std::string line = buffer_.substr(pos_, end - pos_);
  pos_ = eol + 1;
  return line;
}

std::optional<std::string> SseLineReader::take_remainder() {
  if (pos_ >= buffer_.size()) {
    buffer_.clear();
    pos_ = 0;
    return std::nullopt;
  }

  std::string rest = buffer_.substr(pos_);
  buffer_.clear();
  pos_ = 0;
  if (!rest.empty() && rest.back() == '\r') {
    rest.pop_back();
  }
  return rest;
}

}  // namespace relay::net
