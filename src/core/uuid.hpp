#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace relay {

// Random identifiers for synthesized messages and tool calls
class UUID {
 public:
  static std::string short_id(size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      result += charset[dist(gen)];
    }
    return result;
  }

  // Message id for responses the gateway synthesizes, e.g. "msg_proxy_k3j9..."
  static std::string message_id() {
    return "msg_proxy_" + short_id(24);
  }
};

}  // namespace relay
