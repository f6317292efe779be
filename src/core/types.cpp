#include "core/types.hpp"

namespace relay {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "user") return Role::User;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

std::string to_string(StopReason reason) {
  switch (reason) {
    case StopReason::EndTurn:
      return "end_turn";
    case StopReason::ToolUse:
      return "tool_use";
    case StopReason::MaxTokens:
      return "max_tokens";
  }
  return "end_turn";
}

StopReason stop_reason_from_string(const std::string &str) {
  if (str == "tool_use") return StopReason::ToolUse;
  if (str == "max_tokens") return StopReason::MaxTokens;
  return StopReason::EndTurn;
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
  }
  return "stop";
}

std::string dump_json(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace relay
