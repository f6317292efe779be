#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace relay {

using json = nlohmann::json;

// Message role shared by both wire protocols
enum class Role {
  System,
  User,
  Assistant,
  Tool
};

std::string to_string(Role role);

Role role_from_string(const std::string &str);

// Caller-side (Anthropic) terminal reason
enum class StopReason {
  EndTurn,    // Natural completion
  ToolUse,    // Needs tool execution
  MaxTokens   // Token limit reached
};

std::string to_string(StopReason reason);

StopReason stop_reason_from_string(const std::string &str);

// Provider-side (OpenAI) terminal reason
enum class FinishReason {
  Stop,
  ToolCalls,
  Length
};

std::string to_string(FinishReason reason);

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
};

// Serialize without throwing on invalid UTF-8 coming from upstream
std::string dump_json(const json &j);

}  // namespace relay
