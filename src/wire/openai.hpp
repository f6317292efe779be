#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

// OpenAI Chat Completions wire types (the subset the gateway reads or writes).
// Unknown fields are ignored when parsing.
namespace relay::openai {

struct TextPart {
  std::string text;
};

struct ImageUrlPart {
  std::string url;  // usually a data: URI
  std::optional<std::string> detail;
};

using ContentPart = std::variant<TextPart, ImageUrlPart>;

using MessageContent = std::variant<std::string, std::vector<ContentPart>>;

struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments;  // JSON-encoded string

  json to_json() const;
  static ToolCall from_json(const json &j);
};

struct Message {
  Role role = Role::User;
  std::optional<MessageContent> content;  // nullopt serializes as null
  std::vector<ToolCall> tool_calls;
  std::optional<std::string> tool_call_id;

  // Text parts joined by '\n' (plain string content returned as-is)
  std::string content_text() const;

  json to_json() const;
  static Message from_json(const json &j);
};

struct ToolDef {
  std::string name;
  std::string description;
  json parameters = json::object();

  json to_json() const;
  static ToolDef from_json(const json &j);
};

// "auto" | "none" | "required" | {"type":"function","function":{"name":...}}
struct ToolChoice {
  std::string mode = "auto";  // "function" selects function_name
  std::string function_name;

  json to_json() const;
  static ToolChoice from_json(const json &j);
};

struct Usage {
  int64_t prompt_tokens = 0;
  int64_t completion_tokens = 0;
  int64_t total_tokens = 0;

  json to_json() const;
  static Usage from_json(const json &j);
};

struct Request {
  std::string model;
  std::vector<Message> messages;
  std::vector<ToolDef> tools;
  std::optional<ToolChoice> tool_choice;
  std::optional<int64_t> max_tokens;
  std::optional<int64_t> max_completion_tokens;
  std::optional<double> temperature;
  std::optional<double> top_p;
  bool stream = false;
  std::optional<bool> include_usage;  // stream_options.include_usage
  std::vector<std::string> stop;
  std::optional<std::string> user;

  json to_json() const;
  static Request from_json(const json &j);
};

struct Choice {
  int index = 0;
  Message message;
  std::optional<std::string> finish_reason;
};

// Non-streaming completion
struct Response {
  std::string id;
  std::string model;
  std::vector<Choice> choices;
  std::optional<Usage> usage;

  json to_json() const;
  static Response from_json(const json &j);
};

struct ToolCallDelta {
  int index = 0;
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> arguments;
};

struct Delta {
  std::optional<std::string> role;
  std::optional<std::string> content;
  std::vector<ToolCallDelta> tool_calls;
};

struct ChunkChoice {
  int index = 0;
  Delta delta;
  std::optional<std::string> finish_reason;
};

// One "data:" line of a streaming completion
struct StreamChunk {
  std::string id;
  std::optional<std::string> model;
  std::vector<ChunkChoice> choices;
  std::optional<Usage> usage;

  json to_json() const;
  static StreamChunk from_json(const json &j);
};

}  // namespace relay::openai
