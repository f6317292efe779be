#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

// Anthropic Messages API wire types (the subset the gateway reads or writes).
// Unknown fields and unknown content block types are ignored when parsing.
namespace relay::anthropic {

struct TextBlock {
  std::string text;
};

// Inline base64 image: {"type":"image","source":{"type":"base64",...}}
struct ImageBlock {
  std::string media_type;
  std::string data;
};

struct ToolUseBlock {
  std::string id;
  std::string name;
  json input = json::object();
};

struct ToolResultBlock {
  std::string tool_use_id;
  json content = "";  // string or array of content blocks, kept as sent
  bool is_error = false;

  // Text of the result; block lists are reduced to their text blocks joined by '\n'
  std::string content_text() const;
};

struct ThinkingBlock {
  std::string thinking;
  std::optional<std::string> signature;
};

using ContentBlock = std::variant<TextBlock, ImageBlock, ToolUseBlock, ToolResultBlock, ThinkingBlock>;

json to_json(const ContentBlock &block);

// Returns nullopt for block types this gateway does not model
std::optional<ContentBlock> content_block_from_json(const json &j);

using MessageContent = std::variant<std::string, std::vector<ContentBlock>>;

struct Message {
  Role role = Role::User;
  MessageContent content = std::string();

  json to_json() const;
  static Message from_json(const json &j);
};

struct ToolDef {
  std::string name;
  std::string description;
  json input_schema = json::object();

  json to_json() const;
  static ToolDef from_json(const json &j);
};

// {"type":"auto"|"any"|"tool"|"none","name":...}
struct ToolChoice {
  std::string type = "auto";
  std::string name;

  json to_json() const;
  static ToolChoice from_json(const json &j);
};

using SystemPrompt = std::variant<std::string, std::vector<TextBlock>>;

struct Request {
  std::string model;
  std::optional<int64_t> max_tokens;
  std::optional<SystemPrompt> system;
  std::vector<Message> messages;
  std::vector<ToolDef> tools;
  std::optional<ToolChoice> tool_choice;
  std::optional<double> temperature;
  std::optional<double> top_p;
  std::optional<int64_t> top_k;
  std::vector<std::string> stop_sequences;
  bool stream = false;
  std::optional<std::string> user_id;  // metadata.user_id

  // System prompt flattened to one string (text blocks joined by '\n')
  std::string system_text() const;

  json to_json() const;
  static Request from_json(const json &j);
};

struct Response {
  std::string id;
  std::string model;
  std::vector<ContentBlock> content;
  StopReason stop_reason = StopReason::EndTurn;
  std::optional<std::string> stop_sequence;
  TokenUsage usage;

  json to_json() const;
  static Response from_json(const json &j);
};

}  // namespace relay::anthropic
