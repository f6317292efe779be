#include "translate/request_transformer.hpp"

#include "translate/tool_mapper.hpp"

namespace relay::translate {

namespace {

constexpr int64_t kDefaultMaxTokens = 4096;

// Anthropic -> OpenAI

void convert_user_blocks(const std::vector<anthropic::ContentBlock> &blocks, std::vector<openai::Message> &out) {
  std::vector<openai::ContentPart> parts;
  std::vector<openai::Message> tool_results;

  for (const auto &block : blocks) {
    if (auto *text = std::get_if<anthropic::TextBlock>(&block)) {
      parts.push_back(openai::TextPart{text->text});
    } else if (auto *image = std::get_if<anthropic::ImageBlock>(&block)) {
      parts.push_back(openai::ImageUrlPart{to_data_uri(image->media_type, image->data), std::nullopt});
    } else if (auto *result = std::get_if<anthropic::ToolResultBlock>(&block)) {
      std::string content = result->content_text();
      openai::Message tool_msg;
      tool_msg.role = Role::Tool;
      tool_msg.content = result->is_error ? "[ERROR] " + content : content;
      tool_msg.tool_call_id = result->tool_use_id;
      tool_results.push_back(std::move(tool_msg));
    }
    // tool_use and thinking blocks have no place in a user turn
  }

  for (auto &tool_msg : tool_results) {
    out.push_back(std::move(tool_msg));
  }

  if (!parts.empty()) {
    openai::Message user_msg;
    user_msg.role = Role::User;
    if (parts.size() == 1 && std::holds_alternative<openai::TextPart>(parts[0])) {
      user_msg.content = std::get<openai::TextPart>(parts[0]).text;
    } else {
      user_msg.content = std::move(parts);
    }
    out.push_back(std::move(user_msg));
  }

  if (tool_results.empty() && parts.empty()) {
    openai::Message user_msg;
    user_msg.role = Role::User;
    user_msg.content = std::string();
    out.push_back(std::move(user_msg));
  }
}

openai::Message convert_assistant_blocks(const std::vector<anthropic::ContentBlock> &blocks) {
  std::string text;
  openai::Message msg;
  msg.role = Role::Assistant;

  for (const auto &block : blocks) {
    if (auto *text_block = std::get_if<anthropic::TextBlock>(&block)) {
      text += text_block->text;
    } else if (auto *tool_use = std::get_if<anthropic::ToolUseBlock>(&block)) {
      msg.tool_calls.push_back(openai::ToolCall{tool_use->id, tool_use->name, dump_json(tool_use->input)});
    }
    // Thinking blocks have no Chat Completions equivalent and are dropped
  }

  if (!text.empty()) {
    msg.content = text;
  }
  return msg;
}

void convert_caller_message(const anthropic::Message &msg, std::vector<openai::Message> &out) {
  if (auto *text = std::get_if<std::string>(&msg.content)) {
    openai::Message plain;
    plain.role = msg.role;
    plain.content = *text;
    out.push_back(std::move(plain));
    return;
  }

  const auto &blocks = std::get<std::vector<anthropic::ContentBlock>>(msg.content);
  if (msg.role == Role::User) {
    convert_user_blocks(blocks, out);
  } else {
    out.push_back(convert_assistant_blocks(blocks));
  }
}

// OpenAI -> Anthropic

anthropic::Message convert_provider_user(const openai::Message &msg) {
  anthropic::Message result;
  result.role = Role::User;

  if (!msg.content) {
    result.content = std::string();
    return result;
  }
  if (auto *text = std::get_if<std::string>(&*msg.content)) {
    result.content = *text;
    return result;
  }

  std::vector<anthropic::ContentBlock> blocks;
  for (const auto &part : std::get<std::vector<openai::ContentPart>>(*msg.content)) {
    if (auto *text = std::get_if<openai::TextPart>(&part)) {
      blocks.push_back(anthropic::TextBlock{text->text});
    } else if (auto *image = std::get_if<openai::ImageUrlPart>(&part)) {
      if (auto parsed = parse_data_uri(image->url)) {
        blocks.push_back(std::move(*parsed));
      }
    }
  }

  if (blocks.empty()) {
    result.content = std::string();
  } else if (blocks.size() == 1 && std::holds_alternative<anthropic::TextBlock>(blocks[0])) {
    result.content = std::get<anthropic::TextBlock>(blocks[0]).text;
  } else {
    result.content = std::move(blocks);
  }
  return result;
}

anthropic::Message convert_provider_assistant(const openai::Message &msg) {
  std::vector<anthropic::ContentBlock> blocks;

  std::string text = msg.content_text();
  if (!text.empty()) {
    blocks.push_back(anthropic::TextBlock{text});
  }

  for (const auto &tc : msg.tool_calls) {
    blocks.push_back(anthropic::ToolUseBlock{tc.id, tc.name, parse_tool_arguments(tc.arguments)});
  }

  if (blocks.empty()) {
    blocks.push_back(anthropic::TextBlock{""});
  }

  anthropic::Message result;
  result.role = Role::Assistant;
  result.content = std::move(blocks);
  return result;
}

void append_tool_result(const openai::Message &msg, std::vector<anthropic::Message> &messages) {
  anthropic::ToolResultBlock block;
  block.tool_use_id = msg.tool_call_id.value_or("");
  block.content = msg.content_text();

  // Consecutive tool results share one user turn
  if (!messages.empty() && messages.back().role == Role::User) {
    if (auto *blocks = std::get_if<std::vector<anthropic::ContentBlock>>(&messages.back().content)) {
      blocks->push_back(std::move(block));
      return;
    }
  }

  anthropic::Message user_msg;
  user_msg.role = Role::User;
  user_msg.content = std::vector<anthropic::ContentBlock>{std::move(block)};
  messages.push_back(std::move(user_msg));
}

}  // namespace

openai::Request to_provider_format(const anthropic::Request &request) {
  openai::Request result;
  result.model = request.model;

  std::string system_text = request.system_text();
  if (!system_text.empty()) {
    openai::Message system_msg;
    system_msg.role = Role::System;
    system_msg.content = system_text;
    result.messages.push_back(std::move(system_msg));
  }

  for (const auto &msg : request.messages) {
    convert_caller_message(msg, result.messages);
  }

  result.stream = request.stream;
  if (request.stream) {
    result.include_usage = true;
  }

  result.max_tokens = request.max_tokens;
  result.temperature = request.temperature;
  result.top_p = request.top_p;
  result.stop = request.stop_sequences;
  result.user = request.user_id;

  result.tools = tools_to_provider(request.tools);
  if (request.tool_choice) {
    result.tool_choice = tool_choice_to_provider(*request.tool_choice);
  }
  return result;
}

anthropic::Request to_caller_format(const openai::Request &request) {
  anthropic::Request result;
  result.model = request.model;

  std::optional<std::string> system;
  for (const auto &msg : request.messages) {
    switch (msg.role) {
      case Role::System: {
        std::string text = msg.content_text();
        system = system ? *system + "\n" + text : text;
        break;
      }
      case Role::Tool:
        append_tool_result(msg, result.messages);
        break;
      case Role::User:
        result.messages.push_back(convert_provider_user(msg));
        break;
      case Role::Assistant:
        result.messages.push_back(convert_provider_assistant(msg));
        break;
    }
  }
  if (system && !system->empty()) {
    result.system = *system;
  }

  result.max_tokens = request.max_tokens ? request.max_tokens : request.max_completion_tokens;
  if (!result.max_tokens) {
    result.max_tokens = kDefaultMaxTokens;
  }

  result.stream = request.stream;
  result.temperature = request.temperature;
  result.top_p = request.top_p;
  result.stop_sequences = request.stop;
  result.user_id = request.user;

  result.tools = tools_to_caller(request.tools);
  if (request.tool_choice) {
    result.tool_choice = tool_choice_to_caller(*request.tool_choice);
  }
  return result;
}

std::string to_data_uri(const std::string &media_type, const std::string &data) {
  return "data:" + media_type + ";base64," + data;
}

std::optional<anthropic::ImageBlock> parse_data_uri(const std::string &uri) {
  static const std::string kPrefix = "data:";
  static const std::string kMarker = ";base64,";

  if (!uri.starts_with(kPrefix)) {
    return std::nullopt;
  }

  auto marker = uri.find(kMarker, kPrefix.size());
  if (marker == std::string::npos) {
    return std::nullopt;
  }

  std::string media_type = uri.substr(kPrefix.size(), marker - kPrefix.size());
  std::string data = uri.substr(marker + kMarker.size());
  if (media_type.empty() || media_type.find(';') != std::string::npos || data.empty()) {
    return std::nullopt;
  }
  return anthropic::ImageBlock{media_type, data};
}

}  // namespace relay::translate
