#include "wire/anthropic.hpp"

#include <stdexcept>

namespace relay::anthropic {

namespace {

std::optional<double> optional_number(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_number()) {
    return j[key].get<double>();
  }
  return std::nullopt;
}

std::optional<int64_t> optional_integer(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_number()) {
    return j[key].get<int64_t>();
  }
  return std::nullopt;
}

const json &require_array(const json &j, const char *key) {
  const auto &value = j.at(key);
  if (!value.is_array()) {
    throw std::invalid_argument(std::string("'") + key + "' must be an array");
  }
  return value;
}

}  // namespace

std::string ToolResultBlock::content_text() const {
  if (content.is_string()) {
    return content.get<std::string>();
  }

  std::string result;
  if (content.is_array()) {
    bool first = true;
    for (const auto &item : content) {
      if (!item.is_object() || item.value("type", "") != "text") continue;
      if (!first) result += "\n";
      result += item.value("text", "");
      first = false;
    }
  }
  return result;
}

json to_json(const ContentBlock &block) {
  json j;
  if (auto *text = std::get_if<TextBlock>(&block)) {
    j["type"] = "text";
    j["text"] = text->text;
  } else if (auto *image = std::get_if<ImageBlock>(&block)) {
    j["type"] = "image";
    j["source"] = {{"type", "base64"}, {"media_type", image->media_type}, {"data", image->data}};
  } else if (auto *tool_use = std::get_if<ToolUseBlock>(&block)) {
    j["type"] = "tool_use";
    j["id"] = tool_use->id;
    j["name"] = tool_use->name;
    j["input"] = tool_use->input;
  } else if (auto *tool_result = std::get_if<ToolResultBlock>(&block)) {
    j["type"] = "tool_result";
    j["tool_use_id"] = tool_result->tool_use_id;
    j["content"] = tool_result->content;
    if (tool_result->is_error) {
      j["is_error"] = true;
    }
  } else if (auto *thinking = std::get_if<ThinkingBlock>(&block)) {
    j["type"] = "thinking";
    j["thinking"] = thinking->thinking;
    if (thinking->signature) {
      j["signature"] = *thinking->signature;
    }
  }
  return j;
}

std::optional<ContentBlock> content_block_from_json(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }

  std::string type = j.value("type", "");
  if (type == "text") {
    return TextBlock{j.value("text", "")};
  }
  if (type == "image") {
    const auto &source = j.contains("source") ? j["source"] : json::object();
    // Only inline base64 sources have a provider-side equivalent
    if (!source.is_object() || source.value("type", "") != "base64") {
      return std::nullopt;
    }
    return ImageBlock{source.value("media_type", ""), source.value("data", "")};
  }
  if (type == "tool_use") {
    ToolUseBlock block;
    block.id = j.value("id", "");
    block.name = j.value("name", "");
    if (j.contains("input") && !j["input"].is_null()) {
      block.input = j["input"];
    }
    return block;
  }
  if (type == "tool_result") {
    ToolResultBlock block;
    block.tool_use_id = j.value("tool_use_id", "");
    if (j.contains("content") && !j["content"].is_null()) {
      block.content = j["content"];
    }
    block.is_error = j.value("is_error", false);
    return block;
  }
  if (type == "thinking") {
    ThinkingBlock block;
    block.thinking = j.value("thinking", "");
    if (j.contains("signature") && j["signature"].is_string()) {
      block.signature = j["signature"].get<std::string>();
    }
    return block;
  }
  return std::nullopt;
}

json Message::to_json() const {
  json j;
  j["role"] = relay::to_string(role);
  if (auto *text = std::get_if<std::string>(&content)) {
    j["content"] = *text;
  } else {
    json blocks = json::array();
    for (const auto &block : std::get<std::vector<ContentBlock>>(content)) {
      blocks.push_back(anthropic::to_json(block));
    }
    j["content"] = blocks;
  }
  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  msg.role = role_from_string(j.value("role", "user"));

  if (j.contains("content")) {
    const auto &content = j["content"];
    if (content.is_string()) {
      msg.content = content.get<std::string>();
    } else if (content.is_array()) {
      std::vector<ContentBlock> blocks;
      for (const auto &item : content) {
        if (auto block = content_block_from_json(item)) {
          blocks.push_back(std::move(*block));
        }
      }
      msg.content = std::move(blocks);
    }
  }
  return msg;
}

json ToolDef::to_json() const {
  return {{"name", name}, {"description", description}, {"input_schema", input_schema}};
}

ToolDef ToolDef::from_json(const json &j) {
  ToolDef tool;
  tool.name = j.value("name", "");
  tool.description = j.value("description", "");
  if (j.contains("input_schema") && !j["input_schema"].is_null()) {
    tool.input_schema = j["input_schema"];
  }
  return tool;
}

json ToolChoice::to_json() const {
  json j = {{"type", type}};
  if (type == "tool") {
    j["name"] = name;
  }
  return j;
}

ToolChoice ToolChoice::from_json(const json &j) {
  ToolChoice choice;
  choice.type = j.value("type", "auto");
  choice.name = j.value("name", "");
  return choice;
}

std::string Request::system_text() const {
  if (!system) {
    return "";
  }
  if (auto *text = std::get_if<std::string>(&*system)) {
    return *text;
  }

  std::string result;
  const auto &blocks = std::get<std::vector<TextBlock>>(*system);
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) result += "\n";
    result += blocks[i].text;
  }
  return result;
}

json Request::to_json() const {
  json j;
  j["model"] = model;
  if (max_tokens) {
    j["max_tokens"] = *max_tokens;
  }

  if (system) {
    if (auto *text = std::get_if<std::string>(&*system)) {
      j["system"] = *text;
    } else {
      json blocks = json::array();
      for (const auto &block : std::get<std::vector<TextBlock>>(*system)) {
        blocks.push_back({{"type", "text"}, {"text", block.text}});
      }
      j["system"] = blocks;
    }
  }

  json msgs = json::array();
  for (const auto &msg : messages) {
    msgs.push_back(msg.to_json());
  }
  j["messages"] = msgs;

  if (!tools.empty()) {
    json tools_json = json::array();
    for (const auto &tool : tools) {
      tools_json.push_back(tool.to_json());
    }
    j["tools"] = tools_json;
  }
  if (tool_choice) {
    j["tool_choice"] = tool_choice->to_json();
  }

  if (temperature) j["temperature"] = *temperature;
  if (top_p) j["top_p"] = *top_p;
  if (top_k) j["top_k"] = *top_k;
  if (!stop_sequences.empty()) j["stop_sequences"] = stop_sequences;
  j["stream"] = stream;
  if (user_id) {
    j["metadata"] = {{"user_id", *user_id}};
  }
  return j;
}

Request Request::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }

  Request req;
  req.model = j.value("model", "");
  req.max_tokens = optional_integer(j, "max_tokens");

  if (j.contains("system")) {
    const auto &system = j["system"];
    if (system.is_string()) {
      req.system = system.get<std::string>();
    } else if (system.is_array()) {
      std::vector<TextBlock> blocks;
      for (const auto &item : system) {
        if (item.is_object() && item.value("type", "") == "text") {
          blocks.push_back(TextBlock{item.value("text", "")});
        }
      }
      req.system = std::move(blocks);
    }
  }

  for (const auto &msg : require_array(j, "messages")) {
    req.messages.push_back(Message::from_json(msg));
  }

  if (j.contains("tools") && j["tools"].is_array()) {
    for (const auto &tool : j["tools"]) {
      req.tools.push_back(ToolDef::from_json(tool));
    }
  }
  if (j.contains("tool_choice") && j["tool_choice"].is_object()) {
    req.tool_choice = ToolChoice::from_json(j["tool_choice"]);
  }

  req.temperature = optional_number(j, "temperature");
  req.top_p = optional_number(j, "top_p");
  req.top_k = optional_integer(j, "top_k");

  if (j.contains("stop_sequences") && j["stop_sequences"].is_array()) {
    for (const auto &stop : j["stop_sequences"]) {
      req.stop_sequences.push_back(stop.get<std::string>());
    }
  }

  req.stream = j.contains("stream") && j["stream"].is_boolean() && j["stream"].get<bool>();

  if (j.contains("metadata") && j["metadata"].is_object()) {
    const auto &metadata = j["metadata"];
    if (metadata.contains("user_id") && metadata["user_id"].is_string()) {
      req.user_id = metadata["user_id"].get<std::string>();
    }
  }
  return req;
}

json Response::to_json() const {
  json blocks = json::array();
  for (const auto &block : content) {
    blocks.push_back(anthropic::to_json(block));
  }

  return {{"id", id},
          {"type", "message"},
          {"role", "assistant"},
          {"content", blocks},
          {"model", model},
          {"stop_reason", relay::to_string(stop_reason)},
          {"stop_sequence", stop_sequence ? json(*stop_sequence) : json(nullptr)},
          {"usage", {{"input_tokens", usage.input_tokens}, {"output_tokens", usage.output_tokens}}}};
}

Response Response::from_json(const json &j) {
  Response resp;
  resp.id = j.value("id", "");
  resp.model = j.value("model", "");

  if (j.contains("content") && j["content"].is_array()) {
    for (const auto &item : j["content"]) {
      if (auto block = content_block_from_json(item)) {
        resp.content.push_back(std::move(*block));
      }
    }
  }

  if (j.contains("stop_reason") && j["stop_reason"].is_string()) {
    resp.stop_reason = stop_reason_from_string(j["stop_reason"].get<std::string>());
  }
  if (j.contains("stop_sequence") && j["stop_sequence"].is_string()) {
    resp.stop_sequence = j["stop_sequence"].get<std::string>();
  }
  if (j.contains("usage") && j["usage"].is_object()) {
    resp.usage.input_tokens = j["usage"].value("input_tokens", int64_t{0});
    resp.usage.output_tokens = j["usage"].value("output_tokens", int64_t{0});
  }
  return resp;
}

}  // namespace relay::anthropic
