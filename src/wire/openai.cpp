#include "wire/openai.hpp"

#include <stdexcept>

namespace relay::openai {

namespace {

std::optional<std::string> optional_string(const json &j, const char *key) {
  if (j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return std::nullopt;
}

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

json content_to_json(const std::optional<MessageContent> &content) {
  if (!content) {
    return nullptr;
  }
  if (auto *text = std::get_if<std::string>(&*content)) {
    return *text;
  }

  json parts = json::array();
  for (const auto &part : std::get<std::vector<ContentPart>>(*content)) {
    if (auto *text = std::get_if<TextPart>(&part)) {
      parts.push_back({{"type", "text"}, {"text", text->text}});
    } else if (auto *image = std::get_if<ImageUrlPart>(&part)) {
      json image_url = {{"url", image->url}};
      if (image->detail) {
        image_url["detail"] = *image->detail;
      }
      parts.push_back({{"type", "image_url"}, {"image_url", image_url}});
    }
  }
  return parts;
}

std::optional<MessageContent> content_from_json(const json &j) {
  if (j.is_string()) {
    return j.get<std::string>();
  }
  if (!j.is_array()) {
    return std::nullopt;
  }

  std::vector<ContentPart> parts;
  for (const auto &item : j) {
    if (!item.is_object()) continue;
    std::string type = item.value("type", "");
    if (type == "text") {
      parts.push_back(TextPart{item.value("text", "")});
    } else if (type == "image_url" && item.contains("image_url")) {
      const auto &image_url = item["image_url"];
      ImageUrlPart part;
      if (image_url.is_string()) {
        part.url = image_url.get<std::string>();
      } else if (image_url.is_object()) {
        part.url = image_url.value("url", "");
        part.detail = optional_string(image_url, "detail");
      }
      parts.push_back(std::move(part));
    }
  }
  return parts;
}

}  // namespace

json ToolCall::to_json() const {
  return {{"id", id}, {"type", "function"}, {"function", {{"name", name}, {"arguments", arguments}}}};
}

ToolCall ToolCall::from_json(const json &j) {
  ToolCall tc;
  tc.id = j.value("id", "");
  if (j.contains("function") && j["function"].is_object()) {
    const auto &function = j["function"];
    tc.name = function.value("name", "");
    if (function.contains("arguments")) {
      // Some providers send arguments as an object instead of a string
      const auto &arguments = function["arguments"];
      tc.arguments = arguments.is_string() ? arguments.get<std::string>() : dump_json(arguments);
    }
  }
  return tc;
}

std::string Message::content_text() const {
  if (!content) {
    return "";
  }
  if (auto *text = std::get_if<std::string>(&*content)) {
    return *text;
  }

  std::string result;
  bool first = true;
  for (const auto &part : std::get<std::vector<ContentPart>>(*content)) {
    if (auto *text = std::get_if<TextPart>(&part)) {
      if (!first) result += "\n";
      result += text->text;
      first = false;
    }
  }
  return result;
}

json Message::to_json() const {
  json j;
  j["role"] = relay::to_string(role);
  j["content"] = content_to_json(content);

  if (!tool_calls.empty()) {
    json calls = json::array();
    for (const auto &tc : tool_calls) {
      calls.push_back(tc.to_json());
    }
    j["tool_calls"] = calls;
  }
  if (tool_call_id) {
    j["tool_call_id"] = *tool_call_id;
  }
  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  msg.role = role_from_string(j.value("role", "user"));
  if (j.contains("content")) {
    msg.content = content_from_json(j["content"]);
  }

  if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
    for (const auto &tc : j["tool_calls"]) {
      msg.tool_calls.push_back(ToolCall::from_json(tc));
    }
  }
  msg.tool_call_id = optional_string(j, "tool_call_id");
  return msg;
}

json ToolDef::to_json() const {
  return {{"type", "function"}, {"function", {{"name", name}, {"description", description}, {"parameters", parameters}}}};
}

ToolDef ToolDef::from_json(const json &j) {
  ToolDef tool;
  const auto &function = j.contains("function") ? j["function"] : json::object();
  tool.name = function.value("name", "");
  tool.description = function.value("description", "");
  if (function.contains("parameters") && !function["parameters"].is_null()) {
    tool.parameters = function["parameters"];
  }
  return tool;
}

json ToolChoice::to_json() const {
  if (mode == "function") {
    return {{"type", "function"}, {"function", {{"name", function_name}}}};
  }
  return mode;
}

ToolChoice ToolChoice::from_json(const json &j) {
  ToolChoice choice;
  if (j.is_string()) {
    choice.mode = j.get<std::string>();
  } else if (j.is_object()) {
    choice.mode = "function";
    if (j.contains("function") && j["function"].is_object()) {
      choice.function_name = j["function"].value("name", "");
    }
  }
  return choice;
}

json Usage::to_json() const {
  return {{"prompt_tokens", prompt_tokens}, {"completion_tokens", completion_tokens}, {"total_tokens", total_tokens}};
}

Usage Usage::from_json(const json &j) {
  Usage usage;
  usage.prompt_tokens = optional_integer(j, "prompt_tokens").value_or(0);
  usage.completion_tokens = optional_integer(j, "completion_tokens").value_or(0);
  usage.total_tokens = optional_integer(j, "total_tokens").value_or(usage.prompt_tokens + usage.completion_tokens);
  return usage;
}

json Request::to_json() const {
  json j;
  j["model"] = model;

  json msgs = json::array();
  for (const auto &msg : messages) {
    msgs.push_back(msg.to_json());
  }
  j["messages"] = msgs;
  j["stream"] = stream;

  if (include_usage) {
    j["stream_options"] = {{"include_usage", *include_usage}};
  }
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

  if (max_tokens) j["max_tokens"] = *max_tokens;
  if (max_completion_tokens) j["max_completion_tokens"] = *max_completion_tokens;
  if (temperature) j["temperature"] = *temperature;
  if (top_p) j["top_p"] = *top_p;
  if (!stop.empty()) j["stop"] = stop;
  if (user) j["user"] = *user;
  return j;
}

Request Request::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }

  Request req;
  req.model = j.value("model", "");

  const auto &messages = j.at("messages");
  if (!messages.is_array()) {
    throw std::invalid_argument("'messages' must be an array");
  }
  for (const auto &msg : messages) {
    req.messages.push_back(Message::from_json(msg));
  }

  if (j.contains("tools") && j["tools"].is_array()) {
    for (const auto &tool : j["tools"]) {
      req.tools.push_back(ToolDef::from_json(tool));
    }
  }
  if (j.contains("tool_choice") && !j["tool_choice"].is_null()) {
    req.tool_choice = ToolChoice::from_json(j["tool_choice"]);
  }

  req.max_tokens = optional_integer(j, "max_tokens");
  req.max_completion_tokens = optional_integer(j, "max_completion_tokens");
  req.temperature = optional_number(j, "temperature");
  req.top_p = optional_number(j, "top_p");
  req.stream = j.contains("stream") && j["stream"].is_boolean() && j["stream"].get<bool>();

  if (j.contains("stream_options") && j["stream_options"].is_object()) {
    const auto &options = j["stream_options"];
    if (options.contains("include_usage") && options["include_usage"].is_boolean()) {
      req.include_usage = options["include_usage"].get<bool>();
    }
  }

  // "stop" may be a single string or a list
  if (j.contains("stop")) {
    const auto &stop = j["stop"];
    if (stop.is_string()) {
      req.stop.push_back(stop.get<std::string>());
    } else if (stop.is_array()) {
      for (const auto &s : stop) {
        req.stop.push_back(s.get<std::string>());
      }
    }
  }
  req.user = optional_string(j, "user");
  return req;
}

json Response::to_json() const {
  json choices_json = json::array();
  for (const auto &choice : choices) {
    choices_json.push_back({{"index", choice.index},
                            {"message", choice.message.to_json()},
                            {"finish_reason", choice.finish_reason ? json(*choice.finish_reason) : json(nullptr)}});
  }

  json j = {{"id", id}, {"object", "chat.completion"}, {"model", model}, {"choices", choices_json}};
  if (usage) {
    j["usage"] = usage->to_json();
  }
  return j;
}

Response Response::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("completion response must be a JSON object");
  }

  Response resp;
  resp.id = j.value("id", "");
  resp.model = j.value("model", "");

  if (j.contains("choices") && j["choices"].is_array()) {
    for (const auto &item : j["choices"]) {
      if (!item.is_object()) continue;
      Choice choice;
      choice.index = item.value("index", 0);
      if (item.contains("message") && item["message"].is_object()) {
        choice.message = Message::from_json(item["message"]);
      }
      choice.finish_reason = optional_string(item, "finish_reason");
      resp.choices.push_back(std::move(choice));
    }
  }

  if (j.contains("usage") && j["usage"].is_object()) {
    resp.usage = Usage::from_json(j["usage"]);
  }
  return resp;
}

json StreamChunk::to_json() const {
  json choices_json = json::array();
  for (const auto &choice : choices) {
    json delta = json::object();
    if (choice.delta.role) delta["role"] = *choice.delta.role;
    if (choice.delta.content) delta["content"] = *choice.delta.content;
    if (!choice.delta.tool_calls.empty()) {
      json calls = json::array();
      for (const auto &tc : choice.delta.tool_calls) {
        json call = {{"index", tc.index}};
        if (tc.id) {
          call["id"] = *tc.id;
          call["type"] = "function";
        }
        json function = json::object();
        if (tc.name) function["name"] = *tc.name;
        if (tc.arguments) function["arguments"] = *tc.arguments;
        if (!function.empty()) call["function"] = function;
        calls.push_back(call);
      }
      delta["tool_calls"] = calls;
    }
    choices_json.push_back(
        {{"index", choice.index}, {"delta", delta}, {"finish_reason", choice.finish_reason ? json(*choice.finish_reason) : json(nullptr)}});
  }

  json j = {{"id", id}, {"object", "chat.completion.chunk"}, {"choices", choices_json}};
  if (model) {
    j["model"] = *model;
  }
  if (usage) {
    j["usage"] = usage->to_json();
  }
  return j;
}

StreamChunk StreamChunk::from_json(const json &j) {
  if (!j.is_object()) {
    throw std::invalid_argument("stream chunk must be a JSON object");
  }

  StreamChunk chunk;
  chunk.id = j.value("id", "");
  chunk.model = optional_string(j, "model");

  if (j.contains("choices") && j["choices"].is_array()) {
    for (const auto &item : j["choices"]) {
      if (!item.is_object()) continue;
      ChunkChoice choice;
      choice.index = item.value("index", 0);
      choice.finish_reason = optional_string(item, "finish_reason");

      if (item.contains("delta") && item["delta"].is_object()) {
        const auto &delta = item["delta"];
        choice.delta.role = optional_string(delta, "role");
        choice.delta.content = optional_string(delta, "content");

        if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
          for (const auto &tc : delta["tool_calls"]) {
            if (!tc.is_object()) continue;
            ToolCallDelta call;
            call.index = tc.value("index", 0);
            call.id = optional_string(tc, "id");
            if (tc.contains("function") && tc["function"].is_object()) {
              call.name = optional_string(tc["function"], "name");
              call.arguments = optional_string(tc["function"], "arguments");
            }
            choice.delta.tool_calls.push_back(std::move(call));
          }
        }
      }
      chunk.choices.push_back(std::move(choice));
    }
  }

  if (j.contains("usage") && j["usage"].is_object()) {
    chunk.usage = Usage::from_json(j["usage"]);
  }
  return chunk;
}

}  // namespace relay::openai
