#include "translate/tool_mapper.hpp"

namespace relay::translate {

std::vector<openai::ToolDef> tools_to_provider(const std::vector<anthropic::ToolDef> &tools) {
  std::vector<openai::ToolDef> result;
  result.reserve(tools.size());
  for (const auto &tool : tools) {
    result.push_back(openai::ToolDef{tool.name, tool.description, tool.input_schema});
  }
  return result;
}

std::vector<anthropic::ToolDef> tools_to_caller(const std::vector<openai::ToolDef> &tools) {
  std::vector<anthropic::ToolDef> result;
  result.reserve(tools.size());
  for (const auto &tool : tools) {
    result.push_back(anthropic::ToolDef{tool.name, tool.description, tool.parameters});
  }
  return result;
}

openai::ToolChoice tool_choice_to_provider(const anthropic::ToolChoice &choice) {
  openai::ToolChoice result;
  if (choice.type == "any") {
    result.mode = "required";
  } else if (choice.type == "none") {
    result.mode = "none";
  } else if (choice.type == "tool") {
    result.mode = "function";
    result.function_name = choice.name;
  } else {
    result.mode = "auto";
  }
  return result;
}

anthropic::ToolChoice tool_choice_to_caller(const openai::ToolChoice &choice) {
  anthropic::ToolChoice result;
  if (choice.mode == "required") {
    result.type = "any";
  } else if (choice.mode == "none") {
    result.type = "none";
  } else if (choice.mode == "function") {
    result.type = "tool";
    result.name = choice.function_name;
  } else {
    result.type = "auto";
  }
  return result;
}

StopReason finish_reason_to_caller(const std::optional<std::string> &reason) {
  if (!reason) return StopReason::EndTurn;
  if (*reason == "tool_calls") return StopReason::ToolUse;
  if (*reason == "length") return StopReason::MaxTokens;
  return StopReason::EndTurn;
}

FinishReason stop_reason_to_provider(const std::optional<std::string> &reason) {
  if (!reason) return FinishReason::Stop;
  if (*reason == "tool_use") return FinishReason::ToolCalls;
  if (*reason == "max_tokens") return FinishReason::Length;
  return FinishReason::Stop;
}

json parse_tool_arguments(const std::string &arguments) {
  if (arguments.empty()) {
    return json::object();
  }

  // Tool input must be an object, so valid non-object JSON is carried raw as well
  json parsed = json::parse(arguments, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return {{"raw", arguments}};
  }
  return parsed;
}

}  // namespace relay::translate
