#include "translate/response_transformer.hpp"

#include "core/uuid.hpp"
#include "translate/tool_mapper.hpp"

namespace relay::translate {

anthropic::Response to_caller_response(const openai::Response &response, const std::string &fallback_model) {
  anthropic::Response result;
  result.id = response.id.empty() ? UUID::message_id() : response.id;
  result.model = response.model.empty() ? fallback_model : response.model;

  std::optional<std::string> finish_reason;
  if (!response.choices.empty()) {
    const auto &choice = response.choices.front();
    finish_reason = choice.finish_reason;

    std::string text = choice.message.content_text();
    if (!text.empty()) {
      result.content.push_back(anthropic::TextBlock{text});
    }
    for (const auto &tc : choice.message.tool_calls) {
      result.content.push_back(anthropic::ToolUseBlock{tc.id, tc.name, parse_tool_arguments(tc.arguments)});
    }
  }

  if (result.content.empty()) {
    result.content.push_back(anthropic::TextBlock{""});
  }

  result.stop_reason = finish_reason_to_caller(finish_reason);

  if (response.usage) {
    result.usage.input_tokens = response.usage->prompt_tokens;
    result.usage.output_tokens = response.usage->completion_tokens;
  }
  return result;
}

}  // namespace relay::translate
