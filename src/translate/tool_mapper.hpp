#pragma once

#include <optional>
#include <string>
#include <vector>

#include "wire/anthropic.hpp"
#include "wire/openai.hpp"

namespace relay::translate {

// Tool definitions: {name, description, input_schema} <-> {type:function, function:{name, description, parameters}}
std::vector<openai::ToolDef> tools_to_provider(const std::vector<anthropic::ToolDef> &tools);

std::vector<anthropic::ToolDef> tools_to_caller(const std::vector<openai::ToolDef> &tools);

// auto <-> "auto", any <-> "required", none <-> "none", tool{name} <-> function{name}
openai::ToolChoice tool_choice_to_provider(const anthropic::ToolChoice &choice);

anthropic::ToolChoice tool_choice_to_caller(const openai::ToolChoice &choice);

// tool_calls -> tool_use, length -> max_tokens, anything else (stop, null, unknown) -> end_turn
StopReason finish_reason_to_caller(const std::optional<std::string> &reason);

// tool_use -> tool_calls, max_tokens -> length, anything else -> stop
FinishReason stop_reason_to_provider(const std::optional<std::string> &reason);

// Parse a JSON-encoded arguments string into a structured tool input.
// Empty input yields {}; anything that is not a JSON object yields {"raw": arguments}.
json parse_tool_arguments(const std::string &arguments);

}  // namespace relay::translate
