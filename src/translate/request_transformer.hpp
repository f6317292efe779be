#pragma once

#include <optional>
#include <string>

#include "wire/anthropic.hpp"
#include "wire/openai.hpp"

namespace relay::translate {

/**
 * Convert an Anthropic Messages request into an OpenAI Chat Completions request.
 *
 * - system prompt becomes a leading "system" message
 * - tool_result blocks become one "tool" message each, ahead of the user's remaining content
 * - assistant text and tool_use blocks merge into one message; thinking blocks are dropped
 * - streaming requests also ask for usage totals (stream_options.include_usage)
 *
 * The input is not modified.
 */
openai::Request to_provider_format(const anthropic::Request &request);

/**
 * Convert an OpenAI Chat Completions request into an Anthropic Messages request.
 *
 * - "system" messages are joined into the system field
 * - "tool" messages become tool_result blocks of a user turn
 * - tool call arguments are parsed back into structured input ({"raw": ...} when unparsable)
 * - max_tokens falls back to max_completion_tokens, then 4096
 */
anthropic::Request to_caller_format(const openai::Request &request);

// "data:<media_type>;base64,<data>"
std::string to_data_uri(const std::string &media_type, const std::string &data);

// Inverse of to_data_uri; nullopt when the URI is not a base64 data URI
std::optional<anthropic::ImageBlock> parse_data_uri(const std::string &uri);

}  // namespace relay::translate
