#pragma once

#include <string>

#include "wire/anthropic.hpp"
#include "wire/openai.hpp"

namespace relay::translate {

// Map a non-streaming completion onto an Anthropic message.
// Only the first choice is used; a response with no choices yields an empty text block and end_turn.
// fallback_model is reported when the provider omits the model name.
anthropic::Response to_caller_response(const openai::Response &response, const std::string &fallback_model);

}  // namespace relay::translate
