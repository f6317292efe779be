#pragma once

#include <string>

// Core types and configuration
#include "core/config.hpp"
#include "core/types.hpp"

// Wire formats
#include "wire/anthropic.hpp"
#include "wire/openai.hpp"

// Protocol translation
#include "translate/request_transformer.hpp"
#include "translate/response_transformer.hpp"
#include "translate/stream_transformer.hpp"
#include "translate/tool_mapper.hpp"

// Gateway
#include "proxy/proxy_server.hpp"

namespace relay {

// Get version string
std::string version();

}  // namespace relay
