#include "translate/stream_transformer.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "core/uuid.hpp"
#include "translate/tool_mapper.hpp"

namespace relay::translate {

namespace {

std::string trim(const std::string &str) {
  const char *ws = " \t\r\n";
  auto begin = str.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = str.find_last_not_of(ws);
  return str.substr(begin, end - begin + 1);
}

}  // namespace

std::string StreamEvent::to_sse() const {
  return "event: " + type + "\ndata: " + dump_json(data) + "\n\n";
}

StreamTransformer::StreamTransformer(std::string model, std::optional<std::string> message_id)
    : model_(std::move(model)), message_id_(message_id ? std::move(*message_id) : UUID::message_id()) {
}

std::vector<StreamEvent> StreamTransformer::transform(const openai::StreamChunk &chunk) {
  std::vector<StreamEvent> events;

  if (!state_.message_started) {
    start_message(chunk, events);
  }

  if (chunk.usage) {
    state_.input_tokens = chunk.usage->prompt_tokens;
    state_.output_tokens = chunk.usage->completion_tokens;
  }

  // Anything after message_stop is only usage bookkeeping
  if (state_.message_stopped || chunk.choices.empty()) {
    return events;
  }

  const auto &choice = chunk.choices.front();

  if (choice.delta.content && !choice.delta.content->empty()) {
    on_text(*choice.delta.content, events);
  }

  for (const auto &tc : choice.delta.tool_calls) {
    on_tool_call(tc, events);
  }

  if (choice.finish_reason) {
    stop_message(finish_reason_to_caller(choice.finish_reason), events);
  }

  return events;
}

std::vector<StreamEvent> StreamTransformer::finish() {
  std::vector<StreamEvent> events;
  if (state_.message_started && !state_.message_stopped) {
    spdlog::debug("Stream {} ended without a finish reason, closing message", message_id_);
    stop_message(StopReason::EndTurn, events);
  }
  return events;
}

void StreamTransformer::start_message(const openai::StreamChunk &chunk, std::vector<StreamEvent> &events) {
  int64_t input_tokens = chunk.usage ? chunk.usage->prompt_tokens : 0;

  json message = {
      {"id", message_id_},
      {"type", "message"},
      {"role", "assistant"},
      {"content", json::array()},
      {"model", chunk.model.value_or(model_)},
      {"stop_reason", nullptr},
      {"stop_sequence", nullptr},
      {"usage", {{"input_tokens", input_tokens}, {"output_tokens", 0}}},
  };
  events.push_back({"message_start", {{"type", "message_start"}, {"message", message}}});

  state_.message_started = true;
  state_.input_tokens = input_tokens;
}

void StreamTransformer::on_text(const std::string &text, std::vector<StreamEvent> &events) {
  if (!state_.text_block_open) {
    state_.text_block_index = state_.content_block_index++;
    events.push_back({"content_block_start",
                      {{"type", "content_block_start"},
                       {"index", state_.text_block_index},
                       {"content_block", {{"type", "text"}, {"text", ""}}}}});
    state_.text_block_open = true;
  }

  events.push_back({"content_block_delta",
                    {{"type", "content_block_delta"},
                     {"index", state_.text_block_index},
                     {"delta", {{"type", "text_delta"}, {"text", text}}}}});
}

void StreamTransformer::on_tool_call(const openai::ToolCallDelta &delta, std::vector<StreamEvent> &events) {
  ToolCallBlock *block = find_tool_block(delta.index);

  if (!block) {
    close_text_block(events);

    ToolCallBlock created;
    created.provider_index = delta.index;
    created.block_index = state_.content_block_index++;
    if (delta.id && !delta.id->empty()) {
      created.id = *delta.id;
    } else {
      created.id = "toolu_proxy_" + std::to_string(created.block_index);
    }
    created.name = delta.name.value_or("");

    events.push_back({"content_block_start",
                      {{"type", "content_block_start"},
                       {"index", created.block_index},
                       {"content_block", {{"type", "tool_use"}, {"id", created.id}, {"name", created.name}, {"input", json::object()}}}}});

    state_.tool_call_blocks.push_back(std::move(created));
    block = &state_.tool_call_blocks.back();
  }

  if (!delta.arguments || delta.arguments->empty()) {
    return;
  }

  block->arguments += *delta.arguments;
  events.push_back({"content_block_delta",
                    {{"type", "content_block_delta"},
                     {"index", block->block_index},
                     {"delta", {{"type", "input_json_delta"}, {"partial_json", *delta.arguments}}}}});
}

void StreamTransformer::stop_message(StopReason reason, std::vector<StreamEvent> &events) {
  close_text_block(events);
  close_tool_blocks(events);
  state_.tool_call_blocks.clear();

  events.push_back({"message_delta",
                    {{"type", "message_delta"},
                     {"delta", {{"stop_reason", to_string(reason)}, {"stop_sequence", nullptr}}},
                     {"usage", {{"output_tokens", state_.output_tokens}}}}});
  events.push_back({"message_stop", {{"type", "message_stop"}}});

  state_.message_stopped = true;
}

void StreamTransformer::close_text_block(std::vector<StreamEvent> &events) {
  if (!state_.text_block_open) {
    return;
  }
  events.push_back({"content_block_stop", {{"type", "content_block_stop"}, {"index", state_.text_block_index}}});
  state_.text_block_open = false;
}

// First-seen order
void StreamTransformer::close_tool_blocks(std::vector<StreamEvent> &events) {
  for (auto &block : state_.tool_call_blocks) {
    if (block.closed) {
      continue;
    }
    events.push_back({"content_block_stop", {{"type", "content_block_stop"}, {"index", block.block_index}}});
    block.closed = true;
  }
}

ToolCallBlock *StreamTransformer::find_tool_block(int provider_index) {
  for (auto &block : state_.tool_call_blocks) {
    if (block.provider_index == provider_index) {
      return &block;
    }
  }
  return nullptr;
}

std::optional<openai::StreamChunk> parse_chunk_line(const std::string &line) {
  std::string trimmed = trim(line);
  if (!trimmed.starts_with("data:")) {
    return std::nullopt;
  }

  std::string payload = trim(trimmed.substr(5));
  if (payload.empty() || payload == "[DONE]") {
    return std::nullopt;
  }

  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    spdlog::warn("Dropping unparsable stream line: {}", payload);
    return std::nullopt;
  }

  try {
    return openai::StreamChunk::from_json(j);
  } catch (const json::exception &e) {
    spdlog::warn("Dropping malformed stream chunk: {}", e.what());
  } catch (const std::invalid_argument &e) {
    spdlog::warn("Dropping malformed stream chunk: {}", e.what());
  }
  return std::nullopt;
}

}  // namespace relay::translate
