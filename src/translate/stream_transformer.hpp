#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "wire/openai.hpp"

namespace relay::translate {

// One caller-side stream event ("event: <type>\ndata: <json>\n\n" on the wire)
struct StreamEvent {
  std::string type;
  json data;

  std::string to_sse() const;
};

// Tool call being streamed, keyed by the provider's tool_calls[].index
struct ToolCallBlock {
  int provider_index = 0;
  std::string id;
  std::string name;
  int block_index = 0;    // content block index assigned on the caller side
  std::string arguments;  // accumulated JSON fragments
  bool closed = false;
};

struct StreamState {
  int content_block_index = 0;  // next index to assign; advances when a block opens
  bool text_block_open = false;
  int text_block_index = 0;
  std::vector<ToolCallBlock> tool_call_blocks;  // first-seen order
  bool message_started = false;
  bool message_stopped = false;
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
};

/**
 * Rebuilds an Anthropic event stream from OpenAI stream chunks.
 *
 * One instance per upstream stream; not thread-safe. Content block indices seen by
 * the caller are contiguous from 0 in opening order. Only one text block is open at a time; tool
 * blocks stay open until the terminal reason so interleaved argument fragments keep
 * their own index.
 */
class StreamTransformer {
 public:
  explicit StreamTransformer(std::string model, std::optional<std::string> message_id = std::nullopt);

  // Events produced by one provider chunk (possibly none)
  std::vector<StreamEvent> transform(const openai::StreamChunk &chunk);

  // Close a started but unterminated message at end of stream.
  // No-op when nothing was started or message_stop was already sent.
  std::vector<StreamEvent> finish();

  const StreamState &state() const {
    return state_;
  }

  const std::string &message_id() const {
    return message_id_;
  }

 private:
  void start_message(const openai::StreamChunk &chunk, std::vector<StreamEvent> &events);
  void on_text(const std::string &text, std::vector<StreamEvent> &events);
  void on_tool_call(const openai::ToolCallDelta &delta, std::vector<StreamEvent> &events);
  void stop_message(StopReason reason, std::vector<StreamEvent> &events);

  void close_text_block(std::vector<StreamEvent> &events);
  void close_tool_blocks(std::vector<StreamEvent> &events);
  ToolCallBlock *find_tool_block(int provider_index);

  std::string model_;
  std::string message_id_;
  StreamState state_;
};

// Parse one upstream SSE line ("data: {...}").
// Returns nullopt for "[DONE]", non-data lines and payloads that are not a valid chunk.
std::optional<openai::StreamChunk> parse_chunk_line(const std::string &line);

}  // namespace relay::translate
