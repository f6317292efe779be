#include <gtest/gtest.h>

#include "translate/request_transformer.hpp"

using namespace relay;
using namespace relay::translate;

namespace {

anthropic::Request caller_request(const json &j) {
  return anthropic::Request::from_json(j);
}

}  // namespace

TEST(RequestTransformerTest, SystemPromptBecomesLeadingMessage) {
  auto request = caller_request({{"model", "claude-x"},
                                 {"max_tokens", 100},
                                 {"system", json::array({{{"type", "text"}, {"text", "Be brief."}}, {{"type", "text"}, {"text", "Use metric."}}})},
                                 {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  auto out = to_provider_format(request);

  ASSERT_EQ(out.messages.size(), 2u);
  EXPECT_EQ(out.messages[0].role, Role::System);
  EXPECT_EQ(out.messages[0].content_text(), "Be brief.\nUse metric.");
  EXPECT_EQ(out.messages[1].role, Role::User);
  EXPECT_EQ(out.messages[1].content_text(), "hi");
  EXPECT_EQ(out.max_tokens, 100);
}

TEST(RequestTransformerTest, EmptySystemPromptProducesNoMessage) {
  auto request = caller_request({{"model", "m"}, {"system", ""}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  auto out = to_provider_format(request);
  ASSERT_EQ(out.messages.size(), 1u);
  EXPECT_EQ(out.messages[0].role, Role::User);
}

TEST(RequestTransformerTest, SingleTextBlockCollapsesToString) {
  auto request = caller_request(
      {{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", json::array({{{"type", "text"}, {"text", "hello"}}})}}})}});

  json wire = to_provider_format(request).to_json();
  EXPECT_EQ(wire["messages"][0]["content"], "hello");
}

TEST(RequestTransformerTest, ImagesBecomeDataUris) {
  auto request = caller_request(
      {{"model", "m"},
       {"messages",
        json::array({{{"role", "user"},
                      {"content", json::array({{{"type", "text"}, {"text", "what is this?"}},
                                               {{"type", "image"}, {"source", {{"type", "base64"}, {"media_type", "image/png"}, {"data", "iVBORw0"}}}}})}}})}});

  json wire = to_provider_format(request).to_json();
  const auto &content = wire["messages"][0]["content"];
  ASSERT_TRUE(content.is_array());
  ASSERT_EQ(content.size(), 2u);
  EXPECT_EQ(content[0]["type"], "text");
  EXPECT_EQ(content[1]["type"], "image_url");
  EXPECT_EQ(content[1]["image_url"]["url"], "data:image/png;base64,iVBORw0");
}

TEST(RequestTransformerTest, ToolResultsBecomeToolMessagesFirst) {
  auto request = caller_request(
      {{"model", "m"},
       {"messages",
        json::array({{{"role", "user"},
                      {"content",
                       json::array({{{"type", "text"}, {"text", "here you go"}},
                                    {{"type", "tool_result"}, {"tool_use_id", "call_1"}, {"content", "sunny"}},
                                    {{"type", "tool_result"},
                                     {"tool_use_id", "call_2"},
                                     {"is_error", true},
                                     {"content", json::array({{{"type", "text"}, {"text", "line one"}}, {{"type", "text"}, {"text", "line two"}}})}}})}}})}});

  auto out = to_provider_format(request);

  ASSERT_EQ(out.messages.size(), 3u);
  EXPECT_EQ(out.messages[0].role, Role::Tool);
  EXPECT_EQ(out.messages[0].tool_call_id, "call_1");
  EXPECT_EQ(out.messages[0].content_text(), "sunny");
  EXPECT_EQ(out.messages[1].role, Role::Tool);
  EXPECT_EQ(out.messages[1].tool_call_id, "call_2");
  EXPECT_EQ(out.messages[1].content_text(), "[ERROR] line one\nline two");
  EXPECT_EQ(out.messages[2].role, Role::User);
  EXPECT_EQ(out.messages[2].content_text(), "here you go");
}

TEST(RequestTransformerTest, EmptyUserBlocksBecomeEmptyString) {
  auto request = caller_request(
      {{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", json::array({{{"type", "thinking"}, {"thinking", "hmm"}}})}}})}});

  json wire = to_provider_format(request).to_json();
  ASSERT_EQ(wire["messages"].size(), 1u);
  EXPECT_EQ(wire["messages"][0]["role"], "user");
  EXPECT_EQ(wire["messages"][0]["content"], "");
}

TEST(RequestTransformerTest, AssistantTextAndToolUseMerge) {
  auto request = caller_request(
      {{"model", "m"},
       {"messages",
        json::array({{{"role", "user"}, {"content", "weather in Paris?"}},
                     {{"role", "assistant"},
                      {"content",
                       json::array({{{"type", "thinking"}, {"thinking", "need a tool"}},
                                    {{"type", "text"}, {"text", "Let me check."}},
                                    {{"type", "tool_use"}, {"id", "toolu_1"}, {"name", "get_weather"}, {"input", {{"city", "Paris"}}}}})}}})}});

  json wire = to_provider_format(request).to_json();
  const auto &assistant = wire["messages"][1];
  EXPECT_EQ(assistant["role"], "assistant");
  EXPECT_EQ(assistant["content"], "Let me check.");
  ASSERT_EQ(assistant["tool_calls"].size(), 1u);
  EXPECT_EQ(assistant["tool_calls"][0]["id"], "toolu_1");
  EXPECT_EQ(assistant["tool_calls"][0]["type"], "function");
  EXPECT_EQ(assistant["tool_calls"][0]["function"]["name"], "get_weather");
  EXPECT_EQ(json::parse(assistant["tool_calls"][0]["function"]["arguments"].get<std::string>()), json({{"city", "Paris"}}));
}

TEST(RequestTransformerTest, AssistantWithOnlyToolUseHasNullContent) {
  auto request = caller_request(
      {{"model", "m"},
       {"messages",
        json::array({{{"role", "assistant"},
                      {"content", json::array({{{"type", "tool_use"}, {"id", "t"}, {"name", "ls"}, {"input", json::object()}}})}}})}});

  json wire = to_provider_format(request).to_json();
  EXPECT_TRUE(wire["messages"][0]["content"].is_null());
  EXPECT_EQ(wire["messages"][0]["tool_calls"][0]["function"]["arguments"], "{}");
}

TEST(RequestTransformerTest, SamplingAndStreamingOptions) {
  auto request = caller_request({{"model", "m"},
                                 {"max_tokens", 256},
                                 {"temperature", 0.5},
                                 {"top_p", 0.9},
                                 {"top_k", 40},
                                 {"stop_sequences", {"END"}},
                                 {"stream", true},
                                 {"metadata", {{"user_id", "u-1"}}},
                                 {"tools", json::array({{{"name", "ls"}, {"description", "list"}, {"input_schema", {{"type", "object"}}}}})},
                                 {"tool_choice", {{"type", "any"}}},
                                 {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  json wire = to_provider_format(request).to_json();
  EXPECT_EQ(wire["max_tokens"], 256);
  EXPECT_DOUBLE_EQ(wire["temperature"].get<double>(), 0.5);
  EXPECT_DOUBLE_EQ(wire["top_p"].get<double>(), 0.9);
  EXPECT_FALSE(wire.contains("top_k"));
  EXPECT_EQ(wire["stop"], json({"END"}));
  EXPECT_EQ(wire["stream"], true);
  EXPECT_EQ(wire["stream_options"]["include_usage"], true);
  EXPECT_EQ(wire["user"], "u-1");
  EXPECT_EQ(wire["tools"][0]["function"]["name"], "ls");
  EXPECT_EQ(wire["tool_choice"], "required");
}

TEST(RequestTransformerTest, AbsentFieldsAreOmitted) {
  auto request = caller_request({{"model", "m"}, {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  json wire = to_provider_format(request).to_json();
  EXPECT_FALSE(wire.contains("max_tokens"));
  EXPECT_FALSE(wire.contains("temperature"));
  EXPECT_FALSE(wire.contains("stop"));
  EXPECT_FALSE(wire.contains("tools"));
  EXPECT_FALSE(wire.contains("stream_options"));
  EXPECT_EQ(wire["stream"], false);
}

TEST(RequestTransformerTest, InputIsNotModified) {
  auto request = caller_request({{"model", "m"},
                                 {"system", "sys"},
                                 {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});
  json before = request.to_json();

  to_provider_format(request);

  EXPECT_EQ(request.to_json(), before);
}

TEST(RequestTransformerTest, PlainTextConversationRoundTrip) {
  auto request = caller_request({{"model", "m"},
                                 {"max_tokens", 64},
                                 {"system", "You are terse."},
                                 {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  auto back = to_caller_format(to_provider_format(request));

  EXPECT_EQ(back.system_text(), "You are terse.");
  ASSERT_EQ(back.messages.size(), 1u);
  EXPECT_EQ(back.messages[0].role, Role::User);
  ASSERT_TRUE(std::holds_alternative<std::string>(back.messages[0].content));
  EXPECT_EQ(std::get<std::string>(back.messages[0].content), "hi");
  EXPECT_EQ(back.max_tokens, 64);
}

TEST(RequestTransformerTest, ToolConversationRoundTrip) {
  auto request = caller_request(
      {{"model", "m"},
       {"max_tokens", 64},
       {"messages",
        json::array({{{"role", "user"}, {"content", "weather?"}},
                     {{"role", "assistant"},
                      {"content", json::array({{{"type", "tool_use"}, {"id", "call_9"}, {"name", "get_weather"}, {"input", {{"city", "Oslo"}}}}})}},
                     {{"role", "user"}, {"content", json::array({{{"type", "tool_result"}, {"tool_use_id", "call_9"}, {"content", "cold"}}})}}})}});

  auto provider = to_provider_format(request);
  ASSERT_EQ(provider.messages.size(), 3u);
  EXPECT_EQ(provider.messages[2].role, Role::Tool);

  auto back = to_caller_format(provider);
  ASSERT_EQ(back.messages.size(), 3u);

  const auto &assistant = std::get<std::vector<anthropic::ContentBlock>>(back.messages[1].content);
  ASSERT_EQ(assistant.size(), 1u);
  const auto &tool_use = std::get<anthropic::ToolUseBlock>(assistant[0]);
  EXPECT_EQ(tool_use.id, "call_9");
  EXPECT_EQ(tool_use.name, "get_weather");
  EXPECT_EQ(tool_use.input, json({{"city", "Oslo"}}));

  EXPECT_EQ(back.messages[2].role, Role::User);
  const auto &results = std::get<std::vector<anthropic::ContentBlock>>(back.messages[2].content);
  ASSERT_EQ(results.size(), 1u);
  const auto &result = std::get<anthropic::ToolResultBlock>(results[0]);
  EXPECT_EQ(result.tool_use_id, "call_9");
  EXPECT_EQ(result.content_text(), "cold");
}

TEST(RequestTransformerTest, ConsecutiveToolMessagesShareUserTurn) {
  auto request = openai::Request::from_json(
      {{"model", "gpt-4o"},
       {"messages",
        json::array({{{"role", "system"}, {"content", "a"}},
                     {{"role", "system"}, {"content", "b"}},
                     {{"role", "assistant"}, {"content", nullptr}},
                     {{"role", "tool"}, {"tool_call_id", "c1"}, {"content", "r1"}},
                     {{"role", "tool"}, {"tool_call_id", "c2"}, {"content", "r2"}}})}});

  auto out = to_caller_format(request);

  EXPECT_EQ(out.system_text(), "a\nb");
  ASSERT_EQ(out.messages.size(), 2u);

  // Empty assistant message keeps one empty text block
  const auto &assistant = std::get<std::vector<anthropic::ContentBlock>>(out.messages[0].content);
  ASSERT_EQ(assistant.size(), 1u);
  EXPECT_EQ(std::get<anthropic::TextBlock>(assistant[0]).text, "");

  const auto &results = std::get<std::vector<anthropic::ContentBlock>>(out.messages[1].content);
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(std::get<anthropic::ToolResultBlock>(results[0]).tool_use_id, "c1");
  EXPECT_EQ(std::get<anthropic::ToolResultBlock>(results[1]).tool_use_id, "c2");
}

TEST(RequestTransformerTest, CallerFormatDefaultsAndMapping) {
  auto request = openai::Request::from_json({{"model", "gpt-4o"},
                                             {"max_completion_tokens", 77},
                                             {"stop", "DONE"},
                                             {"user", "u-2"},
                                             {"tool_choice", {{"type", "function"}, {"function", {{"name", "ls"}}}}},
                                             {"messages", json::array({{{"role", "user"}, {"content", "hi"}}})}});

  auto out = to_caller_format(request);
  EXPECT_EQ(out.max_tokens, 77);
  EXPECT_EQ(out.stop_sequences, std::vector<std::string>{"DONE"});
  EXPECT_EQ(out.user_id, "u-2");
  ASSERT_TRUE(out.tool_choice.has_value());
  EXPECT_EQ(out.tool_choice->type, "tool");
  EXPECT_EQ(out.tool_choice->name, "ls");

  auto bare = to_caller_format(openai::Request::from_json({{"model", "gpt-4o"}, {"messages", json::array()}}));
  EXPECT_EQ(bare.max_tokens, 4096);
  EXPECT_FALSE(bare.system.has_value());
}

TEST(RequestTransformerTest, UnparsableImageUriIsSkipped) {
  auto request = openai::Request::from_json(
      {{"model", "gpt-4o"},
       {"messages",
        json::array({{{"role", "user"},
                      {"content", json::array({{{"type", "text"}, {"text", "look"}},
                                               {{"type", "image_url"}, {"image_url", {{"url", "https://example.com/cat.png"}}}},
                                               {{"type", "image_url"}, {"image_url", {{"url", "data:image/jpeg;base64,/9j/4AAQ"}}}}})}}})}});

  auto out = to_caller_format(request);
  const auto &blocks = std::get<std::vector<anthropic::ContentBlock>>(out.messages[0].content);
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(std::get<anthropic::TextBlock>(blocks[0]).text, "look");
  const auto &image = std::get<anthropic::ImageBlock>(blocks[1]);
  EXPECT_EQ(image.media_type, "image/jpeg");
  EXPECT_EQ(image.data, "/9j/4AAQ");
}

TEST(RequestTransformerTest, DataUriParsing) {
  EXPECT_EQ(to_data_uri("image/gif", "R0lG"), "data:image/gif;base64,R0lG");

  auto parsed = parse_data_uri("data:image/webp;base64,UklGR");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->media_type, "image/webp");
  EXPECT_EQ(parsed->data, "UklGR");

  EXPECT_FALSE(parse_data_uri("https://example.com/a.png").has_value());
  EXPECT_FALSE(parse_data_uri("data:image/png,rawbytes").has_value());
  EXPECT_FALSE(parse_data_uri("data:;base64,abc").has_value());
  EXPECT_FALSE(parse_data_uri("data:image/png;base64,").has_value());
}
