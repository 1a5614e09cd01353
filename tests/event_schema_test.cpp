#include <gtest/gtest.h>

#include "aikit/error.hpp"
#include "aikit/event_schema.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using aikit::ChatCompletionEventSchema;
using aikit::Delta;
using aikit::ErrorKind;
using aikit::EventKind;
using aikit::Frame;
using aikit::ItemAdded;
using aikit::ItemDelta;
using aikit::ItemDone;
using aikit::ItemField;
using aikit::ItemType;
using aikit::ProtocolViolationError;
using aikit::RequestError;
using aikit::ResponseDone;
using aikit::ResponsesEventSchema;
using aikit::ResponseStarted;
using json = nlohmann::json;

namespace {

Frame frame_of(const json& payload) {
  Frame frame;
  frame.kind = payload.value("type", std::string("message"));
  frame.payload = payload;
  return frame;
}

json chat_chunk(const json& choices) {
  return json{{"id", "chatcmpl_1"}, {"object", "chat.completion.chunk"}, {"model", "gpt-test"}, {"choices", choices}};
}

}  // namespace

TEST(EventKindTest, ParsesKnownKindsAndFallsBackToUnknown) {
  EXPECT_EQ(aikit::parse_event_kind("response.output_text.delta"), EventKind::OutputTextDelta);
  EXPECT_EQ(aikit::parse_event_kind("response.reasoning_summary_text.delta"), EventKind::ReasoningTextDelta);
  EXPECT_EQ(aikit::parse_event_kind("response.audio.delta"), EventKind::Unknown);
  EXPECT_EQ(aikit::to_string(EventKind::ResponseCompleted), "response.completed");
}

TEST(UsageTest, AcceptsChatCompletionSpelling) {
  auto usage = aikit::parse_usage(json{{"prompt_tokens", 4},
                                       {"completion_tokens", 6},
                                       {"completion_tokens_details", {{"reasoning_tokens", 1}}}});
  EXPECT_EQ(usage.input_tokens, 4);
  EXPECT_EQ(usage.output_tokens, 6);
  EXPECT_EQ(usage.total_tokens, 10);
  EXPECT_FALSE(usage.input_tokens_details.has_value());
  ASSERT_TRUE(usage.output_tokens_details.has_value());
  EXPECT_EQ(usage.output_tokens_details->reasoning_tokens, 1);
}

TEST(UsageTest, KeepsCountersPastThirtyTwoBits) {
  auto usage = aikit::parse_usage(json{{"input_tokens", std::int64_t{3000000000}}, {"output_tokens", 1}});
  EXPECT_EQ(usage.input_tokens, std::int64_t{3000000000});
  EXPECT_EQ(usage.total_tokens, std::int64_t{3000000001});
}

TEST(ResponsesEventSchemaTest, MapsLifecycleEvents) {
  ResponsesEventSchema schema;

  auto started = schema.map_frame(frame_of(
      {{"type", "response.created"}, {"response", {{"id", "resp_1"}, {"model", "gpt-test"}, {"status", "in_progress"}}}}));
  ASSERT_EQ(started.size(), 1u);
  ASSERT_TRUE(std::holds_alternative<ResponseStarted>(started[0]));
  EXPECT_EQ(std::get<ResponseStarted>(started[0]).id, "resp_1");

  auto added = schema.map_frame(frame_of(
      {{"type", "response.output_item.added"},
       {"item", {{"id", "fc_1"}, {"type", "function_call"}, {"name", "lookup"}, {"call_id", "call_1"}}}}));
  ASSERT_EQ(added.size(), 1u);
  const auto& item = std::get<ItemAdded>(added[0]);
  EXPECT_EQ(item.id, "fc_1");
  EXPECT_EQ(item.type, ItemType::ToolCall);
  EXPECT_EQ(item.name, "lookup");
  EXPECT_EQ(item.call_id, "call_1");

  auto args = schema.map_frame(
      frame_of({{"type", "response.function_call_arguments.delta"}, {"item_id", "fc_1"}, {"delta", "{\"q\""}}));
  ASSERT_EQ(args.size(), 1u);
  EXPECT_EQ(std::get<ItemDelta>(args[0]).field, ItemField::Arguments);
  EXPECT_EQ(std::get<ItemDelta>(args[0]).fragment, "{\"q\"");

  auto text = schema.map_frame(
      frame_of({{"type", "response.reasoning_text.delta"}, {"item_id", "rs_1"}, {"delta", "thinking"}}));
  ASSERT_EQ(text.size(), 1u);
  EXPECT_EQ(std::get<ItemDelta>(text[0]).field, ItemField::Text);

  auto completed = schema.map_frame(
      frame_of({{"type", "response.incomplete"},
                {"response",
                 {{"id", "resp_1"},
                  {"status", "incomplete"},
                  {"incomplete_details", {{"reason", "max_output_tokens"}}},
                  {"usage", {{"input_tokens", 1}, {"output_tokens", 2}}}}}}));
  ASSERT_EQ(completed.size(), 1u);
  const auto& done = std::get<ResponseDone>(completed[0]);
  EXPECT_EQ(done.status, "incomplete");
  EXPECT_EQ(done.finish_reason, "max_output_tokens");
  ASSERT_TRUE(done.usage.has_value());
  EXPECT_EQ(done.usage->total_tokens, 3);
}

TEST(ResponsesEventSchemaTest, ItemDoneCarriesAdvisoryText) {
  ResponsesEventSchema schema;
  auto deltas = schema.map_frame(frame_of(
      {{"type", "response.output_item.done"},
       {"item",
        {{"id", "msg_1"},
         {"type", "message"},
         {"content", json::array({{{"type", "output_text"}, {"text", "Hel"}}, {{"type", "output_text"}, {"text", "lo"}}})}}}}));
  ASSERT_EQ(deltas.size(), 1u);
  const auto& done = std::get<ItemDone>(deltas[0]);
  EXPECT_EQ(done.text, "Hello");
  EXPECT_FALSE(done.arguments.has_value());
}

TEST(ResponsesEventSchemaTest, IgnoresPartLevelDoneAndUnknownKinds) {
  ResponsesEventSchema schema;
  EXPECT_TRUE(schema.map_frame(frame_of({{"type", "response.output_text.done"}, {"item_id", "msg_1"}, {"text", "x"}}))
                  .empty());
  EXPECT_TRUE(schema.map_frame(frame_of({{"type", "response.audio.delta"}, {"delta", "AAAA"}})).empty());
}

TEST(ResponsesEventSchemaTest, DeltaWithoutItemIdIsDecodeFailure) {
  ResponsesEventSchema schema;
  try {
    schema.map_frame(frame_of({{"type", "response.output_text.delta"}, {"delta", "x"}}));
    FAIL() << "expected decodingFailed";
  } catch (const RequestError& error) {
    EXPECT_EQ(error.kind(), ErrorKind::DecodingFailed);
  }
}

TEST(ResponsesEventSchemaTest, ErrorFrameIsClassifiedByCode) {
  ResponsesEventSchema schema;
  try {
    schema.map_frame(frame_of({{"type", "error"}, {"code", "rate_limit_exceeded"}, {"message", "slow down"}}));
    FAIL() << "expected error frame to throw";
  } catch (const RequestError& error) {
    EXPECT_FALSE(error.status_code().has_value());
    EXPECT_EQ(error.kind(), ErrorKind::ClientError);
    EXPECT_EQ(error.classified().code, "rate_limit_exceeded");
  }

  try {
    schema.map_frame(frame_of({{"type", "error"}, {"code", "server_error"}, {"message", "boom"}}));
    FAIL() << "expected error frame to throw";
  } catch (const RequestError& error) {
    EXPECT_EQ(error.kind(), ErrorKind::ServerError);
    EXPECT_TRUE(error.retryable());
  }
}

TEST(ChatCompletionEventSchemaTest, MapsContentToChoiceItem) {
  ChatCompletionEventSchema schema;
  auto first = schema.map_frame(frame_of(chat_chunk(
      json::array({{{"index", 0}, {"delta", {{"role", "assistant"}, {"content", "Hel"}}}, {"finish_reason", nullptr}}}))));
  ASSERT_EQ(first.size(), 3u);
  EXPECT_EQ(std::get<ResponseStarted>(first[0]).id, "chatcmpl_1");
  const auto& added = std::get<ItemAdded>(first[1]);
  EXPECT_EQ(added.id, "chatcmpl_1:choice:0");
  EXPECT_EQ(added.type, ItemType::Message);
  EXPECT_EQ(added.role, "assistant");
  EXPECT_EQ(std::get<ItemDelta>(first[2]).fragment, "Hel");

  auto second =
      schema.map_frame(frame_of(chat_chunk(json::array({{{"index", 0}, {"delta", {{"content", "lo"}}}}}))));
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(std::get<ItemDelta>(second[0]).fragment, "lo");

  auto finish = schema.map_frame(
      frame_of(chat_chunk(json::array({{{"index", 0}, {"delta", json::object()}, {"finish_reason", "stop"}}}))));
  ASSERT_EQ(finish.size(), 1u);
  EXPECT_EQ(std::get<ItemDone>(finish[0]).id, "chatcmpl_1:choice:0");

  auto end = schema.map_end();
  ASSERT_EQ(end.size(), 1u);
  const auto& done = std::get<ResponseDone>(end[0]);
  EXPECT_EQ(done.status, "completed");
  EXPECT_EQ(done.finish_reason, "stop");
}

TEST(ChatCompletionEventSchemaTest, MapsToolCallsByIndex) {
  ChatCompletionEventSchema schema;
  auto opened = schema.map_frame(frame_of(chat_chunk(json::array(
      {{{"index", 0},
        {"delta",
         {{"tool_calls",
           json::array({{{"index", 0},
                         {"id", "call_a"},
                         {"type", "function"},
                         {"function", {{"name", "lookup"}, {"arguments", ""}}}}})}}}}}))));
  ASSERT_EQ(opened.size(), 2u);
  const auto& added = std::get<ItemAdded>(opened[1]);
  EXPECT_EQ(added.id, "call_a");
  EXPECT_EQ(added.type, ItemType::ToolCall);
  EXPECT_EQ(added.name, "lookup");

  auto fragment = schema.map_frame(frame_of(chat_chunk(json::array(
      {{{"index", 0},
        {"delta", {{"tool_calls", json::array({{{"index", 0}, {"function", {{"arguments", "{\"q\":"}}}}})}}}}}))));
  ASSERT_EQ(fragment.size(), 1u);
  const auto& delta = std::get<ItemDelta>(fragment[0]);
  EXPECT_EQ(delta.id, "call_a");
  EXPECT_EQ(delta.field, ItemField::Arguments);
  EXPECT_EQ(delta.fragment, "{\"q\":");
}

TEST(ChatCompletionEventSchemaTest, UsageChunkCompletesResponse) {
  ChatCompletionEventSchema schema;
  schema.map_frame(frame_of(chat_chunk(json::array({{{"index", 0}, {"delta", {{"content", "x"}}}}}))));
  json usage_chunk = chat_chunk(json::array());
  usage_chunk["usage"] = {{"prompt_tokens", 3}, {"completion_tokens", 1}, {"total_tokens", 4}};
  auto deltas = schema.map_frame(frame_of(usage_chunk));
  ASSERT_EQ(deltas.size(), 1u);
  const auto& done = std::get<ResponseDone>(deltas[0]);
  ASSERT_TRUE(done.usage.has_value());
  EXPECT_EQ(done.usage->total_tokens, 4);
  EXPECT_TRUE(schema.map_end().empty());
}

TEST(ChatCompletionEventSchemaTest, TruncatedStreamEndsIncomplete) {
  ChatCompletionEventSchema schema;
  EXPECT_TRUE(schema.map_end().empty());
  schema.map_frame(frame_of(chat_chunk(json::array({{{"index", 0}, {"delta", {{"content", "x"}}}}}))));
  auto end = schema.map_end();
  ASSERT_EQ(end.size(), 1u);
  EXPECT_EQ(std::get<ResponseDone>(end[0]).status, "incomplete");
}

TEST(ChatCompletionEventSchemaTest, ContentAfterFinishIsViolation) {
  ChatCompletionEventSchema schema;
  schema.map_frame(frame_of(
      chat_chunk(json::array({{{"index", 0}, {"delta", {{"content", "x"}}}, {"finish_reason", "stop"}}}))));
  EXPECT_THROW(
      schema.map_frame(frame_of(chat_chunk(json::array({{{"index", 0}, {"delta", {{"content", "late"}}}}})))),
      ProtocolViolationError);
}

TEST(ChatCompletionEventSchemaTest, MapCompleteFoldsWholeBody) {
  const ChatCompletionEventSchema schema;
  const json body = {
      {"id", "chatcmpl_2"},
      {"object", "chat.completion"},
      {"model", "gpt-test"},
      {"choices",
       json::array({{{"index", 0},
                     {"finish_reason", "tool_calls"},
                     {"message",
                      {{"role", "assistant"},
                       {"content", "ok"},
                       {"tool_calls",
                        json::array({{{"id", "call_z"},
                                      {"type", "function"},
                                      {"function", {{"name", "f"}, {"arguments", "{}"}}}}})}}}}})},
      {"usage", {{"prompt_tokens", 1}, {"completion_tokens", 1}, {"total_tokens", 2}}}};

  std::vector<Delta> deltas = schema.map_complete(body);
  ASSERT_EQ(deltas.size(), 8u);
  EXPECT_TRUE(std::holds_alternative<ResponseStarted>(deltas.front()));
  EXPECT_EQ(std::get<ItemAdded>(deltas[1]).id, "chatcmpl_2:choice:0");
  EXPECT_EQ(std::get<ItemAdded>(deltas[4]).id, "call_z");
  EXPECT_EQ(std::get<ItemDelta>(deltas[5]).fragment, "{}");
  const auto& done = std::get<ResponseDone>(deltas.back());
  EXPECT_EQ(done.finish_reason, "tool_calls");
}
