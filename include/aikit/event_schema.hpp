#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "aikit/frame_decoder.hpp"

namespace aikit {

enum class EventKind {
  ResponseCreated,
  ResponseInProgress,
  OutputItemAdded,
  OutputTextDelta,
  OutputTextDone,
  ReasoningTextDelta,
  ReasoningTextDone,
  FunctionCallArgumentsDelta,
  FunctionCallArgumentsDone,
  OutputItemDone,
  ResponseCompleted,
  ResponseFailed,
  ResponseIncomplete,
  Error,
  ChatCompletionChunk,
  Unknown
};

EventKind parse_event_kind(std::string_view kind);
std::string to_string(EventKind kind);

enum class ItemType { Message, ToolCall, Reasoning, Other };
enum class ItemState { Pending, Streaming, Done };
enum class ItemField { Text, Arguments };

std::string to_string(ItemType type);
std::string to_string(ItemState state);

struct InputTokensDetails {
  std::optional<std::int64_t> cached_tokens;
  std::optional<std::int64_t> audio_tokens;
};

struct OutputTokensDetails {
  std::optional<std::int64_t> reasoning_tokens;
  std::optional<std::int64_t> audio_tokens;
  std::optional<std::int64_t> accepted_prediction_tokens;
  std::optional<std::int64_t> rejected_prediction_tokens;
};

struct Usage {
  std::int64_t input_tokens = 0;
  std::int64_t output_tokens = 0;
  std::int64_t total_tokens = 0;
  std::optional<InputTokensDetails> input_tokens_details;
  std::optional<OutputTokensDetails> output_tokens_details;
  nlohmann::json raw = nlohmann::json::object();
};

Usage parse_usage(const nlohmann::json& payload);

struct ResponseStarted {
  std::optional<std::string> id;
  std::optional<std::string> model;
  std::optional<std::string> status;
};

struct ItemAdded {
  std::string id;
  ItemType type = ItemType::Other;
  std::optional<std::string> name;
  std::optional<std::string> call_id;
  std::optional<std::string> role;
  nlohmann::json raw = nlohmann::json::object();
};

struct ItemDelta {
  std::string id;
  ItemField field = ItemField::Text;
  std::string fragment;
};

struct ItemDone {
  std::string id;
  std::optional<std::string> text;
  std::optional<std::string> arguments;
  std::optional<std::string> name;
  std::optional<nlohmann::json> raw;
};

struct ResponseDone {
  std::optional<std::string> id;
  std::optional<std::string> model;
  std::optional<Usage> usage;
  std::optional<std::string> status;
  std::optional<std::string> finish_reason;
};

using Delta = std::variant<ResponseStarted, ItemAdded, ItemDelta, ItemDone, ResponseDone>;

// One instance per session; implementations may keep state across frames.
class EventSchema {
public:
  virtual ~EventSchema() = default;

  virtual std::string name() const = 0;

  virtual std::vector<Delta> map_frame(const Frame& frame) = 0;

  virtual std::vector<Delta> map_end() { return {}; }

  virtual std::vector<Delta> map_complete(const nlohmann::json& body) const = 0;

  virtual bool supports_streaming() const { return true; }
};

class ResponsesEventSchema : public EventSchema {
public:
  std::string name() const override { return "responses"; }
  std::vector<Delta> map_frame(const Frame& frame) override;
  std::vector<Delta> map_complete(const nlohmann::json& body) const override;
};

class ChatCompletionEventSchema : public EventSchema {
public:
  std::string name() const override { return "chat.completions"; }
  std::vector<Delta> map_frame(const Frame& frame) override;
  std::vector<Delta> map_end() override;
  std::vector<Delta> map_complete(const nlohmann::json& body) const override;

private:
  struct ChoiceState {
    std::string message_id;
    bool message_added = false;
    bool closed = false;
    std::map<int, std::string> tool_call_ids;
  };

  ChoiceState& choice_state(int index);

  std::optional<std::string> response_id_;
  std::optional<std::string> model_;
  std::optional<std::string> finish_reason_;
  std::map<int, ChoiceState> choices_;
  bool started_ = false;
  bool done_ = false;
};

std::string chat_choice_item_id(const std::string& completion_id, int index);

}  // namespace aikit
