#include "aikit/event_schema.hpp"

#include <unordered_map>
#include <utility>

#include "aikit/error.hpp"
#include "aikit/error_classifier.hpp"
#include "aikit/utils/values.hpp"

namespace aikit {
namespace {

using json = nlohmann::json;

const json* object_member(const json& payload, const char* key) {
  if (payload.is_object()) {
    auto it = payload.find(key);
    if (it != payload.end() && it->is_object()) {
      return &*it;
    }
  }
  return nullptr;
}

const json* array_member(const json& payload, const char* key) {
  if (payload.is_object()) {
    auto it = payload.find(key);
    if (it != payload.end() && it->is_array()) {
      return &*it;
    }
  }
  return nullptr;
}

std::string string_or_empty(const json& payload, const char* key) {
  return utils::optional_string(payload, key).value_or(std::string{});
}

ItemType item_type_from(const std::string& type) {
  if (type == "message") {
    return ItemType::Message;
  }
  if (type == "reasoning") {
    return ItemType::Reasoning;
  }
  const std::string_view suffix = "_call";
  if (type.size() > suffix.size() && type.compare(type.size() - suffix.size(), suffix.size(), suffix) == 0) {
    return ItemType::ToolCall;
  }
  return ItemType::Other;
}

std::string join_text_parts(const json* parts, std::string_view wanted_type) {
  std::string text;
  if (!parts) {
    return text;
  }
  for (const auto& part : *parts) {
    if (part.is_object() && string_or_empty(part, "type") == wanted_type) {
      text += string_or_empty(part, "text");
    }
  }
  return text;
}

// Text a finished item reports about itself; compared against the streamed fold only.
std::optional<std::string> advisory_text(const json& item, ItemType type) {
  if (type == ItemType::Message) {
    if (const json* content = array_member(item, "content")) {
      return join_text_parts(content, "output_text");
    }
  } else if (type == ItemType::Reasoning) {
    const json* content = array_member(item, "content");
    if (content && !content->empty()) {
      return join_text_parts(content, "reasoning_text");
    }
    if (const json* summary = array_member(item, "summary")) {
      return join_text_parts(summary, "summary_text");
    }
  }
  return std::nullopt;
}

ItemAdded item_added_from(const json& item, std::string id) {
  ItemAdded added;
  added.id = std::move(id);
  added.type = item_type_from(string_or_empty(item, "type"));
  added.name = utils::optional_string(item, "name");
  added.call_id = utils::optional_string(item, "call_id");
  added.role = utils::optional_string(item, "role");
  added.raw = item;
  return added;
}

ItemDone item_done_from(const json& item, std::string id) {
  ItemDone done;
  done.id = std::move(id);
  const ItemType type = item_type_from(string_or_empty(item, "type"));
  done.text = advisory_text(item, type);
  if (type == ItemType::ToolCall) {
    done.arguments = utils::optional_string(item, "arguments");
  }
  done.name = utils::optional_string(item, "name");
  done.raw = item;
  return done;
}

ResponseDone response_done_from(const json& response) {
  ResponseDone done;
  done.id = utils::optional_string(response, "id");
  done.model = utils::optional_string(response, "model");
  done.status = utils::optional_string(response, "status");
  if (const json* usage = object_member(response, "usage")) {
    done.usage = parse_usage(*usage);
  }
  if (const json* details = object_member(response, "incomplete_details")) {
    done.finish_reason = utils::optional_string(*details, "reason");
  }
  return done;
}

// An `error` frame carries its fields inline or nested under "error".
[[noreturn]] void throw_stream_error(const json& payload) {
  const json* nested = object_member(payload, "error");
  const json& body = nested ? *nested : payload;
  const auto code = utils::optional_string(body, "code");
  const bool server_side = !code || code->find("server") != std::string::npos || *code == "internal_error";
  ClassifiedError error = classify_status(server_side ? 500 : 400, {}, json{{"error", body}}.dump());
  error.status_code.reset();
  throw RequestError(std::move(error));
}

std::string required_item_id(const json& payload) {
  auto id = utils::optional_string(payload, "item_id");
  if (!id) {
    throw RequestError(classify_decode_failure("stream event is missing item_id: " + string_or_empty(payload, "type")));
  }
  return *id;
}

}  // namespace

EventKind parse_event_kind(std::string_view kind) {
  static const std::unordered_map<std::string_view, EventKind> kKinds = {
      {"response.created", EventKind::ResponseCreated},
      {"response.in_progress", EventKind::ResponseInProgress},
      {"response.output_item.added", EventKind::OutputItemAdded},
      {"response.output_text.delta", EventKind::OutputTextDelta},
      {"response.output_text.done", EventKind::OutputTextDone},
      {"response.reasoning_text.delta", EventKind::ReasoningTextDelta},
      {"response.reasoning_summary_text.delta", EventKind::ReasoningTextDelta},
      {"response.reasoning_text.done", EventKind::ReasoningTextDone},
      {"response.reasoning_summary_text.done", EventKind::ReasoningTextDone},
      {"response.function_call_arguments.delta", EventKind::FunctionCallArgumentsDelta},
      {"response.function_call_arguments.done", EventKind::FunctionCallArgumentsDone},
      {"response.output_item.done", EventKind::OutputItemDone},
      {"response.completed", EventKind::ResponseCompleted},
      {"response.failed", EventKind::ResponseFailed},
      {"response.incomplete", EventKind::ResponseIncomplete},
      {"error", EventKind::Error},
      {"chat.completion.chunk", EventKind::ChatCompletionChunk},
  };
  auto it = kKinds.find(kind);
  return it == kKinds.end() ? EventKind::Unknown : it->second;
}

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::ResponseCreated:
      return "response.created";
    case EventKind::ResponseInProgress:
      return "response.in_progress";
    case EventKind::OutputItemAdded:
      return "response.output_item.added";
    case EventKind::OutputTextDelta:
      return "response.output_text.delta";
    case EventKind::OutputTextDone:
      return "response.output_text.done";
    case EventKind::ReasoningTextDelta:
      return "response.reasoning_text.delta";
    case EventKind::ReasoningTextDone:
      return "response.reasoning_text.done";
    case EventKind::FunctionCallArgumentsDelta:
      return "response.function_call_arguments.delta";
    case EventKind::FunctionCallArgumentsDone:
      return "response.function_call_arguments.done";
    case EventKind::OutputItemDone:
      return "response.output_item.done";
    case EventKind::ResponseCompleted:
      return "response.completed";
    case EventKind::ResponseFailed:
      return "response.failed";
    case EventKind::ResponseIncomplete:
      return "response.incomplete";
    case EventKind::Error:
      return "error";
    case EventKind::ChatCompletionChunk:
      return "chat.completion.chunk";
    case EventKind::Unknown:
      break;
  }
  return "unknown";
}

std::string to_string(ItemType type) {
  switch (type) {
    case ItemType::Message:
      return "message";
    case ItemType::ToolCall:
      return "tool_call";
    case ItemType::Reasoning:
      return "reasoning";
    case ItemType::Other:
      break;
  }
  return "other";
}

std::string to_string(ItemState state) {
  switch (state) {
    case ItemState::Pending:
      return "pending";
    case ItemState::Streaming:
      return "streaming";
    case ItemState::Done:
      return "done";
  }
  return "unknown";
}

Usage parse_usage(const json& payload) {
  Usage usage;
  usage.raw = payload;
  if (!payload.is_object()) {
    return usage;
  }
  usage.input_tokens =
      utils::optional_int(payload, "input_tokens").value_or(utils::optional_int(payload, "prompt_tokens").value_or(0));
  usage.output_tokens = utils::optional_int(payload, "output_tokens")
                            .value_or(utils::optional_int(payload, "completion_tokens").value_or(0));
  usage.total_tokens = utils::optional_int(payload, "total_tokens").value_or(usage.input_tokens + usage.output_tokens);

  const json* input = object_member(payload, "input_tokens_details");
  if (!input) {
    input = object_member(payload, "prompt_tokens_details");
  }
  if (input) {
    InputTokensDetails details;
    details.cached_tokens = utils::optional_int(*input, "cached_tokens");
    details.audio_tokens = utils::optional_int(*input, "audio_tokens");
    usage.input_tokens_details = details;
  }

  const json* output = object_member(payload, "output_tokens_details");
  if (!output) {
    output = object_member(payload, "completion_tokens_details");
  }
  if (output) {
    OutputTokensDetails details;
    details.reasoning_tokens = utils::optional_int(*output, "reasoning_tokens");
    details.audio_tokens = utils::optional_int(*output, "audio_tokens");
    details.accepted_prediction_tokens = utils::optional_int(*output, "accepted_prediction_tokens");
    details.rejected_prediction_tokens = utils::optional_int(*output, "rejected_prediction_tokens");
    usage.output_tokens_details = details;
  }
  return usage;
}

std::vector<Delta> ResponsesEventSchema::map_frame(const Frame& frame) {
  const json& payload = frame.payload;
  std::vector<Delta> deltas;

  switch (parse_event_kind(frame.kind)) {
    case EventKind::ResponseCreated:
    case EventKind::ResponseInProgress:
      if (const json* response = object_member(payload, "response")) {
        deltas.push_back(ResponseStarted{utils::optional_string(*response, "id"),
                                         utils::optional_string(*response, "model"),
                                         utils::optional_string(*response, "status")});
      }
      break;
    case EventKind::OutputItemAdded: {
      const json* item = object_member(payload, "item");
      if (!item || !utils::optional_string(*item, "id")) {
        throw RequestError(classify_decode_failure("response.output_item.added without an item id"));
      }
      deltas.push_back(item_added_from(*item, item->at("id").get<std::string>()));
      break;
    }
    case EventKind::OutputTextDelta:
    case EventKind::ReasoningTextDelta:
      deltas.push_back(ItemDelta{required_item_id(payload), ItemField::Text, string_or_empty(payload, "delta")});
      break;
    case EventKind::FunctionCallArgumentsDelta:
      deltas.push_back(ItemDelta{required_item_id(payload), ItemField::Arguments, string_or_empty(payload, "delta")});
      break;
    case EventKind::OutputItemDone: {
      const json* item = object_member(payload, "item");
      if (!item || !utils::optional_string(*item, "id")) {
        throw RequestError(classify_decode_failure("response.output_item.done without an item id"));
      }
      deltas.push_back(item_done_from(*item, item->at("id").get<std::string>()));
      break;
    }
    case EventKind::ResponseCompleted:
    case EventKind::ResponseFailed:
    case EventKind::ResponseIncomplete:
      if (const json* response = object_member(payload, "response")) {
        deltas.push_back(response_done_from(*response));
      } else {
        deltas.push_back(ResponseDone{});
      }
      break;
    case EventKind::Error:
      throw_stream_error(payload);
    // Part-level done events repeat what the deltas already built.
    case EventKind::OutputTextDone:
    case EventKind::ReasoningTextDone:
    case EventKind::FunctionCallArgumentsDone:
    case EventKind::ChatCompletionChunk:
    case EventKind::Unknown:
      break;
  }
  return deltas;
}

std::vector<Delta> ResponsesEventSchema::map_complete(const json& body) const {
  if (!body.is_object()) {
    throw RequestError(classify_decode_failure("response body is not a JSON object"));
  }
  std::vector<Delta> deltas;
  deltas.push_back(ResponseStarted{utils::optional_string(body, "id"), utils::optional_string(body, "model"),
                                   utils::optional_string(body, "status")});

  if (const json* output = array_member(body, "output")) {
    std::size_t index = 0;
    for (const auto& item : *output) {
      std::string id = utils::optional_string(item, "id").value_or("output_" + std::to_string(index));
      ++index;
      ItemAdded added = item_added_from(item, id);
      ItemDone done = item_done_from(item, id);
      const ItemType type = added.type;
      deltas.push_back(std::move(added));
      if (done.text && !done.text->empty()) {
        deltas.push_back(ItemDelta{id, ItemField::Text, *done.text});
      }
      if (type == ItemType::ToolCall && done.arguments && !done.arguments->empty()) {
        deltas.push_back(ItemDelta{id, ItemField::Arguments, *done.arguments});
      }
      deltas.push_back(std::move(done));
    }
  }

  deltas.push_back(response_done_from(body));
  return deltas;
}

std::string chat_choice_item_id(const std::string& completion_id, int index) {
  return completion_id + ":choice:" + std::to_string(index);
}

ChatCompletionEventSchema::ChoiceState& ChatCompletionEventSchema::choice_state(int index) {
  auto it = choices_.find(index);
  if (it == choices_.end()) {
    ChoiceState state;
    state.message_id = chat_choice_item_id(response_id_.value_or(std::string{}), index);
    it = choices_.emplace(index, std::move(state)).first;
  }
  return it->second;
}

std::vector<Delta> ChatCompletionEventSchema::map_frame(const Frame& frame) {
  const json& payload = frame.payload;
  if (!payload.is_object()) {
    return {};
  }
  if (parse_event_kind(frame.kind) == EventKind::Error || object_member(payload, "error")) {
    throw_stream_error(payload);
  }
  const json* choices = array_member(payload, "choices");
  if (!choices && string_or_empty(payload, "object") != "chat.completion.chunk") {
    return {};
  }

  std::vector<Delta> deltas;
  if (!started_) {
    started_ = true;
    response_id_ = utils::optional_string(payload, "id");
    model_ = utils::optional_string(payload, "model");
    deltas.push_back(ResponseStarted{response_id_, model_, std::string("in_progress")});
  }

  if (choices) {
    for (const auto& choice : *choices) {
      const int index = static_cast<int>(utils::optional_int(choice, "index").value_or(0));
      ChoiceState& state = choice_state(index);
      const json* delta = object_member(choice, "delta");
      const json* tool_calls = delta ? array_member(*delta, "tool_calls") : nullptr;
      const auto content = delta ? utils::optional_string(*delta, "content") : std::nullopt;

      if (state.closed && (content || tool_calls)) {
        throw ProtocolViolationError(state.message_id, "chunk for a finished choice");
      }

      if (content) {
        if (!state.message_added) {
          ItemAdded added;
          added.id = state.message_id;
          added.type = ItemType::Message;
          added.role = utils::optional_string(*delta, "role").value_or("assistant");
          deltas.push_back(std::move(added));
          state.message_added = true;
        }
        if (!content->empty()) {
          deltas.push_back(ItemDelta{state.message_id, ItemField::Text, *content});
        }
      }

      if (tool_calls) {
        for (const auto& call : *tool_calls) {
          const int call_index = static_cast<int>(utils::optional_int(call, "index").value_or(0));
          const json* function = object_member(call, "function");
          auto known = state.tool_call_ids.find(call_index);
          if (known == state.tool_call_ids.end()) {
            ItemAdded added;
            added.call_id = utils::optional_string(call, "id");
            added.id = added.call_id.value_or(state.message_id + ":tool:" + std::to_string(call_index));
            added.type = ItemType::ToolCall;
            if (function) {
              added.name = utils::optional_string(*function, "name");
            }
            added.raw = call;
            known = state.tool_call_ids.emplace(call_index, added.id).first;
            deltas.push_back(std::move(added));
          }
          const std::string fragment = function ? string_or_empty(*function, "arguments") : std::string{};
          if (!fragment.empty()) {
            deltas.push_back(ItemDelta{known->second, ItemField::Arguments, fragment});
          }
        }
      }

      if (auto finish_reason = utils::optional_string(choice, "finish_reason"); finish_reason && !state.closed) {
        finish_reason_ = finish_reason;
        if (state.message_added) {
          deltas.push_back(ItemDone{state.message_id, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
        }
        for (const auto& [call_index, call_id] : state.tool_call_ids) {
          deltas.push_back(ItemDone{call_id, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
        }
        state.closed = true;
      }
    }
  }

  // Sent after the last choice chunk when `stream_options.include_usage` is set.
  if (const json* usage = object_member(payload, "usage")) {
    ResponseDone done;
    done.id = response_id_;
    done.model = model_;
    done.usage = parse_usage(*usage);
    done.status = "completed";
    done.finish_reason = finish_reason_;
    deltas.push_back(std::move(done));
    done_ = true;
  }
  return deltas;
}

std::vector<Delta> ChatCompletionEventSchema::map_end() {
  if (!started_ || done_) {
    return {};
  }
  done_ = true;
  ResponseDone done;
  done.id = response_id_;
  done.model = model_;
  done.status = finish_reason_ ? "completed" : "incomplete";
  done.finish_reason = finish_reason_;
  return {done};
}

std::vector<Delta> ChatCompletionEventSchema::map_complete(const json& body) const {
  if (!body.is_object()) {
    throw RequestError(classify_decode_failure("chat completion body is not a JSON object"));
  }
  const std::string completion_id = string_or_empty(body, "id");
  std::vector<Delta> deltas;
  deltas.push_back(ResponseStarted{utils::optional_string(body, "id"), utils::optional_string(body, "model"),
                                   std::string("in_progress")});

  std::optional<std::string> finish_reason;
  if (const json* choices = array_member(body, "choices")) {
    for (const auto& choice : *choices) {
      const int index = static_cast<int>(utils::optional_int(choice, "index").value_or(0));
      const std::string message_id = chat_choice_item_id(completion_id, index);
      if (!finish_reason) {
        finish_reason = utils::optional_string(choice, "finish_reason");
      }
      const json* message = object_member(choice, "message");
      if (!message) {
        continue;
      }
      if (auto content = utils::optional_string(*message, "content")) {
        ItemAdded added;
        added.id = message_id;
        added.type = ItemType::Message;
        added.role = utils::optional_string(*message, "role");
        added.raw = *message;
        deltas.push_back(std::move(added));
        if (!content->empty()) {
          deltas.push_back(ItemDelta{message_id, ItemField::Text, *content});
        }
        deltas.push_back(ItemDone{message_id, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
      }
      if (const json* tool_calls = array_member(*message, "tool_calls")) {
        int call_index = 0;
        for (const auto& call : *tool_calls) {
          const json* function = object_member(call, "function");
          ItemAdded added;
          added.call_id = utils::optional_string(call, "id");
          added.id = added.call_id.value_or(message_id + ":tool:" + std::to_string(call_index));
          added.type = ItemType::ToolCall;
          added.name = function ? utils::optional_string(*function, "name") : std::nullopt;
          added.raw = call;
          const std::string id = added.id;
          deltas.push_back(std::move(added));
          const std::string arguments = function ? string_or_empty(*function, "arguments") : std::string{};
          if (!arguments.empty()) {
            deltas.push_back(ItemDelta{id, ItemField::Arguments, arguments});
          }
          deltas.push_back(ItemDone{id, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
          ++call_index;
        }
      }
    }
  }

  ResponseDone done;
  done.id = utils::optional_string(body, "id");
  done.model = utils::optional_string(body, "model");
  if (const json* usage = object_member(body, "usage")) {
    done.usage = parse_usage(*usage);
  }
  done.status = "completed";
  done.finish_reason = finish_reason;
  deltas.push_back(std::move(done));
  return deltas;
}

}  // namespace aikit
