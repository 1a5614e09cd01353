#include "aikit/event_reconstructor.hpp"

#include <utility>
#include <variant>

#include "aikit/error.hpp"

namespace aikit {
namespace {

template <typename T>
bool assign_if_changed(std::optional<T>& target, const std::optional<T>& value) {
  if (!value || target == value) {
    return false;
  }
  target = value;
  return true;
}

}  // namespace

std::string AccumulatedResult::output_text() const {
  std::string text;
  for (const auto& item : items) {
    if (item.type == ItemType::Message) {
      text += item.text;
    }
  }
  return text;
}

const OutputItem* AccumulatedResult::find_item(std::string_view item_id) const {
  for (const auto& item : items) {
    if (item.id == item_id) {
      return &item;
    }
  }
  return nullptr;
}

EventReconstructor::EventReconstructor(Logger logger) : logger_(std::move(logger)) {}

bool EventReconstructor::apply(const Delta& delta) {
  return std::visit([this](const auto& value) { return handle(value); }, delta);
}

bool EventReconstructor::apply_all(const std::vector<Delta>& deltas) {
  bool changed = false;
  for (const auto& delta : deltas) {
    changed = apply(delta) || changed;
  }
  return changed;
}

void EventReconstructor::ensure_open(const std::string& item_id, const char* action) const {
  if (result_.completed) {
    throw ProtocolViolationError(item_id, std::string(action) + " after response completed");
  }
}

OutputItem& EventReconstructor::open_item(const std::string& item_id, const char* action) {
  ensure_open(item_id, action);
  auto it = index_by_id_.find(item_id);
  if (it == index_by_id_.end()) {
    throw ProtocolViolationError(item_id, std::string(action) + " for unknown output item");
  }
  OutputItem& item = result_.items[it->second];
  if (item.state == ItemState::Done) {
    throw ProtocolViolationError(item_id, std::string(action) + " for completed output item");
  }
  return item;
}

bool EventReconstructor::handle(const ResponseStarted& started) {
  ensure_open(started.id.value_or(result_.id.value_or("")), "response start");
  bool changed = assign_if_changed(result_.id, started.id);
  changed = assign_if_changed(result_.model, started.model) || changed;
  changed = assign_if_changed(result_.status, started.status) || changed;
  return changed;
}

bool EventReconstructor::handle(const ItemAdded& added) {
  ensure_open(added.id, "add");
  if (index_by_id_.count(added.id) > 0) {
    throw ProtocolViolationError(added.id, "duplicate output item");
  }
  OutputItem item;
  item.id = added.id;
  item.type = added.type;
  item.name = added.name;
  item.call_id = added.call_id;
  item.role = added.role;
  item.raw = added.raw;
  index_by_id_.emplace(item.id, result_.items.size());
  result_.items.push_back(std::move(item));
  return true;
}

bool EventReconstructor::handle(const ItemDelta& delta) {
  OutputItem& item = open_item(delta.id, "delta");
  bool changed = false;
  if (item.state == ItemState::Pending) {
    item.state = ItemState::Streaming;
    changed = true;
  }
  if (!delta.fragment.empty()) {
    (delta.field == ItemField::Text ? item.text : item.arguments) += delta.fragment;
    changed = true;
  }
  return changed;
}

bool EventReconstructor::handle(const ItemDone& done) {
  OutputItem& item = open_item(done.id, "done");
  if ((done.text && *done.text != item.text) || (done.arguments && *done.arguments != item.arguments)) {
    logger_.log(LogLevel::Warn, "completed item differs from streamed content",
                {{"item_id", item.id},
                 {"streamed_text_bytes", item.text.size()},
                 {"streamed_argument_bytes", item.arguments.size()}});
  }
  item.state = ItemState::Done;
  if (!item.name && done.name) {
    item.name = done.name;
  }
  if (done.raw) {
    item.raw = *done.raw;
  }
  return true;
}

bool EventReconstructor::handle(const ResponseDone& done) {
  ensure_open(done.id.value_or(result_.id.value_or("")), "response done");
  assign_if_changed(result_.id, done.id);
  assign_if_changed(result_.model, done.model);
  assign_if_changed(result_.status, done.status);
  assign_if_changed(result_.finish_reason, done.finish_reason);
  if (done.usage) {
    result_.usage = done.usage;
  }
  result_.completed = true;
  return true;
}

AccumulatedResult EventReconstructor::fold_complete(const nlohmann::json& body,
                                                    const EventSchema& schema,
                                                    Logger logger) {
  EventReconstructor reconstructor(std::move(logger));
  reconstructor.apply_all(schema.map_complete(body));
  return reconstructor.result_;
}

}  // namespace aikit
