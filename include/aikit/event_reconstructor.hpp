#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "aikit/event_schema.hpp"
#include "aikit/logging.hpp"

namespace aikit {

struct OutputItem {
  std::string id;
  ItemType type = ItemType::Other;
  ItemState state = ItemState::Pending;
  std::string text;
  std::string arguments;
  std::optional<std::string> name;
  std::optional<std::string> call_id;
  std::optional<std::string> role;
  nlohmann::json raw = nlohmann::json::object();
};

struct AccumulatedResult {
  std::optional<std::string> id;
  std::optional<std::string> model;
  std::optional<std::string> status;
  std::vector<OutputItem> items;
  std::optional<Usage> usage;
  std::optional<std::string> finish_reason;
  bool completed = false;

  std::string output_text() const;

  const OutputItem* find_item(std::string_view item_id) const;
};

// A rejected delta leaves the result unchanged.
class EventReconstructor {
public:
  explicit EventReconstructor(Logger logger = {});

  bool apply(const Delta& delta);

  bool apply_all(const std::vector<Delta>& deltas);

  const AccumulatedResult& result() const { return result_; }

  static AccumulatedResult fold_complete(const nlohmann::json& body, const EventSchema& schema, Logger logger = {});

private:
  bool handle(const ResponseStarted& started);
  bool handle(const ItemAdded& added);
  bool handle(const ItemDelta& delta);
  bool handle(const ItemDone& done);
  bool handle(const ResponseDone& done);

  void ensure_open(const std::string& item_id, const char* action) const;
  OutputItem& open_item(const std::string& item_id, const char* action);

  AccumulatedResult result_;
  std::unordered_map<std::string, std::size_t> index_by_id_;
  Logger logger_;
};

}  // namespace aikit
