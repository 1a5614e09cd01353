#pragma once

#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "aikit/cancellation.hpp"
#include "aikit/http_client.hpp"

namespace aikit {

inline constexpr std::string_view kDoneSentinel = "[DONE]";

struct ServerSentEvent {
  std::optional<std::string> event;
  std::string data;
  std::optional<std::string> id;
  bool has_data = false;
};

class SSEParser {
public:
  std::vector<ServerSentEvent> feed(const char* data, std::size_t size);
  std::vector<ServerSentEvent> feed(std::string_view data) { return feed(data.data(), data.size()); }

  // Flushes a trailing event that was not followed by a blank line.
  std::vector<ServerSentEvent> finalize();

private:
  void process_line(std::string_view line, std::vector<ServerSentEvent>& events);
  void dispatch(std::vector<ServerSentEvent>& events);

  std::string buffer_;
  std::size_t scan_from_ = 0;
  ServerSentEvent current_;
  bool pending_ = false;
};

std::vector<ServerSentEvent> parse_sse_stream(const std::string& payload);

struct Frame {
  std::string kind;
  nlohmann::json payload;
  std::optional<std::string> id;
};

Frame make_frame(const ServerSentEvent& event);

class FrameDecoder {
public:
  FrameDecoder(HttpStream& stream, CancellationToken cancellation);

  FrameDecoder(const FrameDecoder&) = delete;
  FrameDecoder& operator=(const FrameDecoder&) = delete;

  std::optional<Frame> next();

  bool finished() const { return finished_; }

private:
  void fill();
  void finish();

  HttpStream& stream_;
  CancellationToken cancellation_;
  SSEParser parser_;
  std::deque<ServerSentEvent> pending_;
  bool eof_ = false;
  bool finished_ = false;
};

}  // namespace aikit
