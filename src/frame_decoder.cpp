#include "aikit/frame_decoder.hpp"

#include <iterator>
#include <utility>

#include "aikit/error.hpp"
#include "aikit/error_classifier.hpp"

namespace aikit {
namespace {

using json = nlohmann::json;

constexpr std::size_t kMaxDetailPreview = 120;

std::string_view strip_carriage_return(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

std::vector<ServerSentEvent> SSEParser::feed(const char* data, std::size_t size) {
  buffer_.append(data, size);
  std::vector<ServerSentEvent> events;
  std::size_t start = 0;
  std::size_t newline_pos = buffer_.find('\n', scan_from_);
  while (newline_pos != std::string::npos) {
    process_line(strip_carriage_return(std::string_view(buffer_).substr(start, newline_pos - start)), events);
    start = newline_pos + 1;
    newline_pos = buffer_.find('\n', start);
  }
  buffer_.erase(0, start);
  scan_from_ = buffer_.size();
  return events;
}

std::vector<ServerSentEvent> SSEParser::finalize() {
  std::vector<ServerSentEvent> events;
  if (!buffer_.empty()) {
    std::string rest;
    rest.swap(buffer_);
    process_line(strip_carriage_return(rest), events);
  }
  scan_from_ = 0;
  dispatch(events);
  return events;
}

void SSEParser::dispatch(std::vector<ServerSentEvent>& events) {
  if (pending_) {
    events.push_back(std::move(current_));
  }
  current_ = ServerSentEvent{};
  pending_ = false;
}

void SSEParser::process_line(std::string_view line, std::vector<ServerSentEvent>& events) {
  if (line.empty()) {
    dispatch(events);
    return;
  }
  if (line.front() == ':') {
    return;
  }

  auto colon_pos = line.find(':');
  std::string_view field = line.substr(0, colon_pos);
  std::string_view value = colon_pos == std::string_view::npos ? std::string_view{} : line.substr(colon_pos + 1);
  if (!value.empty() && value.front() == ' ') {
    value.remove_prefix(1);
  }

  if (field == "event") {
    current_.event = std::string(value);
  } else if (field == "data") {
    if (current_.has_data) {
      current_.data.push_back('\n');
    }
    current_.data.append(value);
    current_.has_data = true;
  } else if (field == "id") {
    current_.id = std::string(value);
  } else {
    return;
  }
  pending_ = true;
}

std::vector<ServerSentEvent> parse_sse_stream(const std::string& payload) {
  SSEParser parser;
  auto events = parser.feed(payload);
  auto remaining = parser.finalize();
  events.insert(events.end(), std::make_move_iterator(remaining.begin()), std::make_move_iterator(remaining.end()));
  return events;
}

Frame make_frame(const ServerSentEvent& event) {
  json payload = json::parse(event.data, nullptr, false);
  if (payload.is_discarded()) {
    std::string preview = event.data.substr(0, kMaxDetailPreview);
    throw RequestError(classify_decode_failure("frame payload is not valid JSON: " + preview));
  }

  Frame frame;
  if (event.event && !event.event->empty()) {
    frame.kind = *event.event;
  } else if (payload.is_object() && payload.contains("type") && payload.at("type").is_string()) {
    frame.kind = payload.at("type").get<std::string>();
  } else {
    frame.kind = "message";
  }
  frame.payload = std::move(payload);
  frame.id = event.id;
  return frame;
}

FrameDecoder::FrameDecoder(HttpStream& stream, CancellationToken cancellation)
    : stream_(stream), cancellation_(std::move(cancellation)) {}

std::optional<Frame> FrameDecoder::next() {
  while (!finished_) {
    if (pending_.empty()) {
      if (eof_) {
        finish();
        break;
      }
      fill();
      continue;
    }

    ServerSentEvent event = std::move(pending_.front());
    pending_.pop_front();
    if (event.data == kDoneSentinel) {
      finish();
      break;
    }
    // An event with no data lines has nothing to decode.
    if (!event.has_data) {
      continue;
    }
    return make_frame(event);
  }
  return std::nullopt;
}

void FrameDecoder::fill() {
  if (cancellation_.is_cancelled()) {
    finish();
    throw RequestError(classify_cancelled());
  }

  std::optional<std::string> chunk;
  try {
    chunk = stream_.read(cancellation_);
  } catch (const TransportError& error) {
    finish();
    throw RequestError(classify_transport_failure(error));
  }

  auto events = chunk ? parser_.feed(*chunk) : parser_.finalize();
  if (!chunk) {
    eof_ = true;
  }
  for (auto& event : events) {
    pending_.push_back(std::move(event));
  }
}

void FrameDecoder::finish() {
  finished_ = true;
  pending_.clear();
  stream_.close();
}

}  // namespace aikit
