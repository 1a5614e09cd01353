#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>

#include "aikit/cancellation.hpp"
#include "aikit/event_reconstructor.hpp"
#include "aikit/event_schema.hpp"
#include "aikit/frame_decoder.hpp"
#include "aikit/http_client.hpp"
#include "aikit/logging.hpp"

namespace aikit {

enum class DecodeFailurePolicy { Fatal, Skip };

class ResultStream {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = AccumulatedResult;
    using difference_type = std::ptrdiff_t;
    using pointer = const AccumulatedResult*;
    using reference = const AccumulatedResult&;

    iterator() = default;
    explicit iterator(ResultStream* stream);

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator& operator++();
    void operator++(int) { ++*this; }

    bool operator==(const iterator& other) const { return stream_ == other.stream_; }
    bool operator!=(const iterator& other) const { return !(*this == other); }

  private:
    ResultStream* stream_ = nullptr;
    std::optional<AccumulatedResult> current_;
  };

  ResultStream(std::unique_ptr<HttpStream> stream,
               std::unique_ptr<EventSchema> schema,
               CancellationToken cancellation = {},
               DecodeFailurePolicy decode_policy = DecodeFailurePolicy::Fatal,
               Logger logger = {});

  ResultStream(ResultStream&&) = default;
  ResultStream& operator=(ResultStream&&) = delete;
  ResultStream(const ResultStream&) = delete;
  ResultStream& operator=(const ResultStream&) = delete;

  ~ResultStream();

  std::optional<AccumulatedResult> next();

  void close();

  bool closed() const { return ended_; }

  const AccumulatedResult& current() const { return reconstructor_.result(); }

  AccumulatedResult collect();

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  std::optional<AccumulatedResult> advance();

  std::unique_ptr<HttpStream> stream_;
  std::unique_ptr<EventSchema> schema_;
  CancellationToken cancellation_;
  std::unique_ptr<FrameDecoder> decoder_;
  EventReconstructor reconstructor_;
  DecodeFailurePolicy decode_policy_;
  Logger logger_;
  std::size_t snapshots_ = 0;
  std::size_t skipped_frames_ = 0;
  bool ended_ = false;
};

}  // namespace aikit
