#include "aikit/result_stream.hpp"

#include <utility>

#include "aikit/error.hpp"
#include "aikit/error_classifier.hpp"

namespace aikit {

ResultStream::iterator::iterator(ResultStream* stream) : stream_(stream) {
  ++*this;
}

ResultStream::iterator& ResultStream::iterator::operator++() {
  if (stream_) {
    current_ = stream_->next();
    if (!current_) {
      stream_ = nullptr;
    }
  }
  return *this;
}

ResultStream::ResultStream(std::unique_ptr<HttpStream> stream,
                           std::unique_ptr<EventSchema> schema,
                           CancellationToken cancellation,
                           DecodeFailurePolicy decode_policy,
                           Logger logger)
    : stream_(std::move(stream)),
      schema_(std::move(schema)),
      cancellation_(std::move(cancellation)),
      reconstructor_(logger),
      decode_policy_(decode_policy),
      logger_(std::move(logger)) {
  if (!stream_ || !schema_) {
    throw Error("ResultStream requires an open stream and an event schema");
  }
  decoder_ = std::make_unique<FrameDecoder>(*stream_, cancellation_);
}

ResultStream::~ResultStream() {
  close();
}

void ResultStream::close() {
  if (stream_) {
    stream_->close();
  }
  ended_ = true;
}

std::optional<AccumulatedResult> ResultStream::next() {
  if (ended_) {
    return std::nullopt;
  }
  try {
    return advance();
  } catch (const Error&) {
    close();
    throw;
  }
}

AccumulatedResult ResultStream::collect() {
  while (next()) {
  }
  return current();
}

std::optional<AccumulatedResult> ResultStream::advance() {
  auto skippable = [this](const RequestError& error) {
    if (decode_policy_ != DecodeFailurePolicy::Skip || error.kind() != ErrorKind::DecodingFailed ||
        decoder_->finished()) {
      return false;
    }
    ++skipped_frames_;
    logger_.log(LogLevel::Warn, "skipping undecodable frame",
                {{"schema", schema_->name()}, {"error", error.what()}, {"skipped", skipped_frames_}});
    return true;
  };

  while (true) {
    if (cancellation_.is_cancelled()) {
      close();
      throw RequestError(classify_cancelled());
    }

    std::optional<Frame> frame;
    try {
      frame = decoder_->next();
    } catch (const RequestError& error) {
      if (!skippable(error)) {
        throw;
      }
      continue;
    }

    if (!frame) {
      const bool changed = reconstructor_.apply_all(schema_->map_end());
      close();
      if (changed || snapshots_ == 0) {
        ++snapshots_;
        return reconstructor_.result();
      }
      return std::nullopt;
    }

    bool changed = false;
    try {
      changed = reconstructor_.apply_all(schema_->map_frame(*frame));
    } catch (const nlohmann::json::exception& error) {
      RequestError decode_error(classify_decode_failure(error.what()));
      if (!skippable(decode_error)) {
        throw decode_error;
      }
      continue;
    } catch (const RequestError& error) {
      if (!skippable(error)) {
        throw;
      }
      continue;
    }

    if (changed) {
      ++snapshots_;
      return reconstructor_.result();
    }
  }
}

}  // namespace aikit
