#pragma once

#include "aikit/error.hpp"
#include "aikit/http_client.hpp"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aikit::testing {

/** Scripted response body delivered one chunk per read. */
struct ScriptedStream {
  long status_code = 200;
  std::map<std::string, std::string> headers{{"Content-Type", "text/event-stream"}};
  std::vector<std::string> chunks;
  /** Raised after the last chunk instead of reporting end of body. */
  std::optional<TransportError::Kind> fail_after_chunks;
  /** Invoked before each read with the number of chunks already delivered. */
  std::function<void(std::size_t)> on_read;
};

/** Observable lifetime of one scripted stream. */
struct StreamProbe {
  bool closed = false;
  std::size_t reads = 0;
};

class MockHttpStream final : public HttpStream {
public:
  MockHttpStream(ScriptedStream script, std::shared_ptr<StreamProbe> probe)
      : script_(std::move(script)), probe_(std::move(probe)) {}

  ~MockHttpStream() override { close(); }

  long status_code() const override { return script_.status_code; }
  const std::map<std::string, std::string>& headers() const override { return script_.headers; }

  std::optional<std::string> read(const CancellationToken& cancellation) override {
    if (probe_->closed) {
      return std::nullopt;
    }
    if (script_.on_read) {
      script_.on_read(next_chunk_);
    }
    if (cancellation.is_cancelled()) {
      close();
      throw TransportError(TransportError::Kind::Cancelled, "read cancelled");
    }
    ++probe_->reads;
    if (next_chunk_ < script_.chunks.size()) {
      return script_.chunks[next_chunk_++];
    }
    if (script_.fail_after_chunks) {
      close();
      throw TransportError(*script_.fail_after_chunks, "scripted transport failure");
    }
    close();
    return std::nullopt;
  }

  void close() override { probe_->closed = true; }
  bool closed() const override { return probe_->closed; }

private:
  ScriptedStream script_;
  std::shared_ptr<StreamProbe> probe_;
  std::size_t next_chunk_ = 0;
};

/**
 * In-memory HttpClient that replays queued outcomes in order, for both buffered
 * requests and streams. Each call consumes one entry.
 */
class MockHttpClient final : public HttpClient {
public:
  struct EnqueuedError {
    TransportError::Kind kind;
    std::string message;
  };

  using Enqueued = std::variant<HttpResponse, ScriptedStream, EnqueuedError>;

  HttpResponse request(const HttpRequest& request) override {
    Enqueued next = take(request);
    if (auto* error = std::get_if<EnqueuedError>(&next)) {
      throw TransportError(error->kind, error->message);
    }
    if (auto* script = std::get_if<ScriptedStream>(&next)) {
      HttpResponse response;
      response.status_code = script->status_code;
      response.headers = script->headers;
      for (const auto& chunk : script->chunks) {
        response.body += chunk;
      }
      return response;
    }
    return std::get<HttpResponse>(std::move(next));
  }

  std::unique_ptr<HttpStream> open_stream(const HttpRequest& request) override {
    Enqueued next = take(request);
    if (auto* error = std::get_if<EnqueuedError>(&next)) {
      throw TransportError(error->kind, error->message);
    }
    ScriptedStream script;
    if (auto* response = std::get_if<HttpResponse>(&next)) {
      script.status_code = response->status_code;
      script.headers = response->headers;
      script.chunks.push_back(response->body);
    } else {
      script = std::get<ScriptedStream>(std::move(next));
    }
    auto probe = std::make_shared<StreamProbe>();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      probes_.push_back(probe);
    }
    return std::make_unique<MockHttpStream>(std::move(script), std::move(probe));
  }

  void enqueue_response(HttpResponse response) { push(std::move(response)); }
  void enqueue_stream(ScriptedStream stream) { push(std::move(stream)); }
  void enqueue_error(TransportError::Kind kind, std::string message = "scripted transport failure") {
    push(EnqueuedError{kind, std::move(message)});
  }

  void enqueue_status(long status, std::string body = {}, std::map<std::string, std::string> headers = {}) {
    HttpResponse response;
    response.status_code = status;
    response.body = std::move(body);
    response.headers = std::move(headers);
    push(std::move(response));
  }

  std::size_t call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

  std::vector<HttpRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::optional<HttpRequest> last_request() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (requests_.empty()) {
      return std::nullopt;
    }
    return requests_.back();
  }

  /** Probes of every stream opened so far, in open order. */
  std::vector<std::shared_ptr<StreamProbe>> stream_probes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probes_;
  }

private:
  void push(Enqueued entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(entry));
  }

  Enqueued take(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (queue_.empty()) {
      throw Error("MockHttpClient queue underflow");
    }
    Enqueued next = std::move(queue_.front());
    queue_.pop_front();
    return next;
  }

  std::deque<Enqueued> queue_;
  std::vector<HttpRequest> requests_;
  std::vector<std::shared_ptr<StreamProbe>> probes_;
  mutable std::mutex mutex_;
};

}  // namespace aikit::testing
