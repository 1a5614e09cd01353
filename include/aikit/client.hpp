#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "aikit/cancellation.hpp"
#include "aikit/error.hpp"
#include "aikit/event_reconstructor.hpp"
#include "aikit/event_schema.hpp"
#include "aikit/http_client.hpp"
#include "aikit/logging.hpp"
#include "aikit/result_stream.hpp"
#include "aikit/retry.hpp"

namespace aikit {

inline constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";

struct ClientOptions {
  std::string api_key;
  std::optional<std::string> organization;
  std::optional<std::string> project;
  std::string base_url = kDefaultBaseUrl;
  std::chrono::milliseconds timeout{60000};
  std::map<std::string, std::string> default_headers;
  RetryPolicy retry_policy;
  DecodeFailurePolicy decode_failure_policy = DecodeFailurePolicy::Fatal;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

struct CallOptions {
  CancellationToken cancellation;
  std::optional<RetryPolicy> retry_policy;
  RetryCallbacks callbacks;
  std::map<std::string, std::string> headers;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::string> idempotency_key;
};

struct RequestEnvelope {
  std::string method = "POST";
  std::string path;
  std::map<std::string, std::string> headers;
  std::string body;
  std::optional<std::chrono::milliseconds> timeout;
  bool stream = false;
};

class Client {
public:
  explicit Client(ClientOptions options = {}, std::unique_ptr<HttpClient> http_client = nullptr);

  HttpResponse send(const RequestEnvelope& envelope, const CallOptions& options = {}) const;

  AccumulatedResult execute(const RequestEnvelope& envelope,
                            const EventSchema& schema,
                            const CallOptions& options = {}) const;

  ResultStream stream(const RequestEnvelope& envelope,
                      std::unique_ptr<EventSchema> schema,
                      const CallOptions& options = {}) const;

  ResultStream responses_stream(nlohmann::json body, const CallOptions& options = {}) const;
  ResultStream chat_stream(nlohmann::json body, const CallOptions& options = {}) const;

  AccumulatedResult create_response(nlohmann::json body, const CallOptions& options = {}) const;
  AccumulatedResult create_chat_completion(nlohmann::json body, const CallOptions& options = {}) const;

  const ClientOptions& options() const { return options_; }

private:
  std::string resolve_url(const std::string& path) const;
  HttpRequest build_request(const RequestEnvelope& envelope,
                            const CallOptions& options,
                            const std::string& url,
                            const std::optional<std::string>& idempotency_key) const;
  RetryController make_retry_controller(const CallOptions& options) const;

  ClientOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  Logger logger_;
};

}  // namespace aikit
