#include "aikit/client.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <utility>

#include "aikit/error_classifier.hpp"
#include "aikit/utils/env.hpp"
#include "aikit/utils/uuid.hpp"
#include "aikit/utils/values.hpp"

namespace aikit {
namespace {

using json = nlohmann::json;

constexpr const char* kUserAgent = "aikit/0.1";

bool iequals(std::string_view lhs, std::string_view rhs) {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
         });
}

std::string build_url(const std::string& base_url, const std::string& path) {
  if (path.empty()) {
    return base_url;
  }
  if (utils::is_absolute_url(path)) {
    return path;
  }
  std::string url = base_url;
  if (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  if (path.front() != '/') {
    url.push_back('/');
  }
  url += path;
  return url;
}

json request_log_details(const HttpRequest& request, std::size_t attempt) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["attempt"] = attempt;
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

json response_log_details(const HttpRequest& request,
                          long status,
                          const std::map<std::string, std::string>& headers,
                          std::chrono::steady_clock::duration duration,
                          std::size_t attempt) {
  json details = request_log_details(request, attempt);
  details["status"] = status;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(headers);
  return details;
}

bool is_success(long status) {
  return status >= 200 && status < 300;
}

void validate_envelope(const RequestEnvelope& envelope, const CallOptions& options) {
  if (envelope.timeout) {
    utils::validate_positive_integer("RequestEnvelope.timeout", envelope.timeout->count());
  }
  if (options.timeout) {
    utils::validate_positive_integer("CallOptions.timeout", options.timeout->count());
  }
  if (!envelope.body.empty() && !utils::safe_json(envelope.body)) {
    throw RequestError(classify_invalid_payload("request body is not valid JSON"));
  }
}

std::string serialize_body(const json& body) {
  if (!body.is_object()) {
    throw RequestError(classify_invalid_payload("request body must be a JSON object"));
  }
  try {
    return body.dump();
  } catch (const json::exception& error) {
    throw RequestError(classify_invalid_payload(error.what()));
  }
}

}  // namespace

Client::Client(ClientOptions options, std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()) {
  if (options_.api_key.empty()) {
    if (auto env_api = utils::read_env("OPENAI_API_KEY")) {
      options_.api_key = *env_api;
    }
  }

  if (options_.base_url.empty() || options_.base_url == kDefaultBaseUrl) {
    options_.base_url = utils::read_env_or("OPENAI_BASE_URL", kDefaultBaseUrl);
    if (options_.base_url.empty()) {
      options_.base_url = kDefaultBaseUrl;
    }
  }

  if (!options_.organization) {
    if (auto env_org = utils::read_env("OPENAI_ORG_ID")) {
      options_.organization = *env_org;
    }
  }

  if (!options_.project) {
    if (auto env_project = utils::read_env("OPENAI_PROJECT_ID")) {
      options_.project = *env_project;
    }
  }

  if (options_.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("OPENAI_LOG")) {
      options_.log_level = parse_log_level(*env_log, options_.log_level);
    }
  }

  if (options_.api_key.empty()) {
    throw Error("Missing API key. Provide ClientOptions.api_key or set the OPENAI_API_KEY environment variable.");
  }

  utils::validate_positive_integer("ClientOptions.timeout", options_.timeout.count());
  options_.retry_policy.validate();
  logger_ = Logger(options_.log_level, options_.logger);
}

std::string Client::resolve_url(const std::string& path) const {
  std::string url = build_url(options_.base_url, path);
  if (!utils::is_absolute_url(url)) {
    throw RequestError(
        classify_transport_failure(TransportError(TransportError::Kind::InvalidURL, "invalid request URL: " + url)));
  }
  return url;
}

RetryController Client::make_retry_controller(const CallOptions& options) const {
  return RetryController(options.retry_policy.value_or(options_.retry_policy), logger_);
}

HttpRequest Client::build_request(const RequestEnvelope& envelope,
                                  const CallOptions& options,
                                  const std::string& url,
                                  const std::optional<std::string>& idempotency_key) const {
  HttpRequest request;
  request.method = envelope.method;
  request.url = url;
  request.body = envelope.body;
  request.timeout = options.timeout.value_or(envelope.timeout.value_or(options_.timeout));
  request.cancellation = options.cancellation;

  std::map<std::string, std::string> headers;
  if (idempotency_key) {
    headers["Idempotency-Key"] = *idempotency_key;
  }
  headers["Accept"] = envelope.stream ? "text/event-stream" : "application/json";
  headers["User-Agent"] = kUserAgent;
  headers["Authorization"] = "Bearer " + options_.api_key;
  if (options_.organization) {
    headers["OpenAI-Organization"] = *options_.organization;
  }
  if (options_.project) {
    headers["OpenAI-Project"] = *options_.project;
  }
  for (const auto& [key, value] : options_.default_headers) {
    headers[key] = value;
  }
  if (!envelope.body.empty()) {
    headers["Content-Type"] = "application/json";
  }
  for (const auto& [key, value] : envelope.headers) {
    headers[key] = value;
  }
  for (const auto& [key, value] : options.headers) {
    headers[key] = value;
  }
  request.headers = std::move(headers);
  return request;
}

HttpResponse Client::send(const RequestEnvelope& envelope, const CallOptions& options) const {
  validate_envelope(envelope, options);
  const std::string url = resolve_url(envelope.path);
  std::optional<std::string> idempotency_key = options.idempotency_key;
  if (!idempotency_key && !iequals(envelope.method, "GET")) {
    idempotency_key = utils::uuid4();
  }

  const RetryController controller = make_retry_controller(options);
  std::size_t attempt = 0;
  return controller.perform(
      [&]() {
        ++attempt;
        HttpRequest request = build_request(envelope, options, url, idempotency_key);
        logger_.log(LogLevel::Debug, "sending request", request_log_details(request, attempt));
        const auto start_time = std::chrono::steady_clock::now();
        HttpResponse response = http_client_->request(request);
        const auto duration = std::chrono::steady_clock::now() - start_time;
        auto details = response_log_details(request, response.status_code, response.headers, duration, attempt);
        if (is_success(response.status_code)) {
          logger_.log(LogLevel::Info, "request succeeded", details);
          return response;
        }
        logger_.log(LogLevel::Warn, "request returned error status", details);
        throw RequestError(classify_status(response.status_code, response.headers, response.body,
                                           controller.policy().base_delay));
      },
      options.cancellation, options.callbacks);
}

AccumulatedResult Client::execute(const RequestEnvelope& envelope,
                                  const EventSchema& schema,
                                  const CallOptions& options) const {
  if (envelope.stream) {
    throw Error("execute() expects a non-streaming envelope; use stream() instead");
  }
  HttpResponse response = send(envelope, options);
  auto body = utils::safe_json(response.body);
  if (!body) {
    throw RequestError(classify_decode_failure("response body is not valid JSON"));
  }
  return EventReconstructor::fold_complete(*body, schema, logger_);
}

ResultStream Client::stream(const RequestEnvelope& envelope,
                            std::unique_ptr<EventSchema> schema,
                            const CallOptions& options) const {
  if (!schema) {
    throw Error("stream() requires an event schema");
  }
  if (!schema->supports_streaming()) {
    throw RequestError(
        classify_streaming_unsupported("the " + schema->name() + " endpoint family does not support streaming"));
  }
  validate_envelope(envelope, options);
  const std::string url = resolve_url(envelope.path);
  std::optional<std::string> idempotency_key = options.idempotency_key;
  if (!idempotency_key && !iequals(envelope.method, "GET")) {
    idempotency_key = utils::uuid4();
  }

  RequestEnvelope streaming = envelope;
  streaming.stream = true;

  const RetryController controller = make_retry_controller(options);
  std::size_t attempt = 0;
  std::unique_ptr<HttpStream> opened = controller.perform(
      [&]() -> std::unique_ptr<HttpStream> {
        ++attempt;
        HttpRequest request = build_request(streaming, options, url, idempotency_key);
        logger_.log(LogLevel::Debug, "sending request", request_log_details(request, attempt));
        const auto start_time = std::chrono::steady_clock::now();
        std::unique_ptr<HttpStream> http_stream = http_client_->open_stream(request);
        const long status = http_stream->status_code();
        const std::map<std::string, std::string> headers = http_stream->headers();
        auto details =
            response_log_details(request, status, headers, std::chrono::steady_clock::now() - start_time, attempt);

        if (is_success(status)) {
          auto content_type = find_header(headers, "content-type");
          if (content_type && content_type->find("text/event-stream") == std::string::npos &&
              content_type->find("json") != std::string::npos) {
            http_stream->close();
            throw RequestError(classify_streaming_unsupported(
                "expected an event stream but the server answered with " + *content_type));
          }
          logger_.log(LogLevel::Info, "request succeeded", details);
          return http_stream;
        }

        logger_.log(LogLevel::Warn, "request returned error status", details);
        const std::string body = http_stream->read_all(options.cancellation);
        http_stream->close();
        throw RequestError(classify_status(status, headers, body, controller.policy().base_delay));
      },
      options.cancellation, options.callbacks);

  return ResultStream(std::move(opened), std::move(schema), options.cancellation, options_.decode_failure_policy,
                      logger_);
}

ResultStream Client::responses_stream(json body, const CallOptions& options) const {
  if (body.is_object()) {
    body["stream"] = true;
  }
  RequestEnvelope envelope;
  envelope.method = "POST";
  envelope.path = "/responses";
  envelope.body = serialize_body(body);
  envelope.stream = true;
  return stream(envelope, std::make_unique<ResponsesEventSchema>(), options);
}

ResultStream Client::chat_stream(json body, const CallOptions& options) const {
  if (body.is_object()) {
    body["stream"] = true;
    if (!body.contains("stream_options")) {
      body["stream_options"] = json{{"include_usage", true}};
    }
  }
  RequestEnvelope envelope;
  envelope.method = "POST";
  envelope.path = "/chat/completions";
  envelope.body = serialize_body(body);
  envelope.stream = true;
  return stream(envelope, std::make_unique<ChatCompletionEventSchema>(), options);
}

AccumulatedResult Client::create_response(json body, const CallOptions& options) const {
  RequestEnvelope envelope;
  envelope.method = "POST";
  envelope.path = "/responses";
  envelope.body = serialize_body(body);
  return execute(envelope, ResponsesEventSchema{}, options);
}

AccumulatedResult Client::create_chat_completion(json body, const CallOptions& options) const {
  RequestEnvelope envelope;
  envelope.method = "POST";
  envelope.path = "/chat/completions";
  envelope.body = serialize_body(body);
  return execute(envelope, ChatCompletionEventSchema{}, options);
}

}  // namespace aikit
