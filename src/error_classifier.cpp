#include "aikit/error_classifier.hpp"

#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

#include "aikit/http_client.hpp"
#include "aikit/utils/values.hpp"

namespace aikit {
namespace {

using json = nlohmann::json;

constexpr std::chrono::milliseconds kMaxRetryAfter = std::chrono::milliseconds(60'000);

std::optional<std::chrono::milliseconds> parse_number_scaled(const std::string& value, double scale) {
  char* end = nullptr;
  double parsed = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  if (parsed < 0) {
    return std::chrono::milliseconds(0);
  }
  if (parsed * scale >= static_cast<double>(kMaxRetryAfter.count())) {
    return kMaxRetryAfter;
  }
  return std::chrono::milliseconds(static_cast<long long>(parsed * scale));
}

std::optional<std::chrono::milliseconds> parse_retry_after_http_date(const std::string& value) {
  std::tm tm{};
  std::istringstream stream(value);
  stream.imbue(std::locale::classic());
  stream >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S GMT");
  if (stream.fail()) {
    return std::nullopt;
  }
#if defined(_WIN32)
  std::time_t utc_time = _mkgmtime(&tm);
#else
  std::time_t utc_time = timegm(&tm);
#endif
  if (utc_time == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  auto now_time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  auto delta = std::difftime(utc_time, now_time);
  if (delta <= 0) {
    return std::chrono::milliseconds(0);
  }
  if (delta * 1000.0 >= static_cast<double>(kMaxRetryAfter.count())) {
    return kMaxRetryAfter;
  }
  return std::chrono::milliseconds(static_cast<long long>(delta * 1000.0));
}

std::string client_error_message(long status) {
  switch (status) {
    case 400:
      return "The request was invalid. Please check your parameters and try again.";
    case 403:
      return "Access forbidden. You don't have permission to access this resource.";
    case 404:
      return "The requested resource was not found.";
    case 413:
      return "The request is too large. Please reduce the size and try again.";
    case 422:
      return "The request couldn't be processed. Please check your input.";
    default:
      return "The request failed. Please check your input and try again.";
  }
}

std::vector<UserAction> client_error_actions(long status) {
  switch (status) {
    case 400:
      return {{UserAction::Kind::Retry}};
    case 403:
      return {{UserAction::Kind::CheckAPIKey}};
    case 404:
      return {{UserAction::Kind::ContactSupport}};
    case 413:
      return {{UserAction::Kind::ReduceRequestSize}};
    default:
      return {{UserAction::Kind::Retry}, {UserAction::Kind::ContactSupport}};
  }
}

UserAction wait_action(std::chrono::milliseconds delay) {
  UserAction action;
  action.kind = UserAction::Kind::Wait;
  action.wait = delay;
  return action;
}

// Fills in the fields that depend only on the kind.
ClassifiedError make_error(ErrorKind kind) {
  ClassifiedError error;
  error.kind = kind;
  switch (kind) {
    case ErrorKind::InvalidRequestURL:
      error.title = "Connection Error";
      error.message = "Unable to reach the API. Please check your internet connection.";
      error.severity = Severity::Critical;
      error.code = "invalid_url";
      error.actions = {{UserAction::Kind::CheckInternetConnection}, {UserAction::Kind::Retry}};
      break;
    case ErrorKind::AuthenticationFailed:
      error.title = "Authentication Error";
      error.message = "Your API key appears to be invalid. Please check your account settings.";
      error.severity = Severity::Critical;
      error.code = "authentication_failed";
      error.actions = {{UserAction::Kind::CheckAPIKey}};
      break;
    case ErrorKind::RateLimitExceeded:
      error.title = "Rate Limit Exceeded";
      error.message = "You've made too many requests. Please wait a moment before trying again.";
      error.severity = Severity::Warning;
      error.retryable = true;
      error.code = "rate_limit_exceeded";
      break;
    case ErrorKind::ClientError:
      error.title = "Request Error";
      error.message = client_error_message(0);
      error.severity = Severity::Warning;
      error.actions = client_error_actions(0);
      break;
    case ErrorKind::ServerError:
      error.title = "Server Error";
      error.message = "The API is experiencing issues. Please try again in a few moments.";
      error.severity = Severity::Critical;
      error.retryable = true;
      error.code = "server_error";
      break;
    case ErrorKind::InvalidPayload:
      error.title = "Invalid Request";
      error.message = "Unable to process your request. Please check your input and try again.";
      error.severity = Severity::Critical;
      error.code = "invalid_payload";
      error.actions = {{UserAction::Kind::ContactSupport}};
      break;
    case ErrorKind::DecodingFailed:
      error.title = "Data Processing Error";
      error.message = "Unable to process the response. Please try again or contact support if this persists.";
      error.severity = Severity::Critical;
      error.code = "decoding_failed";
      error.actions = {{UserAction::Kind::Retry}, {UserAction::Kind::ContactSupport}};
      break;
    case ErrorKind::StreamingUnsupported:
      error.title = "Feature Not Supported";
      error.message = "This feature doesn't support real-time streaming.";
      error.severity = Severity::Info;
      error.code = "streaming_not_supported";
      break;
    case ErrorKind::TimedOut:
      error.title = "Request Timed Out";
      error.message = "The request took too long. Please check your connection and try again.";
      error.severity = Severity::Warning;
      error.retryable = true;
      error.code = "timed_out";
      error.actions = {{UserAction::Kind::CheckInternetConnection}, {UserAction::Kind::Retry}};
      break;
    case ErrorKind::Cancelled:
      error.title = "Request Cancelled";
      error.message = "The request was cancelled.";
      error.severity = Severity::Info;
      error.code = "cancelled";
      break;
  }
  return error;
}

void apply_retry_hint(ClassifiedError& error,
                      std::optional<std::chrono::milliseconds> retry_after,
                      std::chrono::milliseconds default_delay) {
  if (!error.retryable) {
    return;
  }
  error.retry_after = retry_after;
  error.suggested_delay = retry_after.value_or(default_delay);
  error.actions = {wait_action(*error.suggested_delay), {UserAction::Kind::Retry}};
}

}  // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidRequestURL:
      return "invalidRequestURL";
    case ErrorKind::AuthenticationFailed:
      return "authenticationFailed";
    case ErrorKind::RateLimitExceeded:
      return "rateLimitExceeded";
    case ErrorKind::ClientError:
      return "clientError";
    case ErrorKind::ServerError:
      return "serverError";
    case ErrorKind::InvalidPayload:
      return "invalidPayload";
    case ErrorKind::DecodingFailed:
      return "decodingFailed";
    case ErrorKind::StreamingUnsupported:
      return "streamingUnsupported";
    case ErrorKind::TimedOut:
      return "timedOut";
    case ErrorKind::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::Info:
      return "info";
    case Severity::Warning:
      return "warning";
    case Severity::Critical:
      return "critical";
  }
  return "unknown";
}

std::string UserAction::button_title() const {
  switch (kind) {
    case Kind::Retry:
      return "Try Again";
    case Kind::CheckAPIKey:
      return "Check API Key";
    case Kind::CheckInternetConnection:
      return "Check Connection";
    case Kind::ReduceRequestSize:
      return "Reduce Size";
    case Kind::ContactSupport:
      return "Contact Support";
    case Kind::Wait:
      return "Wait " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(wait).count()) + "s";
    case Kind::CheckFileFormat:
      return "Check File";
    case Kind::UseAlternativeModel:
      return "Try Different Model";
  }
  return {};
}

std::string UserAction::description() const {
  switch (kind) {
    case Kind::Retry:
      return "Retry the request";
    case Kind::CheckAPIKey:
      return "Verify your API key in settings";
    case Kind::CheckInternetConnection:
      return "Check your internet connection and try again";
    case Kind::ReduceRequestSize:
      return "Reduce the size of your request";
    case Kind::ContactSupport:
      return "Contact support for assistance";
    case Kind::Wait:
      return "Wait " + std::to_string(std::chrono::duration_cast<std::chrono::seconds>(wait).count()) +
             " seconds before retrying";
    case Kind::CheckFileFormat:
      return "Ensure the file format is supported";
    case Kind::UseAlternativeModel:
      return "Try using a different model";
  }
  return {};
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::map<std::string, std::string>& headers) {
  std::optional<std::chrono::milliseconds> parsed;
  if (auto retry_after_ms = find_header(headers, "retry-after-ms")) {
    parsed = parse_number_scaled(*retry_after_ms, 1.0);
  }
  if (!parsed) {
    if (auto retry_after = find_header(headers, "retry-after")) {
      parsed = parse_number_scaled(*retry_after, 1000.0);
      if (!parsed) {
        parsed = parse_retry_after_http_date(*retry_after);
      }
    }
  }
  if (parsed && (parsed->count() < 0 || *parsed >= kMaxRetryAfter)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<APIErrorBody> parse_api_error_body(const std::string& body) {
  auto payload = utils::safe_json(body);
  if (!payload || !payload->is_object() || !payload->contains("error")) {
    return std::nullopt;
  }
  const auto& err = payload->at("error");
  APIErrorBody parsed;
  if (err.is_string()) {
    parsed.message = err.get<std::string>();
    parsed.raw = err;
    return parsed;
  }
  if (!err.is_object()) {
    return std::nullopt;
  }
  parsed.message = err.value("message", std::string{});
  parsed.type = utils::optional_string(err, "type");
  parsed.param = utils::optional_string(err, "param");
  parsed.code = utils::optional_string(err, "code");
  parsed.raw = err;
  return parsed;
}

ClassifiedError classify_status(long status,
                                const std::map<std::string, std::string>& headers,
                                const std::string& body,
                                std::chrono::milliseconds default_delay) {
  ClassifiedError error;
  if (status == 401) {
    error = make_error(ErrorKind::AuthenticationFailed);
  } else if (status == 429) {
    error = make_error(ErrorKind::RateLimitExceeded);
  } else if (status >= 400 && status < 500) {
    error = make_error(ErrorKind::ClientError);
    error.message = client_error_message(status);
    error.actions = client_error_actions(status);
  } else if (status >= 500 && status < 600) {
    error = make_error(ErrorKind::ServerError);
  } else {
    // Anything else is a response shape the SDK does not understand.
    error = make_error(ErrorKind::ServerError);
    error.retryable = false;
    error.code = "unexpected_status";
    error.actions = {{UserAction::Kind::Retry}, {UserAction::Kind::ContactSupport}};
  }
  error.status_code = status;

  error.api_error = parse_api_error_body(body);
  if (error.api_error) {
    if (!error.api_error->message.empty()) {
      error.detail = error.api_error->message;
    }
    if (error.api_error->code) {
      error.code = error.api_error->code;
    }
  }
  if (error.detail.empty()) {
    error.detail = "HTTP " + std::to_string(status) + " error";
  }

  apply_retry_hint(error, parse_retry_after(headers), default_delay);
  return error;
}

ClassifiedError classify_transport_failure(const TransportError& failure, std::chrono::milliseconds default_delay) {
  ClassifiedError error;
  switch (failure.kind()) {
    case TransportError::Kind::InvalidURL:
    case TransportError::Kind::Unreachable:
      error = make_error(ErrorKind::InvalidRequestURL);
      break;
    case TransportError::Kind::Timeout:
      error = make_error(ErrorKind::TimedOut);
      break;
    case TransportError::Kind::ConnectionLost:
      error = make_error(ErrorKind::ServerError);
      error.code = "connection_lost";
      break;
    case TransportError::Kind::Cancelled:
      error = make_error(ErrorKind::Cancelled);
      break;
  }
  error.detail = failure.what();
  apply_retry_hint(error, std::nullopt, default_delay);
  return error;
}

ClassifiedError classify_decode_failure(const std::string& detail) {
  auto error = make_error(ErrorKind::DecodingFailed);
  error.detail = "Failed to decode response: " + detail;
  return error;
}

ClassifiedError classify_invalid_payload(const std::string& detail) {
  auto error = make_error(ErrorKind::InvalidPayload);
  error.detail = "Failed to encode request: " + detail;
  return error;
}

ClassifiedError classify_streaming_unsupported(const std::string& detail) {
  auto error = make_error(ErrorKind::StreamingUnsupported);
  error.detail = detail;
  return error;
}

ClassifiedError classify_cancelled() {
  auto error = make_error(ErrorKind::Cancelled);
  error.detail = "Request cancelled";
  return error;
}

ClassifiedError classify_current_exception(std::chrono::milliseconds default_delay) {
  try {
    throw;
  } catch (const RequestError& error) {
    return error.classified();
  } catch (const TransportError& error) {
    return classify_transport_failure(error, default_delay);
  } catch (const ProtocolViolationError& error) {
    auto classified = classify_decode_failure(error.what());
    classified.code = "protocol_violation";
    return classified;
  } catch (const json::exception& error) {
    return classify_decode_failure(error.what());
  }
}

nlohmann::json to_json(const ClassifiedError& error) {
  json details;
  details["kind"] = to_string(error.kind);
  details["severity"] = to_string(error.severity);
  details["retryable"] = error.retryable;
  details["title"] = error.title;
  details["message"] = error.message;
  details["detail"] = error.detail;
  if (error.status_code) {
    details["status"] = *error.status_code;
  }
  if (error.code) {
    details["code"] = *error.code;
  }
  if (error.suggested_delay) {
    details["suggested_delay_ms"] = error.suggested_delay->count();
  }
  json actions = json::array();
  for (const auto& action : error.actions) {
    actions.push_back(action.button_title());
  }
  details["actions"] = std::move(actions);
  if (error.api_error) {
    details["api_error"] = error.api_error->raw;
  }
  return details;
}

}  // namespace aikit
