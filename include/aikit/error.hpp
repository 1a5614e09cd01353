#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace aikit {

enum class ErrorKind {
  InvalidRequestURL,
  AuthenticationFailed,
  RateLimitExceeded,
  ClientError,
  ServerError,
  InvalidPayload,
  DecodingFailed,
  StreamingUnsupported,
  TimedOut,
  Cancelled
};

enum class Severity { Info = 0, Warning = 1, Critical = 2 };

struct UserAction {
  enum class Kind {
    Retry,
    CheckAPIKey,
    CheckInternetConnection,
    ReduceRequestSize,
    ContactSupport,
    Wait,
    CheckFileFormat,
    UseAlternativeModel
  };

  Kind kind = Kind::Retry;
  std::chrono::milliseconds wait{0};

  std::string button_title() const;
  std::string description() const;

  bool operator==(const UserAction& other) const {
    return kind == other.kind && wait == other.wait;
  }
};

struct APIErrorBody {
  std::string message;
  std::optional<std::string> type;
  std::optional<std::string> param;
  std::optional<std::string> code;
  nlohmann::json raw = nlohmann::json::object();
};

struct ClassifiedError {
  ErrorKind kind = ErrorKind::ServerError;
  std::optional<long> status_code;
  Severity severity = Severity::Critical;
  bool retryable = false;
  std::optional<std::chrono::milliseconds> suggested_delay;
  std::optional<std::chrono::milliseconds> retry_after;
  std::optional<std::string> code;
  std::string title;
  std::string message;
  std::string detail;
  std::vector<UserAction> actions;
  std::optional<APIErrorBody> api_error;
};

std::string to_string(ErrorKind kind);
std::string to_string(Severity severity);

class Error : public std::runtime_error {
public:
  explicit Error(const std::string& message)
      : std::runtime_error(message) {}
};

class RequestError : public Error {
public:
  explicit RequestError(ClassifiedError error)
      : Error(error.detail.empty() ? error.message : error.detail),
        error_(std::move(error)) {}

  const ClassifiedError& classified() const { return error_; }
  ErrorKind kind() const { return error_.kind; }
  std::optional<long> status_code() const { return error_.status_code; }
  bool retryable() const { return error_.retryable; }

private:
  ClassifiedError error_;
};

class RetryFailedError : public RequestError {
public:
  RetryFailedError(ClassifiedError last_error, std::size_t attempts)
      : RequestError(std::move(last_error)), attempts_(attempts) {}

  std::size_t attempts() const { return attempts_; }

private:
  std::size_t attempts_;
};

class TransportError : public Error {
public:
  enum class Kind { InvalidURL, Unreachable, Timeout, ConnectionLost, Cancelled };

  TransportError(Kind kind, const std::string& message)
      : Error(message), kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

class ProtocolViolationError : public Error {
public:
  ProtocolViolationError(std::string item_id, const std::string& reason)
      : Error(reason + " (item " + item_id + ")"),
        item_id_(std::move(item_id)),
        reason_(reason) {}

  const std::string& item_id() const { return item_id_; }
  const std::string& reason() const { return reason_; }

private:
  std::string item_id_;
  std::string reason_;
};

}  // namespace aikit
