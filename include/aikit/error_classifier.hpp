#pragma once

#include <chrono>
#include <exception>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "aikit/error.hpp"

namespace aikit {

inline constexpr std::chrono::milliseconds kDefaultSuggestedDelay{1000};

std::optional<std::chrono::milliseconds> parse_retry_after(const std::map<std::string, std::string>& headers);

std::optional<APIErrorBody> parse_api_error_body(const std::string& body);

ClassifiedError classify_status(long status,
                                const std::map<std::string, std::string>& headers,
                                const std::string& body,
                                std::chrono::milliseconds default_delay = kDefaultSuggestedDelay);

ClassifiedError classify_transport_failure(const TransportError& error,
                                           std::chrono::milliseconds default_delay = kDefaultSuggestedDelay);

ClassifiedError classify_decode_failure(const std::string& detail);
ClassifiedError classify_invalid_payload(const std::string& detail);
ClassifiedError classify_streaming_unsupported(const std::string& detail);
ClassifiedError classify_cancelled();

// Call from inside a catch block. Exceptions outside the failure model are rethrown.
ClassifiedError classify_current_exception(std::chrono::milliseconds default_delay = kDefaultSuggestedDelay);

nlohmann::json to_json(const ClassifiedError& error);

}  // namespace aikit
