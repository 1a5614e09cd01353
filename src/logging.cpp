#include "aikit/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>

namespace aikit {
namespace {

std::string lowercase(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

}  // namespace

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
  const std::string lowered = lowercase(value);
  if (lowered == "off") return LogLevel::Off;
  if (lowered == "error") return LogLevel::Error;
  if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
  if (lowered == "info") return LogLevel::Info;
  if (lowered == "debug") return LogLevel::Debug;
  return fallback;
}

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::Off: return "off";
    case LogLevel::Error: return "error";
    case LogLevel::Warn: return "warn";
    case LogLevel::Info: return "info";
    case LogLevel::Debug: return "debug";
  }
  return "off";
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie", "api-key"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    sanitized[key] = kSensitive.count(lowercase(key)) ? "***" : value;
  }
  return sanitized;
}

}  // namespace aikit
