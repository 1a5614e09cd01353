#pragma once

#include <functional>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace aikit {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

std::string to_string(LogLevel level);

class Logger {
public:
  Logger() = default;
  Logger(LogLevel level, LoggerCallback callback)
      : level_(level), callback_(std::move(callback)) {}

  bool enabled(LogLevel level) const {
    return callback_ && level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(level_);
  }

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const {
    if (enabled(level)) {
      callback_(level, message, details);
    }
  }

  LogLevel level() const { return level_; }

private:
  LogLevel level_ = LogLevel::Off;
  LoggerCallback callback_;
};

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers);

}  // namespace aikit
