#include "aikit/utils/env.hpp"

#include <cstdlib>
#include <string_view>

namespace aikit::utils {

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (raw == nullptr) {
    return std::nullopt;
  }
  std::string_view value(raw);
  constexpr std::string_view kWhitespace = " \t\r\n\f\v";
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return std::string();
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return std::string(value.substr(first, last - first + 1));
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  auto value = read_env(name);
  if (!value || value->empty()) {
    return fallback;
  }
  return *value;
}

}  // namespace aikit::utils
