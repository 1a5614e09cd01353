#include "aikit/utils/values.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>

namespace aikit::utils {

bool is_absolute_url(std::string_view url) {
  auto colon_pos = url.find(':');
  if (colon_pos == std::string_view::npos || colon_pos == 0) {
    return false;
  }

  unsigned char first = static_cast<unsigned char>(url[0]);
  if (!std::isalpha(first)) {
    return false;
  }

  for (std::size_t i = 1; i < colon_pos; ++i) {
    unsigned char ch = static_cast<unsigned char>(url[i]);
    if (!(std::isalnum(ch) || ch == '+' || ch == '.' || ch == '-')) {
      return false;
    }
  }

  return true;
}

std::optional<nlohmann::json> safe_json(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<std::int64_t> optional_int(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return std::nullopt;
  }
  if (it->is_number_float()) {
    double number = it->get<double>();
    // 2^63 is the first double past the int64 range
    if (!std::isfinite(number) || number < -9223372036854775808.0 || number >= 9223372036854775808.0) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(std::llround(number));
  }
  if (it->is_number_unsigned()) {
    auto number = it->get<std::uint64_t>();
    if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(number);
  }
  return it->get<std::int64_t>();
}

std::optional<std::string> optional_string(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) {
    return std::nullopt;
  }
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace aikit::utils
