#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "aikit/error.hpp"

namespace aikit::utils {

bool is_absolute_url(std::string_view url);

template <typename Integer,
          typename = std::enable_if_t<std::is_integral_v<Integer>>>
Integer validate_positive_integer(const std::string& name, Integer value) {
  if (value <= 0) {
    throw Error(name + " must be a positive integer");
  }
  return value;
}

/** Parses `text` as JSON, returning std::nullopt for empty or malformed input. */
std::optional<nlohmann::json> safe_json(const std::string& text);

/** Reads an optional integer member; absent, null and non-numeric values yield std::nullopt. */
std::optional<std::int64_t> optional_int(const nlohmann::json& object, const char* key);

/** Reads an optional string member; absent, null and non-string values yield std::nullopt. */
std::optional<std::string> optional_string(const nlohmann::json& object, const char* key);

}  // namespace aikit::utils
