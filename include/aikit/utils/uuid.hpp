#pragma once

#include <string>

namespace aikit::utils {

/**
 * Generates a random RFC 4122 version 4 UUID. Used for request idempotency keys.
 */
std::string uuid4();

}  // namespace aikit::utils
