#include <gtest/gtest.h>

#include "aikit/utils/env.hpp"

#include "support/env_guard.hpp"

using aikit::utils::read_env;
using aikit::utils::read_env_or;

namespace testing_utils = aikit::testing;

TEST(UtilsEnvTest, ReturnsNulloptWhenUnset) {
  testing_utils::EnvVarGuard guard("AIKIT_TEST_ENV_UNSET", std::nullopt);
  EXPECT_FALSE(read_env("AIKIT_TEST_ENV_UNSET").has_value());
}

TEST(UtilsEnvTest, TrimsWhitespaceFromValues) {
  testing_utils::EnvVarGuard guard("AIKIT_TEST_ENV_TRIM", std::string("  value\n"));
  auto value = read_env("AIKIT_TEST_ENV_TRIM");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "value");
}

TEST(UtilsEnvTest, ReadEnvOrFallsBackWhenAbsentOrBlank) {
  testing_utils::EnvVarGuard absent("AIKIT_TEST_ENV_OR", std::nullopt);
  EXPECT_EQ(read_env_or("AIKIT_TEST_ENV_OR", "fallback"), "fallback");

  testing_utils::EnvVarGuard blank("AIKIT_TEST_ENV_BLANK", std::string("   "));
  EXPECT_EQ(read_env_or("AIKIT_TEST_ENV_BLANK", "fallback"), "fallback");
}

TEST(UtilsEnvTest, ReadEnvOrPrefersSetValue) {
  testing_utils::EnvVarGuard guard("AIKIT_TEST_ENV_SET", std::string("https://proxy.local/v1"));
  EXPECT_EQ(read_env_or("AIKIT_TEST_ENV_SET", "fallback"), "https://proxy.local/v1");
}
