#include <gtest/gtest.h>

#include "aikit/cancellation.hpp"
#include "aikit/error.hpp"

#include <chrono>
#include <thread>

using aikit::CancellationToken;
using std::chrono::milliseconds;

TEST(CancellationTokenTest, CopiesShareState) {
  CancellationToken token;
  CancellationToken copy = token;
  EXPECT_FALSE(copy.is_cancelled());
  token.cancel();
  EXPECT_TRUE(copy.is_cancelled());
  copy.cancel();
  EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, IndependentTokensDoNotInterfere) {
  CancellationToken first;
  CancellationToken second;
  first.cancel();
  EXPECT_FALSE(second.is_cancelled());
}

TEST(CancellationTokenTest, WaitForElapsesWithoutCancellation) {
  CancellationToken token;
  EXPECT_FALSE(token.wait_for(milliseconds(5)));
  EXPECT_FALSE(token.wait_for(milliseconds(0)));
}

TEST(CancellationTokenTest, WaitForWakesOnCancel) {
  CancellationToken token;
  std::thread canceller([token]() {
    std::this_thread::sleep_for(milliseconds(10));
    token.cancel();
  });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.wait_for(milliseconds(5000)));
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(2000));
  canceller.join();
}

TEST(CancellationTokenTest, ThrowIfCancelledReportsCancelledKind) {
  CancellationToken token;
  EXPECT_NO_THROW(token.throw_if_cancelled());
  token.cancel();
  try {
    token.throw_if_cancelled();
    FAIL() << "expected cancellation";
  } catch (const aikit::RequestError& error) {
    EXPECT_EQ(error.kind(), aikit::ErrorKind::Cancelled);
    EXPECT_FALSE(error.retryable());
  }
}
