#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "aikit/cancellation.hpp"
#include "aikit/error.hpp"
#include "aikit/error_classifier.hpp"
#include "aikit/logging.hpp"

namespace aikit {

using DelayCalculator =
    std::function<std::optional<std::chrono::milliseconds>(const ClassifiedError& error, std::size_t attempt)>;

struct RetryPolicy {
  std::size_t max_attempts = 3;
  std::chrono::milliseconds base_delay{1000};
  std::chrono::milliseconds max_delay{60000};
  double multiplier = 2.0;
  double jitter_min = 0.8;
  double jitter_max = 1.2;
  bool honor_retry_after = true;
  DelayCalculator delay_calculator;

  static RetryPolicy rate_limit_optimized();

  void validate() const;
};

struct RetryEvent {
  std::size_t attempt = 0;
  std::chrono::milliseconds delay{0};
  ClassifiedError error;
};

struct RetryCallbacks {
  std::function<void(const RetryEvent&)> on_retry;
  std::function<void(std::size_t attempts)> on_success;
};

double retry_jitter_factor(double min, double max);

// min(max(base * multiplier^(attempt-1) * jitter, retry_after), max_delay)
std::chrono::milliseconds compute_backoff_delay(const RetryPolicy& policy,
                                                std::size_t attempt,
                                                const ClassifiedError& error,
                                                std::optional<double> jitter = std::nullopt);

class RetryController {
public:
  explicit RetryController(RetryPolicy policy = {}, Logger logger = {});

  template <typename Operation>
  std::invoke_result_t<Operation&> perform(Operation&& operation,
                                           const CancellationToken& cancellation = {},
                                           const RetryCallbacks& callbacks = {}) const;

  const RetryPolicy& policy() const { return policy_; }

private:
  void check_cancelled(const CancellationToken& cancellation, std::size_t attempts_made) const;
  void after_failure(ClassifiedError error,
                     std::size_t attempt,
                     const CancellationToken& cancellation,
                     const RetryCallbacks& callbacks) const;
  void report_success(std::size_t attempts, const RetryCallbacks& callbacks) const;

  RetryPolicy policy_;
  Logger logger_;
};

template <typename Operation>
std::invoke_result_t<Operation&> RetryController::perform(Operation&& operation,
                                                          const CancellationToken& cancellation,
                                                          const RetryCallbacks& callbacks) const {
  using Result = std::invoke_result_t<Operation&>;
  policy_.validate();

  for (std::size_t attempt = 1;; ++attempt) {
    check_cancelled(cancellation, attempt - 1);
    std::optional<ClassifiedError> failure;
    if constexpr (std::is_void_v<Result>) {
      try {
        std::invoke(operation);
      } catch (const Error&) {
        failure = classify_current_exception(policy_.base_delay);
      } catch (const nlohmann::json::exception&) {
        failure = classify_current_exception(policy_.base_delay);
      }
      if (!failure) {
        report_success(attempt, callbacks);
        return;
      }
    } else {
      std::optional<Result> result;
      try {
        result.emplace(std::invoke(operation));
      } catch (const Error&) {
        failure = classify_current_exception(policy_.base_delay);
      } catch (const nlohmann::json::exception&) {
        failure = classify_current_exception(policy_.base_delay);
      }
      if (result) {
        report_success(attempt, callbacks);
        return std::move(*result);
      }
    }
    after_failure(std::move(*failure), attempt, cancellation, callbacks);
  }
}

}  // namespace aikit
