#include "aikit/retry.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace aikit {

RetryPolicy RetryPolicy::rate_limit_optimized() {
  RetryPolicy policy;
  policy.max_attempts = 5;
  policy.base_delay = std::chrono::milliseconds(2000);
  policy.max_delay = std::chrono::milliseconds(120000);
  return policy;
}

void RetryPolicy::validate() const {
  if (max_attempts < 1) {
    throw Error("RetryPolicy.max_attempts must be at least 1");
  }
  if (base_delay.count() < 0) {
    throw Error("RetryPolicy.base_delay must not be negative");
  }
  if (max_delay < base_delay) {
    throw Error("RetryPolicy.max_delay must not be smaller than base_delay");
  }
  if (!(multiplier >= 1.0)) {
    throw Error("RetryPolicy.multiplier must be at least 1");
  }
  if (!(jitter_min >= 0.0) || !(jitter_max >= jitter_min)) {
    throw Error("RetryPolicy jitter band must satisfy 0 <= jitter_min <= jitter_max");
  }
}

double retry_jitter_factor(double min, double max) {
  if (max <= min) {
    return min;
  }
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_real_distribution<double> dist(min, max);
  return dist(rng);
}

std::chrono::milliseconds compute_backoff_delay(const RetryPolicy& policy,
                                                std::size_t attempt,
                                                const ClassifiedError& error,
                                                std::optional<double> jitter) {
  using std::chrono::milliseconds;
  const milliseconds cap = policy.max_delay;

  if (policy.delay_calculator) {
    if (auto custom = policy.delay_calculator(error, attempt)) {
      return std::clamp(*custom, milliseconds(0), cap);
    }
  }

  const double factor = jitter.value_or(retry_jitter_factor(policy.jitter_min, policy.jitter_max));
  const double exponent = attempt > 0 ? static_cast<double>(attempt - 1) : 0.0;
  double scaled = static_cast<double>(policy.base_delay.count()) * std::pow(policy.multiplier, exponent) * factor;
  scaled = std::min(scaled, static_cast<double>(cap.count()));

  milliseconds delay(static_cast<milliseconds::rep>(std::llround(std::max(scaled, 0.0))));
  if (policy.honor_retry_after && error.retry_after) {
    delay = std::max(delay, *error.retry_after);
  }
  return std::min(delay, cap);
}

RetryController::RetryController(RetryPolicy policy, Logger logger)
    : policy_(std::move(policy)), logger_(std::move(logger)) {}

void RetryController::check_cancelled(const CancellationToken& cancellation, std::size_t attempts_made) const {
  if (!cancellation.is_cancelled()) {
    return;
  }
  logger_.log(LogLevel::Info, "request cancelled", {{"attempts", attempts_made}});
  throw RequestError(classify_cancelled());
}

void RetryController::after_failure(ClassifiedError error,
                                    std::size_t attempt,
                                    const CancellationToken& cancellation,
                                    const RetryCallbacks& callbacks) const {
  if (error.kind == ErrorKind::Cancelled) {
    logger_.log(LogLevel::Info, "request cancelled", {{"attempts", attempt}});
    throw RequestError(std::move(error));
  }

  if (!error.retryable || attempt >= policy_.max_attempts) {
    logger_.log(LogLevel::Error, "request failed", {{"attempts", attempt}, {"error", to_json(error)}});
    throw RetryFailedError(std::move(error), attempt);
  }

  const auto delay = compute_backoff_delay(policy_, attempt, error);
  logger_.log(LogLevel::Warn, "retrying request after error",
              {{"attempt", attempt}, {"retry_delay_ms", delay.count()}, {"error", to_json(error)}});
  if (callbacks.on_retry) {
    callbacks.on_retry(RetryEvent{attempt, delay, error});
  }

  if (cancellation.wait_for(delay)) {
    logger_.log(LogLevel::Info, "request cancelled", {{"attempts", attempt}});
    throw RequestError(classify_cancelled());
  }
}

void RetryController::report_success(std::size_t attempts, const RetryCallbacks& callbacks) const {
  if (attempts <= 1) {
    return;
  }
  logger_.log(LogLevel::Info, "request succeeded after retry", {{"attempts", attempts}});
  if (callbacks.on_success) {
    callbacks.on_success(attempts);
  }
}

}  // namespace aikit
