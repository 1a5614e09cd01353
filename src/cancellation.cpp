#include "aikit/cancellation.hpp"

#include "aikit/error.hpp"
#include "aikit/error_classifier.hpp"

namespace aikit {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() const {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
      return;
    }
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  if (duration.count() <= 0) {
    return state_->cancelled;
  }
  return state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
}

void CancellationToken::throw_if_cancelled() const {
  if (is_cancelled()) {
    throw RequestError(classify_cancelled());
  }
}

}  // namespace aikit
