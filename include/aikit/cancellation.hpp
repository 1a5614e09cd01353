#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace aikit {

class CancellationToken {
public:
  CancellationToken();

  void cancel() const;
  [[nodiscard]] bool is_cancelled() const;

  bool wait_for(std::chrono::milliseconds duration) const;

  void throw_if_cancelled() const;

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
  };

  std::shared_ptr<State> state_;
};

}  // namespace aikit
