#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace sitecheck {

// Cooperative cancellation flag shared between a waiter and a worker.
// Copies observe the same flag.
class CancellationToken {
public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void Cancel() const {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->wake.notify_all();
  }

  bool IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
  }

  // Sleeps for `duration` unless cancelled first. Returns false when the
  // sleep was cut short by cancellation.
  template <typename Rep, typename Period>
  bool SleepFor(std::chrono::duration<Rep, Period> duration) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->wake.wait_for(lock, duration,
                                  [this] { return state_->cancelled; });
  }

private:
  struct State {
    std::mutex mutex;
    std::condition_variable wake;
    bool cancelled = false;
  };

  std::shared_ptr<State> state_;
};

} // namespace sitecheck
