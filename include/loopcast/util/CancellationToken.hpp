// Repository: loopcast
// Component: Cancellation Token
// Purpose: Cooperative cancellation shared by every suspension point
//          (process wait, backoff delay, listing calls).
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_CANCELLATION_TOKEN_HPP_
#define LOOPCAST_UTIL_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace loopcast::util {

// Copies share state: cancelling any copy cancels all of them.
class CancellationToken {
 public:
  CancellationToken() : state_(std::make_shared<State>()) {}

  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
  }

  bool IsCancelled() const {
    return state_->cancelled.load(std::memory_order_acquire);
  }

  // Sleeps until deadline or cancellation. Returns true if cancelled.
  bool WaitUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_until(lock, deadline, [this] {
      return state_->cancelled.load(std::memory_order_acquire);
    });
  }

  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    return WaitUntil(std::chrono::steady_clock::now() + timeout);
  }

 private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> cancelled{false};
  };

  std::shared_ptr<State> state_;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_CANCELLATION_TOKEN_HPP_
