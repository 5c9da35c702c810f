// Repository: loopcast
// Component: Event Channel
// Purpose: Unbounded multi-producer queue drained by a single consumer
//          thread (the supervisor control loop).
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_EVENT_CHANNEL_HPP_
#define LOOPCAST_UTIL_EVENT_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace loopcast::util {

template <typename T>
class EventChannel {
 public:
  void Post(T event) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(event));
    }
    cv_.notify_one();
  }

  // Blocks until an event is available.
  T Pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    return TakeFrontLocked();
  }

  // nullopt when the deadline passes with the queue still empty.
  std::optional<T> PopUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_until(lock, deadline, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    return TakeFrontLocked();
  }

 private:
  T TakeFrontLocked() {
    T event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_EVENT_CHANNEL_HPP_
