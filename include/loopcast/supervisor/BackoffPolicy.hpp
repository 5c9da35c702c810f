// Repository: loopcast
// Component: Backoff Policy
// Purpose: Bounded exponential reconnect delay.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SUPERVISOR_BACKOFF_POLICY_HPP_
#define LOOPCAST_SUPERVISOR_BACKOFF_POLICY_HPP_

#include <chrono>

namespace loopcast::supervisor {

// delay(n) = min(base * 2^(n-1), cap) for consecutive-failure count n >= 1.
// Non-decreasing in n; zero for n <= 0.
class BackoffPolicy {
 public:
  BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds cap);

  std::chrono::milliseconds DelayFor(int failures) const;

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds cap_;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_BACKOFF_POLICY_HPP_
