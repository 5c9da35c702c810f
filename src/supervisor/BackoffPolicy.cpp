// Repository: loopcast
// Component: Backoff Policy
// Copyright (c) 2026 Loopcast

#include "loopcast/supervisor/BackoffPolicy.hpp"

#include <algorithm>

namespace loopcast::supervisor {

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds cap)
    : base_(std::max(base, std::chrono::milliseconds(0))), cap_(std::max(cap, base_)) {}

std::chrono::milliseconds BackoffPolicy::DelayFor(int failures) const {
  if (failures <= 0) return std::chrono::milliseconds(0);
  std::chrono::milliseconds delay = base_;
  // Doubling stops at the cap, so large counts cannot overflow.
  for (int i = 1; i < failures && delay < cap_ && delay.count() > 0; ++i) {
    delay *= 2;
  }
  return std::min(delay, cap_);
}

}  // namespace loopcast::supervisor
