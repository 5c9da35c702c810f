// Repository: loopcast
// Component: Time Source
// Purpose: Injectable monotonic clock for cache expiry.
//          Production: SteadyTimeSource. Tests: a manually advanced source.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_TIME_SOURCE_HPP_
#define LOOPCAST_UTIL_TIME_SOURCE_HPP_

#include <chrono>

namespace loopcast::util {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual std::chrono::steady_clock::time_point Now() const = 0;
};

class SteadyTimeSource : public ITimeSource {
 public:
  std::chrono::steady_clock::time_point Now() const override {
    return std::chrono::steady_clock::now();
  }
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_TIME_SOURCE_HPP_
