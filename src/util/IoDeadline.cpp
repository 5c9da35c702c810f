// Repository: loopcast
// Component: I/O Deadline Runner
// Purpose: Drives an asio io_context for one exchange, bounded by a deadline
//          and a cancellation token.
// Copyright (c) 2026 Loopcast

#include "util/IoDeadline.hpp"

#include <algorithm>

namespace loopcast::util {

namespace {

// Upper bound on how late a cancellation is noticed.
constexpr std::chrono::milliseconds kSlice{50};

IoOutcome Abort(boost::asio::io_context& ioc, const std::function<void()>& abort,
                IoOutcome outcome) {
  abort();
  ioc.restart();
  ioc.run_for(kSlice);
  return outcome;
}

}  // namespace

IoOutcome RunIoUntil(boost::asio::io_context& ioc,
                     const std::function<bool()>& done,
                     const std::function<void()>& abort,
                     std::chrono::steady_clock::time_point deadline,
                     const CancellationToken& cancel) {
  while (!done()) {
    if (cancel.IsCancelled()) return Abort(ioc, abort, IoOutcome::kCancelled);
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return Abort(ioc, abort, IoOutcome::kTimedOut);
    if (ioc.stopped()) break;
    const auto remaining =
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(deadline - now);
    ioc.run_for(std::min<std::chrono::steady_clock::duration>(kSlice, remaining));
  }
  return IoOutcome::kCompleted;
}

}  // namespace loopcast::util
