// Repository: loopcast
// Component: I/O Deadline Runner
// Purpose: Drives an asio io_context for one exchange, bounded by a deadline
//          and a cancellation token.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_IO_DEADLINE_HPP_
#define LOOPCAST_UTIL_IO_DEADLINE_HPP_

#include <chrono>
#include <functional>

#include <boost/asio/io_context.hpp>

#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::util {

enum class IoOutcome {
  kCompleted,  // done() reported true, or the context ran out of work.
  kTimedOut,
  kCancelled,
};

// Runs `ioc` in short slices until done() is true. When the deadline passes or
// `cancel` fires first, abort() is called (it must cancel resolvers and close
// sockets owned by the exchange) and the aborted handlers are drained.
//
// A resolve already inside getaddrinfo cannot be interrupted; its completion
// is left to the io_context destructor.
IoOutcome RunIoUntil(boost::asio::io_context& ioc,
                     const std::function<bool()>& done,
                     const std::function<void()>& abort,
                     std::chrono::steady_clock::time_point deadline,
                     const CancellationToken& cancel);

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_IO_DEADLINE_HPP_
