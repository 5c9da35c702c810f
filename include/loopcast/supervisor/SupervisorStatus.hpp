// Repository: loopcast
// Component: Supervisor Status
// Purpose: Lifecycle phases and the read-only snapshot handed to observers
//          and the control surface.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SUPERVISOR_SUPERVISOR_STATUS_HPP_
#define LOOPCAST_SUPERVISOR_SUPERVISOR_STATUS_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "loopcast/Errors.hpp"
#include "loopcast/supervisor/ProgressParser.hpp"

namespace loopcast::supervisor {

// Idle → Starting → Streaming → (Completed | Crashed) → Reconnecting →
// Starting … → Stopping → Stopped. Completed and Crashed are momentary:
// they are reported, then the control loop moves on.
enum class Phase {
  kIdle,
  kStarting,
  kStreaming,
  kCompleted,
  kCrashed,
  kReconnecting,
  kStopping,
  kStopped,
};

const char* PhaseName(Phase phase);

struct SupervisorSnapshot {
  Phase phase = Phase::kIdle;
  uint64_t sequence = 0;  // Increments on every transition.

  std::string active_item;  // Empty when no item is held.
  std::optional<size_t> active_index;
  std::optional<int64_t> active_size_bytes;  // From the source's item metadata.

  int consecutive_failures = 0;
  int item_retries = 0;
  std::string last_error;
  ErrorKind last_error_kind = ErrorKind::kNone;
  std::chrono::milliseconds backoff_delay{0};  // Delay of the current/last Reconnecting.

  TranscoderProgress progress;
  uint64_t items_played = 0;
  uint64_t launches = 0;
  uint64_t forced_kills = 0;

  std::chrono::seconds uptime{0};  // Since the first Start().
};

using StatusObserver = std::function<void(const SupervisorSnapshot&)>;

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_SUPERVISOR_STATUS_HPP_
