// Repository: loopcast
// Component: Stream Supervisor
// Purpose: Owns the transcoder subprocess lifecycle: pulls items from the
//          playlist engine, launches and watches the transcoder, and
//          reconnects with bounded exponential backoff.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SUPERVISOR_STREAM_SUPERVISOR_HPP_
#define LOOPCAST_SUPERVISOR_STREAM_SUPERVISOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/playlist/PlaylistEngine.hpp"
#include "loopcast/source/MediaItem.hpp"
#include "loopcast/supervisor/BackoffPolicy.hpp"
#include "loopcast/supervisor/ChildProcess.hpp"
#include "loopcast/supervisor/SupervisorStatus.hpp"
#include "loopcast/util/CancellationToken.hpp"
#include "loopcast/util/EventChannel.hpp"

namespace loopcast::supervisor {

// Threading:
// - One control-loop thread, started by the constructor, owns every phase
//   decision and the subprocess handle.
// - One watcher thread per live subprocess reads its stderr (progress
//   metrics) and blocks on its exit, then posts the exit status to the
//   control loop.
// - Start/Stop/Skip/PlayIndex may be called from any thread; they enqueue a
//   command that the control loop applies at its next safe point.
//
// A new subprocess is never launched before the previous one is reaped and
// its watcher joined. Stopped is terminal.
class StreamSupervisor {
 public:
  StreamSupervisor(const config::BroadcastConfig& config,
                   playlist::PlaylistEngine& playlist,
                   std::shared_ptr<IProcessLauncher> launcher);
  ~StreamSupervisor();

  StreamSupervisor(const StreamSupervisor&) = delete;
  StreamSupervisor& operator=(const StreamSupervisor&) = delete;

  // False once a stop has been requested.
  bool Start();

  // Idempotent. Returns false if a stop was already requested.
  bool Stop();

  // Abandons the current item (or the pending retry) and plays the next one.
  // Does not count as a failure. False when idle or stopping. A skip that
  // arrives after its item already ended is dropped.
  bool Skip();

  // Jumps the playlist to `index` and plays it now, listing the sources
  // first if no deck exists yet (starts the broadcast when idle). False if
  // out of range or stopping.
  bool PlayIndex(size_t index);

  bool StopRequested() const { return stop_requested_.load(std::memory_order_acquire); }

  SupervisorSnapshot Snapshot() const;

  // Blocks until the supervisor reaches `phase` or the timeout expires.
  bool WaitForPhase(Phase phase, std::chrono::milliseconds timeout) const;
  void WaitUntilStopped() const;

  // Observers run on the control-loop thread and must not call back into
  // Start/Stop/Skip synchronously expecting completion.
  uint64_t AddObserver(StatusObserver observer);
  void RemoveObserver(uint64_t id);

 private:
  struct ControlEvent {
    enum class Type { kStart, kStop, kSkip, kJump, kProcessExited };
    Type type = Type::kStart;
    uint64_t launch_id = 0;
    uint64_t item_epoch = 0;  // kSkip/kJump: the item the command was aimed at.
    ExitStatus status;
  };

  struct ActiveProcess;

  void ControlLoop();
  Phase RunIdle();
  Phase RunStarting();
  Phase RunStreaming();
  Phase RunReconnecting();
  Phase RunStopping();

  Phase OnChildExited(const ExitStatus& status, const std::string& detail);
  Phase OnProcessFailure(const std::string& message);
  Phase OnSourceFailure(ErrorKind kind, const std::string& message);
  Phase OnUnresolvable(const std::string& message);
  Phase BeginReconnect();
  // False for a skip or jump aimed at an item that has since been left.
  bool IsCurrent(const ControlEvent& event) const;

  void LaunchWatcher(std::unique_ptr<IChildProcess> child);
  // SIGTERM, wait up to the grace period, then SIGKILL. Returns once the
  // child is reaped and its watcher joined.
  void TerminateActive();
  void ReapActive();
  void Advance();

  void Transition(Phase phase);
  void RecordError(ErrorKind kind, const std::string& message);
  SupervisorSnapshot SnapshotLocked() const;
  void Notify(const SupervisorSnapshot& snapshot);

  const config::ReconnectPolicy policy_;
  const config::EncodingProfile profile_;
  const config::TranscoderConfig transcoder_;
  config::OverlayConfig overlay_;
  const BackoffPolicy backoff_;
  playlist::PlaylistEngine& playlist_;
  const std::shared_ptr<IProcessLauncher> launcher_;

  util::EventChannel<ControlEvent> events_;
  util::CancellationToken stop_token_;
  std::atomic<bool> stop_requested_{false};

  // Control-loop state.
  std::optional<source::MediaItem> current_item_;
  double resume_seconds_ = 0.0;
  int process_failures_in_streak_ = 0;  // Process failures since the last clean exit.
  size_t unresolvable_streak_ = 0;
  std::chrono::steady_clock::time_point reconnect_deadline_;
  std::unique_ptr<ActiveProcess> active_;
  uint64_t launch_seq_ = 0;
  // Bumped whenever the held item is released; Skip/PlayIndex stamp it.
  std::atomic<uint64_t> item_epoch_{0};

  // Snapshot state; progress is also written by the watcher.
  mutable std::mutex state_mutex_;
  mutable std::condition_variable state_cv_;
  SupervisorSnapshot state_;
  std::optional<std::chrono::steady_clock::time_point> started_at_;
  std::optional<std::chrono::steady_clock::time_point> stopped_at_;

  std::mutex observers_mutex_;
  std::map<uint64_t, StatusObserver> observers_;
  uint64_t next_observer_id_ = 1;

  std::thread control_thread_;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_STREAM_SUPERVISOR_HPP_
