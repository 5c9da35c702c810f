// Repository: loopcast
// Component: Stream Supervisor
// Purpose: Transcoder lifecycle state machine.
// Copyright (c) 2026 Loopcast

#include "loopcast/supervisor/StreamSupervisor.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <vector>

#include "loopcast/supervisor/TranscoderCommand.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::supervisor {

using util::Logger;

const char* PhaseName(Phase phase) {
  switch (phase) {
    case Phase::kIdle: return "Idle";
    case Phase::kStarting: return "Starting";
    case Phase::kStreaming: return "Streaming";
    case Phase::kCompleted: return "Completed";
    case Phase::kCrashed: return "Crashed";
    case Phase::kReconnecting: return "Reconnecting";
    case Phase::kStopping: return "Stopping";
    case Phase::kStopped: return "Stopped";
  }
  return "Unknown";
}

namespace {

bool LooksLikeError(const std::string& line) {
  std::string lower(line.size(), '\0');
  std::transform(line.begin(), line.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("error") != std::string::npos;
}

}  // namespace

// One launched transcoder and the thread watching it.
struct StreamSupervisor::ActiveProcess {
  uint64_t launch_id = 0;
  std::unique_ptr<IChildProcess> child;
  std::thread watcher;
  double resume_seconds = 0.0;

  std::mutex mutex;
  std::condition_variable cv;
  bool exited = false;
  std::string last_error_line;

  void MarkExited() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      exited = true;
    }
    cv.notify_all();
  }

  bool WaitExited(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return exited; });
  }

  void WaitExited() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return exited; });
  }

  std::string LastErrorLine() {
    std::lock_guard<std::mutex> lock(mutex);
    return last_error_line;
  }
};

StreamSupervisor::StreamSupervisor(const config::BroadcastConfig& config,
                                   playlist::PlaylistEngine& playlist,
                                   std::shared_ptr<IProcessLauncher> launcher)
    : policy_(config.reconnect),
      profile_(config.output),
      transcoder_(config.transcoder),
      overlay_(config.overlay),
      backoff_(config.reconnect.backoff_base, config.reconnect.backoff_cap),
      playlist_(playlist),
      launcher_(std::move(launcher)) {
  if (!overlay_.Empty() && overlay_.font_file.empty()) {
    overlay_.font_file = FindFontFile(DefaultFontCandidates());
    if (overlay_.font_file.empty()) {
      Logger::Warn("[StreamSupervisor] no overlay font found, using ffmpeg's default");
    } else {
      Logger::Info("[StreamSupervisor] overlay font " + overlay_.font_file);
    }
  }
  control_thread_ = std::thread([this] { ControlLoop(); });
}

StreamSupervisor::~StreamSupervisor() {
  Stop();
  if (control_thread_.joinable()) {
    control_thread_.join();
  }
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

bool StreamSupervisor::Start() {
  if (stop_requested_.load(std::memory_order_acquire)) return false;
  events_.Post({ControlEvent::Type::kStart});
  return true;
}

bool StreamSupervisor::Stop() {
  if (stop_requested_.exchange(true, std::memory_order_acq_rel)) return false;
  Logger::Info("[StreamSupervisor] stop requested");
  stop_token_.Cancel();
  events_.Post({ControlEvent::Type::kStop});
  return true;
}

bool StreamSupervisor::Skip() {
  if (stop_requested_.load(std::memory_order_acquire)) return false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_.phase == Phase::kIdle || state_.phase == Phase::kStopping ||
        state_.phase == Phase::kStopped) {
      return false;
    }
  }
  ControlEvent event;
  event.type = ControlEvent::Type::kSkip;
  event.item_epoch = item_epoch_.load(std::memory_order_acquire);
  events_.Post(std::move(event));
  return true;
}

bool StreamSupervisor::PlayIndex(size_t index) {
  if (stop_requested_.load(std::memory_order_acquire)) return false;
  if (playlist_.Total() == 0 && !playlist_.EnsureDeck(stop_token_)) return false;
  ControlEvent event;
  event.type = ControlEvent::Type::kJump;
  event.item_epoch = item_epoch_.load(std::memory_order_acquire);
  if (!playlist_.JumpTo(index)) return false;
  events_.Post(std::move(event));
  return true;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

SupervisorSnapshot StreamSupervisor::Snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return SnapshotLocked();
}

SupervisorSnapshot StreamSupervisor::SnapshotLocked() const {
  SupervisorSnapshot snapshot = state_;
  if (started_at_) {
    const auto end = stopped_at_ ? *stopped_at_ : std::chrono::steady_clock::now();
    snapshot.uptime = std::chrono::duration_cast<std::chrono::seconds>(end - *started_at_);
  }
  return snapshot;
}

bool StreamSupervisor::WaitForPhase(Phase phase, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [&] { return state_.phase == phase; });
}

void StreamSupervisor::WaitUntilStopped() const {
  std::unique_lock<std::mutex> lock(state_mutex_);
  state_cv_.wait(lock, [this] { return state_.phase == Phase::kStopped; });
}

uint64_t StreamSupervisor::AddObserver(StatusObserver observer) {
  std::lock_guard<std::mutex> lock(observers_mutex_);
  const uint64_t id = next_observer_id_++;
  observers_.emplace(id, std::move(observer));
  return id;
}

void StreamSupervisor::RemoveObserver(uint64_t id) {
  std::lock_guard<std::mutex> lock(observers_mutex_);
  observers_.erase(id);
}

void StreamSupervisor::Transition(Phase phase) {
  SupervisorSnapshot snapshot;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.phase = phase;
    ++state_.sequence;
    if (phase == Phase::kStopped) stopped_at_ = std::chrono::steady_clock::now();
    snapshot = SnapshotLocked();
  }
  state_cv_.notify_all();
  Logger::Debug(std::string("[StreamSupervisor] phase ") + PhaseName(phase));
  Notify(snapshot);
}

void StreamSupervisor::Notify(const SupervisorSnapshot& snapshot) {
  std::vector<StatusObserver> observers;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers.reserve(observers_.size());
    for (const auto& entry : observers_) observers.push_back(entry.second);
  }
  for (const auto& observer : observers) {
    observer(snapshot);
  }
}

void StreamSupervisor::RecordError(ErrorKind kind, const std::string& message) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_.last_error = message;
  state_.last_error_kind = kind;
}

// ---------------------------------------------------------------------------
// Control loop
// ---------------------------------------------------------------------------

void StreamSupervisor::ControlLoop() {
  Phase next = Phase::kIdle;
  while (next != Phase::kStopped) {
    switch (next) {
      case Phase::kIdle:
        next = RunIdle();
        break;
      case Phase::kStarting:
        next = RunStarting();
        break;
      case Phase::kStreaming:
        next = RunStreaming();
        break;
      case Phase::kReconnecting:
        next = RunReconnecting();
        break;
      case Phase::kStopping:
        next = RunStopping();
        break;
      default:
        // Completed and Crashed are reported by their handlers, never entered.
        Logger::Error(std::string("[StreamSupervisor] unexpected phase ") + PhaseName(next));
        next = Phase::kStopping;
        break;
    }
  }
}

Phase StreamSupervisor::RunIdle() {
  while (true) {
    const ControlEvent event = events_.Pop();
    switch (event.type) {
      case ControlEvent::Type::kStart:
      case ControlEvent::Type::kJump: {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!started_at_) started_at_ = std::chrono::steady_clock::now();
        Logger::Info("[StreamSupervisor] starting broadcast");
        return Phase::kStarting;
      }
      case ControlEvent::Type::kStop:
        return Phase::kStopping;
      default:
        break;
    }
  }
}

Phase StreamSupervisor::RunStarting() {
  Transition(Phase::kStarting);
  if (stop_requested_.load(std::memory_order_acquire)) return Phase::kStopping;

  if (!current_item_) {
    playlist::PlaylistPick pick = playlist_.Next(stop_token_);
    if (!pick.ok()) {
      if (pick.error == ErrorKind::kShutdownRequested) return Phase::kStopping;
      return OnSourceFailure(pick.error, pick.message);
    }
    current_item_ = std::move(pick.item);
    resume_seconds_ = playlist_.ConsumeResumePosition();
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.active_item = current_item_->name;
    state_.active_index = pick.index;
    state_.active_size_bytes.reset();
    state_.item_retries = 0;
  }

  const source::MediaItem& item = *current_item_;
  source::PlayableInput input;
  try {
    input = item.source->Resolve(item, stop_token_);
  } catch (const ItemUnresolvableError& e) {
    return OnUnresolvable(e.what());
  } catch (const ShutdownRequestedError&) {
    return Phase::kStopping;
  } catch (const Error& e) {
    return OnSourceFailure(e.kind(), item.name + ": " + e.what());
  } catch (const std::exception& e) {
    return OnSourceFailure(ErrorKind::kSourceUnavailable, item.name + ": " + e.what());
  }
  unresolvable_streak_ = 0;
  const source::ItemMetadata meta = item.source->Describe(item);

  std::vector<std::string> argv;
  try {
    argv = BuildTranscoderArgs(transcoder_, profile_, overlay_, input, item.name, resume_seconds_);
  } catch (const ConfigError& e) {
    RecordError(ErrorKind::kConfigError, e.what());
    Logger::Error(std::string("[StreamSupervisor] ") + e.what());
    return Phase::kStopping;
  }

  std::unique_ptr<IChildProcess> child;
  try {
    child = launcher_->Launch(argv);
  } catch (const std::exception& e) {
    return OnProcessFailure(std::string("transcoder launch failed: ") + e.what());
  }

  const size_t total = playlist_.Total();
  std::string position = "?";
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++state_.launches;
    state_.progress = TranscoderProgress{};
    // ffmpeg's own Duration line replaces this once it is read.
    if (meta.duration_ms) state_.progress.duration_seconds = *meta.duration_ms / 1000.0;
    state_.active_size_bytes = meta.size_bytes;
    // A launch after pure source failures ends the failure streak; after a
    // process failure only a clean exit does.
    if (process_failures_in_streak_ == 0) state_.consecutive_failures = 0;
    if (state_.active_index) {
      position = std::to_string(*state_.active_index + 1) + "/" + std::to_string(total);
    }
  }
  Logger::Info("[StreamSupervisor] now playing " + item.name + " (" + position + ")");
  Logger::Debug("[StreamSupervisor] " + FormatCommandLine(argv));

  LaunchWatcher(std::move(child));
  Transition(Phase::kStreaming);
  return Phase::kStreaming;
}

Phase StreamSupervisor::RunStreaming() {
  while (true) {
    const ControlEvent event = events_.Pop();
    switch (event.type) {
      case ControlEvent::Type::kProcessExited:
        if (!active_ || event.launch_id != active_->launch_id) break;  // Stale.
        {
          const std::string detail = active_->LastErrorLine();
          ReapActive();
          return OnChildExited(event.status, detail);
        }
      case ControlEvent::Type::kStop:
        return Phase::kStopping;
      case ControlEvent::Type::kSkip:
      case ControlEvent::Type::kJump:
        if (!IsCurrent(event)) break;
        Logger::Info("[StreamSupervisor] skipping " +
                     (current_item_ ? current_item_->name : std::string("current item")));
        TerminateActive();
        Advance();
        return Phase::kStarting;
      case ControlEvent::Type::kStart:
        break;
    }
  }
}

Phase StreamSupervisor::RunReconnecting() {
  Transition(Phase::kReconnecting);
  while (true) {
    const std::optional<ControlEvent> event = events_.PopUntil(reconnect_deadline_);
    if (!event) return Phase::kStarting;
    switch (event->type) {
      case ControlEvent::Type::kStop:
        return Phase::kStopping;
      case ControlEvent::Type::kSkip:
      case ControlEvent::Type::kJump:
        if (!IsCurrent(*event)) break;
        Logger::Info("[StreamSupervisor] reconnect delay cancelled, advancing");
        Advance();
        return Phase::kStarting;
      default:
        break;
    }
  }
}

Phase StreamSupervisor::RunStopping() {
  Transition(Phase::kStopping);
  if (active_) {
    double position;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      position = state_.progress.position_seconds;
    }
    position += active_->resume_seconds;
    TerminateActive();
    playlist_.RecordPosition(position);
  }
  Transition(Phase::kStopped);
  Logger::Info("[StreamSupervisor] stopped");
  return Phase::kStopped;
}

// ---------------------------------------------------------------------------
// Outcomes
// ---------------------------------------------------------------------------

Phase StreamSupervisor::OnChildExited(const ExitStatus& status, const std::string& detail) {
  if (!status.Clean()) {
    std::string message = "transcoder " + status.Describe();
    if (!detail.empty()) message += ": " + detail;
    return OnProcessFailure(message);
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.consecutive_failures = 0;
    ++state_.items_played;
  }
  process_failures_in_streak_ = 0;
  Logger::Info("[StreamSupervisor] finished " + current_item_->name);
  Transition(Phase::kCompleted);
  Advance();
  return Phase::kStarting;
}

Phase StreamSupervisor::OnProcessFailure(const std::string& message) {
  bool give_up;
  int retries;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++state_.consecutive_failures;
    retries = ++state_.item_retries;
    state_.last_error = message;
    state_.last_error_kind = ErrorKind::kStreamProcessCrash;
    give_up = retries > policy_.max_retries;
  }
  ++process_failures_in_streak_;
  const std::string name = current_item_ ? current_item_->name : std::string("<none>");
  Logger::Warn("[StreamSupervisor] " + name + ": " + message + " [" +
               ErrorKindName(ErrorKind::kStreamProcessCrash) + "]");
  Transition(Phase::kCrashed);
  if (give_up) {
    Logger::Warn("[StreamSupervisor] giving up on " + name + " after " +
                 std::to_string(retries - 1) + " retries");
    Advance();
  }
  return BeginReconnect();
}

Phase StreamSupervisor::OnSourceFailure(ErrorKind kind, const std::string& message) {
  bool give_up = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++state_.consecutive_failures;
    state_.last_error = message;
    state_.last_error_kind = kind;
    // A held item whose source stays down counts against its retry budget.
    if (current_item_) give_up = ++state_.item_retries > policy_.max_retries;
  }
  Logger::Warn("[StreamSupervisor] " + message + " [" + ErrorKindName(kind) + "]");
  Transition(Phase::kCrashed);
  if (give_up) Advance();
  return BeginReconnect();
}

Phase StreamSupervisor::OnUnresolvable(const std::string& message) {
  RecordError(ErrorKind::kItemUnresolvable, message);
  Logger::Warn("[StreamSupervisor] " + message + " [" +
               ErrorKindName(ErrorKind::kItemUnresolvable) + "], skipping");
  Advance();
  ++unresolvable_streak_;
  if (unresolvable_streak_ >= std::max<size_t>(1, playlist_.Total())) {
    unresolvable_streak_ = 0;
    return OnSourceFailure(ErrorKind::kSourceUnavailable,
                           "no item in the playlist could be resolved");
  }
  return Phase::kStarting;
}

Phase StreamSupervisor::BeginReconnect() {
  std::chrono::milliseconds delay;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    delay = backoff_.DelayFor(state_.consecutive_failures);
    state_.backoff_delay = delay;
  }
  Logger::Info("[StreamSupervisor] reconnecting in " + std::to_string(delay.count()) + " ms");
  reconnect_deadline_ = std::chrono::steady_clock::now() + delay;
  return Phase::kReconnecting;
}

bool StreamSupervisor::IsCurrent(const ControlEvent& event) const {
  if (event.item_epoch == item_epoch_.load(std::memory_order_acquire)) return true;
  Logger::Debug("[StreamSupervisor] dropping skip aimed at an item that already ended");
  return false;
}

void StreamSupervisor::Advance() {
  current_item_.reset();
  resume_seconds_ = 0.0;
  item_epoch_.fetch_add(1, std::memory_order_acq_rel);
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_.item_retries = 0;
}

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

void StreamSupervisor::LaunchWatcher(std::unique_ptr<IChildProcess> child) {
  auto active = std::make_unique<ActiveProcess>();
  active->launch_id = ++launch_seq_;
  active->child = std::move(child);
  active->resume_seconds = resume_seconds_;

  ActiveProcess* raw = active.get();
  active->watcher = std::thread([this, raw] {
    raw->child->ReadDiagnostics([this, raw](const std::string& line) {
      {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ParseProgressLine(line, &state_.progress);
      }
      if (LooksLikeError(line)) {
        Logger::Warn("[ffmpeg] " + line);
        std::lock_guard<std::mutex> lock(raw->mutex);
        raw->last_error_line = line;
      } else {
        Logger::Debug("[ffmpeg] " + line);
      }
    });
    const ExitStatus status = raw->child->Wait();
    raw->MarkExited();
    ControlEvent event;
    event.type = ControlEvent::Type::kProcessExited;
    event.launch_id = raw->launch_id;
    event.status = status;
    events_.Post(std::move(event));
  });
  active_ = std::move(active);
}

void StreamSupervisor::TerminateActive() {
  if (!active_) return;
  active_->child->Terminate();
  if (!active_->WaitExited(policy_.grace_period)) {
    Logger::Warn("[StreamSupervisor] transcoder pid " + std::to_string(active_->child->Pid()) +
                 " ignored SIGTERM for " + std::to_string(policy_.grace_period.count()) +
                 " ms, sending SIGKILL");
    active_->child->Kill();
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      ++state_.forced_kills;
    }
    active_->WaitExited();
  }
  ReapActive();
}

void StreamSupervisor::ReapActive() {
  if (!active_) return;
  if (active_->watcher.joinable()) {
    active_->watcher.join();
  }
  active_.reset();
}

}  // namespace loopcast::supervisor
