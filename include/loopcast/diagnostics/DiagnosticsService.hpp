// Repository: loopcast
// Component: Diagnostics Service
// Purpose: Runs the self-test off the control loop when the supervisor
//          reports repeated failures, and mails the report.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_DIAGNOSTICS_DIAGNOSTICS_SERVICE_HPP_
#define LOOPCAST_DIAGNOSTICS_DIAGNOSTICS_SERVICE_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/diagnostics/AlertNotifier.hpp"
#include "loopcast/diagnostics/BroadcastDiagnostics.hpp"
#include "loopcast/supervisor/SupervisorStatus.hpp"
#include "loopcast/util/CancellationToken.hpp"
#include "loopcast/util/TimeSource.hpp"

namespace loopcast::diagnostics {

// Why `snapshot` warrants a self-test, or nullopt. Only Crashed snapshots
// qualify: the item reached its failure threshold, or the overall failure
// streak hit a multiple of the interval.
std::optional<std::string> DiagnosisTrigger(const supervisor::SupervisorSnapshot& snapshot,
                                            const config::DiagnosticsConfig& config);

class DiagnosticsService {
 public:
  // `notifier` may be null (reports are logged only). `destination_live`
  // is asked just before a queued self-test runs; the broadcast may have
  // recovered since the trigger.
  DiagnosticsService(config::DiagnosticsConfig config, std::shared_ptr<IDiagnosticChecks> checks,
                     std::shared_ptr<IAlertNotifier> notifier,
                     std::function<bool()> destination_live,
                     std::shared_ptr<util::ITimeSource> time_source =
                         std::make_shared<util::SteadyTimeSource>());
  ~DiagnosticsService();

  DiagnosticsService(const DiagnosticsService&) = delete;
  DiagnosticsService& operator=(const DiagnosticsService&) = delete;

  // Supervisor observer. Never blocks: a qualifying snapshot queues a
  // self-test unless one ran within the cooldown.
  void OnStatus(const supervisor::SupervisorSnapshot& snapshot);

  // Operator-requested self-test on the calling thread. Ignores the
  // cooldown; the report is returned, not mailed.
  DiagnosisReport RunNow(const std::string& reason, bool destination_in_use);

  // Queues an alert for delivery on the worker thread.
  void Notify(Alert alert);

  // Cancels in-flight work and joins the worker. Idempotent; call from the
  // owning thread.
  void Shutdown();

  int ReportsSent() const;
  int RunsCompleted() const;

 private:
  void Enqueue(std::function<void()> job);
  void WorkerLoop();
  void Diagnose(const std::string& reason, const supervisor::SupervisorSnapshot& snapshot);
  void Deliver(const Alert& alert);

  const config::DiagnosticsConfig config_;
  std::shared_ptr<IDiagnosticChecks> checks_;
  std::shared_ptr<IAlertNotifier> notifier_;
  std::function<bool()> destination_live_;
  std::shared_ptr<util::ITimeSource> time_source_;
  util::CancellationToken cancel_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> jobs_;
  bool shutting_down_ = false;
  std::optional<std::chrono::steady_clock::time_point> last_triggered_;
  int reports_sent_ = 0;
  int runs_completed_ = 0;

  std::thread worker_;
};

}  // namespace loopcast::diagnostics

#endif  // LOOPCAST_DIAGNOSTICS_DIAGNOSTICS_SERVICE_HPP_
