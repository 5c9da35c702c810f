// Repository: loopcast
// Component: Diagnostics Service Implementation
// Copyright (c) 2026 Loopcast

#include "loopcast/diagnostics/DiagnosticsService.hpp"

#include <exception>

#include "loopcast/Errors.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::diagnostics {

using supervisor::Phase;
using supervisor::SupervisorSnapshot;
using util::Logger;

std::optional<std::string> DiagnosisTrigger(const SupervisorSnapshot& snapshot,
                                            const config::DiagnosticsConfig& config) {
  if (!config.enabled || snapshot.phase != Phase::kCrashed) return std::nullopt;
  if (config.item_failure_threshold > 0 &&
      snapshot.item_retries == config.item_failure_threshold) {
    return snapshot.active_item + " failed " + std::to_string(snapshot.item_retries) +
           " times in a row";
  }
  if (config.total_failure_interval > 0 && snapshot.consecutive_failures > 0 &&
      snapshot.consecutive_failures % config.total_failure_interval == 0) {
    return std::to_string(snapshot.consecutive_failures) + " consecutive failures";
  }
  return std::nullopt;
}

DiagnosticsService::DiagnosticsService(config::DiagnosticsConfig config,
                                       std::shared_ptr<IDiagnosticChecks> checks,
                                       std::shared_ptr<IAlertNotifier> notifier,
                                       std::function<bool()> destination_live,
                                       std::shared_ptr<util::ITimeSource> time_source)
    : config_(std::move(config)),
      checks_(std::move(checks)),
      notifier_(std::move(notifier)),
      destination_live_(std::move(destination_live)),
      time_source_(std::move(time_source)) {
  worker_ = std::thread([this] { WorkerLoop(); });
}

DiagnosticsService::~DiagnosticsService() { Shutdown(); }

void DiagnosticsService::OnStatus(const SupervisorSnapshot& snapshot) {
  const std::optional<std::string> reason = DiagnosisTrigger(snapshot, config_);
  if (!reason) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = time_source_->Now();
    if (last_triggered_ && now - *last_triggered_ < config_.cooldown) {
      Logger::Info("[Diagnostics] self-test cooling down, not running for: " + *reason);
      return;
    }
    last_triggered_ = now;
  }
  Enqueue([this, reason = *reason, snapshot] { Diagnose(reason, snapshot); });
}

DiagnosisReport DiagnosticsService::RunNow(const std::string& reason, bool destination_in_use) {
  DiagnosisReport report = checks_->Run(reason, destination_in_use, cancel_);
  std::lock_guard<std::mutex> lock(mutex_);
  ++runs_completed_;
  return report;
}

void DiagnosticsService::Notify(Alert alert) {
  Enqueue([this, alert = std::move(alert)] { Deliver(alert); });
}

void DiagnosticsService::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
  }
  cancel_.Cancel();
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

int DiagnosticsService::ReportsSent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reports_sent_;
}

int DiagnosticsService::RunsCompleted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return runs_completed_;
}

void DiagnosticsService::Enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) return;
    jobs_.push_back(std::move(job));
  }
  cv_.notify_all();
}

void DiagnosticsService::WorkerLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return shutting_down_ || !jobs_.empty(); });
      if (shutting_down_) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    try {
      job();
    } catch (const ShutdownRequestedError&) {
      return;
    } catch (const std::exception& e) {
      Logger::Error(std::string("[Diagnostics] ") + e.what());
    }
  }
}

void DiagnosticsService::Diagnose(const std::string& reason, const SupervisorSnapshot& snapshot) {
  const bool live = destination_live_ && destination_live_();
  DiagnosisReport report = checks_->Run(reason, live, cancel_);
  report.item = snapshot.active_item;
  report.consecutive_failures = snapshot.consecutive_failures;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++runs_completed_;
  }
  if (report.DestinationFailed()) {
    Logger::Error("[Diagnostics] destination unreachable or stream key rejected; "
                  "retrying the playlist will not help");
  }

  Alert alert;
  alert.subject = "Broadcast self-test: " + std::to_string(report.PassedCount()) + "/" +
                  std::to_string(report.checks.size()) + " checks passed";
  alert.body = FormatReportHtml(report);
  alert.html = true;
  Deliver(alert);
}

void DiagnosticsService::Deliver(const Alert& alert) {
  if (!notifier_) return;
  try {
    notifier_->Send(alert, cancel_);
  } catch (const AlertDeliveryError& e) {
    Logger::Warn(std::string("[Diagnostics] alert not delivered: ") + e.what());
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  ++reports_sent_;
}

}  // namespace loopcast::diagnostics
