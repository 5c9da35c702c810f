// Repository: loopcast
// Component: Broadcast Diagnostics Implementation
// Copyright (c) 2026 Loopcast

#include "loopcast/diagnostics/BroadcastDiagnostics.hpp"

#include <condition_variable>
#include <cstdio>
#include <ctime>
#include <exception>
#include <mutex>
#include <thread>

#include "loopcast/Errors.hpp"
#include "loopcast/diagnostics/NetworkCheck.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::diagnostics {

using util::Logger;

namespace {

// Resource levels above which the host is reported as overloaded.
constexpr double kCpuLimit = 90.0;
constexpr double kMemoryLimit = 90.0;
constexpr double kDiskLimit = 95.0;

// How long a terminated test push may take to exit before SIGKILL.
constexpr std::chrono::seconds kTestPushGrace{2};

std::string Percent(const std::optional<double>& value) {
  if (!value) return "n/a";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", *value);
  return buf;
}

std::string LocalTimestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

std::string HtmlEscape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c;
    }
  }
  return out;
}

CheckResult Check(const char* id, const char* name) {
  CheckResult result;
  result.id = id;
  result.name = name;
  return result;
}

void LogCheck(const CheckResult& result) {
  const std::string line = std::string("[Diagnostics] ") + (result.ok ? "ok     " : "FAILED ") +
                           result.name + ": " + result.detail;
  if (result.ok) {
    Logger::Info(line);
  } else {
    Logger::Warn(line);
  }
}

}  // namespace

size_t DiagnosisReport::PassedCount() const {
  size_t passed = 0;
  for (const auto& check : checks) passed += check.ok ? 1 : 0;
  return passed;
}

bool DiagnosisReport::DestinationFailed() const {
  for (const auto& check : checks) {
    if (!check.ok && (check.id == "destination" || check.id == "stream_key")) return true;
  }
  return false;
}

std::string FormatReportText(const DiagnosisReport& report) {
  std::string out = "Broadcast self-test " + report.time + "\n";
  out += "Reason: " + report.reason + "\n";
  if (!report.item.empty()) out += "Item: " + report.item + "\n";
  out += "Consecutive failures: " + std::to_string(report.consecutive_failures) + "\n\n";
  for (const auto& check : report.checks) {
    out += std::string(check.ok ? "[ok]     " : "[FAILED] ") + check.name + ": " + check.detail +
           "\n";
  }
  out += "\n" + std::to_string(report.PassedCount()) + "/" + std::to_string(report.checks.size()) +
         " checks passed\n";
  return out;
}

std::string FormatReportHtml(const DiagnosisReport& report) {
  std::string rows;
  for (const auto& check : report.checks) {
    rows += "<tr><td>" + HtmlEscape(check.name) + "</td>";
    rows += std::string("<td style=\"color:") + (check.ok ? "#16a34a\">OK" : "#dc2626\">FAILED") +
            "</td>";
    rows += "<td>" + HtmlEscape(check.detail) + "</td></tr>\n";
  }
  std::string html = "<html><body style=\"font-family:sans-serif\">\n";
  html += "<h2>Broadcast self-test</h2>\n<p>" + HtmlEscape(report.time) + "</p>\n";
  html += "<p><b>Reason:</b> " + HtmlEscape(report.reason) + "<br>\n";
  html += "<b>Item:</b> " + HtmlEscape(report.item.empty() ? "-" : report.item) + "<br>\n";
  html += "<b>Consecutive failures:</b> " + std::to_string(report.consecutive_failures) + "</p>\n";
  html += "<table cellpadding=\"6\" border=\"1\" style=\"border-collapse:collapse\">\n";
  html += "<tr><th>Check</th><th>Status</th><th>Detail</th></tr>\n" + rows + "</table>\n";
  html += "<p>" + std::to_string(report.PassedCount()) + "/" +
          std::to_string(report.checks.size()) + " checks passed</p>\n</body></html>\n";
  return html;
}

std::vector<std::string> BuildStreamKeyTestArgs(const config::TranscoderConfig& transcoder,
                                                const config::EncodingProfile& profile) {
  return {transcoder.binary, "-hide_banner", "-nostdin", "-y",
          "-f", "lavfi", "-i", "color=c=black:s=320x240:d=3",
          "-f", "lavfi", "-i", "anullsrc=r=44100:cl=stereo",
          "-t", "3",
          "-c:v", "libx264", "-preset", "ultrafast",
          "-c:a", "aac",
          "-f", profile.format, profile.destination_url};
}

BroadcastDiagnostics::BroadcastDiagnostics(const config::BroadcastConfig& config,
                                           std::vector<source::ISourceAdapter*> sources,
                                           std::shared_ptr<supervisor::IProcessLauncher> launcher,
                                           std::shared_ptr<SystemUsageSampler> sampler)
    : config_(config.diagnostics),
      profile_(config.output),
      transcoder_(config.transcoder),
      sources_(std::move(sources)),
      launcher_(std::move(launcher)),
      sampler_(std::move(sampler)) {}

DiagnosisReport BroadcastDiagnostics::Run(const std::string& reason, bool destination_in_use,
                                          const util::CancellationToken& cancel) {
  DiagnosisReport report;
  report.reason = reason;
  report.time = LocalTimestamp();
  Logger::Info("[Diagnostics] running self-test: " + reason);

  const auto add = [&](CheckResult result) {
    if (cancel.IsCancelled()) throw ShutdownRequestedError();
    LogCheck(result);
    report.checks.push_back(std::move(result));
  };
  add(CheckNetwork(cancel));
  add(CheckDns(cancel));
  add(CheckDestination(cancel));
  add(CheckStreamKey(destination_in_use, cancel));
  add(CheckSources(cancel));
  add(CheckSystem());

  Logger::Info("[Diagnostics] " + std::to_string(report.PassedCount()) + "/" +
               std::to_string(report.checks.size()) + " checks passed");
  return report;
}

CheckResult BroadcastDiagnostics::CheckNetwork(const util::CancellationToken& cancel) const {
  CheckResult result = Check("network", "Internet connectivity");
  const auto target = SplitHostPort(config_.network_check_address);
  if (!target) {
    result.detail = "invalid check address " + config_.network_check_address;
    return result;
  }
  const ReachResult reach = ConnectTcp(*target, config_.check_timeout, cancel);
  result.ok = reach.ok;
  result.detail = reach.detail;
  return result;
}

CheckResult BroadcastDiagnostics::CheckDns(const util::CancellationToken& cancel) const {
  CheckResult result = Check("dns", "Destination DNS");
  const auto target = DestinationEndpoint(profile_.destination_url);
  if (!target) {
    result.detail = "destination URL has no host";
    return result;
  }
  const ReachResult reach = ResolveHost(target->host, config_.check_timeout, cancel);
  result.ok = reach.ok;
  result.detail = reach.detail;
  return result;
}

CheckResult BroadcastDiagnostics::CheckDestination(const util::CancellationToken& cancel) const {
  CheckResult result = Check("destination", "Destination server");
  const auto target = DestinationEndpoint(profile_.destination_url);
  if (!target) {
    result.detail = "cannot derive host and port from the destination URL";
    return result;
  }
  const ReachResult reach = ConnectTcp(*target, config_.check_timeout, cancel);
  result.ok = reach.ok;
  result.detail = reach.detail;
  return result;
}

CheckResult BroadcastDiagnostics::CheckStreamKey(bool destination_in_use,
                                                 const util::CancellationToken& cancel) const {
  CheckResult result = Check("stream_key", "Stream key");
  if (!config_.stream_key_check) {
    result.ok = true;
    result.detail = "test push disabled";
    return result;
  }
  if (destination_in_use) {
    result.ok = true;
    result.detail = "skipped: the broadcast is live on the destination";
    return result;
  }

  std::unique_ptr<supervisor::IChildProcess> child;
  try {
    child = launcher_->Launch(BuildStreamKeyTestArgs(transcoder_, profile_));
  } catch (const std::exception& e) {
    result.detail = std::string("test push could not start: ") + e.what();
    return result;
  }

  std::mutex mutex;
  std::condition_variable cv;
  bool exited = false;
  supervisor::ExitStatus status;
  std::string last_line;
  supervisor::IChildProcess* process = child.get();
  std::thread waiter([&] {
    process->ReadDiagnostics([&](const std::string& line) {
      if (line.empty()) return;
      std::lock_guard<std::mutex> lock(mutex);
      last_line = line;
    });
    const supervisor::ExitStatus exit = process->Wait();
    {
      std::lock_guard<std::mutex> lock(mutex);
      status = exit;
      exited = true;
    }
    cv.notify_all();
  });

  const auto deadline = std::chrono::steady_clock::now() + config_.stream_key_timeout;
  bool finished = false;
  {
    std::unique_lock<std::mutex> lock(mutex);
    while (!exited && !cancel.IsCancelled() && std::chrono::steady_clock::now() < deadline) {
      cv.wait_for(lock, std::chrono::milliseconds(100));
    }
    finished = exited;
  }
  if (!finished) {
    process->Terminate();
    std::unique_lock<std::mutex> lock(mutex);
    if (!cv.wait_for(lock, kTestPushGrace, [&] { return exited; })) {
      lock.unlock();
      process->Kill();
    }
  }
  waiter.join();

  if (!finished) {
    result.detail = cancel.IsCancelled()
                        ? std::string("test push cancelled")
                        : "test push timed out after " +
                              std::to_string(config_.stream_key_timeout.count() / 1000) + " s";
  } else if (status.Clean()) {
    result.ok = true;
    result.detail = "test push accepted";
  } else {
    result.detail = "test push " + status.Describe();
    if (!last_line.empty()) result.detail += ": " + last_line;
  }
  return result;
}

CheckResult BroadcastDiagnostics::CheckSources(const util::CancellationToken& cancel) const {
  CheckResult result = Check("sources", "Media sources");
  result.ok = true;
  if (sources_.empty()) {
    result.detail = "no sources configured";
    return result;
  }
  for (source::ISourceAdapter* source : sources_) {
    std::string line = source->Label() + ": ";
    try {
      source->CheckAvailable(cancel);
      line += "reachable";
    } catch (const ShutdownRequestedError&) {
      result.ok = false;
      line += "cancelled";
    } catch (const std::exception& e) {
      result.ok = false;
      line += e.what();
    }
    if (!result.detail.empty()) result.detail += "; ";
    result.detail += line;
  }
  return result;
}

CheckResult BroadcastDiagnostics::CheckSystem() const {
  CheckResult result = Check("system", "Host resources");
  const SystemUsage usage = sampler_->Sample();
  std::vector<std::string> issues;
  if (usage.cpu_percent && *usage.cpu_percent > kCpuLimit) issues.push_back("CPU high");
  if (usage.memory_percent && *usage.memory_percent > kMemoryLimit) issues.push_back("memory high");
  if (usage.disk_percent && *usage.disk_percent > kDiskLimit) issues.push_back("disk nearly full");

  result.ok = issues.empty();
  result.detail = "CPU " + Percent(usage.cpu_percent) + ", memory " +
                  Percent(usage.memory_percent) + ", disk " + Percent(usage.disk_percent);
  for (size_t i = 0; i < issues.size(); ++i) {
    result.detail += (i == 0 ? " (" : ", ") + issues[i];
  }
  if (!issues.empty()) result.detail += ")";
  return result;
}

}  // namespace loopcast::diagnostics
