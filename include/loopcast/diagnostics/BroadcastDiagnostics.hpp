// Repository: loopcast
// Component: Broadcast Diagnostics
// Purpose: Self-test run when the broadcast keeps failing: network, DNS,
//          destination reachability, stream key, sources and host resources.
//          Reports only; it never changes what the supervisor does.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_DIAGNOSTICS_BROADCAST_DIAGNOSTICS_HPP_
#define LOOPCAST_DIAGNOSTICS_BROADCAST_DIAGNOSTICS_HPP_

#include <memory>
#include <string>
#include <vector>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/diagnostics/SystemUsage.hpp"
#include "loopcast/source/ISourceAdapter.hpp"
#include "loopcast/supervisor/ChildProcess.hpp"
#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::diagnostics {

struct CheckResult {
  std::string id;    // "network", "dns", "destination", "stream_key", "sources", "system".
  std::string name;  // Operator-facing label.
  bool ok = false;
  std::string detail;
};

struct DiagnosisReport {
  std::string reason;
  std::string item;
  std::string time;  // Local wall clock when the checks started.
  int consecutive_failures = 0;
  std::vector<CheckResult> checks;

  size_t PassedCount() const;
  bool AllPassed() const { return PassedCount() == checks.size(); }
  // The destination is unreachable or refused the test push; retrying the
  // playlist cannot fix that.
  bool DestinationFailed() const;
};

std::string FormatReportText(const DiagnosisReport& report);
std::string FormatReportHtml(const DiagnosisReport& report);

// Argument vector for a short black-frame push of the output format to
// `profile.destination_url`.
std::vector<std::string> BuildStreamKeyTestArgs(const config::TranscoderConfig& transcoder,
                                                const config::EncodingProfile& profile);

class IDiagnosticChecks {
 public:
  virtual ~IDiagnosticChecks() = default;

  // `destination_in_use`: a transcoder is live on the destination, so the
  // test push is skipped.
  virtual DiagnosisReport Run(const std::string& reason, bool destination_in_use,
                              const util::CancellationToken& cancel) = 0;
};

class BroadcastDiagnostics : public IDiagnosticChecks {
 public:
  // Sources are non-owning and must outlive this object.
  BroadcastDiagnostics(const config::BroadcastConfig& config,
                       std::vector<source::ISourceAdapter*> sources,
                       std::shared_ptr<supervisor::IProcessLauncher> launcher,
                       std::shared_ptr<SystemUsageSampler> sampler);

  DiagnosisReport Run(const std::string& reason, bool destination_in_use,
                      const util::CancellationToken& cancel) override;

  CheckResult CheckNetwork(const util::CancellationToken& cancel) const;
  CheckResult CheckDns(const util::CancellationToken& cancel) const;
  CheckResult CheckDestination(const util::CancellationToken& cancel) const;
  CheckResult CheckStreamKey(bool destination_in_use, const util::CancellationToken& cancel) const;
  CheckResult CheckSources(const util::CancellationToken& cancel) const;
  CheckResult CheckSystem() const;

 private:
  const config::DiagnosticsConfig config_;
  const config::EncodingProfile profile_;
  const config::TranscoderConfig transcoder_;
  std::vector<source::ISourceAdapter*> sources_;
  std::shared_ptr<supervisor::IProcessLauncher> launcher_;
  std::shared_ptr<SystemUsageSampler> sampler_;
};

}  // namespace loopcast::diagnostics

#endif  // LOOPCAST_DIAGNOSTICS_BROADCAST_DIAGNOSTICS_HPP_
