// Repository: loopcast
// Component: Network Checks
// Purpose: Bounded DNS and TCP reachability checks used by the broadcast
//          self-test.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_DIAGNOSTICS_NETWORK_CHECK_HPP_
#define LOOPCAST_DIAGNOSTICS_NETWORK_CHECK_HPP_

#include <chrono>
#include <optional>
#include <string>

#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::diagnostics {

struct HostPort {
  std::string host;
  std::string port;
};

// "host:port" or "[v6-address]:port".
std::optional<HostPort> SplitHostPort(const std::string& address);

// Host and port of a push URL; the port defaults by scheme (rtmp 1935,
// rtmps 443, srt none). nullopt when the URL has no host or no usable port.
std::optional<HostPort> DestinationEndpoint(const std::string& url);

struct ReachResult {
  bool ok = false;
  std::string detail;  // Addresses on success, the failing step otherwise.
};

// Both return within `timeout` (see util::RunIoUntil for the one exception)
// and report cancellation as a failure.
ReachResult ResolveHost(const std::string& host, std::chrono::milliseconds timeout,
                        const util::CancellationToken& cancel);
ReachResult ConnectTcp(const HostPort& target, std::chrono::milliseconds timeout,
                       const util::CancellationToken& cancel);

}  // namespace loopcast::diagnostics

#endif  // LOOPCAST_DIAGNOSTICS_NETWORK_CHECK_HPP_
