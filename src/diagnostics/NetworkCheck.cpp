// Repository: loopcast
// Component: Network Checks Implementation
// Copyright (c) 2026 Loopcast

#include "loopcast/diagnostics/NetworkCheck.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "util/IoDeadline.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace loopcast::diagnostics {

namespace {

bool IsPort(const std::string& text) {
  return !text.empty() && text.size() <= 5 &&
         std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string Describe(util::IoOutcome outcome, const std::string& step,
                     std::chrono::milliseconds timeout) {
  if (outcome == util::IoOutcome::kCancelled) return step + " cancelled";
  return step + " timed out after " + std::to_string(timeout.count()) + " ms";
}

}  // namespace

std::optional<HostPort> SplitHostPort(const std::string& address) {
  HostPort out;
  if (!address.empty() && address.front() == '[') {
    const size_t close = address.find(']');
    if (close == std::string::npos || close + 1 >= address.size() || address[close + 1] != ':') {
      return std::nullopt;
    }
    out.host = address.substr(1, close - 1);
    out.port = address.substr(close + 2);
  } else {
    const size_t colon = address.rfind(':');
    if (colon == std::string::npos) return std::nullopt;
    out.host = address.substr(0, colon);
    out.port = address.substr(colon + 1);
  }
  if (out.host.empty() || !IsPort(out.port)) return std::nullopt;
  return out;
}

std::optional<HostPort> DestinationEndpoint(const std::string& url) {
  const size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return std::nullopt;
  std::string scheme = url.substr(0, scheme_end);
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  std::string authority = url.substr(scheme_end + 3);
  authority = authority.substr(0, authority.find_first_of("/?#"));
  const size_t at = authority.rfind('@');
  if (at != std::string::npos) authority = authority.substr(at + 1);
  if (authority.empty()) return std::nullopt;

  if (auto explicit_port = SplitHostPort(authority)) return explicit_port;

  HostPort out;
  out.host = authority;
  if (out.host.front() == '[' && out.host.back() == ']') {
    out.host = out.host.substr(1, out.host.size() - 2);
  }
  if (scheme == "rtmp") {
    out.port = "1935";
  } else if (scheme == "rtmps" || scheme == "https") {
    out.port = "443";
  } else if (scheme == "http") {
    out.port = "80";
  } else {
    return std::nullopt;
  }
  return out;
}

ReachResult ResolveHost(const std::string& host, std::chrono::milliseconds timeout,
                        const util::CancellationToken& cancel) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  bool done = false;
  boost::system::error_code error;
  std::set<std::string> addresses;

  resolver.async_resolve(host, "0",
                         [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                           error = ec;
                           for (const auto& entry : results) {
                             addresses.insert(entry.endpoint().address().to_string());
                           }
                           done = true;
                         });
  const util::IoOutcome outcome = util::RunIoUntil(
      ioc, [&] { return done; }, [&] { resolver.cancel(); },
      std::chrono::steady_clock::now() + timeout, cancel);

  ReachResult result;
  if (outcome != util::IoOutcome::kCompleted) {
    result.detail = Describe(outcome, "resolving " + host, timeout);
  } else if (error || addresses.empty()) {
    result.detail = "resolving " + host + " failed: " +
                    (error ? error.message() : std::string("no addresses"));
  } else {
    result.ok = true;
    for (const auto& address : addresses) {
      if (!result.detail.empty()) result.detail += ", ";
      result.detail += address;
    }
    result.detail = host + " -> " + result.detail;
  }
  return result;
}

ReachResult ConnectTcp(const HostPort& target, std::chrono::milliseconds timeout,
                       const util::CancellationToken& cancel) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  tcp::socket socket(ioc);
  bool done = false;
  std::string step = "resolving " + target.host;
  boost::system::error_code error;
  tcp::endpoint connected;

  resolver.async_resolve(
      target.host, target.port,
      [&](const boost::system::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
          error = ec;
          done = true;
          return;
        }
        step = "connecting to " + target.host + ":" + target.port;
        net::async_connect(socket, results,
                           [&](const boost::system::error_code& connect_ec, const tcp::endpoint& ep) {
                             error = connect_ec;
                             connected = ep;
                             done = true;
                           });
      });
  const util::IoOutcome outcome = util::RunIoUntil(
      ioc, [&] { return done; },
      [&] {
        resolver.cancel();
        boost::system::error_code ignored;
        socket.close(ignored);
      },
      std::chrono::steady_clock::now() + timeout, cancel);

  ReachResult result;
  if (outcome != util::IoOutcome::kCompleted) {
    result.detail = Describe(outcome, step, timeout);
  } else if (error) {
    result.detail = step + " failed: " + error.message();
  } else {
    result.ok = true;
    result.detail = target.host + ":" + target.port + " reachable via " +
                    connected.address().to_string();
  }
  boost::system::error_code ignored;
  socket.close(ignored);
  return result;
}

}  // namespace loopcast::diagnostics
