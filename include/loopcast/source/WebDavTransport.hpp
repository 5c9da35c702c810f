// Repository: loopcast
// Component: WebDAV Transport
// Purpose: Authenticated HTTP(S) requests against a WebDAV endpoint.
//          Production: BeastWebDavTransport (Boost.Beast, OpenSSL).
//          Tests: scripted transport returning canned multistatus bodies.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_WEBDAV_TRANSPORT_HPP_
#define LOOPCAST_SOURCE_WEBDAV_TRANSPORT_HPP_

#include <chrono>
#include <map>
#include <string>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::source {

// Parsed form of source.endpoint ("https://dav.example.com:8443/dav").
struct DavEndpoint {
  bool tls = false;
  std::string host;
  std::string port;       // Always set; defaults to 80/443.
  std::string base_path;  // No trailing slash; "" for server root.

  // scheme://host[:port] without path.
  std::string Origin() const;

  // Throws ConfigError when the URL is not http(s).
  static DavEndpoint Parse(const std::string& url);
};

// Percent-encodes everything except unreserved characters and '/'.
std::string PercentEncodePath(const std::string& path);
std::string PercentDecode(const std::string& text);

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers;  // Lower-case names.
  std::string body;

  std::string Header(const std::string& lower_name) const {
    auto it = headers.find(lower_name);
    return it == headers.end() ? std::string() : it->second;
  }
};

class IWebDavTransport {
 public:
  virtual ~IWebDavTransport() = default;

  // PROPFIND on a server path (decoded form). depth is 0 or 1.
  // Throws SourceUnavailableError on network/TLS failure or when the request
  // outlives request_timeout, ShutdownRequestedError once `cancel` fires.
  virtual HttpResponse Propfind(const std::string& server_path, int depth,
                                const util::CancellationToken& cancel) = 0;

  // Ranged GET (bytes=0-0) that does not follow redirects. Used to discover
  // a short-lived download URL. Same error contract as Propfind.
  virtual HttpResponse FetchFirstByte(const std::string& server_path,
                                      const util::CancellationToken& cancel) = 0;

  // Value of the Authorization header sent with every request.
  virtual std::string AuthorizationHeader() const = 0;
};

// Every request runs on its own io_context. request_timeout bounds the whole
// exchange (resolve, connect, TLS handshake, write, read).
class BeastWebDavTransport : public IWebDavTransport {
 public:
  explicit BeastWebDavTransport(const config::SourceConfig& config);

  BeastWebDavTransport(const BeastWebDavTransport&) = delete;
  BeastWebDavTransport& operator=(const BeastWebDavTransport&) = delete;

  HttpResponse Propfind(const std::string& server_path, int depth,
                        const util::CancellationToken& cancel) override;
  HttpResponse FetchFirstByte(const std::string& server_path,
                              const util::CancellationToken& cancel) override;
  std::string AuthorizationHeader() const override { return authorization_; }

 private:
  HttpResponse Send(const std::string& method,
                    const std::string& server_path,
                    const std::map<std::string, std::string>& extra_headers,
                    const std::string& body,
                    const util::CancellationToken& cancel);

  const DavEndpoint endpoint_;
  const std::string authorization_;
  const std::chrono::milliseconds timeout_;
  const bool verify_tls_;
};

// "Basic base64(user:password)".
std::string BasicAuthorization(const std::string& username, const std::string& password);

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_WEBDAV_TRANSPORT_HPP_
