// Repository: loopcast
// Component: WebDAV Transport
// Purpose: Authenticated HTTP(S) requests against a WebDAV endpoint.
// Copyright (c) 2026 Loopcast

#include "loopcast/source/WebDavTransport.hpp"

#include <cctype>
#include <cstdio>
#include <memory>
#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "loopcast/Errors.hpp"
#include "loopcast/util/Base64.hpp"
#include "loopcast/util/Logger.hpp"
#include "util/IoDeadline.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace loopcast::source {

using util::Logger;

namespace {

constexpr const char* kPropfindBody =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop>"
    "<d:resourcetype/><d:getcontentlength/><d:displayname/><d:getlastmodified/>"
    "</d:prop></d:propfind>";

constexpr size_t kMaxBodyBytes = 32 * 1024 * 1024;

// One request/response exchange: resolve, connect, [TLS handshake], write,
// read. Each step is armed with the stream expiry; the caller bounds the
// exchange as a whole and may Abort() it at any point.
template <typename Stream>
class DavExchange : public std::enable_shared_from_this<DavExchange<Stream>> {
 public:
  static constexpr bool kTls = !std::is_same_v<Stream, beast::tcp_stream>;

  template <typename... StreamArgs>
  DavExchange(net::io_context& ioc, http::request<http::string_body> request, bool head_only,
              std::chrono::milliseconds step_timeout, StreamArgs&... stream_args)
      : resolver_(ioc),
        stream_(ioc, stream_args...),
        request_(std::move(request)),
        step_timeout_(step_timeout) {
    parser_.body_limit(kMaxBodyBytes);
    // Ranged first-byte requests only need status and headers; skip the body.
    parser_.skip(head_only);
  }

  Stream& stream() { return stream_; }

  void Start(const std::string& host, const std::string& port) {
    resolver_.async_resolve(
        host, port, beast::bind_front_handler(&DavExchange::OnResolve, this->shared_from_this()));
  }

  void Abort() {
    resolver_.cancel();
    beast::get_lowest_layer(stream_).close();
  }

  bool Finished() const { return finished_; }
  const beast::error_code& error() const { return error_; }
  const char* failed_step() const { return failed_step_; }
  HttpResponse& response() { return response_; }

 private:
  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return Fail(ec, "resolve");
    auto& lowest = beast::get_lowest_layer(stream_);
    lowest.expires_after(step_timeout_);
    lowest.async_connect(
        results, beast::bind_front_handler(&DavExchange::OnConnect, this->shared_from_this()));
  }

  void OnConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return Fail(ec, "connect");
    if constexpr (kTls) {
      beast::get_lowest_layer(stream_).expires_after(step_timeout_);
      stream_.async_handshake(
          ssl::stream_base::client,
          beast::bind_front_handler(&DavExchange::OnHandshake, this->shared_from_this()));
    } else {
      Write();
    }
  }

  void OnHandshake(beast::error_code ec) {
    if (ec) return Fail(ec, "TLS handshake");
    Write();
  }

  void Write() {
    beast::get_lowest_layer(stream_).expires_after(step_timeout_);
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&DavExchange::OnWrite, this->shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (ec) return Fail(ec, "write");
    beast::get_lowest_layer(stream_).expires_after(step_timeout_);
    http::async_read(stream_, buffer_, parser_,
                     beast::bind_front_handler(&DavExchange::OnRead, this->shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) return Fail(ec, "read");
    const auto& res = parser_.get();
    response_.status = static_cast<int>(res.result_int());
    for (const auto& field : res) {
      std::string name(field.name_string());
      for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      response_.headers[name] = std::string(field.value());
    }
    response_.body = res.body();

    // Connections are never reused.
    auto& lowest = beast::get_lowest_layer(stream_);
    lowest.expires_never();
    beast::error_code ignored;
    lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
    finished_ = true;
  }

  void Fail(beast::error_code ec, const char* step) {
    error_ = ec;
    failed_step_ = step;
    finished_ = true;
  }

  tcp::resolver resolver_;
  Stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> request_;
  http::response_parser<http::string_body> parser_;
  const std::chrono::milliseconds step_timeout_;

  bool finished_ = false;
  beast::error_code error_;
  const char* failed_step_ = "";
  HttpResponse response_;
};

template <typename Stream>
HttpResponse Drive(net::io_context& ioc, DavExchange<Stream>& exchange,
                   const DavEndpoint& endpoint, const std::string& what,
                   std::chrono::milliseconds timeout, const util::CancellationToken& cancel) {
  exchange.Start(endpoint.host, endpoint.port);
  const util::IoOutcome outcome = util::RunIoUntil(
      ioc, [&exchange] { return exchange.Finished(); }, [&exchange] { exchange.Abort(); },
      std::chrono::steady_clock::now() + timeout, cancel);

  switch (outcome) {
    case util::IoOutcome::kCancelled:
      Logger::Debug("[WebDavTransport] " + what + " abandoned: shutdown requested");
      throw ShutdownRequestedError();
    case util::IoOutcome::kTimedOut:
      throw SourceUnavailableError(what + " timed out after " +
                                   std::to_string(timeout.count()) + " ms");
    case util::IoOutcome::kCompleted:
      break;
  }
  if (!exchange.Finished()) {
    throw SourceUnavailableError(what + " failed: exchange ended without a response");
  }
  if (exchange.error()) {
    throw SourceUnavailableError(what + " failed (" + exchange.failed_step() +
                                 "): " + exchange.error().message());
  }
  return std::move(exchange.response());
}

}  // namespace

DavEndpoint DavEndpoint::Parse(const std::string& url) {
  DavEndpoint endpoint;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    endpoint.tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else {
    throw ConfigError("WebDAV endpoint must start with http:// or https://: " + url);
  }

  const size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  endpoint.base_path = slash == std::string::npos ? "" : PercentDecode(rest.substr(slash));
  while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
    endpoint.base_path.pop_back();
  }

  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    endpoint.host = authority.substr(0, colon);
    endpoint.port = authority.substr(colon + 1);
  } else {
    endpoint.host = authority;
    endpoint.port = endpoint.tls ? "443" : "80";
  }
  if (endpoint.host.empty()) {
    throw ConfigError("WebDAV endpoint has no host: " + url);
  }
  return endpoint;
}

std::string DavEndpoint::Origin() const {
  std::string origin = (tls ? "https://" : "http://") + host;
  const bool default_port = (tls && port == "443") || (!tls && port == "80");
  if (!default_port) origin += ":" + port;
  return origin;
}

std::string PercentEncodePath(const std::string& path) {
  std::string out;
  out.reserve(path.size() * 3 / 2);
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      out += buf;
    }
  }
  return out;
}

std::string PercentDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size() &&
        std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
      i += 2;
    } else {
      out += text[i];
    }
  }
  return out;
}

std::string BasicAuthorization(const std::string& username, const std::string& password) {
  return "Basic " + util::Base64Encode(username + ":" + password);
}

BeastWebDavTransport::BeastWebDavTransport(const config::SourceConfig& config)
    : endpoint_(DavEndpoint::Parse(config.endpoint)),
      authorization_(BasicAuthorization(config.username, config.password)),
      timeout_(config.request_timeout),
      verify_tls_(config.verify_tls) {}

HttpResponse BeastWebDavTransport::Propfind(const std::string& server_path, int depth,
                                            const util::CancellationToken& cancel) {
  return Send("PROPFIND", server_path,
              {{"Depth", std::to_string(depth)},
               {"Content-Type", "application/xml; charset=utf-8"}},
              kPropfindBody, cancel);
}

HttpResponse BeastWebDavTransport::FetchFirstByte(const std::string& server_path,
                                                  const util::CancellationToken& cancel) {
  return Send("GET", server_path, {{"Range", "bytes=0-0"}}, "", cancel);
}

HttpResponse BeastWebDavTransport::Send(const std::string& method,
                                        const std::string& server_path,
                                        const std::map<std::string, std::string>& extra_headers,
                                        const std::string& body,
                                        const util::CancellationToken& cancel) {
  if (cancel.IsCancelled()) throw ShutdownRequestedError();

  const std::string target = PercentEncodePath(server_path.empty() ? "/" : server_path);
  http::request<http::string_body> req;
  req.method_string(method);
  req.target(target);
  req.version(11);
  req.set(http::field::host, endpoint_.host);
  req.set(http::field::user_agent, "loopcast");
  req.set(http::field::authorization, authorization_);
  for (const auto& [name, value] : extra_headers) {
    req.set(name, value);
  }
  req.body() = body;
  req.prepare_payload();

  const bool head_only = method == "GET";
  const std::string what = method + " " + endpoint_.Origin() + target;

  if (!endpoint_.tls) {
    net::io_context ioc;
    auto exchange = std::make_shared<DavExchange<beast::tcp_stream>>(
        ioc, std::move(req), head_only, timeout_);
    return Drive(ioc, *exchange, endpoint_, what, timeout_, cancel);
  }

  ssl::context ctx(ssl::context::tls_client);
  if (verify_tls_) {
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
  } else {
    ctx.set_verify_mode(ssl::verify_none);
  }
  net::io_context ioc;
  auto exchange = std::make_shared<DavExchange<beast::ssl_stream<beast::tcp_stream>>>(
      ioc, std::move(req), head_only, timeout_, ctx);
  if (!SSL_set_tlsext_host_name(exchange->stream().native_handle(), endpoint_.host.c_str())) {
    throw SourceUnavailableError(what + " failed: cannot set TLS server name (OpenSSL error " +
                                 std::to_string(::ERR_get_error()) + ")");
  }
  if (verify_tls_) {
    exchange->stream().set_verify_callback(ssl::host_name_verification(endpoint_.host));
  }
  return Drive(ioc, *exchange, endpoint_, what, timeout_, cancel);
}

}  // namespace loopcast::source
