// Repository: loopcast
// Component: SMTP Alert Notifier Implementation
// Copyright (c) 2026 Loopcast

#include "loopcast/diagnostics/AlertNotifier.hpp"

#include <cctype>
#include <ctime>
#include <initializer_list>
#include <string>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "loopcast/Errors.hpp"
#include "loopcast/util/Base64.hpp"
#include "loopcast/util/Logger.hpp"
#include "util/IoDeadline.hpp"

namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace loopcast::diagnostics {

using util::Logger;

namespace {

bool IsPlainAscii(const std::string& text) {
  for (unsigned char c : text) {
    if (c < 0x20 || c > 0x7e) return false;
  }
  return true;
}

std::string EncodeHeaderWord(const std::string& text) {
  if (IsPlainAscii(text)) return text;
  return "=?UTF-8?B?" + util::Base64Encode(text) + "?=";
}

std::string WrapLines(const std::string& text, size_t width) {
  std::string out;
  for (size_t i = 0; i < text.size(); i += width) {
    out += text.substr(i, width);
    out += "\r\n";
  }
  return out;
}

std::string Rfc5322Now() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S %z", &local);
  return buf;
}

ssl::context MakeTlsContext(bool verify) {
  ssl::context ctx(ssl::context::tls_client);
  if (verify) {
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);
  } else {
    ctx.set_verify_mode(ssl::verify_none);
  }
  return ctx;
}

struct Reply {
  int code = 0;
  std::string text;  // Continuation lines joined with ' '.
};

// One SMTP conversation. Every step shares the deadline set at construction.
class SmtpSession {
 public:
  SmtpSession(const config::EmailConfig& config, const util::CancellationToken& cancel)
      : config_(config),
        cancel_(cancel),
        deadline_(std::chrono::steady_clock::now() + config.timeout),
        tls_context_(MakeTlsContext(config.verify_tls)),
        resolver_(ioc_),
        stream_(ioc_, tls_context_) {
    if (config_.verify_tls) {
      stream_.set_verify_callback(ssl::host_name_verification(config_.host));
    }
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), config_.host.c_str())) {
      throw AlertDeliveryError("cannot set TLS server name (OpenSSL error " +
                               std::to_string(::ERR_get_error()) + ")");
    }
  }

  void Connect() {
    const std::string port = std::to_string(config_.port);
    tcp::resolver::results_type endpoints;
    Await("resolve " + config_.host, [&](auto handler) {
      resolver_.async_resolve(config_.host, port,
                              [&endpoints, handler](const boost::system::error_code& ec,
                                                    tcp::resolver::results_type results) mutable {
                                endpoints = std::move(results);
                                handler(ec);
                              });
    });
    Await("connect " + config_.host + ":" + port, [&](auto handler) {
      net::async_connect(stream_.next_layer(), endpoints, handler);
    });
    if (config_.security == config::SmtpSecurity::kImplicitTls) Handshake();
  }

  void Handshake() {
    Await("TLS handshake", [&](auto handler) {
      stream_.async_handshake(ssl::stream_base::client, handler);
    });
    tls_active_ = true;
  }

  Reply ReadReply(const std::string& step) {
    Reply reply;
    while (true) {
      Await(step, [&](auto handler) {
        if (tls_active_) {
          net::async_read_until(stream_, net::dynamic_buffer(buffer_), "\r\n", handler);
        } else {
          net::async_read_until(stream_.next_layer(), net::dynamic_buffer(buffer_), "\r\n",
                                handler);
        }
      });
      const size_t end = buffer_.find("\r\n");
      const std::string line = buffer_.substr(0, end);
      buffer_.erase(0, end + 2);

      if (line.size() < 3 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
          !std::isdigit(static_cast<unsigned char>(line[1])) ||
          !std::isdigit(static_cast<unsigned char>(line[2]))) {
        throw AlertDeliveryError("SMTP " + step + ": malformed reply '" + line + "'");
      }
      reply.code = std::stoi(line.substr(0, 3));
      if (line.size() > 4) {
        if (!reply.text.empty()) reply.text += ' ';
        reply.text += line.substr(4);
      }
      if (line.size() < 4 || line[3] != '-') return reply;
    }
  }

  void Write(const std::string& step, const std::string& data) {
    Await(step, [&](auto handler) {
      if (tls_active_) {
        net::async_write(stream_, net::buffer(data), handler);
      } else {
        net::async_write(stream_.next_layer(), net::buffer(data), handler);
      }
    });
  }

  Reply Expect(const std::string& step, std::initializer_list<int> accepted) {
    Reply reply = ReadReply(step);
    for (int code : accepted) {
      if (reply.code == code) return reply;
    }
    throw AlertDeliveryError("SMTP " + step + " rejected: " + std::to_string(reply.code) + " " +
                             reply.text);
  }

  Reply Command(const std::string& step, const std::string& line,
                std::initializer_list<int> accepted) {
    Write(step, line + "\r\n");
    return Expect(step, accepted);
  }

  void Close() {
    boost::system::error_code ec;
    stream_.next_layer().close(ec);
  }

 private:
  template <typename Initiate>
  void Await(const std::string& step, Initiate&& initiate) {
    bool done = false;
    boost::system::error_code error;
    ioc_.restart();
    initiate([&done, &error](const boost::system::error_code& ec, auto&&...) {
      error = ec;
      done = true;
    });
    const util::IoOutcome outcome = util::RunIoUntil(
        ioc_, [&done] { return done; }, [this] { Abort(); }, deadline_, cancel_);
    if (outcome == util::IoOutcome::kCancelled) throw ShutdownRequestedError();
    if (outcome == util::IoOutcome::kTimedOut) {
      throw AlertDeliveryError("SMTP " + step + " timed out after " +
                               std::to_string(config_.timeout.count()) + " ms");
    }
    if (!done) throw AlertDeliveryError("SMTP " + step + " ended without completing");
    if (error) throw AlertDeliveryError("SMTP " + step + " failed: " + error.message());
  }

  void Abort() {
    resolver_.cancel();
    Close();
  }

  const config::EmailConfig& config_;
  const util::CancellationToken& cancel_;
  const std::chrono::steady_clock::time_point deadline_;
  net::io_context ioc_;
  ssl::context tls_context_;
  tcp::resolver resolver_;
  ssl::stream<tcp::socket> stream_;
  bool tls_active_ = false;
  std::string buffer_;
};

}  // namespace

std::string BuildMimeMessage(const std::string& from, const std::vector<std::string>& to,
                             const std::string& subject, const Alert& alert,
                             const std::string& date) {
  std::string recipients;
  for (const auto& address : to) {
    if (!recipients.empty()) recipients += ", ";
    recipients += address;
  }
  std::string message;
  message += "From: " + from + "\r\n";
  message += "To: " + recipients + "\r\n";
  message += "Subject: " + EncodeHeaderWord(subject) + "\r\n";
  message += "Date: " + date + "\r\n";
  message += "MIME-Version: 1.0\r\n";
  message += std::string("Content-Type: ") + (alert.html ? "text/html" : "text/plain") +
             "; charset=UTF-8\r\n";
  message += "Content-Transfer-Encoding: base64\r\n";
  message += "\r\n";
  message += WrapLines(util::Base64Encode(alert.body), 76);
  return message;
}

std::string DotStuff(const std::string& message) {
  std::string out;
  out.reserve(message.size() + 16);
  bool line_start = true;
  for (size_t i = 0; i < message.size(); ++i) {
    const char c = message[i];
    if (line_start && c == '.') out += '.';
    if (c == '\n' && (i == 0 || message[i - 1] != '\r')) out += '\r';
    out += c;
    line_start = c == '\n';
  }
  if (out.size() < 2 || out.compare(out.size() - 2, 2, "\r\n") != 0) out += "\r\n";
  return out;
}

SmtpAlertNotifier::SmtpAlertNotifier(config::EmailConfig config) : config_(std::move(config)) {}

void SmtpAlertNotifier::Send(const Alert& alert, const util::CancellationToken& cancel) {
  if (cancel.IsCancelled()) throw ShutdownRequestedError();
  const std::string subject =
      config_.subject_prefix.empty() ? alert.subject : config_.subject_prefix + " " + alert.subject;

  SmtpSession session(config_, cancel);
  session.Connect();
  session.Expect("greeting", {220});

  const std::string ehlo = "EHLO " + net::ip::host_name();
  session.Command("EHLO", ehlo, {250});
  if (config_.security == config::SmtpSecurity::kStartTls) {
    session.Command("STARTTLS", "STARTTLS", {220});
    session.Handshake();
    session.Command("EHLO", ehlo, {250});
  }

  if (!config_.password.empty()) {
    session.Command("AUTH", "AUTH LOGIN", {334});
    session.Command("AUTH username", util::Base64Encode(config_.username), {334});
    session.Command("AUTH password", util::Base64Encode(config_.password), {235});
  }

  session.Command("MAIL FROM", "MAIL FROM:<" + config_.from + ">", {250});
  for (const auto& recipient : config_.to) {
    session.Command("RCPT TO " + recipient, "RCPT TO:<" + recipient + ">", {250, 251});
  }
  session.Command("DATA", "DATA", {354});
  session.Write("message", DotStuff(BuildMimeMessage(config_.from, config_.to, subject, alert,
                                                     Rfc5322Now())) +
                               ".\r\n");
  session.Expect("message", {250});

  try {
    session.Command("QUIT", "QUIT", {221});
  } catch (const AlertDeliveryError& e) {
    // The message was already accepted.
    Logger::Debug(std::string("[AlertNotifier] ") + e.what());
  }
  session.Close();
  Logger::Info("[AlertNotifier] sent \"" + alert.subject + "\" to " +
               std::to_string(config_.to.size()) + " recipient(s)");
}

}  // namespace loopcast::diagnostics
