// Repository: loopcast
// Component: Alert Notifier
// Purpose: Operator notifications (self-test reports, broadcast start) by
//          e-mail. SmtpAlertNotifier speaks SMTP directly over Boost.Asio
//          with implicit TLS, STARTTLS or plaintext.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_DIAGNOSTICS_ALERT_NOTIFIER_HPP_
#define LOOPCAST_DIAGNOSTICS_ALERT_NOTIFIER_HPP_

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::diagnostics {

struct Alert {
  std::string subject;
  std::string body;
  bool html = false;
};

// Delivery failed: connection, TLS, authentication or an unexpected reply.
class AlertDeliveryError : public std::runtime_error {
 public:
  explicit AlertDeliveryError(const std::string& message) : std::runtime_error(message) {}
};

class IAlertNotifier {
 public:
  virtual ~IAlertNotifier() = default;

  // Blocks until the alert is accepted. Throws AlertDeliveryError, or
  // ShutdownRequestedError when `cancel` fires first.
  virtual void Send(const Alert& alert, const util::CancellationToken& cancel) = 0;
};

// RFC 5322 message with a base64 UTF-8 body and an RFC 2047 encoded subject.
// `date` is an RFC 5322 date-time.
std::string BuildMimeMessage(const std::string& from, const std::vector<std::string>& to,
                             const std::string& subject, const Alert& alert,
                             const std::string& date);

// SMTP data transparency: CRLF line endings, leading dots doubled.
std::string DotStuff(const std::string& message);

class SmtpAlertNotifier : public IAlertNotifier {
 public:
  explicit SmtpAlertNotifier(config::EmailConfig config);

  void Send(const Alert& alert, const util::CancellationToken& cancel) override;

 private:
  const config::EmailConfig config_;
};

}  // namespace loopcast::diagnostics

#endif  // LOOPCAST_DIAGNOSTICS_ALERT_NOTIFIER_HPP_
