// Repository: loopcast
// Component: Error Taxonomy
// Purpose: Typed failure conditions surfaced from adapters and the playlist
//          engine to the stream supervisor.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_ERRORS_HPP_
#define LOOPCAST_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace loopcast {

enum class ErrorKind {
  kNone,
  kConfigError,         // Fatal: prevents startup.
  kSourceUnavailable,   // Transient: retried with backoff.
  kSourceEmpty,         // Transient: nothing to play, retried with backoff.
  kItemUnresolvable,    // Transient: skip to the next item, no backoff.
  kStreamProcessCrash,  // Transient: drives Reconnecting.
  kShutdownRequested,   // Expected; not a failure.
};

const char* ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message)
      : Error(ErrorKind::kConfigError, message) {}
};

class SourceUnavailableError : public Error {
 public:
  explicit SourceUnavailableError(const std::string& message)
      : Error(ErrorKind::kSourceUnavailable, message) {}
};

class SourceEmptyError : public Error {
 public:
  explicit SourceEmptyError(const std::string& message)
      : Error(ErrorKind::kSourceEmpty, message) {}
};

class ItemUnresolvableError : public Error {
 public:
  explicit ItemUnresolvableError(const std::string& message)
      : Error(ErrorKind::kItemUnresolvable, message) {}
};

class ShutdownRequestedError : public Error {
 public:
  ShutdownRequestedError() : Error(ErrorKind::kShutdownRequested, "shutdown requested") {}
};

}  // namespace loopcast

#endif  // LOOPCAST_ERRORS_HPP_
