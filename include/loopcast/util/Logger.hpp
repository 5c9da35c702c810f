// Repository: loopcast
// Component: Thread-Safe Logger
// Purpose: Serialized, timestamped log lines for a long-running daemon.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_UTIL_LOGGER_HPP_
#define LOOPCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace loopcast::util {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

const char* LogLevelName(LogLevel level);

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Every call takes one static mutex, writes the whole line and flushes, so
// output from the control loop, transcoder watchers and gRPC handlers never
// interleaves. Stream lines carry a UTC timestamp and the level:
//
//   2026-03-01T12:00:00.123Z WARN  [StreamSupervisor] a.mp4: transcoder exit code 1
//
// Info  → stdout
// Debug → stdout, only when LOOPCAST_DEBUG is set in the environment
// Warn  → stderr (transient conditions the supervisor recovers from)
// Error → stderr
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  // Test hook: receives every emitted line (untimestamped) besides the
  // stream write. Pass nullptr to clear.
  static void SetSink(LogSink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static LogSink sink_;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_LOGGER_HPP_
