// Repository: loopcast
// Component: Thread-Safe Logger
// Copyright (c) 2026 Loopcast

#include "loopcast/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace loopcast::util {

std::mutex Logger::mutex_;
LogSink Logger::sink_;

namespace {

std::string UtcTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900,
                tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(millis));
  return buf;
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo: return "INFO";
    case LogLevel::kWarn: return "WARN";
    case LogLevel::kError: return "ERROR";
  }
  return "?";
}

bool Logger::DebugEnabled() {
  static const bool enabled = std::getenv("LOOPCAST_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  char tag[8];
  std::snprintf(tag, sizeof(tag), "%-5s", LogLevelName(level));
  const std::string stamped = UtcTimestamp() + " " + tag + " " + line;

  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << stamped << '\n';
  out.flush();
}

}  // namespace loopcast::util
