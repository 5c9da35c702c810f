// Repository: loopcast
// Component: Transcoder Progress Parser
// Copyright (c) 2026 Loopcast

#include "loopcast/supervisor/ProgressParser.hpp"

#include <algorithm>
#include <regex>

namespace loopcast::supervisor {

namespace {

const std::regex& DurationPattern() {
  static const std::regex re(R"(Duration:\s*(\d+:\d{2}:\d{2}(?:\.\d+)?))");
  return re;
}

const std::regex& TimePattern() {
  static const std::regex re(R"(time=\s*(-?\d+:\d{2}:\d{2}(?:\.\d+)?))");
  return re;
}

const std::regex& BitratePattern() {
  static const std::regex re(R"(bitrate=\s*(\d+(?:\.\d+)?)\s*kbits/s)");
  return re;
}

const std::regex& SpeedPattern() {
  static const std::regex re(R"(speed=\s*(\d+(?:\.\d+)?)x)");
  return re;
}

}  // namespace

std::optional<double> TranscoderProgress::Percent() const {
  if (!duration_seconds || *duration_seconds <= 0.0) return std::nullopt;
  return std::clamp(position_seconds / *duration_seconds * 100.0, 0.0, 100.0);
}

std::optional<double> ParseClockTime(const std::string& text) {
  static const std::regex re(R"((-?)(\d+):(\d{2}):(\d{2}(?:\.\d+)?))");
  std::smatch m;
  if (!std::regex_match(text, m, re)) return std::nullopt;
  const double seconds = std::stod(m[2].str()) * 3600.0 + std::stod(m[3].str()) * 60.0 +
                         std::stod(m[4].str());
  return m[1].matched && m[1].length() > 0 ? -seconds : seconds;
}

bool ParseProgressLine(const std::string& line, TranscoderProgress* progress) {
  bool changed = false;
  std::smatch m;

  if (std::regex_search(line, m, DurationPattern())) {
    if (auto d = ParseClockTime(m[1].str())) {
      progress->duration_seconds = *d;
      changed = true;
    }
  }
  if (std::regex_search(line, m, TimePattern())) {
    if (auto t = ParseClockTime(m[1].str())) {
      // ffmpeg reports small negative times while priming the muxer.
      progress->position_seconds = std::max(0.0, *t);
      changed = true;
    }
  }
  if (std::regex_search(line, m, BitratePattern())) {
    progress->bitrate_kbps = std::stod(m[1].str());
    changed = true;
  }
  if (std::regex_search(line, m, SpeedPattern())) {
    progress->speed = std::stod(m[1].str());
    changed = true;
  }
  return changed;
}

}  // namespace loopcast::supervisor
