// Repository: loopcast
// Component: Transcoder Progress Parser
// Purpose: Extracts duration, position, bitrate and speed from ffmpeg
//          diagnostic lines.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SUPERVISOR_PROGRESS_PARSER_HPP_
#define LOOPCAST_SUPERVISOR_PROGRESS_PARSER_HPP_

#include <optional>
#include <string>

namespace loopcast::supervisor {

struct TranscoderProgress {
  std::optional<double> duration_seconds;  // From the input header.
  double position_seconds = 0.0;
  std::optional<double> bitrate_kbps;
  std::optional<double> speed;

  // 0..100, or nullopt while the duration is unknown.
  std::optional<double> Percent() const;
};

// "HH:MM:SS.xx" → seconds. nullopt for "N/A" and malformed input.
std::optional<double> ParseClockTime(const std::string& text);

// Updates `progress` from one stderr line. Returns true if anything changed.
bool ParseProgressLine(const std::string& line, TranscoderProgress* progress);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_PROGRESS_PARSER_HPP_
