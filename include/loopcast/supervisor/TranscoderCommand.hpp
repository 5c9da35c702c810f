// Repository: loopcast
// Component: Transcoder Command
// Purpose: Builds the ffmpeg argument list for one item from the resolved
//          input and the fixed encoding profile.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SUPERVISOR_TRANSCODER_COMMAND_HPP_
#define LOOPCAST_SUPERVISOR_TRANSCODER_COMMAND_HPP_

#include <string>
#include <vector>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/source/MediaItem.hpp"

namespace loopcast::supervisor {

// Every item is scaled and padded to the profile resolution (aspect ratio
// preserved) and re-encoded with the profile codecs, so the endpoint sees one
// uniform stream whatever the source looks like. `resume_seconds` > 0 seeks
// into the input before decoding.
//
// Throws ConfigError if the profile bitrate cannot be interpreted.
std::vector<std::string> BuildTranscoderArgs(const config::TranscoderConfig& transcoder,
                                             const config::EncodingProfile& profile,
                                             const source::PlayableInput& input,
                                             double resume_seconds = 0.0);

// As above, with overlays burned in through -filter_complex. Image overlays
// whose local file is missing are left out with a warning. `item_name` feeds
// the episode label.
std::vector<std::string> BuildTranscoderArgs(const config::TranscoderConfig& transcoder,
                                             const config::EncodingProfile& profile,
                                             const config::OverlayConfig& overlay,
                                             const source::PlayableInput& input,
                                             const std::string& item_name,
                                             double resume_seconds = 0.0);

// "Show.S01E02.mkv" → "Season 1 Episode 2", "Show EP12.mp4" → "Episode 12",
// anything else → the file name without its extension.
std::string EpisodeLabel(const std::string& item_name);

// Quotes a filter option value for use inside a filtergraph description,
// escaping for both the option and the graph level.
std::string QuoteFilterValue(const std::string& value);

// First candidate that exists as a regular file, or "".
std::string FindFontFile(const std::vector<std::string>& candidates);
const std::vector<std::string>& DefaultFontCandidates();

// Single-line rendering for logs. Header values and the stream key part of
// the destination are masked.
std::string FormatCommandLine(const std::vector<std::string>& argv);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_TRANSCODER_COMMAND_HPP_
