// Repository: loopcast
// Component: Transcoder Command
// Copyright (c) 2026 Loopcast

#include "loopcast/supervisor/TranscoderCommand.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <regex>
#include <system_error>

#include "loopcast/Errors.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::supervisor {

namespace {

std::string FormatSeconds(double seconds) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", seconds);
  return buf;
}

std::string ScalePadFilter(int width, int height) {
  const std::string w = std::to_string(width);
  const std::string h = std::to_string(height);
  return "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease," +
         "pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2:color=black,setsar=1";
}

bool IsRtmp(const std::string& url) {
  return url.rfind("rtmp://", 0) == 0 || url.rfind("rtmps://", 0) == 0;
}

bool Usable(const config::ImageOverlay& image) {
  if (image.path.find("://") != std::string::npos) return true;
  std::error_code ec;
  if (std::filesystem::is_regular_file(image.path, ec)) return true;
  util::Logger::Warn("[TranscoderCommand] overlay image not found, skipped: " + image.path);
  return false;
}

std::string DrawText(const std::string& text, int font_size, const std::string& color,
                     const std::string& x, const std::string& y, int border_width,
                     const std::string& font_file) {
  std::string filter = "drawtext=text=" + QuoteFilterValue(text);
  if (!font_file.empty()) filter += ":fontfile=" + QuoteFilterValue(font_file);
  filter += ":fontsize=" + std::to_string(font_size) + ":fontcolor=" + color +
            ":x=" + QuoteFilterValue(x) + ":y=" + QuoteFilterValue(y);
  if (border_width > 0) filter += ":borderw=" + std::to_string(border_width);
  return filter;
}

// [0:v] is normalized to [base]; each image input i+1 is scaled and laid
// over the previous result; the text filters close the chain as [out].
std::string OverlayGraph(const config::EncodingProfile& profile,
                         const config::OverlayConfig& overlay,
                         const std::vector<config::ImageOverlay>& images,
                         const std::string& item_name) {
  std::string graph = "[0:v]" + ScalePadFilter(profile.width, profile.height) + "[base]";
  std::string current = "base";
  for (size_t i = 0; i < images.size(); ++i) {
    const config::ImageOverlay& image = images[i];
    const std::string label = "img" + std::to_string(i);
    const std::string next = "ov" + std::to_string(i);
    graph += ";[" + std::to_string(i + 1) + ":v]scale=-1:" + std::to_string(image.height) +
             ",format=rgba";
    if (image.opacity < 1.0) {
      char opacity[16];
      std::snprintf(opacity, sizeof(opacity), "%.2f", image.opacity);
      graph += std::string(",colorchannelmixer=aa=") + opacity;
    }
    graph += "[" + label + "];[" + current + "][" + label + "]overlay=x=" +
             QuoteFilterValue(image.x) + ":y=" + QuoteFilterValue(image.y) + "[" + next + "]";
    current = next;
  }

  std::vector<std::string> draws;
  for (const auto& text : overlay.texts) {
    draws.push_back(DrawText(text.text, text.font_size, text.font_color, text.x, text.y,
                             text.border_width, overlay.font_file));
  }
  if (overlay.episode_label) {
    draws.push_back(DrawText(EpisodeLabel(item_name), 28, "white@0.8", "w-tw-30", "h-th-30", 2,
                             overlay.font_file));
  }
  if (overlay.clock.enabled) {
    std::string format;
    for (char c : overlay.clock.format) {
      if (c == ':') format += '\\';
      format += c;
    }
    const config::ClockOverlay& clock = overlay.clock;
    draws.push_back(DrawText("%{localtime:" + format + "}", clock.font_size, clock.font_color,
                             clock.x, clock.y, 0, overlay.font_file));
  }

  std::string chain;
  for (const auto& draw : draws) chain += (chain.empty() ? "" : ",") + draw;
  graph += ";[" + current + "]" + (chain.empty() ? std::string("null") : chain) + "[out]";
  return graph;
}

}  // namespace

std::string QuoteFilterValue(const std::string& value) {
  std::string escaped;
  for (char c : value) {
    if (c == '\\' || c == '\'' || c == ':') escaped += '\\';
    escaped += c;
  }
  std::string quoted = "'";
  for (char c : escaped) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  return quoted + "'";
}

std::string EpisodeLabel(const std::string& item_name) {
  static const std::regex kSeasonEpisode(R"([Ss](\d{1,3})[ ._-]?[Ee](\d{1,4}))");
  static const std::regex kEpisode(R"((?:^|[^A-Za-z])[Ee][Pp]?[ ._-]?(\d{1,4}))");
  std::smatch match;
  if (std::regex_search(item_name, match, kSeasonEpisode)) {
    return "Season " + std::to_string(std::stoi(match[1].str())) + " Episode " +
           std::to_string(std::stoi(match[2].str()));
  }
  if (std::regex_search(item_name, match, kEpisode)) {
    return "Episode " + std::to_string(std::stoi(match[1].str()));
  }
  const size_t dot = item_name.rfind('.');
  return dot == std::string::npos || dot == 0 ? item_name : item_name.substr(0, dot);
}

std::string FindFontFile(const std::vector<std::string>& candidates) {
  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
  }
  return "";
}

const std::vector<std::string>& DefaultFontCandidates() {
  static const std::vector<std::string> kCandidates = {
      "/usr/share/fonts/truetype/wqy/wqy-zenhei.ttc",
      "/usr/share/fonts/truetype/wqy/wqy-microhei.ttc",
      "/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc",
      "/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc",
      "/usr/share/fonts/google-noto-cjk/NotoSansCJK-Regular.ttc",
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
  };
  return kCandidates;
}

std::vector<std::string> BuildTranscoderArgs(const config::TranscoderConfig& transcoder,
                                             const config::EncodingProfile& profile,
                                             const source::PlayableInput& input,
                                             double resume_seconds) {
  return BuildTranscoderArgs(transcoder, profile, config::OverlayConfig{}, input, "",
                             resume_seconds);
}

std::vector<std::string> BuildTranscoderArgs(const config::TranscoderConfig& transcoder,
                                             const config::EncodingProfile& profile,
                                             const config::OverlayConfig& overlay,
                                             const source::PlayableInput& input,
                                             const std::string& item_name,
                                             double resume_seconds) {
  const auto kbps = config::BitrateKbps(profile.video_bitrate);
  if (!kbps || *kbps <= 0) {
    throw ConfigError("output.bitrate is not a bitrate: " + profile.video_bitrate);
  }

  std::vector<std::string> args = {transcoder.binary, "-hide_banner", "-nostdin"};

  if (resume_seconds > 0.0) {
    args.insert(args.end(), {"-ss", FormatSeconds(resume_seconds)});
  }
  if (!input.headers.empty()) {
    std::string headers;
    for (const auto& [name, value] : input.headers) {
      headers += name + ": " + value + "\r\n";
    }
    args.insert(args.end(), {"-headers", headers});
  }
  // Read at native rate: the endpoint expects a live feed.
  args.insert(args.end(), {"-re", "-i", input.uri});

  if (overlay.Empty()) {
    args.insert(args.end(), {"-map", "0:v:0", "-map", "0:a:0?"});
    args.insert(args.end(), {"-vf", ScalePadFilter(profile.width, profile.height)});
  } else {
    std::vector<config::ImageOverlay> images;
    for (const auto& image : overlay.images) {
      if (Usable(image)) images.push_back(image);
    }
    for (const auto& image : images) {
      args.insert(args.end(), {"-i", image.path});
    }
    args.insert(args.end(), {"-filter_complex", OverlayGraph(profile, overlay, images, item_name),
                             "-map", "[out]", "-map", "0:a:0?"});
  }

  const std::string fps = std::to_string(profile.fps);
  args.insert(args.end(), {"-c:v", profile.video_codec});
  if (!profile.preset.empty()) {
    args.insert(args.end(), {"-preset", profile.preset});
  }
  args.insert(args.end(), {"-b:v", profile.video_bitrate,
                           "-maxrate", profile.video_bitrate,
                           "-bufsize", std::to_string(*kbps * 2) + "k",
                           "-r", fps,
                           "-g", std::to_string(profile.fps * 2),
                           "-pix_fmt", "yuv420p"});

  args.insert(args.end(), {"-c:a", profile.audio_codec,
                           "-b:a", profile.audio_bitrate,
                           "-ar", std::to_string(profile.audio_sample_rate),
                           "-ac", std::to_string(profile.audio_channels)});

  if (profile.format == "flv") {
    args.insert(args.end(), {"-flvflags", "no_duration_filesize"});
  }
  args.insert(args.end(), {"-f", profile.format, profile.destination_url});
  return args;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    std::string arg = argv[i];
    if (i > 0 && argv[i - 1] == "-headers") {
      arg = "<redacted>";
    } else if (i + 1 == argv.size() && IsRtmp(arg)) {
      // rtmp://host/app/<stream key>
      const auto slash = arg.rfind('/');
      if (slash != std::string::npos && slash > arg.find("://") + 3) {
        arg = arg.substr(0, slash + 1) + "****";
      }
    }
    if (!line.empty()) line += ' ';
    if (arg.find_first_of(" \t\"") != std::string::npos) {
      line += '"' + arg + '"';
    } else {
      line += arg;
    }
  }
  return line;
}

}  // namespace loopcast::supervisor
