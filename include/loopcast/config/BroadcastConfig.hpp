// Repository: loopcast
// Component: Broadcast Configuration
// Purpose: Validated configuration value built once at startup and passed by
//          reference into the playlist engine and stream supervisor.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_CONFIG_BROADCAST_CONFIG_HPP_
#define LOOPCAST_CONFIG_BROADCAST_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loopcast::config {

enum class SourceType { kLocal, kRemote };

struct SourceConfig {
  SourceType type = SourceType::kLocal;

  // Local: root folder. Remote: base collection path on the server.
  std::string path;
  bool recursive = true;
  std::vector<std::string> extensions;  // Lower-case, leading dot.

  // Remote only.
  std::string endpoint;
  std::string username;
  std::string password;
  std::chrono::milliseconds listing_ttl{std::chrono::seconds(300)};
  std::chrono::milliseconds resolve_validity{std::chrono::seconds(60)};
  std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
  bool verify_tls = true;
};

enum class PlayMode { kSequential, kShuffled };

struct PlaybackConfig {
  PlayMode mode = PlayMode::kSequential;
  std::string progress_file;  // Empty disables progress persistence.
};

// Fixed output parameters applied to every item regardless of its native
// resolution or codec. Immutable for the process lifetime.
struct EncodingProfile {
  std::string destination_url;
  int width = 1920;
  int height = 1080;
  std::string video_codec = "libx264";
  std::string video_bitrate = "3000k";
  std::string preset = "veryfast";
  int fps = 30;
  std::string audio_codec = "aac";
  std::string audio_bitrate = "192k";
  int audio_sample_rate = 44100;
  int audio_channels = 2;
  std::string format = "flv";
};

struct TranscoderConfig {
  std::string binary = "ffmpeg";
};

struct ReconnectPolicy {
  int max_retries = 3;  // Retries of one item before the playlist advances.
  std::chrono::milliseconds backoff_base{std::chrono::seconds(5)};
  std::chrono::milliseconds backoff_cap{std::chrono::seconds(60)};
  std::chrono::milliseconds grace_period{std::chrono::seconds(5)};
};

// Position values are ffmpeg expressions ("20", "w-tw-30", "h-th-30").
struct TextOverlay {
  std::string text;
  int font_size = 36;
  std::string font_color = "white";
  std::string x = "20";
  std::string y = "20";
  int border_width = 2;
};

// Local file or URL, scaled to `height` with the aspect ratio preserved.
struct ImageOverlay {
  std::string path;
  int height = 80;
  std::string x = "20";
  std::string y = "20";
  double opacity = 1.0;
};

struct ClockOverlay {
  bool enabled = false;
  std::string format = "%H:%M:%S";  // strftime, local time.
  int font_size = 24;
  std::string font_color = "white@0.8";
  std::string x = "w-tw-30";
  std::string y = "30";
};

// Burned into every item. Images are drawn in order (logo first), then the
// text overlays, the episode label (bottom right) and the clock.
struct OverlayConfig {
  std::vector<TextOverlay> texts;
  std::vector<ImageOverlay> images;
  ClockOverlay clock;
  bool episode_label = false;
  std::string font_file;  // Empty: first installed CJK-capable font, else ffmpeg's default.

  bool Empty() const {
    return texts.empty() && images.empty() && !clock.enabled && !episode_label;
  }
};

struct DiagnosticsConfig {
  bool enabled = true;
  int item_failure_threshold = 3;  // Consecutive failures of one item.
  int total_failure_interval = 5;  // Every Nth consecutive failure overall.
  std::chrono::milliseconds cooldown{std::chrono::seconds(60)};
  std::string network_check_address = "1.1.1.1:53";  // host:port reached over TCP.
  std::chrono::milliseconds check_timeout{std::chrono::seconds(10)};
  bool stream_key_check = true;
  std::chrono::milliseconds stream_key_timeout{std::chrono::seconds(15)};
};

enum class SmtpSecurity {
  kImplicitTls,  // SMTPS, usually port 465.
  kStartTls,     // Plain connect, upgraded with STARTTLS.
  kNone,         // Local relays only.
};

struct EmailConfig {
  bool enabled = false;
  std::string host;
  int port = 465;
  SmtpSecurity security = SmtpSecurity::kImplicitTls;
  std::string username;  // Defaults to `from`.
  std::string password;  // Empty skips AUTH.
  std::string from;
  std::vector<std::string> to;
  std::string subject_prefix = "[loopcast]";
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  bool verify_tls = true;
  bool notify_on_start = false;
};

struct ControlConfig {
  std::string listen_address = "127.0.0.1:50071";
  bool autostart = true;
};

struct BroadcastConfig {
  std::vector<SourceConfig> sources;
  PlaybackConfig playback;
  EncodingProfile output;
  TranscoderConfig transcoder;
  ReconnectPolicy reconnect;
  ControlConfig control;
  OverlayConfig overlay;
  DiagnosticsConfig diagnostics;
  EmailConfig email;
};

std::vector<std::string> DefaultExtensions();

// "3000k" → 3000, "3M" → 3000, bare numbers are bits per second.
// nullopt when the string is not a bitrate.
std::optional<int64_t> BitrateKbps(const std::string& bitrate);

}  // namespace loopcast::config

#endif  // LOOPCAST_CONFIG_BROADCAST_CONFIG_HPP_
