// Repository: loopcast
// Component: Configuration Loader
// Purpose: JSON config file → BroadcastConfig, with validation.
// Copyright (c) 2026 Loopcast

#include "loopcast/config/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

#include "loopcast/Errors.hpp"
#include "loopcast/util/JsonFields.hpp"

namespace loopcast::config {

namespace {

using util::JsonGetBool;
using util::JsonGetDouble;
using util::JsonGetInt;
using util::JsonGetObject;
using util::JsonGetObjectArray;
using util::JsonGetString;
using util::JsonGetStringArray;

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string NormalizeExtension(const std::string& ext) {
  std::string lower = ToLower(ext);
  if (!lower.empty() && lower.front() != '.') lower.insert(lower.begin(), '.');
  return lower;
}

// Seconds may be fractional; stored as milliseconds.
void ReadSeconds(const std::string& json, const std::string& key,
                 std::chrono::milliseconds* out) {
  if (auto seconds = JsonGetDouble(json, key)) {
    if (*seconds < 0) {
      throw ConfigError(key + " must not be negative");
    }
    *out = std::chrono::milliseconds(static_cast<int64_t>(std::llround(*seconds * 1000.0)));
  }
}

void ReadInt(const std::string& json, const std::string& key, int* out) {
  if (auto value = JsonGetInt(json, key)) {
    *out = static_cast<int>(*value);
  }
}

void ReadString(const std::string& json, const std::string& key, std::string* out) {
  if (auto value = JsonGetString(json, key)) {
    *out = *value;
  }
}

SourceConfig ParseSource(const std::string& json) {
  SourceConfig source;
  const std::string type = ToLower(JsonGetString(json, "type").value_or("local"));
  if (type == "local") {
    source.type = SourceType::kLocal;
  } else if (type == "remote" || type == "webdav") {
    source.type = SourceType::kRemote;
    source.path = "/";
  } else {
    throw ConfigError("source.type must be 'local' or 'remote', got '" + type + "'");
  }

  ReadString(json, "path", &source.path);
  if (auto recursive = JsonGetBool(json, "recursive")) source.recursive = *recursive;

  if (auto extensions = JsonGetStringArray(json, "extensions")) {
    for (const auto& ext : *extensions) {
      source.extensions.push_back(NormalizeExtension(ext));
    }
  } else {
    source.extensions = DefaultExtensions();
  }

  ReadString(json, "endpoint", &source.endpoint);
  if (source.endpoint.empty()) ReadString(json, "url", &source.endpoint);
  ReadString(json, "username", &source.username);
  ReadString(json, "password", &source.password);
  ReadSeconds(json, "listingTtlSeconds", &source.listing_ttl);
  ReadSeconds(json, "resolveValiditySeconds", &source.resolve_validity);
  ReadSeconds(json, "timeoutSeconds", &source.request_timeout);
  if (auto verify = JsonGetBool(json, "verifyTls")) source.verify_tls = *verify;
  return source;
}

// Positions may be given as numbers or as ffmpeg expressions.
void ReadExpression(const std::string& json, const std::string& key, std::string* out) {
  if (auto text = JsonGetString(json, key)) {
    *out = *text;
  } else if (auto number = JsonGetDouble(json, key)) {
    *out = std::to_string(static_cast<int64_t>(std::llround(*number)));
  }
}

ImageOverlay ParseImage(const std::string& json) {
  ImageOverlay image;
  ReadString(json, "path", &image.path);
  ReadInt(json, "height", &image.height);
  ReadExpression(json, "x", &image.x);
  ReadExpression(json, "y", &image.y);
  if (auto opacity = JsonGetDouble(json, "opacity")) image.opacity = *opacity;
  return image;
}

OverlayConfig ParseOverlay(const std::string& json) {
  OverlayConfig overlay;
  if (auto texts = JsonGetObjectArray(json, "texts")) {
    for (const auto& text_json : *texts) {
      TextOverlay text;
      ReadString(text_json, "text", &text.text);
      ReadInt(text_json, "fontSize", &text.font_size);
      ReadString(text_json, "fontColor", &text.font_color);
      ReadExpression(text_json, "x", &text.x);
      ReadExpression(text_json, "y", &text.y);
      ReadInt(text_json, "borderWidth", &text.border_width);
      if (!text.text.empty()) overlay.texts.push_back(std::move(text));
    }
  }
  if (auto logo = JsonGetObject(json, "logo")) {
    overlay.images.push_back(ParseImage(*logo));
  }
  if (auto images = JsonGetObjectArray(json, "images")) {
    for (const auto& image_json : *images) overlay.images.push_back(ParseImage(image_json));
  }
  if (auto clock = JsonGetObject(json, "clock")) {
    overlay.clock.enabled = JsonGetBool(*clock, "enabled").value_or(true);
    ReadString(*clock, "format", &overlay.clock.format);
    ReadInt(*clock, "fontSize", &overlay.clock.font_size);
    ReadString(*clock, "fontColor", &overlay.clock.font_color);
    ReadExpression(*clock, "x", &overlay.clock.x);
    ReadExpression(*clock, "y", &overlay.clock.y);
  }
  if (auto episode = JsonGetBool(json, "episodeLabel")) overlay.episode_label = *episode;
  ReadString(json, "fontFile", &overlay.font_file);
  return overlay;
}

DiagnosticsConfig ParseDiagnostics(const std::string& json) {
  DiagnosticsConfig diagnostics;
  if (auto enabled = JsonGetBool(json, "enabled")) diagnostics.enabled = *enabled;
  ReadInt(json, "itemFailureThreshold", &diagnostics.item_failure_threshold);
  ReadInt(json, "totalFailureInterval", &diagnostics.total_failure_interval);
  ReadSeconds(json, "cooldownSeconds", &diagnostics.cooldown);
  ReadString(json, "networkCheckAddress", &diagnostics.network_check_address);
  ReadSeconds(json, "checkTimeoutSeconds", &diagnostics.check_timeout);
  if (auto check = JsonGetBool(json, "streamKeyCheck")) diagnostics.stream_key_check = *check;
  ReadSeconds(json, "streamKeyTimeoutSeconds", &diagnostics.stream_key_timeout);
  return diagnostics;
}

EmailConfig ParseEmail(const std::string& json) {
  EmailConfig email;
  if (auto enabled = JsonGetBool(json, "enabled")) email.enabled = *enabled;
  ReadString(json, "smtpServer", &email.host);
  if (email.host.empty()) ReadString(json, "host", &email.host);
  ReadInt(json, "smtpPort", &email.port);
  ReadInt(json, "port", &email.port);

  const std::string security =
      ToLower(JsonGetString(json, "security").value_or(email.port == 465 ? "ssl" : "starttls"));
  if (security == "ssl" || security == "tls") {
    email.security = SmtpSecurity::kImplicitTls;
  } else if (security == "starttls") {
    email.security = SmtpSecurity::kStartTls;
  } else if (security == "none") {
    email.security = SmtpSecurity::kNone;
  } else {
    throw ConfigError("email.security must be 'ssl', 'starttls' or 'none', got '" + security + "'");
  }

  ReadString(json, "fromAddr", &email.from);
  if (email.from.empty()) ReadString(json, "from", &email.from);
  ReadString(json, "username", &email.username);
  if (email.username.empty()) email.username = email.from;
  ReadString(json, "password", &email.password);
  if (auto to = JsonGetStringArray(json, "toAddrs")) {
    email.to = *to;
  } else if (auto single = JsonGetString(json, "toAddr")) {
    email.to.push_back(*single);
  }
  ReadString(json, "subjectPrefix", &email.subject_prefix);
  ReadSeconds(json, "timeoutSeconds", &email.timeout);
  if (auto verify = JsonGetBool(json, "verifyTls")) email.verify_tls = *verify;
  if (auto notify = JsonGetBool(json, "notifyOnStart")) email.notify_on_start = *notify;
  return email;
}

void ParseResolution(const std::string& value, EncodingProfile* profile) {
  const size_t x = ToLower(value).find('x');
  if (x == std::string::npos) {
    throw ConfigError("output.resolution must look like WIDTHxHEIGHT, got '" + value + "'");
  }
  try {
    profile->width = std::stoi(value.substr(0, x));
    profile->height = std::stoi(value.substr(x + 1));
  } catch (const std::exception&) {
    throw ConfigError("output.resolution must look like WIDTHxHEIGHT, got '" + value + "'");
  }
}

EncodingProfile ParseOutput(const std::string& json) {
  EncodingProfile profile;
  ReadString(json, "destinationUrl", &profile.destination_url);
  if (profile.destination_url.empty()) {
    const std::string rtmp_url = JsonGetString(json, "rtmpUrl").value_or("");
    const std::string stream_key = JsonGetString(json, "streamKey").value_or("");
    if (!rtmp_url.empty()) profile.destination_url = rtmp_url + stream_key;
  }
  if (auto resolution = JsonGetString(json, "resolution")) {
    ParseResolution(*resolution, &profile);
  }
  ReadInt(json, "width", &profile.width);
  ReadInt(json, "height", &profile.height);
  ReadString(json, "codec", &profile.video_codec);
  ReadString(json, "bitrate", &profile.video_bitrate);
  ReadString(json, "preset", &profile.preset);
  ReadInt(json, "fps", &profile.fps);
  ReadString(json, "audioCodec", &profile.audio_codec);
  ReadString(json, "audioBitrate", &profile.audio_bitrate);
  ReadInt(json, "audioSampleRate", &profile.audio_sample_rate);
  ReadInt(json, "audioChannels", &profile.audio_channels);
  ReadString(json, "format", &profile.format);
  return profile;
}

}  // namespace

BroadcastConfig LoadConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseConfig(buffer.str());
}

BroadcastConfig ParseConfig(const std::string& json) {
  const auto first = json.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || json[first] != '{') {
    throw ConfigError("config must be a JSON object");
  }

  BroadcastConfig config;

  if (auto sources = JsonGetObjectArray(json, "sources")) {
    for (const auto& source_json : *sources) {
      config.sources.push_back(ParseSource(source_json));
    }
  } else if (auto source = JsonGetObject(json, "source")) {
    config.sources.push_back(ParseSource(*source));
  }

  if (auto playback = JsonGetObject(json, "playback")) {
    const std::string mode = ToLower(JsonGetString(*playback, "mode").value_or("sequential"));
    if (mode == "sequential") {
      config.playback.mode = PlayMode::kSequential;
    } else if (mode == "shuffled" || mode == "random") {
      config.playback.mode = PlayMode::kShuffled;
    } else {
      throw ConfigError("playback.mode must be 'sequential' or 'shuffled', got '" + mode + "'");
    }
    ReadString(*playback, "progressFile", &config.playback.progress_file);
  }

  if (auto output = JsonGetObject(json, "output")) {
    config.output = ParseOutput(*output);
  }

  if (auto transcoder = JsonGetObject(json, "transcoder")) {
    ReadString(*transcoder, "binary", &config.transcoder.binary);
  }

  if (auto reconnect = JsonGetObject(json, "reconnect")) {
    ReadInt(*reconnect, "maxRetries", &config.reconnect.max_retries);
    ReadSeconds(*reconnect, "backoffBaseSeconds", &config.reconnect.backoff_base);
    ReadSeconds(*reconnect, "backoffCapSeconds", &config.reconnect.backoff_cap);
    ReadSeconds(*reconnect, "gracePeriodSeconds", &config.reconnect.grace_period);
  }

  if (auto control = JsonGetObject(json, "control")) {
    ReadString(*control, "listenAddress", &config.control.listen_address);
    if (auto autostart = JsonGetBool(*control, "autostart")) config.control.autostart = *autostart;
  }

  if (auto overlay = JsonGetObject(json, "overlay")) {
    config.overlay = ParseOverlay(*overlay);
  }
  if (auto diagnostics = JsonGetObject(json, "diagnostics")) {
    config.diagnostics = ParseDiagnostics(*diagnostics);
  }
  if (auto email = JsonGetObject(json, "email")) {
    config.email = ParseEmail(*email);
  }

  ValidateConfig(config);
  return config;
}

void ValidateConfig(const BroadcastConfig& config) {
  if (config.sources.empty()) {
    throw ConfigError("at least one source must be configured");
  }
  for (size_t i = 0; i < config.sources.size(); ++i) {
    const SourceConfig& source = config.sources[i];
    const std::string where = "source[" + std::to_string(i) + "]";
    if (source.extensions.empty()) {
      throw ConfigError(where + ": extensions must not be empty");
    }
    if (source.type == SourceType::kLocal && source.path.empty()) {
      throw ConfigError(where + ": local source requires path");
    }
    if (source.type == SourceType::kRemote) {
      if (source.endpoint.rfind("http://", 0) != 0 && source.endpoint.rfind("https://", 0) != 0) {
        throw ConfigError(where + ": remote endpoint must be an http(s) URL");
      }
      if (source.request_timeout.count() == 0) {
        throw ConfigError(where + ": timeoutSeconds must be positive");
      }
    }
  }

  const EncodingProfile& out = config.output;
  if (out.destination_url.empty()) {
    throw ConfigError("output.destinationUrl is required");
  }
  if (out.width <= 0 || out.height <= 0 || out.width % 2 != 0 || out.height % 2 != 0) {
    throw ConfigError("output resolution must be positive and even");
  }
  if (!BitrateKbps(out.video_bitrate) || *BitrateKbps(out.video_bitrate) <= 0) {
    throw ConfigError("output.bitrate must look like '3000k', got '" + out.video_bitrate + "'");
  }
  if (out.video_codec.empty() || out.format.empty()) {
    throw ConfigError("output.codec and output.format must not be empty");
  }
  if (out.fps <= 0) {
    throw ConfigError("output.fps must be positive");
  }
  if (config.transcoder.binary.empty()) {
    throw ConfigError("transcoder.binary must not be empty");
  }

  const ReconnectPolicy& reconnect = config.reconnect;
  if (reconnect.max_retries < 0) {
    throw ConfigError("reconnect.maxRetries must not be negative");
  }
  if (reconnect.backoff_cap < reconnect.backoff_base) {
    throw ConfigError("reconnect.backoffCapSeconds must be >= backoffBaseSeconds");
  }
  if (config.control.listen_address.empty()) {
    throw ConfigError("control.listenAddress must not be empty");
  }

  for (const auto& image : config.overlay.images) {
    if (image.path.empty() || image.height <= 0) {
      throw ConfigError("overlay images need a path and a positive height");
    }
    if (image.opacity < 0.0 || image.opacity > 1.0) {
      throw ConfigError("overlay image opacity must be within 0..1");
    }
  }

  const DiagnosticsConfig& diagnostics = config.diagnostics;
  if (diagnostics.item_failure_threshold <= 0 || diagnostics.total_failure_interval <= 0) {
    throw ConfigError("diagnostics failure thresholds must be positive");
  }
  if (diagnostics.network_check_address.rfind(':') == std::string::npos) {
    throw ConfigError("diagnostics.networkCheckAddress must be host:port");
  }

  const EmailConfig& email = config.email;
  if (email.enabled) {
    if (email.host.empty() || email.from.empty() || email.to.empty()) {
      throw ConfigError("email requires smtpServer, fromAddr and toAddrs when enabled");
    }
    if (email.port <= 0 || email.port > 65535) {
      throw ConfigError("email.smtpPort is out of range");
    }
  }
}

}  // namespace loopcast::config
