// Repository: loopcast
// Component: Configuration Loader unit tests

#include <gtest/gtest.h>

#include "loopcast/Errors.hpp"
#include "loopcast/config/ConfigLoader.hpp"
#include "support/TempDir.hpp"

namespace loopcast::config {
namespace {

constexpr const char* kFullConfig = R"({
  "sources": [
    {"type": "local", "path": "/srv/videos", "recursive": false, "extensions": ["MP4", "mkv"]},
    {"type": "webdav", "url": "https://dav.example.com/remote.php/dav", "path": "/Movies",
     "username": "alice", "password": "s3cret", "listingTtlSeconds": 120,
     "resolveValiditySeconds": 30.5, "verifyTls": false}
  ],
  "playback": {"mode": "shuffled", "progressFile": "/var/lib/loopcast/progress.json"},
  "output": {
    "rtmpUrl": "rtmp://live.example.com/app/", "streamKey": "abcd-1234",
    "resolution": "1280x720", "codec": "libx264", "bitrate": "2500k", "preset": "fast",
    "fps": 25, "audioCodec": "aac", "audioBitrate": "128k", "format": "flv"
  },
  "transcoder": {"binary": "/usr/local/bin/ffmpeg"},
  "reconnect": {"maxRetries": 5, "backoffBaseSeconds": 2, "backoffCapSeconds": 30,
                "gracePeriodSeconds": 3},
  "control": {"listenAddress": "0.0.0.0:6000", "autostart": false}
})";

constexpr const char* kMinimalConfig = R"({
  "source": {"path": "/videos"},
  "output": {"destinationUrl": "rtmp://localhost/live/key"}
})";

TEST(ConfigLoaderTest, ParsesEverySection) {
  const BroadcastConfig config = ParseConfig(kFullConfig);

  ASSERT_EQ(config.sources.size(), 2u);
  const SourceConfig& local = config.sources[0];
  EXPECT_EQ(local.type, SourceType::kLocal);
  EXPECT_EQ(local.path, "/srv/videos");
  EXPECT_FALSE(local.recursive);
  EXPECT_EQ(local.extensions, (std::vector<std::string>{".mp4", ".mkv"}));

  const SourceConfig& remote = config.sources[1];
  EXPECT_EQ(remote.type, SourceType::kRemote);
  EXPECT_EQ(remote.endpoint, "https://dav.example.com/remote.php/dav");
  EXPECT_EQ(remote.path, "/Movies");
  EXPECT_EQ(remote.username, "alice");
  EXPECT_EQ(remote.password, "s3cret");
  EXPECT_EQ(remote.listing_ttl, std::chrono::seconds(120));
  EXPECT_EQ(remote.resolve_validity, std::chrono::milliseconds(30500));
  EXPECT_FALSE(remote.verify_tls);
  EXPECT_EQ(remote.extensions, DefaultExtensions());

  EXPECT_EQ(config.playback.mode, PlayMode::kShuffled);
  EXPECT_EQ(config.playback.progress_file, "/var/lib/loopcast/progress.json");

  EXPECT_EQ(config.output.destination_url, "rtmp://live.example.com/app/abcd-1234");
  EXPECT_EQ(config.output.width, 1280);
  EXPECT_EQ(config.output.height, 720);
  EXPECT_EQ(config.output.video_bitrate, "2500k");
  EXPECT_EQ(config.output.preset, "fast");
  EXPECT_EQ(config.output.fps, 25);
  EXPECT_EQ(config.output.audio_bitrate, "128k");

  EXPECT_EQ(config.transcoder.binary, "/usr/local/bin/ffmpeg");
  EXPECT_EQ(config.reconnect.max_retries, 5);
  EXPECT_EQ(config.reconnect.backoff_base, std::chrono::seconds(2));
  EXPECT_EQ(config.reconnect.backoff_cap, std::chrono::seconds(30));
  EXPECT_EQ(config.reconnect.grace_period, std::chrono::seconds(3));
  EXPECT_EQ(config.control.listen_address, "0.0.0.0:6000");
  EXPECT_FALSE(config.control.autostart);
}

TEST(ConfigLoaderTest, MinimalConfigUsesDefaults) {
  const BroadcastConfig config = ParseConfig(kMinimalConfig);

  ASSERT_EQ(config.sources.size(), 1u);
  EXPECT_EQ(config.sources[0].type, SourceType::kLocal);
  EXPECT_TRUE(config.sources[0].recursive);
  EXPECT_EQ(config.playback.mode, PlayMode::kSequential);
  EXPECT_TRUE(config.playback.progress_file.empty());
  EXPECT_EQ(config.output.width, 1920);
  EXPECT_EQ(config.output.height, 1080);
  EXPECT_EQ(config.output.format, "flv");
  EXPECT_EQ(config.transcoder.binary, "ffmpeg");
  EXPECT_EQ(config.reconnect.max_retries, 3);
  EXPECT_EQ(config.reconnect.backoff_base, std::chrono::seconds(5));
  EXPECT_EQ(config.reconnect.backoff_cap, std::chrono::seconds(60));
  EXPECT_TRUE(config.control.autostart);
}

TEST(ConfigLoaderTest, RejectsInvalidConfigs) {
  EXPECT_THROW(ParseConfig("[]"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"output": {"destinationUrl": "rtmp://x/y"}})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"}})"), ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"type": "ftp", "path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"type": "remote", "endpoint": "nas.local"},
                               "output": {"destinationUrl": "rtmp://x/y"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y", "resolution": "wide"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y", "resolution": "1279x720"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y", "bitrate": "fast"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "playback": {"mode": "backwards"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "reconnect": {"backoffBaseSeconds": 10, "backoffCapSeconds": 5}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "reconnect": {"maxRetries": -1}})"),
               ConfigError);
}

TEST(ConfigLoaderTest, ErrorMessageNamesTheField) {
  try {
    ParseConfig(R"({"source": {"path": "/v"}, "output": {"destinationUrl": "rtmp://x/y", "fps": 0}})");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("fps"), std::string::npos);
  }
}

TEST(ConfigLoaderTest, LoadsFromFile) {
  tests::TempDir dir;
  const std::string path = dir.WriteFile("loopcast.json", kMinimalConfig);
  const BroadcastConfig config = LoadConfigFile(path);
  EXPECT_EQ(config.output.destination_url, "rtmp://localhost/live/key");

  EXPECT_THROW(LoadConfigFile(dir.str() + "/missing.json"), ConfigError);
}

TEST(ConfigLoaderTest, ParsesOverlayDiagnosticsAndEmail) {
  const BroadcastConfig config = ParseConfig(R"({
    "source": {"path": "/v"},
    "output": {"destinationUrl": "rtmp://x/live/key"},
    "overlay": {
      "texts": [{"text": "Channel 7", "fontSize": 40, "x": 30, "y": "h-th-30"}, {"text": ""}],
      "logo": {"path": "/srv/logo.png", "height": 60, "opacity": 0.5},
      "clock": {"format": "%H:%M"},
      "episodeLabel": true,
      "fontFile": "/usr/share/fonts/noto.ttc"
    },
    "diagnostics": {"itemFailureThreshold": 2, "totalFailureInterval": 4, "cooldownSeconds": 120,
                    "networkCheckAddress": "8.8.8.8:53", "streamKeyCheck": false},
    "email": {"enabled": true, "smtpServer": "smtp.example.com", "smtpPort": 587,
              "fromAddr": "tv@example.com", "password": "pw", "toAddr": "ops@example.com",
              "notifyOnStart": true}
  })");

  const OverlayConfig& overlay = config.overlay;
  ASSERT_EQ(overlay.texts.size(), 1u);
  EXPECT_EQ(overlay.texts[0].text, "Channel 7");
  EXPECT_EQ(overlay.texts[0].font_size, 40);
  EXPECT_EQ(overlay.texts[0].x, "30");
  EXPECT_EQ(overlay.texts[0].y, "h-th-30");
  ASSERT_EQ(overlay.images.size(), 1u);
  EXPECT_EQ(overlay.images[0].height, 60);
  EXPECT_DOUBLE_EQ(overlay.images[0].opacity, 0.5);
  EXPECT_TRUE(overlay.clock.enabled);
  EXPECT_EQ(overlay.clock.format, "%H:%M");
  EXPECT_TRUE(overlay.episode_label);
  EXPECT_EQ(overlay.font_file, "/usr/share/fonts/noto.ttc");

  EXPECT_EQ(config.diagnostics.item_failure_threshold, 2);
  EXPECT_EQ(config.diagnostics.total_failure_interval, 4);
  EXPECT_EQ(config.diagnostics.cooldown, std::chrono::seconds(120));
  EXPECT_EQ(config.diagnostics.network_check_address, "8.8.8.8:53");
  EXPECT_FALSE(config.diagnostics.stream_key_check);

  const EmailConfig& email = config.email;
  EXPECT_TRUE(email.enabled);
  EXPECT_EQ(email.host, "smtp.example.com");
  EXPECT_EQ(email.port, 587);
  EXPECT_EQ(email.security, SmtpSecurity::kStartTls);
  EXPECT_EQ(email.username, "tv@example.com");
  EXPECT_EQ(email.to, std::vector<std::string>{"ops@example.com"});
  EXPECT_TRUE(email.notify_on_start);
}

TEST(ConfigLoaderTest, DefaultsLeaveOverlayAndEmailOff) {
  const BroadcastConfig config = ParseConfig(kMinimalConfig);
  EXPECT_TRUE(config.overlay.Empty());
  EXPECT_TRUE(config.diagnostics.enabled);
  EXPECT_FALSE(config.email.enabled);
  EXPECT_EQ(config.email.security, SmtpSecurity::kImplicitTls);
}

TEST(ConfigLoaderTest, RejectsInvalidOverlayDiagnosticsAndEmail) {
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "overlay": {"logo": {"path": "/l.png", "opacity": 2}}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "diagnostics": {"totalFailureInterval": 0}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "diagnostics": {"networkCheckAddress": "1.1.1.1"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "email": {"enabled": true, "smtpServer": "smtp.example.com"}})"),
               ConfigError);
  EXPECT_THROW(ParseConfig(R"({"source": {"path": "/v"},
                               "output": {"destinationUrl": "rtmp://x/y"},
                               "email": {"security": "smoke"}})"),
               ConfigError);
}

TEST(BitrateTest, ParsesSuffixes) {
  EXPECT_EQ(BitrateKbps("3000k").value_or(-1), 3000);
  EXPECT_EQ(BitrateKbps("3M").value_or(-1), 3000);
  EXPECT_EQ(BitrateKbps("128000").value_or(-1), 128);
  EXPECT_FALSE(BitrateKbps("").has_value());
  EXPECT_FALSE(BitrateKbps("k").has_value());
  EXPECT_FALSE(BitrateKbps("1.5M").has_value());
}

}  // namespace
}  // namespace loopcast::config
