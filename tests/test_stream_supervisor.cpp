// Repository: loopcast
// Component: Stream Supervisor tests (scripted launcher and real /bin/sh child)

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/FakeProcessLauncher.h"
#include "fixtures/FakeSourceAdapter.h"
#include "loopcast/playlist/PlaylistEngine.hpp"
#include "loopcast/supervisor/StreamSupervisor.hpp"
#include "support/TempDir.hpp"
#include "support/WaitFor.hpp"

namespace loopcast::supervisor {
namespace {

using std::chrono::milliseconds;
using tests::FakeProcessLauncher;
using tests::FakeRun;
using tests::FakeSourceAdapter;
using tests::WaitFor;

FakeRun Runs() {
  FakeRun run;
  run.exit_immediately = false;
  return run;
}

FakeRun Exits(int code) {
  FakeRun run;
  run.exit_code = code;
  return run;
}

// Records every snapshot delivered to observers.
class SnapshotRecorder {
 public:
  void Attach(StreamSupervisor& supervisor) {
    supervisor.AddObserver([this](const SupervisorSnapshot& s) {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshots_.push_back(s);
    });
  }

  std::vector<SupervisorSnapshot> All() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_;
  }

  int Count(Phase phase) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto& s : snapshots_) n += s.phase == phase ? 1 : 0;
    return n;
  }

  std::vector<milliseconds> ReconnectDelays() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<milliseconds> delays;
    for (const auto& s : snapshots_) {
      if (s.phase == Phase::kReconnecting) delays.push_back(s.backoff_delay);
    }
    return delays;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<SupervisorSnapshot> snapshots_;
};

class StreamSupervisorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.output.destination_url = "rtmp://localhost/live/test";
    config_.reconnect.max_retries = 3;
    config_.reconnect.backoff_base = milliseconds(10);
    config_.reconnect.backoff_cap = milliseconds(1000);
    config_.reconnect.grace_period = milliseconds(2000);
  }

  void Build(std::vector<std::string> names, FakeProcessLauncher::Script script) {
    source_ = std::make_unique<FakeSourceAdapter>(std::move(names));
    playlist_ = std::make_unique<playlist::PlaylistEngine>(
        std::vector<source::ISourceAdapter*>{source_.get()}, config::PlayMode::kSequential);
    launcher_ = std::make_shared<FakeProcessLauncher>(std::move(script));
    supervisor_ = std::make_unique<StreamSupervisor>(config_, *playlist_, launcher_);
    recorder_.Attach(*supervisor_);
  }

  void TearDown() override {
    if (supervisor_) {
      supervisor_->Stop();
      supervisor_->WaitUntilStopped();
    }
  }

  config::BroadcastConfig config_;
  std::unique_ptr<FakeSourceAdapter> source_;
  std::unique_ptr<playlist::PlaylistEngine> playlist_;
  std::shared_ptr<FakeProcessLauncher> launcher_;
  std::unique_ptr<StreamSupervisor> supervisor_;
  SnapshotRecorder recorder_;
};

TEST_F(StreamSupervisorTest, CleanExitsWalkThePlaylistAndLoop) {
  Build({"a", "b", "c"}, [](const std::string&, size_t index) {
    return index < 3 ? Exits(0) : Runs();
  });

  EXPECT_EQ(supervisor_->Snapshot().phase, Phase::kIdle);
  ASSERT_TRUE(supervisor_->Start());
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 4; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_EQ(launcher_->Inputs(),
            (std::vector<std::string>{"fake://a", "fake://b", "fake://c", "fake://a"}));
  EXPECT_EQ(playlist_->NextCalls(), 4u);

  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.items_played, 3u);
  EXPECT_EQ(snapshot.consecutive_failures, 0);
  EXPECT_EQ(snapshot.active_item, "a");
  EXPECT_EQ(snapshot.active_index.value_or(99), 0u);
  EXPECT_EQ(recorder_.Count(Phase::kCompleted), 3);
  EXPECT_EQ(recorder_.Count(Phase::kCrashed), 0);
}

TEST_F(StreamSupervisorTest, ListingFailuresBackOffThenStream) {
  config_.reconnect.backoff_base = milliseconds(20);
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  source_->FailNextListings(2);

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 1; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_EQ(recorder_.ReconnectDelays(), (std::vector<milliseconds>{milliseconds(20),
                                                                    milliseconds(40)}));
  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.consecutive_failures, 0);
  EXPECT_EQ(snapshot.last_error_kind, ErrorKind::kSourceUnavailable);
  EXPECT_EQ(source_->ListCalls(), 3);

  // Starting was entered once per attempt.
  EXPECT_EQ(recorder_.Count(Phase::kStarting), 3);
}

TEST_F(StreamSupervisorTest, StopTerminatesWithinGracePeriod) {
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_TRUE(supervisor_->Stop());
  supervisor_->WaitUntilStopped();

  EXPECT_EQ(launcher_->TerminateCount(), 1);
  EXPECT_EQ(launcher_->KillCount(), 0);
  EXPECT_TRUE(launcher_->LastChild()->Exited());
  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.phase, Phase::kStopped);
  EXPECT_EQ(snapshot.forced_kills, 0u);
}

TEST_F(StreamSupervisorTest, CrashingItemIsAbandonedAfterMaxRetries) {
  config_.reconnect.max_retries = 2;
  Build({"bad", "good"}, [](const std::string& input, size_t) {
    return input == "fake://bad" ? Exits(1) : Runs();
  });

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 4; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_EQ(launcher_->Inputs(), (std::vector<std::string>{"fake://bad", "fake://bad",
                                                           "fake://bad", "fake://good"}));
  EXPECT_EQ(recorder_.ReconnectDelays(),
            (std::vector<milliseconds>{milliseconds(10), milliseconds(20), milliseconds(40)}));

  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.active_item, "good");
  EXPECT_EQ(snapshot.item_retries, 0);
  EXPECT_EQ(snapshot.last_error_kind, ErrorKind::kStreamProcessCrash);
  EXPECT_NE(snapshot.last_error.find("exit code 1"), std::string::npos);
  // Still in a failure streak: only a clean exit clears it.
  EXPECT_EQ(snapshot.consecutive_failures, 3);
}

TEST_F(StreamSupervisorTest, CleanExitAfterCrashResetsCounter) {
  Build({"a", "b"}, [](const std::string&, size_t index) {
    if (index == 0) return Exits(1);
    if (index == 1) return Exits(0);
    return Runs();
  });

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 3; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  // The crashed item is retried, completes, and the playlist advances once.
  EXPECT_EQ(launcher_->Inputs(),
            (std::vector<std::string>{"fake://a", "fake://a", "fake://b"}));
  EXPECT_EQ(supervisor_->Snapshot().consecutive_failures, 0);
  EXPECT_EQ(playlist_->NextCalls(), 2u);
}

TEST_F(StreamSupervisorTest, LaunchFailureIsRetriedLikeACrash) {
  Build({"a"}, [](const std::string&, size_t index) {
    FakeRun run = Runs();
    run.launch_fails = index == 0;
    return run;
  });

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 2; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_NE(snapshot.last_error.find("launch failed"), std::string::npos);
  EXPECT_EQ(snapshot.launches, 1u);
}

TEST_F(StreamSupervisorTest, StopTwiceStopsOnce) {
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_TRUE(supervisor_->Stop());
  EXPECT_FALSE(supervisor_->Stop());
  supervisor_->WaitUntilStopped();
  EXPECT_FALSE(supervisor_->Stop());

  EXPECT_EQ(recorder_.Count(Phase::kStopped), 1);
  EXPECT_EQ(recorder_.Count(Phase::kStopping), 1);
  EXPECT_EQ(launcher_->TerminateCount(), 1);

  // Stopped is terminal.
  EXPECT_FALSE(supervisor_->Start());
  EXPECT_FALSE(supervisor_->Skip());
}

TEST_F(StreamSupervisorTest, StopWhileIdle) {
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  EXPECT_FALSE(supervisor_->Skip());
  supervisor_->Stop();
  supervisor_->WaitUntilStopped();
  EXPECT_EQ(launcher_->LaunchCount(), 0u);
  EXPECT_EQ(supervisor_->Snapshot().uptime.count(), 0);
}

TEST_F(StreamSupervisorTest, SigkillAfterGracePeriod) {
  config_.reconnect.grace_period = milliseconds(50);
  Build({"a"}, [](const std::string&, size_t) {
    FakeRun run = Runs();
    run.ignore_sigterm = true;
    return run;
  });
  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  supervisor_->Stop();
  supervisor_->WaitUntilStopped();

  EXPECT_EQ(launcher_->TerminateCount(), 1);
  EXPECT_EQ(launcher_->KillCount(), 1);
  EXPECT_EQ(supervisor_->Snapshot().forced_kills, 1u);
}

TEST_F(StreamSupervisorTest, SkipPlaysNextItemWithoutCountingFailure) {
  Build({"a", "b"}, [](const std::string&, size_t) { return Runs(); });
  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 1; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_TRUE(supervisor_->Skip());
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 2; }));
  ASSERT_TRUE(WaitFor([&] { return supervisor_->Snapshot().phase == Phase::kStreaming; }));

  EXPECT_EQ(launcher_->Inputs(), (std::vector<std::string>{"fake://a", "fake://b"}));
  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.consecutive_failures, 0);
  EXPECT_EQ(snapshot.items_played, 0u);
  EXPECT_EQ(snapshot.active_item, "b");
  EXPECT_EQ(recorder_.Count(Phase::kCrashed), 0);
}

TEST_F(StreamSupervisorTest, SkipCancelsReconnectDelay) {
  config_.reconnect.backoff_base = milliseconds(60000);
  config_.reconnect.backoff_cap = milliseconds(60000);
  Build({"a", "b"}, [](const std::string& input, size_t) {
    return input == "fake://a" ? Exits(1) : Runs();
  });
  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kReconnecting, milliseconds(5000)));

  EXPECT_TRUE(supervisor_->Skip());
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 2; }));
  EXPECT_EQ(launcher_->Inputs().back(), "fake://b");
}

TEST_F(StreamSupervisorTest, PlayIndexJumpsImmediately) {
  Build({"a", "b", "c", "d"}, [](const std::string&, size_t) { return Runs(); });
  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_FALSE(supervisor_->PlayIndex(9));
  EXPECT_TRUE(supervisor_->PlayIndex(2));
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 2; }));
  EXPECT_EQ(launcher_->Inputs().back(), "fake://c");
  ASSERT_TRUE(WaitFor([&] { return supervisor_->Snapshot().active_index == size_t{2}; }));
}

TEST_F(StreamSupervisorTest, SkipAfterTheItemAlreadyEndedLeavesTheNextItemPlaying) {
  Build({"a", "b", "c"}, [](const std::string&, size_t) { return Runs(); });
  std::atomic<bool> fired{false};
  // Observers run on the control loop, so the exit below is queued ahead of
  // the skip, which was aimed at "a".
  supervisor_->AddObserver([&](const SupervisorSnapshot& s) {
    if (s.phase != Phase::kStreaming || s.active_item != "a" || fired.exchange(true)) return;
    launcher_->LastChild()->Finish(0);
    std::this_thread::sleep_for(milliseconds(100));
    supervisor_->Skip();
  });

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 2; }));
  ASSERT_TRUE(WaitFor([&] { return supervisor_->Snapshot().phase == Phase::kStreaming &&
                                   supervisor_->Snapshot().active_item == "b"; }));
  std::this_thread::sleep_for(milliseconds(200));

  EXPECT_EQ(launcher_->Inputs(), (std::vector<std::string>{"fake://a", "fake://b"}));
  EXPECT_EQ(launcher_->TerminateCount(), 0);
  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.phase, Phase::kStreaming);
  EXPECT_EQ(snapshot.active_item, "b");
  EXPECT_EQ(snapshot.items_played, 1u);
}

TEST_F(StreamSupervisorTest, PlayIndexWhileIdleListsAndStarts) {
  Build({"a", "b", "c"}, [](const std::string&, size_t) { return Runs(); });
  EXPECT_EQ(playlist_->Total(), 0u);

  EXPECT_FALSE(supervisor_->PlayIndex(7));
  EXPECT_TRUE(supervisor_->PlayIndex(1));
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 1; }));
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));

  EXPECT_EQ(launcher_->Inputs(), (std::vector<std::string>{"fake://b"}));
  EXPECT_EQ(supervisor_->Snapshot().active_index.value_or(99), 1u);
  EXPECT_EQ(source_->ListCalls(), 1);
}

TEST_F(StreamSupervisorTest, PlayIndexFailsWhenTheSourceCannotBeListed) {
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  source_->FailNextListings(1);
  EXPECT_FALSE(supervisor_->PlayIndex(0));
  EXPECT_EQ(supervisor_->Snapshot().phase, Phase::kIdle);
  EXPECT_EQ(launcher_->LaunchCount(), 0u);
}

TEST_F(StreamSupervisorTest, StopDuringABlockedListingEndsPromptly) {
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  source_->BlockListings(true);

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return source_->ListCalls() == 1; }));
  const auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(supervisor_->Stop());
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStopped, milliseconds(2000)));

  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(2000));
  EXPECT_EQ(launcher_->LaunchCount(), 0u);
  EXPECT_EQ(recorder_.Count(Phase::kReconnecting), 0);
}

TEST_F(StreamSupervisorTest, ItemMetadataSeedsDurationAndSize) {
  Build({"abc"}, [](const std::string&, size_t) { return Runs(); });
  source_->SetDuration("abc", 90500);

  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kStreaming, milliseconds(5000)));
  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_DOUBLE_EQ(snapshot.progress.duration_seconds.value_or(0), 90.5);
  EXPECT_EQ(snapshot.active_size_bytes.value_or(0), 3072);
}

TEST_F(StreamSupervisorTest, TextOverlayMovesVideoIntoAFilterGraph) {
  config_.overlay.texts.push_back(config::TextOverlay{"Live"});
  config_.overlay.font_file = "/fonts/test.ttf";
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 1; }));

  const auto argv = launcher_->LastArgv();
  bool graph = false;
  for (size_t i = 0; i + 1 < argv.size(); ++i) {
    if (argv[i] == "-filter_complex") {
      graph = true;
      EXPECT_NE(argv[i + 1].find("fontfile='/fonts/test.ttf'"), std::string::npos) << argv[i + 1];
    }
  }
  EXPECT_TRUE(graph);
}

TEST_F(StreamSupervisorTest, UnresolvableItemIsSkippedWithoutBackoff) {
  Build({"gone", "b"}, [](const std::string&, size_t) { return Runs(); });
  source_->MarkUnresolvable("gone");

  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 1; }));
  EXPECT_EQ(launcher_->Inputs().front(), "fake://b");
  EXPECT_EQ(recorder_.Count(Phase::kReconnecting), 0);
  EXPECT_EQ(supervisor_->Snapshot().last_error_kind, ErrorKind::kItemUnresolvable);
}

TEST_F(StreamSupervisorTest, WhollyUnresolvableDeckBacksOff) {
  config_.reconnect.backoff_base = milliseconds(60000);
  config_.reconnect.backoff_cap = milliseconds(60000);
  Build({"x", "y"}, [](const std::string&, size_t) { return Runs(); });
  source_->MarkUnresolvable("x");
  source_->MarkUnresolvable("y");

  supervisor_->Start();
  ASSERT_TRUE(supervisor_->WaitForPhase(Phase::kReconnecting, milliseconds(5000)));
  const SupervisorSnapshot snapshot = supervisor_->Snapshot();
  EXPECT_EQ(snapshot.last_error_kind, ErrorKind::kSourceUnavailable);
  EXPECT_EQ(snapshot.consecutive_failures, 1);
  EXPECT_EQ(launcher_->LaunchCount(), 0u);
  EXPECT_EQ(source_->ResolveCalls(), 2);
}

TEST_F(StreamSupervisorTest, StderrFeedsProgress) {
  Build({"a"}, [](const std::string&, size_t) {
    FakeRun run = Runs();
    run.stderr_lines = {"  Duration: 00:01:40.00, start: 0.000000, bitrate: 900 kb/s",
                        "frame=  750 fps= 25 time=00:00:25.00 bitrate=2400.0kbits/s speed=1.01x"};
    return run;
  });
  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return supervisor_->Snapshot().progress.position_seconds > 0; }));

  const TranscoderProgress progress = supervisor_->Snapshot().progress;
  EXPECT_DOUBLE_EQ(progress.position_seconds, 25.0);
  EXPECT_DOUBLE_EQ(progress.Percent().value_or(-1), 25.0);
  EXPECT_DOUBLE_EQ(progress.speed.value_or(0), 1.01);
}

TEST_F(StreamSupervisorTest, TranscoderArgsCarryProfileAndInput) {
  config_.transcoder.binary = "/opt/ffmpeg/bin/ffmpeg";
  Build({"a"}, [](const std::string&, size_t) { return Runs(); });
  supervisor_->Start();
  ASSERT_TRUE(WaitFor([&] { return launcher_->LaunchCount() == 1; }));

  const auto argv = launcher_->LastArgv();
  ASSERT_FALSE(argv.empty());
  EXPECT_EQ(argv.front(), "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(argv.back(), "rtmp://localhost/live/test");
}

TEST(StreamSupervisorProcessTest, StopsRealChildProcessGroup) {
  tests::TempDir dir;
  const std::string script = dir.WriteFile(
      "fake-ffmpeg.sh",
      "#!/bin/sh\n"
      "echo 'time=00:00:02.00 bitrate=100.0kbits/s speed=1.00x' >&2\n"
      "sleep 30\n");
  std::filesystem::permissions(script, std::filesystem::perms::owner_all);

  config::BroadcastConfig config;
  config.output.destination_url = "rtmp://localhost/live/test";
  config.transcoder.binary = script;
  config.reconnect.grace_period = milliseconds(3000);

  FakeSourceAdapter source({"a"});
  playlist::PlaylistEngine playlist({&source}, config::PlayMode::kSequential);
  StreamSupervisor supervisor(config, playlist, std::make_shared<PosixProcessLauncher>());

  supervisor.Start();
  ASSERT_TRUE(supervisor.WaitForPhase(Phase::kStreaming, milliseconds(5000)));
  ASSERT_TRUE(WaitFor([&] { return supervisor.Snapshot().progress.position_seconds > 0; }));

  supervisor.Stop();
  supervisor.WaitUntilStopped();
  // The shell and its sleep share a process group; SIGTERM ends both.
  EXPECT_EQ(supervisor.Snapshot().forced_kills, 0u);
}

TEST(StreamSupervisorProcessTest, MissingTranscoderIsReportedAsCrash) {
  config::BroadcastConfig config;
  config.output.destination_url = "rtmp://localhost/live/test";
  config.transcoder.binary = "/nonexistent/ffmpeg";
  config.reconnect.backoff_base = milliseconds(60000);
  config.reconnect.backoff_cap = milliseconds(60000);

  FakeSourceAdapter source({"a"});
  playlist::PlaylistEngine playlist({&source}, config::PlayMode::kSequential);
  StreamSupervisor supervisor(config, playlist, std::make_shared<PosixProcessLauncher>());

  supervisor.Start();
  ASSERT_TRUE(supervisor.WaitForPhase(Phase::kReconnecting, milliseconds(5000)));
  const SupervisorSnapshot snapshot = supervisor.Snapshot();
  EXPECT_EQ(snapshot.last_error_kind, ErrorKind::kStreamProcessCrash);
  EXPECT_NE(snapshot.last_error.find("/nonexistent/ffmpeg"), std::string::npos);
  supervisor.Stop();
  supervisor.WaitUntilStopped();
}

}  // namespace
}  // namespace loopcast::supervisor
