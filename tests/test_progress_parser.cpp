// Repository: loopcast
// Component: Transcoder Progress Parser unit tests

#include <gtest/gtest.h>

#include "loopcast/supervisor/ProgressParser.hpp"

namespace loopcast::supervisor {
namespace {

TEST(ProgressParserTest, ClockTime) {
  EXPECT_DOUBLE_EQ(ParseClockTime("00:00:00.00").value_or(-1), 0.0);
  EXPECT_DOUBLE_EQ(ParseClockTime("01:02:03.50").value_or(-1), 3723.5);
  EXPECT_DOUBLE_EQ(ParseClockTime("00:10:00").value_or(-1), 600.0);
  EXPECT_DOUBLE_EQ(ParseClockTime("-00:00:00.04").value_or(0), -0.04);
  EXPECT_FALSE(ParseClockTime("N/A").has_value());
  EXPECT_FALSE(ParseClockTime("12:3").has_value());
}

TEST(ProgressParserTest, TracksDurationAndProgressLines) {
  TranscoderProgress progress;
  EXPECT_FALSE(progress.Percent().has_value());

  EXPECT_TRUE(ParseProgressLine(
      "  Duration: 00:20:00.00, start: 0.000000, bitrate: 2210 kb/s", &progress));
  ASSERT_TRUE(progress.duration_seconds.has_value());
  EXPECT_DOUBLE_EQ(*progress.duration_seconds, 1200.0);

  EXPECT_TRUE(ParseProgressLine(
      "frame= 7501 fps= 25 q=23.0 size=   91648kB time=00:05:00.00 bitrate=2502.6kbits/s "
      "speed=1.00x",
      &progress));
  EXPECT_DOUBLE_EQ(progress.position_seconds, 300.0);
  EXPECT_DOUBLE_EQ(progress.bitrate_kbps.value_or(0), 2502.6);
  EXPECT_DOUBLE_EQ(progress.speed.value_or(0), 1.0);
  EXPECT_DOUBLE_EQ(progress.Percent().value_or(-1), 25.0);
}

TEST(ProgressParserTest, IgnoresUnrelatedAndPartialLines) {
  TranscoderProgress progress;
  EXPECT_FALSE(ParseProgressLine("Stream #0:0: Video: h264 (High), yuv420p", &progress));
  EXPECT_FALSE(ParseProgressLine("  Duration: N/A, start: 0.000000, bitrate: N/A", &progress));
  EXPECT_FALSE(progress.duration_seconds.has_value());
  EXPECT_FALSE(ParseProgressLine("size=N/A time=N/A bitrate=N/A speed=N/A", &progress));
}

TEST(ProgressParserTest, NegativePrimingTimeClampsToZero) {
  TranscoderProgress progress;
  EXPECT_TRUE(ParseProgressLine("frame=    0 fps=0.0 q=0.0 size=0kB time=-00:00:00.04 "
                                "bitrate=N/A speed=N/A",
                                &progress));
  EXPECT_DOUBLE_EQ(progress.position_seconds, 0.0);
  EXPECT_FALSE(progress.bitrate_kbps.has_value());
}

TEST(ProgressParserTest, PercentIsClamped) {
  TranscoderProgress progress;
  progress.duration_seconds = 10.0;
  progress.position_seconds = 12.5;
  EXPECT_DOUBLE_EQ(progress.Percent().value_or(-1), 100.0);
}

}  // namespace
}  // namespace loopcast::supervisor
