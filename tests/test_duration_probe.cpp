#include <cmath>
#include <limits>

#include <gtest/gtest.h>

#include "fake_toolkit.hpp"
#include "loopify/duration_probe.hpp"
#include "loopify/scoped_path.hpp"

namespace loopify {
namespace {

using testing::FakeToolkit;
using testing::write_file;

TEST(InterpretProbeReport, ReportsDuration) {
  ProbeReport r;
  r.audio_streams = 1;
  r.has_duration = true;
  r.duration = 12.5;
  double d = -1;
  ASSERT_TRUE(interpret_probe_report(r, d).ok());
  EXPECT_DOUBLE_EQ(d, 12.5);
}

TEST(InterpretProbeReport, NoAudioStream) {
  ProbeReport r;
  r.audio_streams = 0;
  r.has_duration = true;
  r.duration = 3.0;
  double d = 0;
  EXPECT_EQ(interpret_probe_report(r, d).kind, ErrorKind::NoAudioStream);
}

TEST(InterpretProbeReport, MissingDurationIsInvalid) {
  ProbeReport r;
  r.audio_streams = 2;
  r.has_duration = false;
  double d = 0;
  EXPECT_EQ(interpret_probe_report(r, d).kind, ErrorKind::InvalidDuration);
}

TEST(InterpretProbeReport, InfiniteDurationIsInvalid) {
  ProbeReport r;
  r.audio_streams = 1;
  r.has_duration = true;
  r.duration = std::numeric_limits<double>::infinity();
  double d = 0;
  EXPECT_EQ(interpret_probe_report(r, d).kind, ErrorKind::InvalidDuration);
}

TEST(InterpretProbeReport, NanAndNegativeBecomeZero) {
  ProbeReport r;
  r.audio_streams = 1;
  r.has_duration = true;
  r.duration = std::numeric_limits<double>::quiet_NaN();
  double d = -1;
  ASSERT_TRUE(interpret_probe_report(r, d).ok());
  EXPECT_EQ(d, 0.0);

  r.duration = -4.0;
  d = -1;
  ASSERT_TRUE(interpret_probe_report(r, d).ok());
  EXPECT_EQ(d, 0.0);
}

TEST(ProbeDuration, FillsAssetFromToolkit) {
  TempDirectory dir;
  std::string error;
  ASSERT_TRUE(dir.create("/tmp", "loopify-test-", error)) << error;
  std::string src = dir.file("clip.MP3");
  write_file(src, "0123456789");

  FakeToolkit toolkit;
  AudioAsset asset;
  ASSERT_TRUE(probe_duration(toolkit, src, asset).ok());
  EXPECT_EQ(asset.path, src);
  EXPECT_DOUBLE_EQ(asset.duration, 10.0);
  EXPECT_EQ(asset.format_hint, ".MP3");
}

TEST(ProbeDuration, ToolkitFailureIsProbeFailureWithMessage) {
  FakeToolkit toolkit;
  toolkit.probe_fails = true;
  AudioAsset asset;
  Status st = probe_duration(toolkit, "/nonexistent.wav", asset);
  EXPECT_EQ(st.kind, ErrorKind::ProbeFailure);
  EXPECT_NE(st.message.find("invalid data"), std::string::npos);
}

} // namespace
} // namespace loopify
