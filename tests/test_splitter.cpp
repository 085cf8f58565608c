#include <gtest/gtest.h>

#include "fake_toolkit.hpp"
#include "loopify/splitter.hpp"

namespace loopify {
namespace {

using testing::FakeToolkit;
using testing::read_file;
using testing::write_file;

TEST(FormatSeconds, StripsTrailingZeros) {
  EXPECT_EQ(format_seconds(3.0), "3");
  EXPECT_EQ(format_seconds(2.5), "2.5");
  EXPECT_EQ(format_seconds(8.125), "8.125");
  EXPECT_EQ(format_seconds(10.0), "10");
  EXPECT_EQ(format_seconds(100.0), "100");
}

TEST(FormatSeconds, RoundsToSixDecimals) {
  EXPECT_EQ(format_seconds(1.23456789), "1.234568");
  EXPECT_EQ(format_seconds(0.0000004), "0");
  EXPECT_EQ(format_seconds(0.000001), "0.000001");
}

TEST(FormatSeconds, ZeroIsZero) {
  EXPECT_EQ(format_seconds(0.0), "0");
  EXPECT_EQ(format_seconds(-0.0), "0");
}

TEST(ExtractArgs, TailSeeksAfterInputAndCopies) {
  std::vector<std::string> expected{"-i", "in.flac", "-ss", "3.5",
                                    "-c", "copy",    "tail.flac"};
  EXPECT_EQ(tail_extract_args("in.flac", "3.5", "tail.flac"), expected);
}

TEST(ExtractArgs, HeadTrimsDurationAndCopies) {
  std::vector<std::string> expected{"-i", "in.flac", "-t", "3.5",
                                    "-c", "copy",    "head.flac"};
  EXPECT_EQ(head_extract_args("in.flac", "3.5", "head.flac"), expected);
}

class SplitSegmentsTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::string error;
    ASSERT_TRUE(dir_.create("/tmp", "loopify-test-", error)) << error;
    asset_.path = dir_.file("source.wav");
    asset_.duration = 10.0;
    asset_.format_hint = ".wav";
    write_file(asset_.path, "0123456789");
  }

  TempDirectory dir_;
  AudioAsset asset_;
  FakeToolkit toolkit_;
};

TEST_F(SplitSegmentsTest, ProducesDisjointTailAndHead) {
  SegmentFiles segs;
  ASSERT_TRUE(split_segments(toolkit_, asset_, 3.0, dir_, ".wav", segs).ok());

  EXPECT_EQ(read_file(segs.tail_path), "3456789");
  EXPECT_EQ(read_file(segs.head_path), "012");
  EXPECT_DOUBLE_EQ(segs.tail_range.start, 3.0);
  EXPECT_DOUBLE_EQ(segs.tail_range.end, 10.0);
  EXPECT_DOUBLE_EQ(segs.head_range.start, 0.0);
  EXPECT_DOUBLE_EQ(segs.head_range.end, 3.0);
  EXPECT_DOUBLE_EQ(segs.tail_range.length() + segs.head_range.length(),
                   asset_.duration);
}

TEST_F(SplitSegmentsTest, SegmentsUseRequestedSuffix) {
  SegmentFiles segs;
  ASSERT_TRUE(split_segments(toolkit_, asset_, 4.0, dir_, ".ogg", segs).ok());
  EXPECT_EQ(segs.tail_path, dir_.file("tail.ogg"));
  EXPECT_EQ(segs.head_path, dir_.file("head.ogg"));
}

TEST_F(SplitSegmentsTest, TailIsExtractedFirst) {
  SegmentFiles segs;
  ASSERT_TRUE(split_segments(toolkit_, asset_, 2.0, dir_, ".wav", segs).ok());
  ASSERT_EQ(toolkit_.transcode_args.size(), 2u);
  EXPECT_EQ(toolkit_.transcode_args[0][2], "-ss");
  EXPECT_EQ(toolkit_.transcode_args[1][2], "-t");
  EXPECT_EQ(toolkit_.transcode_args[0][3], "2");
}

TEST_F(SplitSegmentsTest, ExtractionFailureIsFatal) {
  toolkit_.split_fails = true;
  SegmentFiles segs;
  Status st = split_segments(toolkit_, asset_, 3.0, dir_, ".wav", segs);
  EXPECT_EQ(st.kind, ErrorKind::SplitFailure);
  EXPECT_NE(st.message.find("invalid argument"), std::string::npos);
  /// No second attempt after the first failure
  EXPECT_EQ(toolkit_.transcode_args.size(), 1u);
}

} // namespace
} // namespace loopify
