#include <cmath>

#include <gtest/gtest.h>

#include "loopify/cli.hpp"

namespace loopify {
namespace {

CliAction parse(std::vector<const char *> args, LoopRequest &req,
                std::string &error) {
  args.insert(args.begin(), "loopify");
  return parse_command_line(static_cast<int>(args.size()), args.data(), req,
                            error);
}

TEST(CommandLine, PositionalArguments) {
  LoopRequest req;
  std::string error;
  ASSERT_EQ(parse({"song.mp3", "12.5"}, req, error), CliAction::Run);
  EXPECT_EQ(req.input_path, "song.mp3");
  EXPECT_DOUBLE_EQ(req.cut_seconds, 12.5);
  EXPECT_TRUE(req.output_path.empty());
  EXPECT_EQ(req.policy, OverwritePolicy::Refuse);
}

TEST(CommandLine, NegativeCutIsANumberNotAnOption) {
  LoopRequest req;
  std::string error;
  ASSERT_EQ(parse({"track.flac", "-2.0", "--force"}, req, error),
            CliAction::Run);
  EXPECT_DOUBLE_EQ(req.cut_seconds, -2.0);
  EXPECT_EQ(req.policy, OverwritePolicy::Force);
}

TEST(CommandLine, OutputOptionForms) {
  LoopRequest req;
  std::string error;
  ASSERT_EQ(parse({"in.wav", "3", "-o", "rotated.wav"}, req, error),
            CliAction::Run);
  EXPECT_EQ(req.output_path, "rotated.wav");

  LoopRequest req2;
  ASSERT_EQ(parse({"--output=x.wav", "-f", "in.wav", "3"}, req2, error),
            CliAction::Run);
  EXPECT_EQ(req2.output_path, "x.wav");
  EXPECT_EQ(req2.policy, OverwritePolicy::Force);
}

TEST(CommandLine, DoubleDashEndsOptions) {
  LoopRequest req;
  std::string error;
  ASSERT_EQ(parse({"--", "-weird-name.wav", "-1"}, req, error),
            CliAction::Run);
  EXPECT_EQ(req.input_path, "-weird-name.wav");
  EXPECT_DOUBLE_EQ(req.cut_seconds, -1.0);
}

TEST(CommandLine, NonFiniteCutParsesAndIsLeftToThePipeline) {
  LoopRequest req;
  std::string error;
  ASSERT_EQ(parse({"in.wav", "nan"}, req, error), CliAction::Run);
  EXPECT_TRUE(std::isnan(req.cut_seconds));
}

TEST(CommandLine, HexadecimalCutIsRejected) {
  const char *spellings[] = {"0x1p3", "0X10", "+0x8", "-0x1p3"};
  for (const char *cut : spellings) {
    LoopRequest req;
    std::string error;
    EXPECT_EQ(parse({"in.wav", "--", cut}, req, error), CliAction::Error)
        << cut;
  }

  LoopRequest req;
  std::string error;
  ASSERT_EQ(parse({"in.wav", "0.5e1"}, req, error), CliAction::Run);
  EXPECT_DOUBLE_EQ(req.cut_seconds, 5.0);
}

TEST(CommandLine, UsageErrors) {
  LoopRequest req;
  std::string error;
  EXPECT_EQ(parse({"in.wav"}, req, error), CliAction::Error);
  EXPECT_EQ(parse({"in.wav", "abc"}, req, error), CliAction::Error);
  EXPECT_NE(error.find("abc"), std::string::npos);
  EXPECT_EQ(parse({"in.wav", "3", "-o"}, req, error), CliAction::Error);
  EXPECT_EQ(parse({"in.wav", "3", "--bogus"}, req, error), CliAction::Error);
  EXPECT_EQ(parse({"a", "1", "b"}, req, error), CliAction::Error);
}

TEST(CommandLine, Help) {
  LoopRequest req;
  std::string error;
  EXPECT_EQ(parse({"-h"}, req, error), CliAction::Help);
  EXPECT_NE(usage_text("loopify").find("--force"), std::string::npos);
}

} // namespace
} // namespace loopify
