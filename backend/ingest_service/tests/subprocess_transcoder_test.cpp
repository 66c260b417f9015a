#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>

#include "infrastructure/subprocess_transcoder.hpp"
#include "test_support.hpp"

namespace ingest_service {
namespace {

using test_support::TempDir;
using test_support::writeFile;

std::filesystem::path writeScript(const TempDir& dir, const std::string& name, const std::string& body) {
  auto path = dir / name;
  writeFile(path, "#!/bin/sh\n" + body + "\n");
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

SubprocessTranscoder makeTranscoder(const std::string& binary,
                                    std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
  SubprocessTranscoder::Options options;
  options.binary = binary;
  options.timeout = timeout;
  return SubprocessTranscoder(options);
}

TEST(SubprocessTranscoderTest, BuildsFfmpegArguments) {
  SubprocessTranscoder::Options options;
  options.codec = "libx265";
  options.crf = 30;
  options.max_width = 640;
  options.max_height = 360;
  SubprocessTranscoder transcoder(options);

  auto args = transcoder.buildArguments("/in/a.mov", "/out/a.mp4");
  ASSERT_GE(args.size(), 4u);
  EXPECT_EQ(args.back(), "/out/a.mp4");

  auto after = [&](const std::string& flag) -> std::string {
    auto it = std::find(args.begin(), args.end(), flag);
    return it != args.end() && std::next(it) != args.end() ? *std::next(it) : "";
  };
  EXPECT_EQ(after("-i"), "/in/a.mov");
  EXPECT_EQ(after("-c:v"), "libx265");
  EXPECT_EQ(after("-crf"), "30");
  EXPECT_NE(after("-vf").find("min(640,iw)"), std::string::npos);
  EXPECT_NE(after("-vf").find("min(360,ih)"), std::string::npos);
  EXPECT_NE(std::find(args.begin(), args.end(), "-nostdin"), args.end());
}

TEST(SubprocessTranscoderTest, ZeroExitIsSuccess) {
  auto transcoder = makeTranscoder("/bin/true");
  auto result = transcoder.transcode("/in.mp4", "/out.mp4");
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_TRUE(result->succeeded());
  EXPECT_EQ(result->exit_code, 0);
}

TEST(SubprocessTranscoderTest, NonZeroExitIsReportedNotLaunchFailure) {
  auto transcoder = makeTranscoder("/bin/false");
  auto result = transcoder.transcode("/in.mp4", "/out.mp4");
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_FALSE(result->succeeded());
  EXPECT_FALSE(result->timed_out);
  EXPECT_EQ(result->exit_code, 1);
}

TEST(SubprocessTranscoderTest, MissingBinaryIsLaunchFailure) {
  auto on_path = makeTranscoder("vidferry-no-such-transcoder");
  auto result = on_path.transcode("/in.mp4", "/out.mp4");
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message.find("vidferry-no-such-transcoder"), std::string::npos);

  auto absolute = makeTranscoder("/nonexistent/dir/ffmpeg");
  EXPECT_FALSE(absolute.transcode("/in.mp4", "/out.mp4").has_value());
}

TEST(SubprocessTranscoderTest, CapturesStderrAndExitCode) {
  TempDir dir("transcoder_stderr");
  auto script = writeScript(dir, "fail.sh", "echo 'moov atom not found' >&2\nexit 3");
  auto transcoder = makeTranscoder(script.string());

  auto result = transcoder.transcode(dir / "in.mp4", dir / "out.mp4");
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_NE(result->diagnostics.find("moov atom not found"), std::string::npos);
}

TEST(SubprocessTranscoderTest, TimeoutKillsTheProcess) {
  TempDir dir("transcoder_timeout");
  auto script = writeScript(dir, "hang.sh", "exec sleep 30");
  auto transcoder = makeTranscoder(script.string(), std::chrono::milliseconds(200));

  const auto started = std::chrono::steady_clock::now();
  auto result = transcoder.transcode(dir / "in.mp4", dir / "out.mp4");
  const auto elapsed = std::chrono::steady_clock::now() - started;

  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_TRUE(result->timed_out);
  EXPECT_FALSE(result->succeeded());
  EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(SubprocessTranscoderTest, PassesInputAndOutputPaths) {
  TempDir dir("transcoder_args");
  // Copies the -i argument to the last argument, like a no-op encoder.
  auto script = writeScript(dir, "copy.sh",
    "in=''\nprev=''\nfor a in \"$@\"; do\n"
    "  if [ \"$prev\" = '-i' ]; then in=\"$a\"; fi\n"
    "  prev=\"$a\"; out=\"$a\"\ndone\ncp \"$in\" \"$out\"");
  writeFile(dir / "in.mp4", "source bytes");
  auto transcoder = makeTranscoder(script.string());

  auto result = transcoder.transcode(dir / "in.mp4", dir / "out.mp4");
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_TRUE(result->succeeded()) << result->diagnostics;
  EXPECT_EQ(test_support::readFile(dir / "out.mp4"), "source bytes");
}

} // namespace
} // namespace ingest_service
