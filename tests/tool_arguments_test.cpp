#include "common/subprocess.hpp"
#include "infrastructure/ffmpeg_transcoder.hpp"
#include "infrastructure/ytdlp_extractor.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace relay_service {
namespace {

bool hasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == flag && args[i + 1] == value) {
      return true;
    }
  }
  return false;
}

// Writes an executable shell script standing in for an external tool.
class ScriptedToolTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() /
           ("vidrelay-tool-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::string writeScript(const std::string& body) {
    auto path = dir_ / "tool.sh";
    std::ofstream{path} << "#!/bin/sh\n" << body << "\n";
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path.string();
  }

  std::filesystem::path dir_;
};

TEST(YtDlpExtractorTest, ArgumentsCarrySizeCapAndTemplate) {
  YtDlpExtractor extractor;
  auto args = extractor.buildArguments("https://example.com/v", "/work/dir", 200);

  EXPECT_TRUE(hasPair(args, "--max-filesize", "200M"));
  EXPECT_TRUE(hasPair(args, "--output", "/work/dir/%(id)s.%(ext)s"));
  EXPECT_NE(std::find(args.begin(), args.end(), "--no-playlist"), args.end());
  EXPECT_EQ(args.back(), "https://example.com/v");
}

TEST(YtDlpExtractorTest, UrlIsNeverParsedAsOption) {
  YtDlpExtractor extractor;
  auto args = extractor.buildArguments("--exec=touch /tmp/owned", "/work/dir", 200);

  ASSERT_GE(args.size(), 2u);
  EXPECT_EQ(args[args.size() - 2], "--");
  EXPECT_EQ(args.back(), "--exec=touch /tmp/owned");
  EXPECT_EQ(std::count(args.begin(), args.end(), "--"), 1);
}

TEST(FfmpegTranscoderTest, ArgumentsWithoutBitrateKeepSourceQuality) {
  FfmpegTranscoder transcoder{"ffmpeg", 50};
  auto args = transcoder.buildArguments("/in.mkv", "/out.mp4", std::nullopt);

  EXPECT_TRUE(hasPair(args, "-i", "/in.mkv"));
  EXPECT_TRUE(hasPair(args, "-c:v", "libx264"));
  EXPECT_TRUE(hasPair(args, "-pix_fmt", "yuv420p"));
  EXPECT_TRUE(hasPair(args, "-movflags", "+faststart"));
  EXPECT_TRUE(hasPair(args, "-b:a", "128k"));
  EXPECT_TRUE(hasPair(args, "-fs", "50M"));
  EXPECT_EQ(std::find(args.begin(), args.end(), "-b:v"), args.end());
  EXPECT_EQ(args.back(), "/out.mp4");
}

TEST(FfmpegTranscoderTest, ArgumentsWithBitrate) {
  FfmpegTranscoder transcoder{"ffmpeg", 50};
  auto args = transcoder.buildArguments("/in.mkv", "/out.mp4", 522u);
  EXPECT_TRUE(hasPair(args, "-b:v", "522k"));
  EXPECT_EQ(args.back(), "/out.mp4");
}

TEST_F(ScriptedToolTest, RunProcessCapturesExitCodeAndOutput) {
  auto result = common::runProcess(writeScript("echo first\necho last >&2\nexit 3"), {});
  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_FALSE(result->success());
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(result->lastLine(), "last");
}

TEST_F(ScriptedToolTest, RunProcessKeepsOutputTail) {
  auto result = common::runProcess(writeScript("i=0\nwhile [ $i -lt 100 ]; do echo line$i; i=$((i+1)); done"),
                                   {}, 64);
  ASSERT_TRUE(result.has_value());
  EXPECT_LE(result->output.size(), 64u);
  EXPECT_EQ(result->lastLine(), "line99");
}

TEST(SubprocessTest, MissingProgramIsAnError) {
  EXPECT_FALSE(common::runProcess("vidrelay-no-such-tool", {}).has_value());
  EXPECT_FALSE(common::isExecutableAvailable("vidrelay-no-such-tool"));
  EXPECT_TRUE(common::isExecutableAvailable("sh"));
}

TEST_F(ScriptedToolTest, ExtractorReportsSizeCap) {
  YtDlpExtractor extractor{writeScript("echo '[info] File is larger than max-filesize (300 bytes > 200 bytes). Aborting.'")};
  auto ret = extractor.fetch("https://example.com/v", dir_, 200);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().kind, ErrorKind::Extraction);
  EXPECT_EQ(ret.error().message, "base file size exceeded 200 MB");
}

TEST_F(ScriptedToolTest, ExtractorReportsExitCode) {
  YtDlpExtractor extractor{writeScript("echo 'ERROR: Unsupported URL' >&2\nexit 1")};
  auto ret = extractor.fetch("https://example.com/v", dir_, 200);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().message, "extractor exited with code 1: ERROR: Unsupported URL");
}

TEST_F(ScriptedToolTest, TranscoderNeedsOutputFile) {
  FfmpegTranscoder transcoder{writeScript("exit 0"), 50};
  auto ret = transcoder.transcode(dir_ / "in.mkv", dir_ / "out.mp4", std::nullopt);
  ASSERT_FALSE(ret.has_value());
  EXPECT_EQ(ret.error().kind, ErrorKind::Transcode);
}

TEST_F(ScriptedToolTest, TranscoderSucceedsWhenOutputWritten) {
  // the output path is the last argument
  FfmpegTranscoder transcoder{writeScript("for last; do :; done\necho data > \"$last\""), 50};
  auto ret = transcoder.transcode(dir_ / "in.mkv", dir_ / "out.mp4", 522u);
  EXPECT_TRUE(ret.has_value());
  EXPECT_TRUE(std::filesystem::exists(dir_ / "out.mp4"));
}

} // namespace
} // namespace relay_service
