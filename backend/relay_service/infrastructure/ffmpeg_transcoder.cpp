// ffmpeg_transcoder.cpp
#include "ffmpeg_transcoder.hpp"
#include "common/subprocess.hpp"
#include <spdlog/spdlog.h>

namespace relay_service {

FfmpegTranscoder::FfmpegTranscoder(std::string executable, uint32_t size_ceiling_mb)
  : executable_(std::move(executable)), size_ceiling_mb_(size_ceiling_mb) {}

std::vector<std::string> FfmpegTranscoder::buildArguments(const std::filesystem::path& input_path,
                                                          const std::filesystem::path& output_path,
                                                          std::optional<uint32_t> video_bitrate_kbps) const {
  std::vector<std::string> args = {
    "-y", "-hide_banner", "-nostats",
    "-i", input_path.string(),
    "-c:v", "libx264",
    "-pix_fmt", "yuv420p",
    "-movflags", "+faststart",
    "-b:a", "128k",
    "-fs", std::to_string(size_ceiling_mb_) + "M",
    // libx264 needs even dimensions
    "-vf", "crop=trunc(iw/2)*2:trunc(ih/2)*2",
  };

  if (video_bitrate_kbps) {
    args.push_back("-b:v");
    args.push_back(std::to_string(*video_bitrate_kbps) + "k");
  }

  args.push_back(output_path.string());
  return args;
}

std::expected<void, PipelineError> FfmpegTranscoder::transcode(
  const std::filesystem::path& input_path,
  const std::filesystem::path& output_path,
  std::optional<uint32_t> video_bitrate_kbps
) {
  auto result = common::runProcess(executable_, buildArguments(input_path, output_path, video_bitrate_kbps));
  if (!result) {
    return std::unexpected(PipelineError{ErrorKind::Transcode, result.error()});
  }

  if (!result->success()) {
    spdlog::debug("ffmpeg output for {}:\n{}", input_path.string(), result->output);
    return std::unexpected(PipelineError{
      ErrorKind::Transcode,
      "ffmpeg exited with code " + std::to_string(result->exit_code)
    });
  }

  std::error_code ec;
  if (!std::filesystem::exists(output_path, ec)) {
    return std::unexpected(PipelineError{ErrorKind::Transcode, "ffmpeg produced no output file"});
  }
  return {};
}

} // namespace relay_service
