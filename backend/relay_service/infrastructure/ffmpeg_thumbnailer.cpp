#include "ffmpeg_thumbnailer.hpp"
#include "common/subprocess.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace relay_service {

FfmpegThumbnailer::FfmpegThumbnailer(std::string executable) : executable_(std::move(executable)) {}

std::optional<std::filesystem::path> FfmpegThumbnailer::extract(const std::filesystem::path& video_path) {
  auto thumbnail_path = video_path.parent_path() / "thumbnail.jpg";

  auto result = common::runProcess(executable_, {
    "-y", "-hide_banner", "-nostats",
    "-i", video_path.string(),
    "-vframes", "1",
    "-q:v", "3",   // 1 (best) .. 31
    thumbnail_path.string(),
  });

  if (!result) {
    spdlog::warn("thumbnail extraction failed: {}", result.error());
    return std::nullopt;
  }
  std::error_code ec;
  if (!result->success() || !std::filesystem::exists(thumbnail_path, ec)) {
    spdlog::debug("no thumbnail for {} (exit code {})", video_path.string(), result->exit_code);
    return std::nullopt;
  }
  return thumbnail_path;
}

}
