#pragma once
#include "domain/thumbnail_extractor.hpp"
#include <string>

namespace relay_service {

// Grabs the first frame as thumbnail.jpg next to the video.
class FfmpegThumbnailer : public ThumbnailExtractor {
public:
  explicit FfmpegThumbnailer(std::string executable = "ffmpeg");

  std::optional<std::filesystem::path> extract(const std::filesystem::path& video_path) override;

private:
  std::string executable_;
};

}
