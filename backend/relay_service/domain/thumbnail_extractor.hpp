#pragma once
#include <filesystem>
#include <optional>

namespace relay_service {

class ThumbnailExtractor {
public:
  virtual ~ThumbnailExtractor() = default;
  // Best effort single-frame capture; nullopt on any failure.
  virtual std::optional<std::filesystem::path> extract(const std::filesystem::path& video_path) = 0;
};

}
