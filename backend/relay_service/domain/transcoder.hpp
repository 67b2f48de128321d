#pragma once
#include "pipeline_error.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>

namespace relay_service {

class Transcoder {
public:
  virtual ~Transcoder() = default;
  // Produces a single h264/yuv420p mp4 with even dimensions and fast-start
  // layout at output_path. Without a bitrate the source quality is kept.
  virtual std::expected<void, PipelineError> transcode(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    std::optional<uint32_t> video_bitrate_kbps
  ) = 0;
};

}
