// ffmpeg_transcoder.hpp
#pragma once

#include "domain/transcoder.hpp"

#include <string>
#include <vector>

namespace relay_service {

// Re-encodes through the ffmpeg binary: libx264/yuv420p, 128k audio,
// +faststart, even dimensions, hard file size ceiling.
class FfmpegTranscoder : public Transcoder {
public:
  FfmpegTranscoder(std::string executable, uint32_t size_ceiling_mb);

  std::expected<void, PipelineError> transcode(
    const std::filesystem::path& input_path,
    const std::filesystem::path& output_path,
    std::optional<uint32_t> video_bitrate_kbps
  ) override;

  std::vector<std::string> buildArguments(const std::filesystem::path& input_path,
                                          const std::filesystem::path& output_path,
                                          std::optional<uint32_t> video_bitrate_kbps) const;

private:
  std::string executable_;
  uint32_t size_ceiling_mb_;
};

} // namespace relay_service
