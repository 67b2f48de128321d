#include "libav_prober.hpp"
#include <spdlog/spdlog.h>
#include <limits>

extern "C" {
  #include <libavformat/avformat.h>
  #include <libavutil/avutil.h>
}

namespace relay_service {

namespace {

struct InputContext {
  AVFormatContext* ctx{nullptr};
  ~InputContext() { avformat_close_input(&ctx); }
};

uint32_t clampToU32(int64_t value) {
  if (value <= 0) {
    return 0;
  }
  if (value > std::numeric_limits<uint32_t>::max()) {
    return std::numeric_limits<uint32_t>::max();
  }
  return static_cast<uint32_t>(value);
}

} // namespace

LibavProber::LibavProber(int loglevel) {
  av_log_set_level(loglevel);
}

void LibavProber::setLogLevel(int loglevel) {
  av_log_set_level(loglevel);
}

std::optional<ProbeMetadata> LibavProber::probe(const std::filesystem::path& path) {
  InputContext input;
  if (avformat_open_input(&input.ctx, path.c_str(), nullptr, nullptr) < 0) {
    spdlog::warn("could not open {} for probing", path.string());
    return std::nullopt;
  }
  if (avformat_find_stream_info(input.ctx, nullptr) < 0) {
    spdlog::warn("could not find stream info in {}", path.string());
    return std::nullopt;
  }

  const int video_stream_idx = av_find_best_stream(input.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    spdlog::warn("no video stream in {}", path.string());
    return std::nullopt;
  }
  const AVCodecParameters* params = input.ctx->streams[video_stream_idx]->codecpar;

  ProbeMetadata metadata;
  metadata.width = clampToU32(params->width);
  metadata.height = clampToU32(params->height);
  // container bitrate covers audio too, which is what the size budget needs
  metadata.bitrate = clampToU32(input.ctx->bit_rate / 1000);
  if (input.ctx->duration != AV_NOPTS_VALUE) {
    metadata.duration = clampToU32(input.ctx->duration / AV_TIME_BASE);
  }
  return metadata;
}

} // namespace relay_service
