#pragma once

// project
#include "domain/prober.hpp"

// ffmpeg
extern "C" {
  #include <libavutil/log.h>
}

namespace relay_service {

// Reads container and video stream parameters with libavformat, in process.
class LibavProber : public Prober {
  public:
  // AV_LOG_QUIET   = -8
  // AV_LOG_ERROR   = 16
  // AV_LOG_WARNING = 24
  // AV_LOG_INFO    = 32
  explicit LibavProber(int loglevel = AV_LOG_ERROR);

  std::optional<ProbeMetadata> probe(const std::filesystem::path& path) override;
  void setLogLevel(int loglevel);
};

} // namespace relay_service
