#include "bitrate_policy.hpp"
#include <cmath>
#include <string>

namespace relay_service {

std::optional<uint32_t> maxBitrateFor(uint32_t duration, uint32_t upload_limit_mb) {
  if (duration == 0) {
    return std::nullopt;
  }

  // MB -> kb is * 8 bits * 1000
  const double capacity = static_cast<double>(upload_limit_mb) * 8000.0 / static_cast<double>(duration);
  const double with_audio = capacity - kAudioReserveKbps;
  const double with_container = std::floor(with_audio * kContainerOverheadFactor);

  if (with_container <= 0.0) {
    return 0u;
  }
  return static_cast<uint32_t>(with_container);
}

uint32_t qualityCutoff(uint32_t original_bitrate) {
  return static_cast<uint32_t>(std::floor(static_cast<double>(original_bitrate) * kQualityCutoffRatio));
}

std::expected<BitrateDecision, PipelineError> decideBitrate(const ProbeMetadata& metadata,
                                                            uint32_t upload_limit_mb,
                                                            bool enable_fallback) {
  BitrateDecision decision;
  decision.max_bitrate = maxBitrateFor(metadata.duration, upload_limit_mb);
  if (!decision.max_bitrate) {
    return decision;
  }

  const uint32_t max_bitrate = *decision.max_bitrate;
  const uint32_t original = metadata.bitrate;

  if (original != 0 && max_bitrate < qualityCutoff(original) && !enable_fallback) {
    return std::unexpected(PipelineError{
      ErrorKind::QualityDegradation,
      "the bitrate would have to drop from " + std::to_string(original) + " kbps to " +
        std::to_string(max_bitrate) + " kbps, which is too low; try again with fallback enabled"
    });
  }

  if (original < max_bitrate) {
    return decision;
  }

  decision.target_bitrate = max_bitrate;
  decision.reduced = true;
  return decision;
}

}
