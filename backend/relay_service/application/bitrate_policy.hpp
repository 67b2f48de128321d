#pragma once
#include "domain/pipeline_error.hpp"
#include "domain/task.hpp"
#include <cstdint>
#include <expected>
#include <optional>

namespace relay_service {

// kbps kept free for the audio track
inline constexpr double kAudioReserveKbps = 128.0;
// share of the budget left after container/muxing overhead
inline constexpr double kContainerOverheadFactor = 0.97;
// lowest acceptable ratio of new to original bitrate without fallback
inline constexpr double kQualityCutoffRatio = 0.85;

struct BitrateDecision {
  std::optional<uint32_t> max_bitrate;     // nullopt when duration is unknown
  std::optional<uint32_t> target_bitrate;  // set only when reduced
  bool reduced{false};
};

// Highest video bitrate (kbps) that fits upload_limit_mb over duration
// seconds, or nullopt for a zero duration. Never negative.
std::optional<uint32_t> maxBitrateFor(uint32_t duration, uint32_t upload_limit_mb);

// floor(original * 0.85)
uint32_t qualityCutoff(uint32_t original_bitrate);

// Decides whether and how far the source has to be re-encoded. Fails with
// QualityDegradation when the cap would cost more than 15% of the original
// bitrate and fallback is off. An unknown (zero) original bitrate never fails.
std::expected<BitrateDecision, PipelineError> decideBitrate(
  const ProbeMetadata& metadata,
  uint32_t upload_limit_mb,
  bool enable_fallback
);

}
