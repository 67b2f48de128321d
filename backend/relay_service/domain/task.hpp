#pragma once
#include "common/oneshot.hpp"
#include "common/temp_dir.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace relay_service {

// All fields are zero when the source could not be probed.
struct ProbeMetadata {
  uint32_t duration{0};  // whole seconds
  uint32_t bitrate{0};   // kbps, whole container
  uint32_t width{0};
  uint32_t height{0};

  bool operator==(const ProbeMetadata&) const = default;
};

// Result of a processed Task. Files live inside dir, which is removed when
// the output is destroyed, so keep the output alive while using them.
struct TaskOutput {
  common::TempDir dir;
  std::filesystem::path video_path;
  std::optional<std::filesystem::path> thumbnail_path;
  ProbeMetadata metadata;       // of the original download
  std::optional<uint32_t> reduced_bitrate;  // kbps, set only when re-encoded below the source
};

using TaskResult = std::expected<std::unique_ptr<TaskOutput>, std::string>;

// A download request waiting for the worker. The worker owns completion once
// the task is dequeued and sends exactly one result through it.
struct Task {
  std::string url;
  bool enable_fallback{false};
  common::OneshotSender<TaskResult> completion;
};

} // namespace relay_service
