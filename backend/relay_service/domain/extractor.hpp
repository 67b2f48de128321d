#pragma once
#include "pipeline_error.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace relay_service {

// Fetches the media behind a URL.
class Extractor {
public:
  virtual ~Extractor() = default;
  // Writes exactly one file into output_dir. Exceeding max_size_mb must be
  // reported as an Extraction error naming the cap.
  virtual std::expected<void, PipelineError> fetch(
    const std::string& url,
    const std::filesystem::path& output_dir,
    uint64_t max_size_mb
  ) = 0;
};

}
