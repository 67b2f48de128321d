#pragma once
#include "domain/extractor.hpp"
#include "domain/pipeline_error.hpp"
#include "domain/prober.hpp"
#include "domain/task.hpp"
#include "domain/thumbnail_extractor.hpp"
#include "domain/transcoder.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace relay_service {

struct PipelineLimits {
  uint64_t max_filesize_mb{200};
  uint64_t fallback_filesize_mb{1000};
  uint32_t upload_limit_mb{50};
  std::filesystem::path work_root;  // parent of the per-task temp dirs
};

// fetch -> size check -> probe -> bitrate decision -> transcode -> thumbnail.
// Each stage's failure ends the run; nothing here is retried.
class Pipeline {
public:
  Pipeline(std::shared_ptr<Extractor> extractor,
           std::shared_ptr<Prober> prober,
           std::shared_ptr<Transcoder> transcoder,
           std::shared_ptr<ThumbnailExtractor> thumbnailer,
           PipelineLimits limits);

  std::expected<std::unique_ptr<TaskOutput>, PipelineError> run(const std::string& url,
                                                                 bool enable_fallback) const;

  uint64_t sizeCap(bool enable_fallback) const {
    return enable_fallback ? limits_.fallback_filesize_mb : limits_.max_filesize_mb;
  }

private:
  std::expected<std::filesystem::path, PipelineError> fetch(const std::string& url,
                                                             const common::TempDir& dir,
                                                             uint64_t cap) const;
  std::expected<void, PipelineError> checkSize(const std::filesystem::path& file, uint64_t cap) const;

  std::shared_ptr<Extractor> extractor_;
  std::shared_ptr<Prober> prober_;
  std::shared_ptr<Transcoder> transcoder_;
  std::shared_ptr<ThumbnailExtractor> thumbnailer_;
  PipelineLimits limits_;
};

}
