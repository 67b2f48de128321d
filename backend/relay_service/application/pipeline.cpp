#include "pipeline.hpp"
#include "bitrate_policy.hpp"
#include "common/uuid.hpp"
#include <spdlog/spdlog.h>
#include <system_error>
#include <vector>

namespace relay_service {

Pipeline::Pipeline(std::shared_ptr<Extractor> extractor,
                   std::shared_ptr<Prober> prober,
                   std::shared_ptr<Transcoder> transcoder,
                   std::shared_ptr<ThumbnailExtractor> thumbnailer,
                   PipelineLimits limits)
  : extractor_(std::move(extractor)),
    prober_(std::move(prober)),
    transcoder_(std::move(transcoder)),
    thumbnailer_(std::move(thumbnailer)),
    limits_(std::move(limits)) {
  if (limits_.work_root.empty()) {
    limits_.work_root = std::filesystem::temp_directory_path();
  }
}

std::expected<std::unique_ptr<TaskOutput>, PipelineError> Pipeline::run(const std::string& url,
                                                                         bool enable_fallback) const {
  const uint64_t cap = sizeCap(enable_fallback);

  auto dir = common::TempDir::create(limits_.work_root);
  if (!dir) {
    return std::unexpected(PipelineError{ErrorKind::Io, dir.error()});
  }

  auto source = fetch(url, *dir, cap);
  if (!source) {
    return std::unexpected(source.error());
  }

  if (auto ret = checkSize(*source, cap); !ret) {
    return std::unexpected(ret.error());
  }
  spdlog::info("downloaded {} to {}", url, source->string());

  // missing metadata only weakens the bitrate decision
  auto metadata = prober_->probe(*source).value_or(ProbeMetadata{});
  spdlog::debug("probe: {}s, {} kbps, {}x{}", metadata.duration, metadata.bitrate,
                metadata.width, metadata.height);

  auto decision = decideBitrate(metadata, limits_.upload_limit_mb, enable_fallback);
  if (!decision) {
    spdlog::warn("rejecting {}: {}", url, decision.error().message);
    return std::unexpected(decision.error());
  }

  auto output_path = dir->path() / (common::generateUuid() + ".mp4");
  if (auto ret = transcoder_->transcode(*source, output_path, decision->target_bitrate); !ret) {
    std::error_code ec;
    std::filesystem::remove(output_path, ec);

    const std::string attempted = decision->target_bitrate
      ? std::to_string(*decision->target_bitrate) + " kbps"
      : std::string("original bitrate");
    spdlog::error("failed to convert {} ({}): {}", url, attempted, ret.error().message);
    return std::unexpected(PipelineError{
      ErrorKind::Transcode,
      "failed to convert the video at " + attempted + ": " + ret.error().message
    });
  }

  if (decision->reduced) {
    spdlog::info("converted {} (bitrate adjusted to {} kbps)", url, *decision->target_bitrate);
  } else {
    spdlog::info("converted {} (no bitrate adjustment)", url);
  }

  auto output = std::make_unique<TaskOutput>();
  output->thumbnail_path = thumbnailer_->extract(output_path);
  output->video_path = std::move(output_path);
  output->metadata = metadata;
  output->reduced_bitrate = decision->reduced ? decision->target_bitrate : std::nullopt;
  output->dir = std::move(*dir);
  return output;
}

std::expected<std::filesystem::path, PipelineError> Pipeline::fetch(const std::string& url,
                                                                     const common::TempDir& dir,
                                                                     uint64_t cap) const {
  if (auto ret = extractor_->fetch(url, dir.path(), cap); !ret) {
    return std::unexpected(ret.error());
  }

  std::error_code ec;
  std::vector<std::filesystem::path> files;
  for (std::filesystem::directory_iterator it{dir.path(), ec}, end; !ec && it != end; it.increment(ec)) {
    files.push_back(it->path());
  }
  if (ec) {
    return std::unexpected(PipelineError{
      ErrorKind::Io, "could not read download directory: " + ec.message()
    });
  }

  if (files.size() != 1) {
    return std::unexpected(PipelineError{
      ErrorKind::Extraction,
      std::to_string(files.size()) + " files found, expected 1"
    });
  }
  return files.front();
}

std::expected<void, PipelineError> Pipeline::checkSize(const std::filesystem::path& file, uint64_t cap) const {
  std::error_code ec;
  const auto bytes = std::filesystem::file_size(file, ec);
  if (ec) {
    return std::unexpected(PipelineError{
      ErrorKind::Io, "could not read size of " + file.filename().string() + ": " + ec.message()
    });
  }

  // decimal megabytes
  if (bytes / 1000 / 1000 > cap) {
    return std::unexpected(PipelineError{
      ErrorKind::SizeLimit, "base file size exceeded " + std::to_string(cap) + " MB"
    });
  }
  return {};
}

}
