#include "ytdlp_extractor.hpp"
#include "common/subprocess.hpp"
#include <spdlog/spdlog.h>

namespace relay_service {

namespace {

// yt-dlp reports a skipped download as "File is larger than max-filesize"
bool exceededSizeCap(const std::string& output) {
  return output.find("larger than max-filesize") != std::string::npos;
}

} // namespace

YtDlpExtractor::YtDlpExtractor(std::string executable) : executable_(std::move(executable)) {}

std::vector<std::string> YtDlpExtractor::buildArguments(const std::string& url,
                                                        const std::filesystem::path& output_dir,
                                                        uint64_t max_size_mb) const {
  return {
    "--no-playlist",
    "--no-progress",
    "--max-filesize", std::to_string(max_size_mb) + "M",
    "--output", (output_dir / "%(id)s.%(ext)s").string(),
    // everything after this is a URL, even if it starts with '-'
    "--",
    url,
  };
}

std::expected<void, PipelineError> YtDlpExtractor::fetch(
  const std::string& url,
  const std::filesystem::path& output_dir,
  uint64_t max_size_mb
) {
  auto result = common::runProcess(executable_, buildArguments(url, output_dir, max_size_mb));
  if (!result) {
    return std::unexpected(PipelineError{ErrorKind::Extraction, result.error()});
  }

  if (exceededSizeCap(result->output)) {
    return std::unexpected(PipelineError{
      ErrorKind::Extraction,
      "base file size exceeded " + std::to_string(max_size_mb) + " MB"
    });
  }

  if (!result->success()) {
    spdlog::debug("yt-dlp output for {}:\n{}", url, result->output);
    auto detail = result->lastLine();
    return std::unexpected(PipelineError{
      ErrorKind::Extraction,
      "extractor exited with code " + std::to_string(result->exit_code)
        + (detail.empty() ? std::string() : ": " + detail)
    });
  }

  return {};
}

}
