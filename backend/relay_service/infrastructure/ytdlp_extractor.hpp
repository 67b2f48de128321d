#pragma once
#include "domain/extractor.hpp"
#include <string>
#include <vector>

namespace relay_service {

// Runs yt-dlp as a subprocess, one output file named by the video id.
class YtDlpExtractor : public Extractor {
public:
  explicit YtDlpExtractor(std::string executable = "yt-dlp");
  
  std::expected<void, PipelineError> fetch(
    const std::string& url,
    const std::filesystem::path& output_dir,
    uint64_t max_size_mb
  ) override;

  std::vector<std::string> buildArguments(const std::string& url,
                                          const std::filesystem::path& output_dir,
                                          uint64_t max_size_mb) const;
  
private:
  std::string executable_;
};

}
