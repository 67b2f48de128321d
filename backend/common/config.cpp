#include "config/config.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>

namespace config {

// Values outside [1, max] are rejected, never truncated.
uint64_t parseNumber(const char* name, const char* value, uint64_t fallback, uint64_t max) {
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  try {
    const std::string text{value};
    if (text.find_first_not_of("0123456789") != std::string::npos) {
      throw std::invalid_argument(text);
    }
    size_t consumed = 0;
    auto parsed = std::stoull(text, &consumed);
    if (consumed != text.size() || parsed == 0 || parsed > max) {
      throw std::out_of_range(text);
    }
    return parsed;
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("Invalid numeric value for ") + name + ": " + value +
                             " (expected 1.." + std::to_string(max) + ")");
  }
}

namespace {

std::string envOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return fallback;
  }
  return value;
}

uint64_t envNumberOr(const char* name, uint64_t fallback, uint64_t max) {
  return parseNumber(name, std::getenv(name), fallback, max);
}

} // namespace

  Config::Config() {
    // fallback mode may fetch five times the normal ceiling
    const auto max_filesize = envNumberOr("MAX_FILESIZE", 200, std::numeric_limits<uint64_t>::max() / 5);
    const auto upload_limit = static_cast<uint32_t>(
      envNumberOr("UPLOAD_LIMIT", 50, std::numeric_limits<uint32_t>::max()));

    limits_ = {
      .max_filesize_mb = max_filesize,
      .fallback_filesize_mb = max_filesize * 5,
      .upload_limit_mb = upload_limit,
      .transcode_ceiling_mb = upload_limit,
    };

    tools_ = {
      .ytdlp = envOr("YTDLP_PATH", "yt-dlp"),
      .ffmpeg = envOr("FFMPEG_PATH", "ffmpeg"),
    };

    http_ = {
      .host = envOr("RELAY_HTTP_HOST", "0.0.0.0"),
      .port = static_cast<unsigned int>(
        envNumberOr("RELAY_HTTP_PORT", 8080, std::numeric_limits<uint16_t>::max())),
    };

    logging_ = {
      .level = envOr("RELAY_LOG_LEVEL", "info"),
    };

    storage_path_ = envOr("RELAY_STORAGE_PATH", std::filesystem::temp_directory_path().string());
    result_retention_ = std::chrono::seconds(
      envNumberOr("RELAY_RESULT_RETENTION", 3600, std::numeric_limits<uint32_t>::max()));
  }
}
