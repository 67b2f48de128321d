#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace config {

// All sizes are decimal megabytes.
struct LimitsConfig {
  uint64_t max_filesize_mb;
  uint64_t fallback_filesize_mb;
  uint32_t upload_limit_mb;
  uint32_t transcode_ceiling_mb;
};

struct ToolsConfig {
  std::string ytdlp;
  std::string ffmpeg;
};

struct HttpConfig {
  std::string host;
  unsigned int port;
};

struct LoggingConfig {
  std::string level;
};

// Parses a positive decimal no greater than max. Empty or null value gives
// fallback; anything else throws std::runtime_error naming the variable.
uint64_t parseNumber(const char* name, const char* value, uint64_t fallback, uint64_t max);

class Config {
public:
static Config& getInstance() {
  static Config instance;
  return instance;
}

// Delete copy/move constructors and assign operators
Config(const Config&) = delete;
Config& operator=(const Config&) = delete;
Config(Config&&) = delete;
Config& operator=(Config&&) = delete;

// Getters
const LimitsConfig& getLimits() const { return limits_; }
const ToolsConfig& getTools() const { return tools_; }
const HttpConfig& getHttp() const { return http_; }
const LoggingConfig& getLogging() const { return logging_; }
const std::string& getStoragePath() const { return storage_path_; }
std::chrono::seconds getResultRetention() const { return result_retention_; }
std::string getHttpIpPort() const { return http_.host+":"+std::to_string(http_.port);}

private:
  Config();

  LimitsConfig limits_;
  ToolsConfig tools_;
  HttpConfig http_;
  LoggingConfig logging_;
  std::string storage_path_;
  std::chrono::seconds result_retention_{3600};
};

} // namespace config
