#pragma once
#include <string>

namespace relay_service {

enum class ErrorKind {
  Extraction,          // oversized source, extractor failure, wrong output file count
  SizeLimit,           // post-fetch size re-check
  QualityDegradation,  // bitrate would drop too far without fallback
  Transcode,
  Io,
};

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Extraction: return "extraction";
    case ErrorKind::SizeLimit: return "size limit";
    case ErrorKind::QualityDegradation: return "quality degradation";
    case ErrorKind::Transcode: return "transcode";
    case ErrorKind::Io: return "io";
  }
  return "unknown";
}

struct PipelineError {
  ErrorKind kind;
  std::string message;  // user-facing reason
};

} // namespace relay_service
