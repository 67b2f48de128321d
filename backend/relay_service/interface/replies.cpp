#include "replies.hpp"
#include <iomanip>
#include <sstream>

namespace relay_service {

std::string acceptMessage(size_t position) {
  if (position == 0) {
    return "Request accepted.\nThe queue is empty, downloading now.";
  }
  return "Request accepted.\nYour position in the queue: " + std::to_string(position) + ".";
}

std::string statusMessage(size_t queue_size) {
  return "Number of active tasks: " + std::to_string(queue_size) + ".";
}

std::string failureMessage(const std::string& reason) {
  return "Failed to download video (" + reason + ").";
}

std::optional<std::string> bitrateWarning(uint32_t original_kbps, std::optional<uint32_t> reduced_kbps) {
  if (!reduced_kbps) {
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << "Warning: the bitrate of the video has been reduced ";
  if (original_kbps > 0) {
    const double ratio = static_cast<double>(*reduced_kbps) / static_cast<double>(original_kbps);
    ss << "from " << original_kbps << " kbps to " << *reduced_kbps << " kbps ("
       << std::fixed << std::setprecision(1) << (1.0 - ratio) * 100.0 << "% reduction)";
  } else {
    ss << "to " << *reduced_kbps << " kbps";
  }
  ss << " to meet the upload size limit.";
  return ss.str();
}

}
