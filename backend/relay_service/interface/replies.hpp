#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace relay_service {

// User-facing texts returned by the HTTP surface.

std::string acceptMessage(size_t position);
std::string statusMessage(size_t queue_size);
std::string failureMessage(const std::string& reason);
// nullopt when the bitrate was not reduced.
std::optional<std::string> bitrateWarning(uint32_t original_kbps, std::optional<uint32_t> reduced_kbps);

}
