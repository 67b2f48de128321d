#pragma once
#include "task.hpp"
#include <filesystem>
#include <optional>

namespace relay_service {

class Prober {
public:
  virtual ~Prober() = default;
  // nullopt when the file has no decodable video stream.
  virtual std::optional<ProbeMetadata> probe(const std::filesystem::path& path) = 0;
};

}
