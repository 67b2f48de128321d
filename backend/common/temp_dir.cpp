#include "temp_dir.hpp"
#include "uuid.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace common {

std::expected<TempDir, std::string> TempDir::create(const std::filesystem::path& parent,
                                                    const std::string& prefix) {
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    return std::unexpected("could not create " + parent.string() + ": " + ec.message());
  }

  auto path = parent / (prefix + generateUuid());
  if (!std::filesystem::create_directory(path, ec)) {
    return std::unexpected("could not create temp dir " + path.string() + ": " +
                           (ec ? ec.message() : std::string("already exists")));
  }
  return TempDir{std::move(path)};
}

TempDir::~TempDir() { remove(); }

TempDir::TempDir(TempDir&& other) noexcept : path_(std::move(other.path_)) {
  other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void TempDir::remove() noexcept {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    spdlog::warn("failed to remove temp dir {}: {}", path_.string(), ec.message());
  }
  path_.clear();
}

}
