#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace common {

// RAII: owns a freshly created directory and removes it recursively on
// destruction. Move-only, the moved-from object owns nothing.
class TempDir {
public:
  // Creates <parent>/<prefix><uuid>.
  static std::expected<TempDir, std::string> create(const std::filesystem::path& parent,
                                                    const std::string& prefix = "vidrelay-");

  TempDir() = default;
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  TempDir(TempDir&& other) noexcept;
  TempDir& operator=(TempDir&& other) noexcept;

  const std::filesystem::path& path() const { return path_; }
  bool valid() const { return !path_.empty(); }

private:
  explicit TempDir(std::filesystem::path path) : path_(std::move(path)) {}
  void remove() noexcept;

  std::filesystem::path path_;
};

}
