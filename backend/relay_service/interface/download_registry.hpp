#pragma once
#include "application/task_manager.hpp"
#include "domain/task.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay_service {

// Copy of a download's state, safe to use after the registry lock is gone.
struct DownloadSnapshot {
  enum class State { Pending, Done, Failed };

  State state{State::Pending};
  std::filesystem::path video_path;
  std::optional<std::filesystem::path> thumbnail_path;
  ProbeMetadata metadata;
  std::optional<uint32_t> reduced_bitrate;
  std::string error;
};

struct Submission {
  std::string id;
  size_t position{0};
};

// The requester side of the task queue: keeps each request's completion
// receiver and, once it arrives, the result with its temp dir. A finished
// entry is dropped, files included, on release() or once it has been
// finished for longer than the retention. Pending entries never expire.
class DownloadRegistry {
public:
  DownloadRegistry(TaskManager& manager, std::chrono::steady_clock::duration retention);

  DownloadRegistry(const DownloadRegistry&) = delete;
  DownloadRegistry& operator=(const DownloadRegistry&) = delete;

  Submission submit(const std::string& url, bool enable_fallback);

  // nullopt for unknown ids.
  std::optional<DownloadSnapshot> status(const std::string& id);

  // Forgets id and deletes its files. False for unknown ids.
  bool release(const std::string& id);

  size_t size();

private:
  struct Entry {
    common::OneshotReceiver<TaskResult> receiver;
    std::optional<TaskResult> result;
    std::chrono::steady_clock::time_point finished_at;
  };

  using Node = std::unordered_map<std::string, Entry>::node_type;

  // Moves the result into entry once the worker has sent it.
  static void collect(Entry& entry);
  // Unlinks expired entries; the caller destroys them after unlocking.
  std::vector<Node> takeExpired();

  TaskManager& manager_;
  const std::chrono::steady_clock::duration retention_;
  mutable std::mutex mtx_;
  std::unordered_map<std::string, Entry> entries_;
};

}
