#include "download_registry.hpp"
#include "common/uuid.hpp"
#include <spdlog/spdlog.h>

namespace relay_service {

DownloadRegistry::DownloadRegistry(TaskManager& manager, std::chrono::steady_clock::duration retention)
  : manager_(manager), retention_(retention) {}

void DownloadRegistry::collect(Entry& entry) {
  if (entry.result) {
    return;
  }
  auto received = entry.receiver.tryRecv();
  if (!received) {
    return;
  }
  if (*received) {
    entry.result.emplace(std::move(**received));
  } else {
    entry.result.emplace(std::unexpected(std::string("internal error: channel closed")));
  }
  entry.finished_at = std::chrono::steady_clock::now();
}

std::vector<DownloadRegistry::Node> DownloadRegistry::takeExpired() {
  const auto now = std::chrono::steady_clock::now();
  std::vector<Node> expired;
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto current = it++;
    collect(current->second);
    if (current->second.result && now - current->second.finished_at >= retention_) {
      spdlog::info("expiring result {}", current->first);
      expired.push_back(entries_.extract(current));
    }
  }
  return expired;
}

Submission DownloadRegistry::submit(const std::string& url, bool enable_fallback) {
  // hold the position between answering the caller and queueing the task
  auto reservation = manager_.reserve();
  Submission submission{common::generateUuid(), reservation.position()};

  auto [sender, receiver] = common::makeOneshot<TaskResult>();
  std::vector<Node> expired;
  {
    std::lock_guard<std::mutex> lock{mtx_};
    expired = takeExpired();
    entries_.emplace(submission.id, Entry{std::move(receiver), std::nullopt, {}});
  }

  manager_.enqueue(Task{url, enable_fallback, std::move(sender)}, std::move(reservation));
  spdlog::info("accepted {} as {} at position {}", url, submission.id, submission.position);
  return submission;
}

std::optional<DownloadSnapshot> DownloadRegistry::status(const std::string& id) {
  // declared before the lock so expired files are deleted after unlocking
  std::vector<Node> expired;
  std::lock_guard<std::mutex> lock{mtx_};
  expired = takeExpired();
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }

  const auto& entry = it->second;
  DownloadSnapshot snapshot;
  if (!entry.result) {
    return snapshot;
  }

  const auto& result = *entry.result;
  if (!result) {
    snapshot.state = DownloadSnapshot::State::Failed;
    snapshot.error = result.error();
    return snapshot;
  }

  const auto& output = **result;
  snapshot.state = DownloadSnapshot::State::Done;
  snapshot.video_path = output.video_path;
  snapshot.thumbnail_path = output.thumbnail_path;
  snapshot.metadata = output.metadata;
  snapshot.reduced_bitrate = output.reduced_bitrate;
  return snapshot;
}

bool DownloadRegistry::release(const std::string& id) {
  std::unique_lock<std::mutex> lock{mtx_};
  auto node = entries_.extract(id);
  lock.unlock();
  // files go away with the node, outside the lock
  return !node.empty();
}

size_t DownloadRegistry::size() {
  std::vector<Node> expired;
  std::lock_guard<std::mutex> lock{mtx_};
  expired = takeExpired();
  return entries_.size();
}

}
