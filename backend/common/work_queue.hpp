#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace common {

// Unbounded FIFO, many producers and one consumer.
// push never blocks; pop blocks until an item arrives or stop is requested.
//
// The callback overloads run while the queue lock is held, so callers can keep
// their own bookkeeping consistent with the queue length. Callbacks must not
// call back into the queue.
template <typename T>
class WorkQueue {
public:
  WorkQueue() = default;

  WorkQueue(const WorkQueue&) = delete;
  WorkQueue& operator=(const WorkQueue&) = delete;

  void push(T item) {
    push(std::move(item), []() {});
  }

  template <typename Func>
  void push(T item, Func&& under_lock) {
    {
      std::lock_guard<std::mutex> lock{mtx_};
      items_.push_back(std::move(item));
      under_lock();
    }
    cv_.notify_one();
  }

  std::optional<T> pop(std::stop_token stoken) {
    return pop(stoken, []() {});
  }

  // Returns nullopt once stop is requested, even if items are waiting.
  template <typename Func>
  std::optional<T> pop(std::stop_token stoken, Func&& on_taken) {
    std::unique_lock<std::mutex> lock{mtx_};
    cv_.wait(lock, stoken, [this]() -> bool { return !items_.empty(); });

    if (stoken.stop_requested() || items_.empty()) {
      return std::nullopt;
    }

    std::optional<T> item{std::move(items_.front())};
    items_.pop_front();
    on_taken();
    return item;
  }

  // Calls func(queued_count) under the queue lock and returns its result.
  template <typename Func>
  decltype(auto) inspect(Func&& func) const {
    std::lock_guard<std::mutex> lock{mtx_};
    return func(items_.size());
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock{mtx_};
    return items_.size();
  }

  bool empty() const { return size() == 0; }

private:
  mutable std::mutex mtx_;
  std::condition_variable_any cv_;
  std::deque<T> items_;
};

} // namespace common
