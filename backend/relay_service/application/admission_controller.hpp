#pragma once
#include "common/work_queue.hpp"
#include "domain/task.hpp"
#include <atomic>
#include <cstddef>
#include <optional>
#include <stop_token>

namespace relay_service {

class AdmissionController;

// A queue position promised to a caller before its Task exists. Counted by
// queueSize() until it is handed to enqueue() or destroyed.
class Reservation {
public:
  Reservation() = default;
  ~Reservation();

  Reservation(const Reservation&) = delete;
  Reservation& operator=(const Reservation&) = delete;

  Reservation(Reservation&& other) noexcept;
  Reservation& operator=(Reservation&& other) noexcept;

  // Number of tasks ahead of this one when it was made.
  size_t position() const { return position_; }
  bool active() const { return owner_ != nullptr; }

private:
  friend class AdmissionController;
  Reservation(AdmissionController* owner, size_t position) : owner_(owner), position_(position) {}
  void release() noexcept;

  AdmissionController* owner_{nullptr};
  size_t position_{0};
};

// Tracks how many tasks occupy the system: queued, reserved but not yet
// queued, and the one being processed. Every counter change happens inside
// the queue's lock region so queueSize() never misses a promised task.
class AdmissionController {
public:
  AdmissionController() = default;

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;

  size_t queueSize() const;

  // Returns the current size as the caller's position and counts one more.
  Reservation reserve();

  void enqueue(Task task);
  // Queues task in place of the reservation, leaving queueSize() unchanged.
  void enqueue(Task task, Reservation reservation);

  // worker side

  // Blocks for the next task and marks it in flight. nullopt on stop.
  std::optional<Task> take(std::stop_token stoken);
  // Clears the in-flight mark set by take().
  void complete();

  size_t queued() const { return queue_.size(); }
  size_t tentative() const { return tentative_.load(std::memory_order_acquire); }
  bool busy() const { return in_flight_.load(std::memory_order_acquire) != 0; }

private:
  friend class Reservation;
  void releaseReservation();

  common::WorkQueue<Task> queue_;
  std::atomic<size_t> tentative_{0};
  std::atomic<size_t> in_flight_{0};
};

}
