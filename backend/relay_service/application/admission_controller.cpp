#include "admission_controller.hpp"
#include <spdlog/spdlog.h>

namespace relay_service {

Reservation::~Reservation() { release(); }

Reservation::Reservation(Reservation&& other) noexcept
  : owner_(other.owner_), position_(other.position_) {
  other.owner_ = nullptr;
}

Reservation& Reservation::operator=(Reservation&& other) noexcept {
  if (this != &other) {
    release();
    owner_ = other.owner_;
    position_ = other.position_;
    other.owner_ = nullptr;
  }
  return *this;
}

void Reservation::release() noexcept {
  if (owner_ != nullptr) {
    owner_->releaseReservation();
    owner_ = nullptr;
  }
}

size_t AdmissionController::queueSize() const {
  return queue_.inspect([this](size_t queued) -> size_t {
    return queued
      + tentative_.load(std::memory_order_acquire)   // promised, not yet queued
      + in_flight_.load(std::memory_order_acquire);  // +1 while processing
  });
}

Reservation AdmissionController::reserve() {
  auto position = queue_.inspect([this](size_t queued) -> size_t {
    auto size = queued
      + tentative_.load(std::memory_order_acquire)
      + in_flight_.load(std::memory_order_acquire);
    tentative_.fetch_add(1, std::memory_order_acq_rel);
    return size;
  });
  return Reservation{this, position};
}

void AdmissionController::enqueue(Task task) {
  queue_.push(std::move(task));
}

void AdmissionController::enqueue(Task task, Reservation reservation) {
  if (reservation.owner_ != this) {
    // foreign or already used reservation; it releases itself on return
    enqueue(std::move(task));
    return;
  }
  queue_.push(std::move(task), [this, &reservation]() {
    tentative_.fetch_sub(1, std::memory_order_acq_rel);
    reservation.owner_ = nullptr;
  });
}

std::optional<Task> AdmissionController::take(std::stop_token stoken) {
  return queue_.pop(stoken, [this]() {
    in_flight_.store(1, std::memory_order_release);
  });
}

void AdmissionController::complete() {
  queue_.inspect([this](size_t) {
    in_flight_.store(0, std::memory_order_release);
  });
}

void AdmissionController::releaseReservation() {
  queue_.inspect([this](size_t) {
    tentative_.fetch_sub(1, std::memory_order_acq_rel);
  });
  spdlog::debug("queue reservation released without a task");
}

}
