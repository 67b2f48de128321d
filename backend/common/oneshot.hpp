#pragma once

#include <chrono>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace common {

// Returned by a receiver whose sender went away without sending.
struct ChannelClosed {};

namespace detail {

template <typename T>
struct OneshotState {
  std::mutex mtx;
  std::condition_variable cv;
  std::optional<T> value;
  bool sender_alive{true};
  bool receiver_alive{true};
};

} // namespace detail

// Producer half of a single-value channel. Move-only; dropping it without
// sending closes the channel.
template <typename T>
class OneshotSender {
public:
  OneshotSender() = default;
  explicit OneshotSender(std::shared_ptr<detail::OneshotState<T>> state) : state_(std::move(state)) {}

  OneshotSender(const OneshotSender&) = delete;
  OneshotSender& operator=(const OneshotSender&) = delete;

  OneshotSender(OneshotSender&& other) noexcept : state_(std::move(other.state_)) {}
  OneshotSender& operator=(OneshotSender&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~OneshotSender() { close(); }

  // Delivers the value. Returns false, dropping the value, when the receiver
  // is gone or the sender was already used.
  bool send(T value) {
    if (!state_) {
      return false;
    }
    bool delivered = false;
    {
      std::lock_guard<std::mutex> lock{state_->mtx};
      if (state_->receiver_alive) {
        state_->value.emplace(std::move(value));
        delivered = true;
      }
      state_->sender_alive = false;
    }
    state_->cv.notify_all();
    state_.reset();
    return delivered;
  }

  // True when nobody is listening any more.
  bool isClosed() const {
    if (!state_) {
      return true;
    }
    std::lock_guard<std::mutex> lock{state_->mtx};
    return !state_->receiver_alive;
  }

private:
  void close() {
    if (!state_) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock{state_->mtx};
      state_->sender_alive = false;
    }
    state_->cv.notify_all();
    state_.reset();
  }

  std::shared_ptr<detail::OneshotState<T>> state_;
};

// Consumer half of a single-value channel.
template <typename T>
class OneshotReceiver {
public:
  using Result = std::expected<T, ChannelClosed>;

  OneshotReceiver() = default;
  explicit OneshotReceiver(std::shared_ptr<detail::OneshotState<T>> state) : state_(std::move(state)) {}

  OneshotReceiver(const OneshotReceiver&) = delete;
  OneshotReceiver& operator=(const OneshotReceiver&) = delete;

  OneshotReceiver(OneshotReceiver&& other) noexcept : state_(std::move(other.state_)) {}
  OneshotReceiver& operator=(OneshotReceiver&& other) noexcept {
    if (this != &other) {
      close();
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~OneshotReceiver() { close(); }

  // Blocks until the value arrives or the sender is dropped.
  Result recv() {
    if (!state_) {
      return std::unexpected(ChannelClosed{});
    }
    std::unique_lock<std::mutex> lock{state_->mtx};
    state_->cv.wait(lock, [this]() -> bool { return ready(); });
    return take();
  }

  // nullopt while the sender is still working on it.
  std::optional<Result> tryRecv() {
    if (!state_) {
      return Result{std::unexpected(ChannelClosed{})};
    }
    std::lock_guard<std::mutex> lock{state_->mtx};
    if (!ready()) {
      return std::nullopt;
    }
    return take();
  }

  template <typename Rep, typename Period>
  std::optional<Result> recvFor(const std::chrono::duration<Rep, Period>& timeout) {
    if (!state_) {
      return Result{std::unexpected(ChannelClosed{})};
    }
    std::unique_lock<std::mutex> lock{state_->mtx};
    if (!state_->cv.wait_for(lock, timeout, [this]() -> bool { return ready(); })) {
      return std::nullopt;
    }
    return take();
  }

private:
  // Callers hold state_->mtx.
  bool ready() const { return state_->value.has_value() || !state_->sender_alive; }

  Result take() {
    if (!state_->value) {
      return std::unexpected(ChannelClosed{});
    }
    Result result{std::move(*state_->value)};
    state_->value.reset();
    return result;
  }

  void close() {
    if (!state_) {
      return;
    }
    std::lock_guard<std::mutex> lock{state_->mtx};
    state_->receiver_alive = false;
    state_->value.reset();
  }

  std::shared_ptr<detail::OneshotState<T>> state_;
};

template <typename T>
std::pair<OneshotSender<T>, OneshotReceiver<T>> makeOneshot() {
  auto state = std::make_shared<detail::OneshotState<T>>();
  return {OneshotSender<T>{state}, OneshotReceiver<T>{state}};
}

} // namespace common
