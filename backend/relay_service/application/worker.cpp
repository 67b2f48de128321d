#include "worker.hpp"
#include <spdlog/spdlog.h>
#include <exception>

namespace relay_service {

const char* toString(WorkerState state) {
  switch (state) {
    case WorkerState::Idle: return "idle";
    case WorkerState::Busy: return "busy";
    case WorkerState::Stopped: return "stopped";
  }
  return "unknown";
}

Worker::Worker(AdmissionController& admission, std::shared_ptr<const Pipeline> pipeline)
  : admission_(admission), pipeline_(std::move(pipeline)) {}

Worker::~Worker() { stop(); }

void Worker::start(std::stop_token parent) {
  if (thread_.joinable()) {
    spdlog::warn("worker already running");
    return;
  }

  state_.store(WorkerState::Idle, std::memory_order_release);
  thread_ = std::jthread([this](std::stop_token stoken) { loop(stoken); });
  // runs immediately if parent is already stopped
  parent_link_.emplace(parent, std::function<void()>([this]() { thread_.request_stop(); }));
}

void Worker::stop() {
  // unlink first so the callback cannot race with join
  parent_link_.reset();
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void Worker::loop(std::stop_token stoken) {
  spdlog::debug("worker started");
  while (!stoken.stop_requested()) {
    auto task = admission_.take(stoken);
    if (!task) {
      continue;
    }

    state_.store(WorkerState::Busy, std::memory_order_release);
    handleTask(std::move(*task));
    admission_.complete();
    state_.store(WorkerState::Idle, std::memory_order_release);
  }
  state_.store(WorkerState::Stopped, std::memory_order_release);
  spdlog::debug("worker stopped, {} task(s) left in queue", admission_.queued());
}

void Worker::handleTask(Task task) {
  spdlog::info("processing {}{}", task.url, task.enable_fallback ? " (fallback)" : "");

  auto result = process(task);
  if (result) {
    spdlog::info("finished {}", task.url);
  } else {
    spdlog::warn("failed {}: {}", task.url, result.error());
  }

  if (!task.completion.send(std::move(result))) {
    spdlog::error("failed to send task result for {}: channel closed", task.url);
  }
}

TaskResult Worker::process(const Task& task) {
  try {
    auto output = pipeline_->run(task.url, task.enable_fallback);
    if (!output) {
      spdlog::debug("{} stage failed for {}", toString(output.error().kind), task.url);
      return std::unexpected(output.error().message);
    }
    return std::move(*output);
  } catch (const std::exception& e) {
    spdlog::error("unexpected error while processing {}: {}", task.url, e.what());
    return std::unexpected(std::string("internal error: ") + e.what());
  }
}

}
