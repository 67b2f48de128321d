#pragma once
#include "admission_controller.hpp"
#include "pipeline.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <thread>

namespace relay_service {

enum class WorkerState { Idle, Busy, Stopped };

const char* toString(WorkerState state);

// Runs one task at a time, in queue order, on its own thread.
//
// Stop requests are checked before every dequeue and win over waiting work,
// but never interrupt a task that is already running. A failing or throwing
// pipeline only fails its own task.
class Worker {
public:
  Worker(AdmissionController& admission, std::shared_ptr<const Pipeline> pipeline);
  ~Worker();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  // Starts the loop. Requesting stop on parent also stops the worker.
  void start(std::stop_token parent);
  // Requests stop and waits for the current task, if any, to finish.
  void stop();

  WorkerState state() const { return state_.load(std::memory_order_acquire); }

private:
  void loop(std::stop_token stoken);
  void handleTask(Task task);
  TaskResult process(const Task& task);

  AdmissionController& admission_;
  std::shared_ptr<const Pipeline> pipeline_;
  std::atomic<WorkerState> state_{WorkerState::Idle};
  std::jthread thread_;
  std::optional<std::stop_callback<std::function<void()>>> parent_link_;
};

}
