#pragma once
#include "admission_controller.hpp"
#include "pipeline.hpp"
#include "worker.hpp"
#include <memory>
#include <stop_token>

namespace relay_service {

// Entry point for the rest of the application: admission on one side, the
// worker on the other, and the root stop source shared by both.
//
// Lifecycle is start() once, stop() once. Tasks still queued after stop()
// stay counted; destroying the manager drops them, which closes their
// completion channels.
class TaskManager {
public:
  explicit TaskManager(std::shared_ptr<const Pipeline> pipeline);
  ~TaskManager();

  TaskManager(const TaskManager&) = delete;
  TaskManager& operator=(const TaskManager&) = delete;

  void start();
  void stop();

  size_t queueSize() const { return admission_.queueSize(); }
  Reservation reserve() { return admission_.reserve(); }
  void enqueue(Task task) { admission_.enqueue(std::move(task)); }
  void enqueue(Task task, Reservation reservation) {
    admission_.enqueue(std::move(task), std::move(reservation));
  }

  WorkerState workerState() const { return worker_.state(); }

private:
  // declaration order matters: the worker must stop before the queue goes
  AdmissionController admission_;
  Worker worker_;
  std::stop_source stop_source_;
};

}
