#include "task_manager.hpp"
#include <spdlog/spdlog.h>

namespace relay_service {

TaskManager::TaskManager(std::shared_ptr<const Pipeline> pipeline)
  : worker_(admission_, std::move(pipeline)) {}

TaskManager::~TaskManager() {
  stop();
}

void TaskManager::start() {
  if (stop_source_.stop_requested()) {
    spdlog::warn("task manager cannot be restarted after stop");
    return;
  }
  worker_.start(stop_source_.get_token());
  spdlog::debug("task manager started");
}

void TaskManager::stop() {
  if (stop_source_.request_stop()) {
    spdlog::debug("task manager stopped");
  }
  worker_.stop();
}

}
