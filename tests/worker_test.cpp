#include "application/task_manager.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace relay_service {
namespace {

using common::OneshotReceiver;
using fakes::waitUntil;

class WorkerTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = std::filesystem::temp_directory_path() /
            ("vidrelay-worker-test-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
    std::filesystem::remove_all(root_);

    auto pipeline = std::make_shared<const Pipeline>(
      extractor_, prober_, transcoder_, thumbnailer_,
      PipelineLimits{.max_filesize_mb = 200, .fallback_filesize_mb = 1000, .upload_limit_mb = 50, .work_root = root_});
    manager_ = std::make_unique<TaskManager>(pipeline);
  }

  void TearDown() override {
    gate_.open();
    manager_.reset();
    std::filesystem::remove_all(root_);
  }

  OneshotReceiver<TaskResult> submit(const std::string& url, bool fallback = false) {
    auto [sender, receiver] = common::makeOneshot<TaskResult>();
    manager_->enqueue(Task{url, fallback, std::move(sender)});
    return std::move(receiver);
  }

  std::filesystem::path root_;
  fakes::Gate gate_;
  std::shared_ptr<fakes::FakeExtractor> extractor_ = std::make_shared<fakes::FakeExtractor>();
  std::shared_ptr<fakes::FakeProber> prober_ = std::make_shared<fakes::FakeProber>();
  std::shared_ptr<fakes::FakeTranscoder> transcoder_ = std::make_shared<fakes::FakeTranscoder>();
  std::shared_ptr<fakes::FakeThumbnailer> thumbnailer_ = std::make_shared<fakes::FakeThumbnailer>();
  std::unique_ptr<TaskManager> manager_;
};

TEST_F(WorkerTest, ProcessesTasksInSubmissionOrder) {
  extractor_->gate = &gate_;
  manager_->start();

  std::vector<OneshotReceiver<TaskResult>> receivers;
  for (int i = 0; i < 3; ++i) {
    receivers.push_back(submit("https://example.com/" + std::to_string(i)));
  }
  gate_.open();

  for (auto& receiver : receivers) {
    auto result = receiver.recvFor(std::chrono::seconds(5));
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_TRUE(result->value().has_value());
  }

  auto calls = extractor_->calls();
  ASSERT_EQ(calls.size(), 3u);
  for (size_t i = 0; i < calls.size(); ++i) {
    EXPECT_EQ(calls[i].url, "https://example.com/" + std::to_string(i));
  }
  EXPECT_TRUE(waitUntil([&]() { return manager_->queueSize() == 0; }));
}

TEST_F(WorkerTest, RunsOneTaskAtATime) {
  extractor_->gate = &gate_;
  manager_->start();

  auto first = submit("first");
  auto second = submit("second");
  ASSERT_TRUE(waitUntil([&]() { return extractor_->started() == 1; }));
  EXPECT_EQ(manager_->workerState(), WorkerState::Busy);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(extractor_->started(), 1u);
  EXPECT_EQ(manager_->queueSize(), 2u);

  gate_.open();
  EXPECT_TRUE(second.recvFor(std::chrono::seconds(5)).has_value());
  EXPECT_EQ(extractor_->started(), 2u);
}

TEST_F(WorkerTest, QueueSizeCountsInFlightUntilResultDelivered) {
  extractor_->gate = &gate_;
  manager_->start();

  auto receiver = submit("one");
  ASSERT_TRUE(waitUntil([&]() { return extractor_->started() == 1; }));
  EXPECT_EQ(manager_->queueSize(), 1u);

  gate_.open();
  ASSERT_TRUE(receiver.recvFor(std::chrono::seconds(5)).has_value());
  EXPECT_TRUE(waitUntil([&]() { return manager_->queueSize() == 0; }));
  EXPECT_TRUE(waitUntil([&]() { return manager_->workerState() == WorkerState::Idle; }));
}

TEST_F(WorkerTest, StopFinishesCurrentTaskAndLeavesPendingQueued) {
  extractor_->gate = &gate_;
  manager_->start();

  auto in_flight = submit("in-flight");
  ASSERT_TRUE(waitUntil([&]() { return extractor_->started() == 1; }));
  std::vector<OneshotReceiver<TaskResult>> pending;
  for (int i = 0; i < 3; ++i) {
    pending.push_back(submit("pending-" + std::to_string(i)));
  }
  EXPECT_EQ(manager_->queueSize(), 4u);

  auto stopped = std::async(std::launch::async, [&]() { manager_->stop(); });
  // stop waits for the running task
  EXPECT_EQ(stopped.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);
  gate_.open();
  ASSERT_EQ(stopped.wait_for(std::chrono::seconds(5)), std::future_status::ready);

  auto result = in_flight.tryRecv();
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->has_value());
  EXPECT_TRUE(result->value().has_value());

  EXPECT_EQ(manager_->workerState(), WorkerState::Stopped);
  EXPECT_EQ(extractor_->started(), 1u);
  EXPECT_EQ(manager_->queueSize(), 3u);
  for (auto& receiver : pending) {
    EXPECT_FALSE(receiver.tryRecv().has_value());
  }

  // dropping the manager drops the queued tasks and closes their channels
  manager_.reset();
  for (auto& receiver : pending) {
    auto closed = receiver.tryRecv();
    ASSERT_TRUE(closed.has_value());
    EXPECT_FALSE(closed->has_value());
  }
}

TEST_F(WorkerTest, DroppedReceiverDoesNotStopWorker) {
  manager_->start();
  {
    auto abandoned = submit("abandoned");
  }
  auto receiver = submit("kept");

  auto result = receiver.recvFor(std::chrono::seconds(5));
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->has_value());
  EXPECT_TRUE(result->value().has_value());
  EXPECT_EQ(extractor_->started(), 2u);
}

TEST_F(WorkerTest, PipelineFailureIsReportedAsMessage) {
  extractor_->file_count = 2;
  manager_->start();

  auto result = submit("playlist").recvFor(std::chrono::seconds(5));
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->has_value());
  ASSERT_FALSE(result->value().has_value());
  EXPECT_EQ(result->value().error(), "2 files found, expected 1");
}

TEST_F(WorkerTest, ThrowingCollaboratorFailsOnlyItsTask) {
  extractor_->throw_message = "boom";
  manager_->start();

  auto failed = submit("throws").recvFor(std::chrono::seconds(5));
  ASSERT_TRUE(failed.has_value());
  ASSERT_TRUE(failed->has_value());
  ASSERT_FALSE(failed->value().has_value());
  EXPECT_EQ(failed->value().error(), "internal error: boom");

  // the worker is parked on the queue, so the fake can be changed safely
  extractor_->throw_message.reset();
  auto ok = submit("fine").recvFor(std::chrono::seconds(5));
  ASSERT_TRUE(ok.has_value());
  ASSERT_TRUE(ok->has_value());
  EXPECT_TRUE(ok->value().has_value());
}

TEST_F(WorkerTest, ConcurrentProducersNeverOverlapTasks) {
  constexpr size_t kThreads = 4;
  constexpr size_t kPerThread = 5;
  extractor_->hold = std::chrono::milliseconds(2);
  manager_->start();

  std::mutex receivers_mtx;
  std::vector<OneshotReceiver<TaskResult>> receivers;
  std::vector<std::thread> producers;
  for (size_t t = 0; t < kThreads; ++t) {
    producers.emplace_back([&, t]() {
      for (size_t i = 0; i < kPerThread; ++i) {
        auto reservation = manager_->reserve();
        auto [sender, receiver] = common::makeOneshot<TaskResult>();
        manager_->enqueue(Task{"producer-" + std::to_string(t), false, std::move(sender)},
                          std::move(reservation));
        std::lock_guard<std::mutex> lock{receivers_mtx};
        receivers.push_back(std::move(receiver));
      }
    });
  }
  for (auto& producer : producers) {
    producer.join();
  }

  for (auto& receiver : receivers) {
    auto result = receiver.recvFor(std::chrono::seconds(10));
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(result->has_value());
    EXPECT_TRUE(result->value().has_value());
  }
  EXPECT_EQ(extractor_->started(), kThreads * kPerThread);
  EXPECT_EQ(extractor_->maxActive(), 1u);
  EXPECT_TRUE(waitUntil([&]() { return manager_->queueSize() == 0; }));
}

TEST_F(WorkerTest, StoppedManagerCannotRestart) {
  manager_->start();
  manager_->stop();
  EXPECT_EQ(manager_->workerState(), WorkerState::Stopped);

  manager_->start();
  auto receiver = submit("late");
  EXPECT_FALSE(receiver.recvFor(std::chrono::milliseconds(50)).has_value());
  EXPECT_EQ(manager_->queueSize(), 1u);
}

} // namespace
} // namespace relay_service
