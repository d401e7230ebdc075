// Unit tests for TaskQueue draining and ProgressAggregator accounting.

#include "vod_fetch/task_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace vod_fetch;

namespace {

std::vector<DownloadTask> MakeTasks(int n) {
  std::vector<DownloadTask> tasks;
  for (int i = 1; i <= n; ++i) {
    DownloadTask t;
    t.id = i;
    t.segment_name = "seg";
    t.output_path = "out/" + std::to_string(i) + ".mp4";
    tasks.push_back(t);
  }
  return tasks;
}

TaskOutcome Outcome(const DownloadTask& task, TaskStatus status,
                    std::uint64_t bytes) {
  TaskOutcome o;
  o.task = task;
  o.status = status;
  o.bytes = bytes;
  return o;
}

}  // namespace

TEST(TaskQueueTest, PopsInPlanOrderThenEmpty)
{
  TaskQueue queue(MakeTasks(3));
  EXPECT_EQ(queue.remaining(), 3u);

  for (int expected = 1; expected <= 3; ++expected) {
    auto t = queue.try_pop();
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->id, expected);
  }
  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_EQ(queue.remaining(), 0u);
}

TEST(TaskQueueTest, ConcurrentConsumersTakeEachTaskOnce)
{
  constexpr int kTasks = 500;
  TaskQueue queue(MakeTasks(kTasks));

  std::mutex mu;
  std::multiset<int> seen;
  std::vector<std::thread> consumers;
  for (int c = 0; c < 4; ++c) {
    consumers.emplace_back([&] {
      while (auto t = queue.try_pop()) {
        std::lock_guard<std::mutex> lock(mu);
        seen.insert(t->id);
      }
    });
  }
  for (auto& th : consumers) th.join();

  ASSERT_EQ(seen.size(), static_cast<size_t>(kTasks));
  for (int i = 1; i <= kTasks; ++i) EXPECT_EQ(seen.count(i), 1u);
}

TEST(ProgressAggregatorTest, CountsEachOutcomeInOneBucket)
{
  auto tasks = MakeTasks(4);
  ProgressAggregator progress(tasks.size());

  progress.record(Outcome(tasks[0], TaskStatus::Downloaded, 1000));
  progress.record(Outcome(tasks[1], TaskStatus::Exists, 400));
  progress.record(Outcome(tasks[2], TaskStatus::Failed, 0));

  ProgressSnapshot s = progress.snapshot();
  EXPECT_EQ(s.downloaded, 1u);
  EXPECT_EQ(s.exists, 1u);
  EXPECT_EQ(s.failed, 1u);
  EXPECT_EQ(s.total, 4u);
  EXPECT_EQ(s.completed(), 3u);
  EXPECT_EQ(s.not_attempted(), 1u);
  EXPECT_EQ(s.bytes_transferred, 1000u);
  EXPECT_EQ(s.bytes_existing, 400u);
  EXPECT_EQ(s.bytes_on_disk(), 1400u);

  auto failed = progress.failed_tasks();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].id, 3);
}

TEST(ProgressAggregatorTest, RecordReturnsSnapshotAfterUpdate)
{
  auto tasks = MakeTasks(2);
  ProgressAggregator progress(tasks.size());

  ProgressSnapshot first = progress.record(Outcome(tasks[0], TaskStatus::Exists, 5));
  EXPECT_EQ(first.completed(), 1u);
  ProgressSnapshot second =
      progress.record(Outcome(tasks[1], TaskStatus::Downloaded, 7));
  EXPECT_EQ(second.completed(), 2u);
  EXPECT_EQ(second.not_attempted(), 0u);
}

TEST(ProgressAggregatorTest, ConcurrentRecordsNeverExceedTotal)
{
  constexpr int kTasks = 400;
  auto tasks = MakeTasks(kTasks);
  TaskQueue queue(tasks);
  ProgressAggregator progress(tasks.size());
  std::atomic<bool> overflow{false};

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      while (auto t = queue.try_pop()) {
        TaskStatus status = static_cast<TaskStatus>(t->id % 3);
        ProgressSnapshot s = progress.record(Outcome(*t, status, 10));
        if (s.completed() > s.total) overflow = true;
      }
    });
  }
  for (auto& th : workers) th.join();

  ProgressSnapshot s = progress.snapshot();
  EXPECT_FALSE(overflow.load());
  EXPECT_EQ(s.completed(), static_cast<size_t>(kTasks));
  EXPECT_EQ(s.failed, progress.failed_tasks().size());
}
