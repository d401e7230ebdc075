/**
 * @file task_queue.cpp
 * @brief Thread-safe task queue and progress aggregation implementation
 *
 * @details Provides implementations for:
 *
 *          - TaskQueue: Pull queue of pending download tasks
 *
 *          - ProgressAggregator: Thread-safe counters for task outcomes
 */

#include "vod_fetch/task_queue.hpp"

#include <iterator>

namespace vod_fetch {

// **----- TaskQueue Implementation -----**

TaskQueue::TaskQueue(std::vector<DownloadTask> plan) { load(std::move(plan)); }

void TaskQueue::load(std::vector<DownloadTask> plan) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.insert(tasks.end(), std::make_move_iterator(plan.begin()),
               std::make_move_iterator(plan.end()));
}

std::optional<DownloadTask> TaskQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex);
  if (tasks.empty())
    return std::nullopt;
  DownloadTask task = std::move(tasks.front());
  tasks.pop_front();
  return task;
}

std::size_t TaskQueue::remaining() const {
  std::lock_guard<std::mutex> lock(mutex);
  return tasks.size();
}

// **----- ProgressAggregator Implementation -----**

ProgressAggregator::ProgressAggregator(std::size_t total) {
  state.total = total;
}

ProgressSnapshot ProgressAggregator::record(const TaskOutcome &outcome) {
  std::lock_guard<std::mutex> lock(mutex);
  switch (outcome.status) {
  case TaskStatus::Downloaded:
    ++state.downloaded;
    state.bytes_transferred += outcome.bytes;
    break;
  case TaskStatus::Exists:
    ++state.exists;
    state.bytes_existing += outcome.bytes;
    break;
  case TaskStatus::Failed:
    ++state.failed;
    failed.push_back(outcome.task);
    break;
  }
  return state;
}

ProgressSnapshot ProgressAggregator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  return state;
}

std::vector<DownloadTask> ProgressAggregator::failed_tasks() const {
  std::lock_guard<std::mutex> lock(mutex);
  return failed;
}

} // namespace vod_fetch
