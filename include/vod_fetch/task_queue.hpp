/**
 * @file task_queue.hpp
 * @brief Thread-safe task queue and progress aggregation
 *
 * @details Provides:
 *          - TaskQueue: Pull queue of pending download tasks
 *
 *          - ProgressAggregator: Thread-safe counters for task outcomes
 */

#ifndef VOD_FETCH_TASK_QUEUE_HPP
#define VOD_FETCH_TASK_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "types.hpp"

namespace vod_fetch {

/**
 * @class TaskQueue
 * @brief Thread-safe pull queue for dynamic load balancing.
 *
 * @attention DESIGN:
 *
 * - The full plan is loaded before any worker starts
 *
 * - Workers call try_pop() until it reports empty, then exit
 *
 * - Nothing is ever pushed back: a failed task is terminal for the run
 *
 * @note Since the total is known up front there is no blocking pop and no
 *       finish() signal; empty simply means done.
 */
class TaskQueue {
  std::deque<DownloadTask> tasks;
  mutable std::mutex mutex;

public:
  TaskQueue() = default;
  explicit TaskQueue(std::vector<DownloadTask> plan);

  /**
   * @brief Append the plan to the queue.
   * @note Called by the orchestrator before workers are spawned.
   */
  void load(std::vector<DownloadTask> plan);

  /**
   * @brief Take the next task.
   * @return The task, or std::nullopt once the queue is drained
   */
  std::optional<DownloadTask> try_pop();

  /// Tasks not yet handed out
  std::size_t remaining() const;
};

/**
 * @class ProgressAggregator
 * @brief Thread-safe aggregator for task outcomes.
 * @note One mutex guards every counter so readers always see a consistent
 *       snapshot; the critical section is a few increments.
 */
class ProgressAggregator {
  ProgressSnapshot state;
  std::vector<DownloadTask> failed;
  mutable std::mutex mutex;

public:
  /**
   * @param total Number of tasks in the plan
   */
  explicit ProgressAggregator(std::size_t total);

  /**
   * @brief Account for one finished task.
   * @return Snapshot taken right after the update (for the progress line)
   */
  ProgressSnapshot record(const TaskOutcome &outcome);

  /// Consistent copy of all counters
  ProgressSnapshot snapshot() const;

  /// Tasks that ended Failed, in completion order
  std::vector<DownloadTask> failed_tasks() const;
};

} // namespace vod_fetch

#endif // VOD_FETCH_TASK_QUEUE_HPP
