/**
 * @file download_worker.hpp
 * @brief One unit of download concurrency and its retry policy
 *
 * @details A DownloadWorker owns exactly one RetrievalSession. It logs in,
 *          pulls tasks from the shared TaskQueue until it is empty, executes
 *          each task with retry/backoff, reports every outcome to the
 *          ProgressAggregator and finally releases its session.
 *
 * @attention PER-TASK STATE MACHINE:
 *
 *   1. Output file present with non-zero size -> Exists (no device call)
 *
 *   2. Up to max_retries fetch attempts, streaming straight to the output
 *      file (created/truncated on the first byte)
 *
 *   3. Failed attempts back off according to classify_error():
 *
 *      - Busy:          (attempt+1) * 5 units
 *
 *      - SessionBroken: (attempt+1) * 2 units, then re-login
 *
 *      - Other:         (attempt+1) * 2 units
 *
 *   4. Retries exhausted -> partial file deleted, Failed
 */

#ifndef VOD_FETCH_DOWNLOAD_WORKER_HPP
#define VOD_FETCH_DOWNLOAD_WORKER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "errors.hpp"
#include "retrieval_session.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace vod_fetch {

/**
 * @struct RetryPolicy
 * @brief Attempts, backoff steps and pacing, all in multiples of time_unit.
 */
struct RetryPolicy {
  int max_retries = DEFAULT_MAX_RETRIES;
  std::chrono::milliseconds time_unit{1000};
  int busy_step = 5;         //< Units per attempt after a busy reply
  int default_step = 2;      //< Units per attempt for everything else
  double pacing_units = 0.3; //< Delay between tasks of one worker
  double stagger_units = 1.0; //< Delay between worker start-ups

  /**
   * @brief Delay before the attempt following a failed one.
   * @param cls Class of the failure
   * @param attempt 0-based index of the failed attempt
   */
  std::chrono::milliseconds backoff(ErrorClass cls, int attempt) const;

  std::chrono::milliseconds pacing() const;
  std::chrono::milliseconds stagger() const;

  /// Policy from VOD_MAX_RETRIES / VOD_TIME_UNIT_MS
  static RetryPolicy from_config();
};

/**
 * @struct FetchTarget
 * @brief Which camera stream the tasks are fetched from.
 */
struct FetchTarget {
  int channel = 0;
  StreamQuality quality = StreamQuality::Main;
};

/**
 * @struct WorkerStats
 * @brief Per-worker counters (only touched by the owning thread).
 */
struct WorkerStats {
  int tasks = 0;           //< Tasks pulled from the queue
  int fetch_attempts = 0;  //< Calls to fetch()
  int reauth_attempts = 0; //< Re-logins after session errors
  bool login_failed = false;
};

/**
 * @brief Sleep hook used for backoff and pacing.
 * @return false if the wait was cut short by cancellation
 */
using SleepFn = std::function<bool(std::chrono::milliseconds)>;

/**
 * @class DownloadWorker
 * @brief Drains the TaskQueue through its own device session.
 */
class DownloadWorker {
public:
  /**
   * @param id Worker number used in log prefixes (1-based)
   * @param session Session owned exclusively by this worker
   * @param queue Shared task queue
   * @param progress Shared progress counters
   * @param target Channel and stream to fetch
   * @param policy Retry/backoff policy
   * @param cancel Cooperative cancellation flag (nullptr = never)
   * @param sleep Sleep hook (empty = cancellation-aware real sleep)
   */
  DownloadWorker(int id, std::unique_ptr<RetrievalSession> session,
                 TaskQueue &queue, ProgressAggregator &progress,
                 FetchTarget target, RetryPolicy policy,
                 const std::atomic<bool> *cancel = nullptr,
                 SleepFn sleep = {});

  ~DownloadWorker();

  DownloadWorker(const DownloadWorker &) = delete;
  DownloadWorker &operator=(const DownloadWorker &) = delete;

  /**
   * @brief Log in, drain the queue, log out.
   * @note Never throws. A failed login ends this worker only; the tasks it
   *       would have taken stay in the queue for its siblings.
   */
  void run();

  /**
   * @brief Execute one task against the (already authenticated) session.
   * @return Terminal outcome; per-task errors never escape
   */
  TaskOutcome execute(const DownloadTask &task);

  const WorkerStats &stats() const { return stats_; }
  int id() const { return id_; }

private:
  int id_;
  std::unique_ptr<RetrievalSession> session_;
  TaskQueue &queue_;
  ProgressAggregator &progress_;
  FetchTarget target_;
  RetryPolicy policy_;
  const std::atomic<bool> *cancel_;
  SleepFn sleep_;
  WorkerStats stats_;
  bool released_ = false;

  /**
   * @brief One fetch attempt streamed into task.output_path.
   * @return Bytes written
   */
  std::uint64_t fetch_to_file(const DownloadTask &task);

  void reauthenticate();
  void release_session() noexcept;
  void report(const TaskOutcome &outcome);
  bool cancelled() const;
};

} // namespace vod_fetch

#endif // VOD_FETCH_DOWNLOAD_WORKER_HPP
