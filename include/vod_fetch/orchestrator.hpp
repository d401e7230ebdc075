/**
 * @file orchestrator.hpp
 * @brief Full-day download orchestration
 *
 * @details The DayDownloader ties the pipeline together for one day:
 *
 *          - One scout session lists the day's recordings
 *
 *          - ChunkPlanner slices them into fixed-length tasks
 *
 *          - The TaskQueue is pre-loaded with the whole plan
 *
 *          - N DownloadWorker threads (one device session each) drain it,
 *            started with a stagger delay between them
 *
 *          - A summary table is printed once all workers have joined
 *
 * @note Worker count, chunk length and retry timing come from RunOptions,
 *       which main.cpp fills from Config and the command line.
 */

#ifndef VOD_FETCH_ORCHESTRATOR_HPP
#define VOD_FETCH_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "download_worker.hpp"
#include "retrieval_session.hpp"
#include "types.hpp"

namespace vod_fetch {

/**
 * @struct RunOptions
 * @brief Everything one day's download needs besides the device sessions.
 */
struct RunOptions {
  CivilDate day;
  int channel = 0;
  StreamQuality quality = StreamQuality::Main;
  std::string output_dir = "./downloads";
  int num_workers = DEFAULT_WORKERS;
  std::chrono::seconds chunk_duration{DEFAULT_CHUNK_MINUTES * 60};
  std::string extension = "mp4";
  RetryPolicy retry;
};

/**
 * @enum RunStatus
 * @brief How a run ended.
 */
enum class RunStatus {
  Completed,    //< Plan executed (individual chunks may still have failed)
  NoRecordings, //< The device has nothing for that day
  ListingFailed //< Scout login/listing or output directory failed
};

const char *run_status_name(RunStatus status);

/**
 * @struct RunSummary
 * @brief Final accounting of a run.
 */
struct RunSummary {
  RunStatus status = RunStatus::Completed;
  ProgressSnapshot progress;
  std::size_t segments = 0;
  double elapsed_sec = 0.0;
  std::vector<DownloadTask> failed;
  std::string error; //< Reason for ListingFailed

  bool all_succeeded() const {
    return status == RunStatus::Completed && progress.failed == 0 &&
           progress.not_attempted() == 0;
  }
};

/**
 * @class DayDownloader
 * @brief Downloads every recording of one day in fixed-length chunks.
 */
class DayDownloader {
public:
  /**
   * @param factory Creates one fresh session per call
   * @param options Day, stream and scheduling parameters
   * @param cancel Cooperative cancellation flag (nullptr = never)
   */
  DayDownloader(SessionFactory factory, RunOptions options,
                const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Execute the whole run and print its summary.
   * @note Never throws for device or per-chunk errors; they are reflected
   *       in the returned summary.
   */
  RunSummary run();

private:
  SessionFactory factory_;
  RunOptions options_;
  const std::atomic<bool> *cancel_;

  /**
   * @brief Log in with a scout session and list the day's segments.
   * @throws Whatever the session throws
   */
  std::vector<Segment> list_day();

  /**
   * @brief Thread body: create a session and run a worker on it.
   */
  void worker_thread(int worker_id, TaskQueue &queue,
                     ProgressAggregator &progress);

  void log_plan(const std::vector<Segment> &segments,
                const std::vector<DownloadTask> &tasks) const;

  void print_summary(const RunSummary &summary) const;
};

/**
 * @brief Find the days with recordings among the last `days` days.
 *
 * @details Probes the first hour of each day with list_segments(). Days
 *          whose probe fails are logged and skipped.
 *
 * @param session Authenticated session
 * @param today Most recent day to probe
 * @return Days with at least one recording, newest first
 */
std::vector<CivilDate> scan_recording_dates(RetrievalSession &session,
                                            int channel, StreamQuality quality,
                                            const CivilDate &today,
                                            int days = 30);

} // namespace vod_fetch

#endif // VOD_FETCH_ORCHESTRATOR_HPP
