/**
 * @file orchestrator.cpp
 * @brief Full-day download orchestration implementation
 *
 * @details Implements the DayDownloader run:
 *
 *          - Scout listing through a short-lived session
 *
 *          - Planning and queue pre-loading
 *
 *          - Staggered worker threads, one device session each
 *
 *          - Sequential summary output
 */

#include "vod_fetch/orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vod_fetch/chunk_planner.hpp"
#include "vod_fetch/logging.hpp"
#include "vod_fetch/system.hpp"
#include "vod_fetch/task_queue.hpp"

namespace vod_fetch {

namespace fs = std::filesystem;

const char *run_status_name(RunStatus status) {
  switch (status) {
  case RunStatus::Completed:
    return "completed";
  case RunStatus::NoRecordings:
    return "no recordings";
  case RunStatus::ListingFailed:
    return "listing failed";
  }
  return "unknown";
}

DayDownloader::DayDownloader(SessionFactory factory, RunOptions options,
                             const std::atomic<bool> *cancel)
    : factory_(std::move(factory)), options_(std::move(options)),
      cancel_(cancel) {
  if (!factory_) {
    throw std::invalid_argument("DayDownloader requires a session factory");
  }
  options_.num_workers = std::max(1, options_.num_workers);
}

RunSummary DayDownloader::run() {
  RunSummary summary;
  auto run_start = std::chrono::steady_clock::now();

  std::string dir_error;
  if (!ensure_directory(options_.output_dir, dir_error)) {
    summary.status = RunStatus::ListingFailed;
    summary.error =
        fmt::format("cannot create {}: {}", options_.output_dir, dir_error);
    LOG_ERROR("{}", summary.error);
    return summary;
  }

  LOG_PHASE("================== DAY DOWNLOAD ==================");
  LOG_INFO("Date: {}", format_date(options_.day));
  LOG_INFO("Channel: {}", options_.channel);
  LOG_INFO("Quality: {}", quality_label(options_.quality));
  LOG_INFO("Chunk size: {} minutes", options_.chunk_duration.count() / 60);
  LOG_INFO("Workers: {} parallel sessions", options_.num_workers);
  LOG_PHASE("==================================================");

  // **---- SCOUT ----**

  std::vector<Segment> segments;
  try {
    segments = list_day();
  } catch (const std::exception &e) {
    summary.status = RunStatus::ListingFailed;
    summary.error = e.what();
    LOG_ERROR("Error searching for recordings: {}", e.what());
    return summary;
  }

  summary.segments = segments.size();
  if (segments.empty()) {
    summary.status = RunStatus::NoRecordings;
    LOG_WARN("No recordings found for {}", format_date(options_.day));
    return summary;
  }
  LOG_INFO("Found {} recording segments", segments.size());

  // **---- PLAN ----**

  ChunkPlanner planner(options_.chunk_duration, options_.output_dir,
                       options_.extension);
  std::vector<DownloadTask> tasks = planner.plan(segments, options_.day);
  log_plan(segments, tasks);

  TaskQueue queue(tasks);
  ProgressAggregator progress(tasks.size());

  // **---- WORKERS ----**

  if (options_.num_workers > 1) {
    LOG_INFO("Starting {} workers (occasional busy replies are retried)",
             options_.num_workers);
  }

  std::vector<std::thread> workers;
  for (int i = 0; i < options_.num_workers; ++i) {
    if (i > 0 && !interruptible_sleep(options_.retry.stagger(), cancel_))
      break;
    workers.emplace_back(&DayDownloader::worker_thread, this, i + 1,
                         std::ref(queue), std::ref(progress));
  }

  for (auto &worker : workers) {
    worker.join();
  }

  summary.status = RunStatus::Completed;
  summary.progress = progress.snapshot();
  summary.failed = progress.failed_tasks();
  summary.elapsed_sec = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - run_start)
                            .count();

  print_summary(summary);
  return summary;
}

std::vector<Segment> DayDownloader::list_day() {
  SessionGuard scout(factory_());
  if (!scout.get())
    throw std::runtime_error("session factory returned no session");

  scout->authenticate();
  return scout->list_segments(options_.channel, options_.quality,
                              start_of_day(options_.day),
                              end_of_day(options_.day));
}

void DayDownloader::worker_thread(int worker_id, TaskQueue &queue,
                                  ProgressAggregator &progress) {
  std::unique_ptr<RetrievalSession> session;
  try {
    session = factory_();
  } catch (const std::exception &e) {
    LOG_ERROR("[W{}] Cannot create session: {}", worker_id, e.what());
    return;
  }
  if (!session) {
    LOG_ERROR("[W{}] Cannot create session", worker_id);
    return;
  }

  FetchTarget target{options_.channel, options_.quality};
  DownloadWorker worker(worker_id, std::move(session), queue, progress, target,
                        options_.retry, cancel_);
  worker.run();
}

void DayDownloader::log_plan(const std::vector<Segment> &segments,
                             const std::vector<DownloadTask> &tasks) const {
  double minutes = static_cast<double>(options_.chunk_duration.count()) / 60.0;
  double est_gb = tasks.size() * minutes * MAIN_STREAM_MB_PER_MIN / 1024.0;
  if (options_.quality == StreamQuality::Sub)
    est_gb /= 10.0;

  LOG_INFO("Total chunks: {} (from {} segments)", tasks.size(),
           segments.size());
  LOG_INFO("Estimated size: ~{:.1f} GB", est_gb);
  for (const auto &s : segments) {
    LOG_DEBUG("Segment {} [{} - {}]", s.name, format_datetime(s.start),
              format_datetime(s.end));
  }
}

void DayDownloader::print_summary(const RunSummary &summary) const {
  const ProgressSnapshot &p = summary.progress;
  double total_mb = to_mib(p.bytes_on_disk());
  double transferred_mb = to_mib(p.bytes_transferred);
  double speed =
      summary.elapsed_sec > 0 ? transferred_mb / summary.elapsed_sec : 0.0;

  std::error_code ec;
  fs::path location = fs::absolute(options_.output_dir, ec);
  if (ec)
    location = options_.output_dir;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= DOWNLOAD SUMMARY =================\n");
  fmt::print("{:<25} {:>25}\n", "Date:", format_date(options_.day));
  fmt::print("{:<25} {:>25}\n", "Total chunks:", p.total);
  fmt::print("{:<25} {:>25}\n", "Downloaded:", p.downloaded);
  fmt::print("{:<25} {:>25}\n", "Already present:", p.exists);
  fmt::print("{:<25} {:>25}\n", "Failed:", p.failed);
  fmt::print("{:<25} {:>25}\n", "Not attempted:", p.not_attempted());
  fmt::print("{:<25} {:>22.1f} MB\n", "Total size:", total_mb);
  fmt::print("{:<25} {:>22.1f} MB\n", "Transferred:", transferred_mb);
  fmt::print("{:<25} {:>25}\n", "Time elapsed:",
             format_elapsed(summary.elapsed_sec));
  fmt::print("{:<25} {:>20.1f} MB/s\n", "Speed:", speed);
  fmt::print("{:<25} {}\n", "Location:", location.string());
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");

  if (!summary.failed.empty()) {
    fmt::print(fg(fmt::color::red), "\nFailed chunks (rerun to resume):\n");
    for (const auto &task : summary.failed) {
      fmt::print(fg(fmt::color::red), "  - {} {}\n", task.label(),
                 fs::path(task.output_path).filename().string());
    }
  }
  std::fflush(stdout);
}

// **---- Date scan ----**

std::vector<CivilDate> scan_recording_dates(RetrievalSession &session,
                                            int channel, StreamQuality quality,
                                            const CivilDate &today, int days) {
  std::vector<CivilDate> found;
  for (int back = 0; back < days; ++back) {
    CivilDate day = add_days(today, -back);
    Timestamp start = start_of_day(day);
    try {
      auto segments = session.list_segments(channel, quality, start,
                                            start + std::chrono::hours(1));
      if (!segments.empty())
        found.push_back(day);
    } catch (const std::exception &e) {
      LOG_DEBUG("Probe of {} failed: {}", format_date(day), e.what());
    }
  }
  return found;
}

} // namespace vod_fetch
