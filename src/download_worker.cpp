/**
 * @file download_worker.cpp
 * @brief Download worker and retry policy implementation
 *
 * @details Implements:
 *
 *          - RetryPolicy backoff/pacing arithmetic
 *
 *          - DownloadWorker::run - session lifecycle and queue draining
 *
 *          - DownloadWorker::execute - per-task existence check and retries
 */

#include "vod_fetch/download_worker.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

#include "vod_fetch/config.hpp"
#include "vod_fetch/logging.hpp"
#include "vod_fetch/system.hpp"

namespace vod_fetch {

// **---- RetryPolicy ----**

namespace {

std::chrono::milliseconds scale(std::chrono::milliseconds unit,
                                double units) {
  return std::chrono::milliseconds(
      static_cast<long long>(unit.count() * units + 0.5));
}

} // anonymous namespace

std::chrono::milliseconds RetryPolicy::backoff(ErrorClass cls,
                                               int attempt) const {
  int step = (cls == ErrorClass::Busy) ? busy_step : default_step;
  return time_unit * ((attempt + 1) * step);
}

std::chrono::milliseconds RetryPolicy::pacing() const {
  return scale(time_unit, pacing_units);
}

std::chrono::milliseconds RetryPolicy::stagger() const {
  return scale(time_unit, stagger_units);
}

RetryPolicy RetryPolicy::from_config() {
  RetryPolicy policy;
  policy.max_retries = std::max(1, Config::max_retries());
  policy.time_unit =
      std::chrono::milliseconds(std::max(0, Config::time_unit_ms()));
  return policy;
}

// **---- Construction ----**

DownloadWorker::DownloadWorker(int id,
                               std::unique_ptr<RetrievalSession> session,
                               TaskQueue &queue, ProgressAggregator &progress,
                               FetchTarget target, RetryPolicy policy,
                               const std::atomic<bool> *cancel, SleepFn sleep)
    : id_(id), session_(std::move(session)), queue_(queue),
      progress_(progress), target_(target), policy_(policy), cancel_(cancel),
      sleep_(std::move(sleep)) {
  if (!session_) {
    throw std::invalid_argument("DownloadWorker requires a session");
  }
  if (!sleep_) {
    const std::atomic<bool> *flag = cancel_;
    sleep_ = [flag](std::chrono::milliseconds d) {
      return interruptible_sleep(d, flag);
    };
  }
}

DownloadWorker::~DownloadWorker() { release_session(); }

// **---- Main Loop ----**

void DownloadWorker::run() {
  try {
    session_->authenticate();
  } catch (const std::exception &e) {
    stats_.login_failed = true;
    LOG_ERROR("[W{}] Login failed, worker stopping: {}", id_, e.what());
    release_session();
    return;
  }
  LOG_DEBUG("[W{}] Logged in", id_);

  while (!cancelled()) {
    auto task = queue_.try_pop();
    if (!task)
      break;
    ++stats_.tasks;

    TaskOutcome outcome;
    try {
      outcome = execute(*task);
    } catch (const std::exception &e) {
      LOG_ERROR("[W{}] Error on {}: {}", id_, task->label(), e.what());
      /// A popped task always lands in a bucket
      outcome.task = *task;
      outcome.status = TaskStatus::Failed;
      outcome.bytes = 0;
      if (!remove_if_exists(task->output_path)) {
        LOG_ERROR("[W{}] Could not remove partial file {}", id_,
                  task->output_path);
      }
    }

    try {
      report(outcome);
      if (!sleep_(policy_.pacing()))
        break;
    } catch (const std::exception &e) {
      LOG_ERROR("[W{}] Error after {}: {}", id_, task->label(), e.what());
    }
  }

  if (cancelled()) {
    LOG_WARN("[W{}] Cancelled", id_);
  }
  release_session();
  LOG_DEBUG("[W{}] Finished ({} tasks, {} fetch attempts)", id_, stats_.tasks,
            stats_.fetch_attempts);
}

// **---- Task Execution ----**

TaskOutcome DownloadWorker::execute(const DownloadTask &task) {
  TaskOutcome outcome;
  outcome.task = task;

  /// Idempotent resume: a non-empty file is a finished chunk
  std::uint64_t existing = file_size_or_zero(task.output_path);
  if (existing > 0) {
    outcome.status = TaskStatus::Exists;
    outcome.bytes = existing;
    return outcome;
  }

  for (int attempt = 0; attempt < policy_.max_retries; ++attempt) {
    if (cancelled())
      break;

    ++outcome.attempts;
    ++stats_.fetch_attempts;

    ErrorClass cls = ErrorClass::Other;
    std::string reason;
    try {
      std::uint64_t written = fetch_to_file(task);
      std::uint64_t size = file_size_or_zero(task.output_path);
      if (written > 0 && size > 0) {
        outcome.status = TaskStatus::Downloaded;
        outcome.bytes = size;
        return outcome;
      }
      reason = "device returned an empty stream";
    } catch (const std::exception &e) {
      cls = classify_error(e);
      reason = e.what();
    }

    if (cancelled())
      break;

    bool last = (attempt + 1 >= policy_.max_retries);
    LOG_WARN("[W{}] {} attempt {}/{} failed ({}): {}", id_, task.label(),
             attempt + 1, policy_.max_retries, error_class_name(cls), reason);
    if (last)
      break;

    if (!sleep_(policy_.backoff(cls, attempt)))
      break;

    if (cls == ErrorClass::SessionBroken)
      reauthenticate();
  }

  /// Never leave a truncated file behind for the next run to trust
  if (!remove_if_exists(task.output_path)) {
    LOG_ERROR("[W{}] Could not remove partial file {}", id_, task.output_path);
  }
  outcome.status = TaskStatus::Failed;
  outcome.bytes = 0;
  return outcome;
}

std::uint64_t DownloadWorker::fetch_to_file(const DownloadTask &task) {
  std::ofstream out;
  std::uint64_t written = 0;
  bool write_failed = false;

  ChunkSink sink = [&](const char *data, std::size_t size) {
    if (cancelled())
      return false;
    if (!out.is_open()) {
      out.open(task.output_path, std::ios::binary | std::ios::trunc);
      if (!out) {
        write_failed = true;
        return false;
      }
    }
    out.write(data, static_cast<std::streamsize>(size));
    if (!out) {
      write_failed = true;
      return false;
    }
    written += size;
    return true;
  };

  try {
    session_->fetch(target_.channel, target_.quality, task.segment_name,
                    task.chunk_start, task.chunk_end, sink);
  } catch (const TransferAborted &) {
    if (write_failed) {
      throw std::runtime_error(
          fmt::format("cannot write {}", task.output_path));
    }
    throw;
  }

  if (out.is_open()) {
    out.close();
    if (!out) {
      throw std::runtime_error(
          fmt::format("cannot finish writing {}", task.output_path));
    }
  }
  return written;
}

void DownloadWorker::reauthenticate() {
  ++stats_.reauth_attempts;
  try {
    session_->authenticate();
    LOG_INFO("[W{}] Re-logged in", id_);
  } catch (const std::exception &e) {
    LOG_WARN("[W{}] Re-login failed: {}", id_, e.what());
  }
}

void DownloadWorker::release_session() noexcept {
  if (released_)
    return;
  released_ = true;
  session_->release();
}

// **---- Reporting ----**

void DownloadWorker::report(const TaskOutcome &outcome) {
  ProgressSnapshot p = progress_.record(outcome);
  const std::string label = outcome.task.label();

  switch (outcome.status) {
  case TaskStatus::Exists:
    LOG_INFO("[W{}] skip {} (exists: {:.1f} MB) [{}/{}]", id_, label,
             to_mib(outcome.bytes), p.completed(), p.total);
    break;
  case TaskStatus::Downloaded:
    LOG_SUCCESS("[W{}] done {} ({:.1f} MB) [{}/{}]", id_, label,
                to_mib(outcome.bytes), p.completed(), p.total);
    break;
  case TaskStatus::Failed:
    LOG_ERROR("[W{}] FAILED {} after {} attempt(s) [{}/{}]", id_, label,
              outcome.attempts, p.completed(), p.total);
    break;
  }
}

bool DownloadWorker::cancelled() const {
  return cancel_ != nullptr && cancel_->load();
}

} // namespace vod_fetch
