/**
 * @file types.hpp
 * @brief Core data types and constants for vod_fetch
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Retry and pacing constants
 *
 *          - Segment for recordings listed by the device
 *
 *          - DownloadTask for work queue items
 *
 *          - TaskOutcome and ProgressSnapshot for progress accounting
 */

#ifndef VOD_FETCH_TYPES_HPP
#define VOD_FETCH_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "civil_time.hpp"

namespace vod_fetch {

// **----- CONSTANTS -----**

/// Default slicing window for one download task
constexpr int DEFAULT_CHUNK_MINUTES = 5;

/// Default number of fetch attempts per task
constexpr int DEFAULT_MAX_RETRIES = 5;

/**
 * @brief Default number of concurrent device sessions.
 * @note The device serializes requests internally; more than two sessions
 *       mostly produces busy replies.
 */
constexpr int DEFAULT_WORKERS = 2;

/**
 * @brief Approximate main-stream bitrate used for the pre-run size estimate.
 * @note The sub stream is roughly a tenth of this.
 */
constexpr double MAIN_STREAM_MB_PER_MIN = 37.0;

// **----- DATA STRUCTURES -----**

/**
 * @enum StreamQuality
 * @brief Which encoder stream of the camera to download.
 */
enum class StreamQuality {
  Main, //< Full resolution ("high")
  Sub   //< Reduced resolution ("low")
};

/// Device-side stream name ("main" / "sub")
const char *stream_name(StreamQuality quality);

/// Human readable label used in logs
const char *quality_label(StreamQuality quality);

/**
 * @struct Segment
 * @brief One continuously recorded file as reported by the device.
 */
struct Segment {
  std::string name; //< Opaque device file name
  Timestamp start;  //< First second covered
  Timestamp end;    //< End of coverage (exclusive)
};

/**
 * @struct DownloadTask
 * @brief A work unit for the download queue.
 * @note Covers [chunk_start, chunk_end) of a single segment.
 */
struct DownloadTask {
  int id = 0;               //< Plan order, 1-based
  std::string segment_name; //< Source segment on the device
  Timestamp chunk_start;    //< Start of the slice
  Timestamp chunk_end;      //< End of the slice (exclusive)
  std::string output_path;  //< Deterministic destination file

  /// "HH:MM-HH:MM" label used in log lines
  std::string label() const;
};

/**
 * @enum TaskStatus
 * @brief Terminal state of one executed task.
 */
enum class TaskStatus {
  Exists,     //< Output already present, nothing fetched
  Downloaded, //< Fetched in this run
  Failed      //< Retries exhausted (or cancelled)
};

const char *status_name(TaskStatus status);

/**
 * @struct TaskOutcome
 * @brief Result reported by a worker after executing one task.
 */
struct TaskOutcome {
  DownloadTask task;
  TaskStatus status = TaskStatus::Failed;
  std::uint64_t bytes = 0; //< File size on disk (0 for failures)
  int attempts = 0;        //< Fetch attempts made (0 for Exists)
};

/**
 * @struct ProgressSnapshot
 * @brief Consistent copy of the shared progress counters.
 */
struct ProgressSnapshot {
  std::size_t downloaded = 0;
  std::size_t exists = 0;
  std::size_t failed = 0;
  std::size_t total = 0;
  std::uint64_t bytes_transferred = 0; //< Bytes fetched in this run
  std::uint64_t bytes_existing = 0;    //< Bytes found from earlier runs

  std::size_t completed() const { return downloaded + exists + failed; }
  std::size_t not_attempted() const { return total - completed(); }
  std::uint64_t bytes_on_disk() const {
    return bytes_transferred + bytes_existing;
  }
};

} // namespace vod_fetch

#endif // VOD_FETCH_TYPES_HPP
