/**
 * @file chunk_planner.hpp
 * @brief Partition a day's recordings into fixed-length download tasks
 *
 * @details For each segment the planner walks forward from segment.start in
 *          steps of chunk_duration and clamps the final chunk to
 *          segment.end, so the tasks of one segment tile it exactly.
 *
 *          Output names depend only on (day, chunk_start):
 *
 *            {output_dir}/{YYYY-MM-DD}_{YYYYMMDD_HHMMSS}.{ext}
 *
 *          which is what lets a rerun find the chunks of an earlier run.
 */

#ifndef VOD_FETCH_CHUNK_PLANNER_HPP
#define VOD_FETCH_CHUNK_PLANNER_HPP

#include <chrono>
#include <string>
#include <vector>

#include "types.hpp"

namespace vod_fetch {

/**
 * @class ChunkPlanner
 * @brief Builds the ordered task list for one day.
 */
class ChunkPlanner {
public:
  /**
   * @param chunk_duration Maximum length of a task (must be positive)
   * @param output_dir Directory the chunk files are written to
   * @param extension File extension without the dot
   * @throws std::invalid_argument if chunk_duration is not positive
   */
  ChunkPlanner(std::chrono::seconds chunk_duration, std::string output_dir,
               std::string extension = "mp4");

  /**
   * @brief Plan the tasks for all segments of a day.
   *
   * @note Segments with end <= start are skipped. When two overlapping
   *       segments produce chunks starting on the same second, the later
   *       task's file gets a "_N" suffix so every task owns its own file.
   *
   * @param segments Segments as listed by the device
   * @param day The day being downloaded (prefix of the file names)
   * @return Tasks in segment order, ids starting at 1 (empty if no segments)
   */
  std::vector<DownloadTask> plan(const std::vector<Segment> &segments,
                                 const CivilDate &day) const;

  /// Output path for a chunk of the given day
  std::string output_path_for(const CivilDate &day,
                              Timestamp chunk_start) const;

  std::chrono::seconds chunk_duration() const { return chunk_duration_; }

private:
  std::chrono::seconds chunk_duration_;
  std::string output_dir_;
  std::string extension_;
};

} // namespace vod_fetch

#endif // VOD_FETCH_CHUNK_PLANNER_HPP
