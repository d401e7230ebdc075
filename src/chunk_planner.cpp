/**
 * @file chunk_planner.cpp
 * @brief Chunk planning implementation
 */

#include "vod_fetch/chunk_planner.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <unordered_map>

#include <fmt/core.h>

#include "vod_fetch/logging.hpp"

namespace vod_fetch {

namespace fs = std::filesystem;

ChunkPlanner::ChunkPlanner(std::chrono::seconds chunk_duration,
                           std::string output_dir, std::string extension)
    : chunk_duration_(chunk_duration), output_dir_(std::move(output_dir)),
      extension_(std::move(extension)) {
  if (chunk_duration_.count() <= 0) {
    throw std::invalid_argument("chunk duration must be positive");
  }
}

std::string ChunkPlanner::output_path_for(const CivilDate &day,
                                          Timestamp chunk_start) const {
  std::string name = fmt::format("{}_{}.{}", format_date(day),
                                 format_compact(chunk_start), extension_);
  return (fs::path(output_dir_) / name).string();
}

std::vector<DownloadTask>
ChunkPlanner::plan(const std::vector<Segment> &segments,
                   const CivilDate &day) const {
  std::vector<DownloadTask> tasks;

  /// Times a base path has been handed out, for collision suffixes
  std::unordered_map<std::string, int> path_uses;

  int next_id = 1;
  for (const auto &segment : segments) {
    if (segment.end <= segment.start) {
      LOG_WARN("Skipping empty segment {} ({} -> {})", segment.name,
               format_datetime(segment.start), format_datetime(segment.end));
      continue;
    }

    Timestamp chunk_start = segment.start;
    while (chunk_start < segment.end) {
      Timestamp chunk_end = std::min(chunk_start + chunk_duration_, segment.end);

      DownloadTask task;
      task.id = next_id++;
      task.segment_name = segment.name;
      task.chunk_start = chunk_start;
      task.chunk_end = chunk_end;
      task.output_path = output_path_for(day, chunk_start);

      int uses = path_uses[task.output_path]++;
      if (uses > 0) {
        fs::path p(task.output_path);
        task.output_path =
            (p.parent_path() / fmt::format("{}_{}{}", p.stem().string(), uses,
                                           p.extension().string()))
                .string();
      }

      tasks.push_back(std::move(task));
      chunk_start = chunk_end;
    }
  }

  return tasks;
}

} // namespace vod_fetch
