/**
 * @file types.cpp
 * @brief Names and labels for core data types
 */

#include "vod_fetch/types.hpp"

#include <fmt/core.h>

namespace vod_fetch {

const char *stream_name(StreamQuality quality) {
  return quality == StreamQuality::Main ? "main" : "sub";
}

const char *quality_label(StreamQuality quality) {
  return quality == StreamQuality::Main ? "HIGH (main)" : "LOW (sub)";
}

const char *status_name(TaskStatus status) {
  switch (status) {
  case TaskStatus::Exists:
    return "exists";
  case TaskStatus::Downloaded:
    return "downloaded";
  case TaskStatus::Failed:
    return "failed";
  }
  return "unknown";
}

std::string DownloadTask::label() const {
  return fmt::format("{}-{}", format_hhmm(chunk_start), format_hhmm(chunk_end));
}

} // namespace vod_fetch
