/**
 * @file logging.hpp
 * @brief Logging macros shared by the scout, the workers and the summary
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime-gated LOG_DEBUG (VOD_VERBOSE=1)
 *
 *          - A global log mutex so lines from concurrent workers never
 *            interleave
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress stays visible when stdout is piped.
 */

#ifndef VOD_FETCH_LOGGING_HPP
#define VOD_FETCH_LOGGING_HPP

#include <cstdio>
#include <mutex>

#include <fmt/color.h>
#include <fmt/core.h>

#include "config.hpp"

namespace vod_fetch {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_fetch::log_mutex);                    \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (vod_fetch::Config::verbose()) {                                        \
      std::lock_guard<std::mutex> lock(vod_fetch::log_mutex);                  \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_fetch::log_mutex);                    \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_fetch::log_mutex);                    \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_fetch::log_mutex);                    \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vod_fetch::log_mutex);                    \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

/**
 * @brief Bytes to mebibytes for log lines.
 */
inline double to_mib(unsigned long long bytes) {
  return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

} // namespace vod_fetch

#endif // VOD_FETCH_LOGGING_HPP
