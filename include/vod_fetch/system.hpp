/**
 * @file system.hpp
 * @brief System utilities: cancellation, sleeping and file helpers
 *
 * @details Provides:
 *
 *          - Process-wide cancellation flag driven by SIGINT/SIGTERM
 *
 *          - Sleeps that wake early when cancellation is requested
 *
 *          - Non-throwing file size / removal / directory helpers
 *
 *          - Time formatting utilities
 *
 * @note The first SIGINT/SIGTERM requests a cooperative stop (workers finish
 *       or abandon their current chunk and exit). The handler then restores
 *       the default action, so a second signal kills the process.
 */

#ifndef VOD_FETCH_SYSTEM_HPP
#define VOD_FETCH_SYSTEM_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace vod_fetch {

// **---- Cancellation ----**

/// Flag set by the interrupt handler
std::atomic<bool> &cancellation_flag();

/**
 * @brief Route SIGINT and SIGTERM to cancellation_flag().
 */
void install_interrupt_handlers();

/**
 * @brief Sleep for the given duration, waking early on cancellation.
 *
 * @param duration How long to sleep
 * @param cancel Flag to poll (nullptr = plain sleep)
 * @return false if the sleep was cut short by cancellation
 */
bool interruptible_sleep(std::chrono::milliseconds duration,
                         const std::atomic<bool> *cancel);

// **---- Files ----**

/**
 * @brief Size of a regular file.
 * @return Size in bytes, or 0 if missing, not a regular file or unreadable
 */
std::uint64_t file_size_or_zero(const std::string &path);

/**
 * @brief Remove a file if it exists.
 * @return true if the file is gone afterwards
 */
bool remove_if_exists(const std::string &path);

/**
 * @brief Create a directory (and parents) if absent.
 * @param error Output: reason on failure
 * @return true if the directory exists afterwards
 */
bool ensure_directory(const std::string &path, std::string &error);

// **---- Utilities ----**

/**
 * @brief Format seconds as "Xm Ys".
 * @param seconds Time in seconds
 */
std::string format_elapsed(double seconds);

} // namespace vod_fetch

#endif // VOD_FETCH_SYSTEM_HPP
