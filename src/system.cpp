/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - SIGINT/SIGTERM driven cancellation
 *
 *          - Cancellation-aware sleeping
 *
 *          - Non-throwing filesystem helpers
 *
 *          - Time formatting utilities
 */

#include "vod_fetch/system.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace vod_fetch {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::atomic<bool> g_cancel{false};

/// Granularity at which sleeps re-check the cancellation flag
constexpr std::chrono::milliseconds SLEEP_SLICE{50};

void on_interrupt(int signum) {
  g_cancel.store(true);
  std::signal(signum, SIG_DFL);
}

} // anonymous namespace

// **---- Cancellation ----**

std::atomic<bool> &cancellation_flag() { return g_cancel; }

void install_interrupt_handlers() {
  std::signal(SIGINT, on_interrupt);
  std::signal(SIGTERM, on_interrupt);
}

bool interruptible_sleep(std::chrono::milliseconds duration,
                         const std::atomic<bool> *cancel) {
  if (!cancel) {
    std::this_thread::sleep_for(duration);
    return true;
  }

  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!cancel->load()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return true;
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(left, SLEEP_SLICE));
  }
  return false;
}

// **---- Files ----**

std::uint64_t file_size_or_zero(const std::string &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec)
    return 0;
  auto size = fs::file_size(path, ec);
  return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool remove_if_exists(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  return !ec && !fs::exists(path, ec);
}

bool ensure_directory(const std::string &path, std::string &error) {
  std::error_code ec;
  if (fs::is_directory(path, ec))
    return true;
  fs::create_directories(path, ec);
  if (ec) {
    error = ec.message();
    return false;
  }
  return true;
}

// **---- Utilities ----**

std::string format_elapsed(double seconds) {
  int total = static_cast<int>(seconds);
  return fmt::format("{}m {}s", total / 60, total % 60);
}

} // namespace vod_fetch
