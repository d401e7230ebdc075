/**
 * @file main.cpp
 * @brief Entry point for vod_fetch
 *
 * @details Main entry point that handles:
 *
 *          - .env loading and command-line argument parsing
 *
 *          - Date scan mode: list the days that have recordings
 *
 *          - Download mode: fetch one full day with DayDownloader
 *
 * @note Flags override the REOLINK_* / VOD_* environment. Exit codes:
 *       0 = everything present, 1 = failures or listing error, 2 = usage.
 */

#include <chrono>
#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "vod_fetch/config.hpp"
#include "vod_fetch/download_worker.hpp"
#include "vod_fetch/logging.hpp"
#include "vod_fetch/orchestrator.hpp"
#include "vod_fetch/reolink_session.hpp"
#include "vod_fetch/system.hpp"

using namespace vod_fetch;

namespace {

constexpr int EXIT_USAGE = 2;

/// More sessions than this mostly produce busy replies from the device
constexpr int RECOMMENDED_MAX_WORKERS = 2;

/**
 * @struct CliArgs
 * @brief Command-line values; unset fields fall back to Config.
 */
struct CliArgs {
  std::optional<std::string> host;
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::optional<std::string> date;
  std::optional<std::string> output;
  std::optional<std::string> env_file;
  std::optional<int> channel;
  std::optional<int> workers;
  std::optional<int> chunk_minutes;
  StreamQuality quality = StreamQuality::Main;
  bool list_dates = false;
  bool help = false;
};

void print_usage(const char *prog) {
  fmt::print("Usage: {} [options]\n\n"
             "Download a full day of recordings from a Reolink camera/NVR.\n\n"
             "  --host HOST           Device address (REOLINK_HOST)\n"
             "  --username USER       Login name (REOLINK_USERNAME, admin)\n"
             "  --password PASS       Password (REOLINK_PASSWORD)\n"
             "  --date YYYY-MM-DD     Day to download (omit to list dates)\n"
             "  --channel N           Camera channel (REOLINK_CHANNEL, 0)\n"
             "  --quality high|low    Main or sub stream (high)\n"
             "  --workers N           Parallel sessions (VOD_WORKERS, 2)\n"
             "  --output DIR          Output directory (VOD_OUTPUT_DIR)\n"
             "  --chunk-minutes N     Chunk length (VOD_CHUNK_MINUTES, 5)\n"
             "  --list-dates          List days with recordings and exit\n"
             "  --env-file PATH       Load KEY=VALUE settings (default .env)\n"
             "  --help                Show this help\n",
             prog);
}

bool parse_int(const std::string &text, int &out) {
  try {
    size_t used = 0;
    int val = std::stoi(text, &used);
    if (used != text.size())
      return false;
    out = val;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

/**
 * @brief Parse argv into CliArgs.
 * @return false (after logging the reason) on malformed arguments
 */
bool parse_args(int argc, char *argv[], CliArgs &args) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      continue;
    }
    if (arg == "--list-dates") {
      args.list_dates = true;
      continue;
    }

    if (i + 1 >= argc) {
      LOG_ERROR("Missing value for {}", arg);
      return false;
    }
    std::string value = argv[++i];

    if (arg == "--host") {
      args.host = value;
    } else if (arg == "--username") {
      args.username = value;
    } else if (arg == "--password") {
      args.password = value;
    } else if (arg == "--date") {
      args.date = value;
    } else if (arg == "--output") {
      args.output = value;
    } else if (arg == "--env-file") {
      args.env_file = value;
    } else if (arg == "--quality") {
      if (value == "high") {
        args.quality = StreamQuality::Main;
      } else if (value == "low") {
        args.quality = StreamQuality::Sub;
      } else {
        LOG_ERROR("--quality must be high or low, got '{}'", value);
        return false;
      }
    } else if (arg == "--channel" || arg == "--workers" ||
               arg == "--chunk-minutes") {
      int n = 0;
      if (!parse_int(value, n) || n < 0 || (arg != "--channel" && n == 0)) {
        LOG_ERROR("Invalid value for {}: '{}'", arg, value);
        return false;
      }
      if (arg == "--channel")
        args.channel = n;
      else if (arg == "--workers")
        args.workers = n;
      else
        args.chunk_minutes = n;
    } else {
      LOG_ERROR("Unknown option: {}", arg);
      return false;
    }
  }
  return true;
}

int list_dates(const SessionFactory &factory, int channel,
               StreamQuality quality) {
  LOG_INFO("Scanning the last 30 days for recordings...");
  std::vector<CivilDate> dates;
  try {
    SessionGuard session(factory());
    session->authenticate();
    dates = scan_recording_dates(*session, channel, quality, local_today());
  } catch (const std::exception &e) {
    LOG_ERROR("Cannot connect to device: {}", e.what());
    return 1;
  }

  if (dates.empty()) {
    LOG_WARN("No recordings found in the past 30 days");
    return 0;
  }

  CivilDate today = local_today();
  LOG_PHASE("Recording dates:");
  for (const auto &d : dates) {
    auto age = days_from_civil(today) - days_from_civil(d);
    if (age == 0)
      LOG_INFO("  {} - today", format_date(d));
    else
      LOG_INFO("  {} - {} days ago", format_date(d), age);
  }
  LOG_INFO("Download one with --date YYYY-MM-DD");
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  CliArgs args;
  if (!parse_args(argc, argv, args)) {
    print_usage(argv[0]);
    return EXIT_USAGE;
  }
  if (args.help) {
    print_usage(argv[0]);
    return 0;
  }

  /// Must run before the first Config getter memoizes its value
  if (args.env_file) {
    int applied = Config::load_env_file(*args.env_file);
    if (applied < 0) {
      LOG_ERROR("Cannot read env file {}", *args.env_file);
      return EXIT_USAGE;
    }
    LOG_DEBUG("Loaded {} settings from {}", applied, *args.env_file);
  } else {
    Config::load_env_file(".env");
  }

  DeviceEndpoint endpoint = DeviceEndpoint::from_config();
  if (args.host)
    endpoint.host = *args.host;
  if (args.username)
    endpoint.username = *args.username;
  if (args.password)
    endpoint.password = *args.password;

  if (endpoint.host.empty() || endpoint.password.empty()) {
    LOG_ERROR("Device host and password are required "
              "(--host/--password or REOLINK_HOST/REOLINK_PASSWORD)");
    print_usage(argv[0]);
    return EXIT_USAGE;
  }

  int channel = args.channel.value_or(Config::channel());

  install_interrupt_handlers();
  try {
    ensure_curl_global_init();
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
  SessionFactory factory = make_reolink_factory(endpoint);

  if (args.list_dates || !args.date) {
    return list_dates(factory, channel, args.quality);
  }

  // **---- DOWNLOAD MODE ----**

  std::optional<CivilDate> day = parse_date(*args.date);
  if (!day) {
    LOG_ERROR("Invalid date '{}' (expected YYYY-MM-DD)", *args.date);
    return EXIT_USAGE;
  }

  RunOptions options;
  options.day = *day;
  options.channel = channel;
  options.quality = args.quality;
  options.output_dir = args.output.value_or(Config::output_dir());
  options.num_workers = args.workers.value_or(Config::workers());
  options.chunk_duration = std::chrono::minutes(
      args.chunk_minutes.value_or(Config::chunk_minutes()));
  options.extension = Config::extension();
  options.retry = RetryPolicy::from_config();

  if (options.num_workers < 1 || options.chunk_duration.count() <= 0) {
    LOG_ERROR("Workers and chunk length must be positive");
    return EXIT_USAGE;
  }
  if (options.num_workers > RECOMMENDED_MAX_WORKERS) {
    LOG_WARN("{} workers requested; the device usually serves at most {} "
             "sessions without busy replies",
             options.num_workers, RECOMMENDED_MAX_WORKERS);
  }

  LOG_INFO("vod_fetch - {} on {}", format_date(options.day), endpoint.host);

  DayDownloader downloader(factory, options, &cancellation_flag());
  RunSummary summary = downloader.run();

  switch (summary.status) {
  case RunStatus::NoRecordings:
    return 0;
  case RunStatus::ListingFailed:
    return 1;
  case RunStatus::Completed:
    break;
  }

  if (cancellation_flag().load()) {
    LOG_WARN("Interrupted; rerun the same command to resume");
  }
  return summary.all_succeeded() ? 0 : 1;
}
