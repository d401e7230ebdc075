/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          An optional .env file (KEY=VALUE lines) can seed the environment
 *          before the first getter is read; variables that are already set
 *          always win over the file.
 *
 *          Command-line flags in main.cpp override these defaults.
 */

#ifndef VOD_FETCH_CONFIG_HPP
#define VOD_FETCH_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace vod_fetch {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or unparsable
 * @return Parsed integer value or default
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
std::string get_env_string(const char *name, const std::string &default_val);

/**
 * @brief Seed the environment from a .env style file.
 *
 * @note Blank lines and lines starting with '#' are ignored, an optional
 *       leading "export " is accepted and matching single or double quotes
 *       around the value are stripped. Existing variables are not
 *       overwritten.
 *
 * @param path File to read
 * @return Number of variables set, or -1 if the file could not be opened
 */
int load_env_file(const std::string &path);

// **---- DEVICE ----**

inline std::string host() {
  static std::string val = get_env_string("REOLINK_HOST", "");
  return val;
}

inline std::string username() {
  static std::string val = get_env_string("REOLINK_USERNAME", "admin");
  return val;
}

inline std::string password() {
  static std::string val = get_env_string("REOLINK_PASSWORD", "");
  return val;
}

/// Camera channel on an NVR (0 for a standalone camera)
inline int channel() {
  static int val = get_env_int("REOLINK_CHANNEL", 0);
  return val;
}

/// Talk to the device over https instead of http
inline bool use_https() {
  static bool val = (get_env_int("VOD_USE_HTTPS", 0) != 0);
  return val;
}

/**
 * @brief Verify the device's TLS certificate.
 * @note Recorders ship self-signed certificates, so this is off by default.
 */
inline bool verify_tls() {
  static bool val = (get_env_int("VOD_VERIFY_TLS", 0) != 0);
  return val;
}

inline int connect_timeout_sec() {
  static int val = get_env_int("VOD_CONNECT_TIMEOUT_SEC", 10);
  return val;
}

/**
 * @brief Whole-request timeout for one fetch or listing call.
 * @note A 5 minute main-stream chunk is ~185 MB; keep this well above the
 *       transfer time on a slow link.
 */
inline int request_timeout_sec() {
  static int val = get_env_int("VOD_REQUEST_TIMEOUT_SEC", 600);
  return val;
}

// **---- SCHEDULING ----**

/// Length of one download task in minutes
inline int chunk_minutes() {
  static int val = get_env_int("VOD_CHUNK_MINUTES", 5);
  return val;
}

/**
 * @brief Number of parallel workers (one device session each).
 * @note The device's concurrency tolerance, not local resources, is the
 *       limit. 1-2 is the safe range for most recorders.
 */
inline int workers() {
  static int val = get_env_int("VOD_WORKERS", 2);
  return val;
}

/// Fetch attempts per task before it is marked failed
inline int max_retries() {
  static int val = get_env_int("VOD_MAX_RETRIES", 5);
  return val;
}

/**
 * @brief Length of one backoff "unit" in milliseconds.
 * @note Busy backoff is (attempt+1)*5 units, other backoff (attempt+1)*2
 *       units, pacing 0.3 units and worker stagger 1 unit.
 */
inline int time_unit_ms() {
  static int val = get_env_int("VOD_TIME_UNIT_MS", 1000);
  return val;
}

// **---- OUTPUT ----**

inline std::string output_dir() {
  static std::string val = get_env_string("VOD_OUTPUT_DIR", "./downloads");
  return val;
}

/// Extension of the downloaded chunk files
inline std::string extension() {
  static std::string val = get_env_string("VOD_EXTENSION", "mp4");
  return val;
}

/// Enable LOG_DEBUG output
inline bool verbose() {
  static bool val = (get_env_int("VOD_VERBOSE", 0) != 0);
  return val;
}

} // namespace Config
} // namespace vod_fetch

#endif // VOD_FETCH_CONFIG_HPP
