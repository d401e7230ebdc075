/**
 * @file config.cpp
 * @brief Environment parsing and .env loading
 */

#include "vod_fetch/config.hpp"

#include <fstream>
#include <stdexcept>

#include "vod_fetch/logging.hpp"

namespace vod_fetch {
namespace Config {

namespace {

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  size_t first = s.find_first_not_of(ws);
  if (first == std::string::npos)
    return "";
  size_t last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

} // anonymous namespace

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  try {
    return std::stoi(val);
  } catch (const std::exception &) {
    LOG_WARN("Ignoring non-numeric {}='{}', using {}", name, val,
             default_val);
    return default_val;
  }
}

std::string get_env_string(const char *name, const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

int load_env_file(const std::string &path) {
  std::ifstream f(path);
  if (!f)
    return -1;

  int applied = 0;
  std::string line;
  while (std::getline(f, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    if (line.compare(0, 7, "export ") == 0)
      line = trim(line.substr(7));

    size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    /// overwrite = 0: the real environment always wins
    if (std::getenv(key.c_str()) == nullptr &&
        setenv(key.c_str(), value.c_str(), 0) == 0) {
      ++applied;
    }
  }
  return applied;
}

} // namespace Config
} // namespace vod_fetch
