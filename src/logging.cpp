/**
 * @file logging.cpp
 * @brief Logging globals
 */

#include "vod_fetch/logging.hpp"

namespace vod_fetch {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

} // namespace vod_fetch
