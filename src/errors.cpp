/**
 * @file errors.cpp
 * @brief Error taxonomy implementation
 */

#include "vod_fetch/errors.hpp"

namespace vod_fetch {

RemoteError::RemoteError(const std::string &message, int http_status,
                         int device_code, bool busy)
    : RetrievalError(message), http_status_(http_status),
      device_code_(device_code), busy_(busy) {}

ErrorClass classify_error(const std::exception &error) {
  if (const auto *remote = dynamic_cast<const RemoteError *>(&error)) {
    return remote->busy() ? ErrorClass::Busy : ErrorClass::Other;
  }
  if (dynamic_cast<const TransportError *>(&error) != nullptr) {
    return ErrorClass::SessionBroken;
  }
  return ErrorClass::Other;
}

const char *error_class_name(ErrorClass cls) {
  switch (cls) {
  case ErrorClass::Busy:
    return "busy";
  case ErrorClass::SessionBroken:
    return "session";
  case ErrorClass::Other:
    return "error";
  }
  return "error";
}

} // namespace vod_fetch
