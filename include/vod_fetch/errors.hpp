/**
 * @file errors.hpp
 * @brief Error taxonomy for device sessions and its retry classification
 *
 * @details Sessions report failures by throwing one of the RetrievalError
 *          subclasses below. Workers never inspect messages: classify_error()
 *          maps the dynamic type (and, for RemoteError, the busy flag) onto
 *          the three retry policies.
 *
 * @attention MAPPING:
 *
 *   - RemoteError with busy() == true         -> ErrorClass::Busy
 *
 *   - TransportError (reset, stale session)    -> ErrorClass::SessionBroken
 *
 *   - Timeout, other RemoteError, local I/O,
 *     anything else                            -> ErrorClass::Other
 */

#ifndef VOD_FETCH_ERRORS_HPP
#define VOD_FETCH_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace vod_fetch {

/**
 * @class RetrievalError
 * @brief Base of all errors raised by a RetrievalSession.
 */
class RetrievalError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @class AuthError
 * @brief Credentials rejected or host unreachable during login.
 * @note Fatal for the session that raised it, never for its siblings.
 */
class AuthError : public RetrievalError {
public:
  using RetrievalError::RetrievalError;
};

/**
 * @class RemoteError
 * @brief The device answered, but with an error.
 */
class RemoteError : public RetrievalError {
public:
  /**
   * @param message Description for logs
   * @param http_status HTTP status of the reply (0 if not applicable)
   * @param device_code Device "rspCode" (0 if not applicable)
   * @param busy True if the device reported overload (HTTP 5xx)
   */
  RemoteError(const std::string &message, int http_status, int device_code,
              bool busy);

  int http_status() const { return http_status_; }
  int device_code() const { return device_code_; }
  bool busy() const { return busy_; }

private:
  int http_status_;
  int device_code_;
  bool busy_;
};

/**
 * @class TransportError
 * @brief Connection reset/refused or the session token was invalidated.
 */
class TransportError : public RetrievalError {
public:
  using RetrievalError::RetrievalError;
};

/**
 * @class Timeout
 * @brief The request did not complete within the configured timeout.
 */
class Timeout : public RetrievalError {
public:
  using RetrievalError::RetrievalError;
};

/**
 * @class TransferAborted
 * @brief The fetch sink asked to stop (cancellation or local write failure).
 */
class TransferAborted : public RetrievalError {
public:
  using RetrievalError::RetrievalError;
};

/**
 * @enum ErrorClass
 * @brief Retry policy selector for a failed fetch attempt.
 */
enum class ErrorClass {
  Busy,          //< Device overloaded: long backoff
  SessionBroken, //< Stale session: short backoff + re-login
  Other          //< Anything else: short backoff
};

/**
 * @brief Classify a failed attempt into one of the retry policies.
 */
ErrorClass classify_error(const std::exception &error);

const char *error_class_name(ErrorClass cls);

} // namespace vod_fetch

#endif // VOD_FETCH_ERRORS_HPP
