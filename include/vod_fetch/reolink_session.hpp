/**
 * @file reolink_session.hpp
 * @brief RetrievalSession over the Reolink HTTP/JSON API
 *
 * @details Talks to /cgi-bin/api.cgi on the recorder:
 *
 *          - Login  -> token with a lease time
 *
 *          - Search -> recorded files of a channel/stream in a time range
 *
 *          - Download (with start/end) -> raw byte stream of a time slice
 *
 *          - Logout
 *
 *          Transport is libcurl (one easy handle per session, so connections
 *          are reused and never shared between threads). Request and reply
 *          bodies are nlohmann::json.
 *
 * @attention ERROR MAPPING:
 *
 *   - HTTP 5xx                         -> RemoteError (busy)
 *
 *   - HTTP 401, rspCode "login first"  -> TransportError (session invalid)
 *
 *   - connect/reset/empty-reply errors -> TransportError (AuthError at login)
 *
 *   - CURLE_OPERATION_TIMEDOUT         -> Timeout
 *
 *   - other command errors             -> RemoteError (not busy)
 */

#ifndef VOD_FETCH_REOLINK_SESSION_HPP
#define VOD_FETCH_REOLINK_SESSION_HPP

#include <chrono>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "retrieval_session.hpp"
#include "types.hpp"

namespace vod_fetch {

/**
 * @struct DeviceEndpoint
 * @brief Where and how to reach the recorder.
 */
struct DeviceEndpoint {
  std::string host; //< IP or host name, optionally with :port
  std::string username;
  std::string password;
  bool use_https = false;
  bool verify_tls = false;
  int connect_timeout_sec = 10;
  int request_timeout_sec = 600;

  /// Endpoint from the REOLINK_* / VOD_* environment
  static DeviceEndpoint from_config();
};

/**
 * @class CurlHandle
 * @brief RAII wrapper for a CURL easy handle.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CurlHandle(CurlHandle &&other) noexcept;
  CurlHandle &operator=(CurlHandle &&other) noexcept;

  CURL *get() const { return curl_; }

private:
  CURL *curl_ = nullptr;
};

/**
 * @brief Process-wide curl_global_init, safe to call from any thread.
 */
void ensure_curl_global_init();

// **---- Wire format helpers ----**

namespace reolink {

/// Device reply code for an expired or unknown token
constexpr int RSP_LOGIN_REQUIRED = -6;

/// Seconds before lease expiry at which the token is renewed
constexpr int TOKEN_RENEW_MARGIN_SEC = 60;

struct LoginToken {
  std::string name;
  int lease_sec = 0;
};

nlohmann::json time_to_json(Timestamp ts);
Timestamp time_from_json(const nlohmann::json &j);

/// YYYYMMDDHHMMSS as used by the Download command
std::string compact_time(Timestamp ts);

nlohmann::json login_request(const std::string &username,
                             const std::string &password);

nlohmann::json search_request(int channel, StreamQuality quality,
                              Timestamp start, Timestamp end);

/**
 * @brief Extract the first command reply of a response body.
 * @throws RemoteError if the body is not a JSON command reply
 */
nlohmann::json first_reply(const std::string &body);

/**
 * @brief Raise the error matching a failed command reply (code != 0).
 * @param reply One element of the reply array
 * @param login True for the Login command (failures become AuthError)
 */
[[noreturn]] void throw_command_error(const nlohmann::json &reply,
                                      bool login);

/**
 * @brief Parse a Login reply.
 * @throws AuthError if the device refused the credentials
 */
LoginToken parse_login_reply(const std::string &body);

/**
 * @brief Parse a Search reply into segments of the requested stream.
 * @note Files of the other stream and malformed entries are skipped. The
 *       result is sorted by start time.
 */
std::vector<Segment> parse_search_reply(const std::string &body,
                                        StreamQuality quality);

} // namespace reolink

/**
 * @class ReolinkSession
 * @brief One login on a Reolink camera or NVR.
 */
class ReolinkSession : public RetrievalSession {
public:
  explicit ReolinkSession(DeviceEndpoint endpoint);
  ~ReolinkSession() override = default;

  void authenticate() override;

  std::vector<Segment> list_segments(int channel, StreamQuality quality,
                                     Timestamp start, Timestamp end) override;

  void fetch(int channel, StreamQuality quality,
             const std::string &segment_name, Timestamp start, Timestamp end,
             const ChunkSink &sink) override;

  void release() noexcept override;

private:
  DeviceEndpoint endpoint_;
  CurlHandle curl_;
  std::string token_;
  std::chrono::steady_clock::time_point token_expiry_{};

  enum class RequestKind {
    Login,   //< No token; every failure is an AuthError
    Command, //< Token attached, renewed first if close to expiry
    Logout   //< Token attached as-is
  };

  std::string api_url(const std::string &query) const;

  /// Re-login if the token lease is about to run out
  void ensure_token();

  /**
   * @brief POST a JSON command to api.cgi.
   * @return Raw reply body of a 2xx response
   */
  std::string post_command(const std::string &cmd, const nlohmann::json &body,
                           RequestKind kind);

  /// Options shared by every request (timeouts, TLS, keep-alive)
  void apply_common_options(char *errbuf);
};

/// Factory creating independent ReolinkSessions for the same endpoint
SessionFactory make_reolink_factory(DeviceEndpoint endpoint);

} // namespace vod_fetch

#endif // VOD_FETCH_REOLINK_SESSION_HPP
