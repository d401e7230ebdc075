/**
 * @file retrieval_session.hpp
 * @brief Abstract connection to the recording device
 *
 * @details A RetrievalSession is one authenticated login on the device.
 *          The scout and every worker create their own session through a
 *          SessionFactory; sessions are never shared between threads.
 *
 * @attention LIFECYCLE:
 *
 *   - authenticate() before the first list_segments()/fetch()
 *
 *   - release() exactly once when done, including on error paths
 *     (SessionGuard does this from its destructor)
 */

#ifndef VOD_FETCH_RETRIEVAL_SESSION_HPP
#define VOD_FETCH_RETRIEVAL_SESSION_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "types.hpp"

namespace vod_fetch {

/**
 * @brief Receives the fetched byte stream one chunk at a time.
 * @return false to abort the transfer (fetch then throws TransferAborted)
 */
using ChunkSink = std::function<bool(const char *data, std::size_t size)>;

/**
 * @class RetrievalSession
 * @brief One login on the device. Not thread-safe.
 */
class RetrievalSession {
public:
  virtual ~RetrievalSession() = default;

  /**
   * @brief Log in (or log in again on the same object).
   * @throws AuthError on rejected credentials or unreachable host
   */
  virtual void authenticate() = 0;

  /**
   * @brief List recorded segments overlapping [start, end].
   * @throws RemoteError, TransportError or Timeout
   */
  virtual std::vector<Segment> list_segments(int channel,
                                             StreamQuality quality,
                                             Timestamp start,
                                             Timestamp end) = 0;

  /**
   * @brief Stream the [start, end) slice of a segment into sink.
   * @throws RemoteError (busy flag set for overload), TransportError,
   *         Timeout or TransferAborted
   */
  virtual void fetch(int channel, StreamQuality quality,
                     const std::string &segment_name, Timestamp start,
                     Timestamp end, const ChunkSink &sink) = 0;

  /**
   * @brief Log out. Best effort: never throws.
   */
  virtual void release() noexcept = 0;
};

/// Creates a fresh, unauthenticated session
using SessionFactory = std::function<std::unique_ptr<RetrievalSession>()>;

/**
 * @class SessionGuard
 * @brief RAII owner that releases its session on scope exit.
 */
class SessionGuard {
public:
  explicit SessionGuard(std::unique_ptr<RetrievalSession> session)
      : session_(std::move(session)) {}

  ~SessionGuard() {
    if (session_)
      session_->release();
  }

  SessionGuard(const SessionGuard &) = delete;
  SessionGuard &operator=(const SessionGuard &) = delete;

  RetrievalSession &operator*() const { return *session_; }
  RetrievalSession *operator->() const { return session_.get(); }
  RetrievalSession *get() const { return session_.get(); }

private:
  std::unique_ptr<RetrievalSession> session_;
};

} // namespace vod_fetch

#endif // VOD_FETCH_RETRIEVAL_SESSION_HPP
