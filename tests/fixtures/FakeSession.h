// Scripted in-memory device for worker and orchestrator tests.
// Every FakeSession created by FakeDevice::factory() shares the device state,
// so counters cover the scout and all worker sessions of a run.

#ifndef VOD_FETCH_TESTS_FIXTURES_FAKE_SESSION_H_
#define VOD_FETCH_TESTS_FIXTURES_FAKE_SESSION_H_

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "vod_fetch/errors.hpp"
#include "vod_fetch/retrieval_session.hpp"

namespace vod_fetch::tests::fixtures {

// What a single fetch() call does.
enum class FetchStep {
  Ok,      // stream the payload
  Busy,    // RemoteError with busy flag (HTTP 503)
  Broken,  // TransportError (session invalidated)
  Timeout, // Timeout
  Empty,   // succeed without a single byte
  PartialThenReset  // stream half the payload, then TransportError
};

class FakeDevice : public std::enable_shared_from_this<FakeDevice> {
 public:
  // Configuration (set before the run starts).
  std::vector<Segment> segments;
  std::string payload = "fake-video-payload";
  bool fail_login = false;
  bool fail_reauth = false;  // every login after a session's first one fails
  bool fail_listing = false;
  std::chrono::milliseconds fetch_delay{0};
  std::set<std::string> always_busy;  // chunk keys (format_compact of start)

  // Counters.
  std::atomic<int> sessions_created{0};
  std::atomic<int> auth_calls{0};
  std::atomic<int> list_calls{0};
  std::atomic<int> fetch_calls{0};
  std::atomic<int> release_calls{0};
  std::atomic<int> max_in_flight_per_chunk{0};

  void script(std::initializer_list<FetchStep> steps) {
    std::lock_guard<std::mutex> lock(mutex_);
    steps_.insert(steps_.end(), steps.begin(), steps.end());
  }

  SessionFactory factory() {
    std::shared_ptr<FakeDevice> self = shared_from_this();
    return [self]() -> std::unique_ptr<RetrievalSession> {
      int id = ++self->sessions_created;
      return std::make_unique<Session>(self, id);
    };
  }

  // Sessions that fetched the given chunk.
  std::set<int> fetchers_of(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchers_[key];
  }

  std::size_t distinct_chunks_fetched() {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchers_.size();
  }

 private:
  class Session : public RetrievalSession {
   public:
    Session(std::shared_ptr<FakeDevice> device, int id)
        : device_(std::move(device)), id_(id) {}

    void authenticate() override {
      ++device_->auth_calls;
      if (device_->fail_login) throw AuthError("login rejected");
      if (logged_in_ && device_->fail_reauth)
        throw AuthError("re-login rejected");
      logged_in_ = true;
    }

    std::vector<Segment> list_segments(int, StreamQuality, Timestamp start,
                                       Timestamp end) override {
      ++device_->list_calls;
      if (device_->fail_listing)
        throw RemoteError("search failed", 500, 0, true);
      std::vector<Segment> out;
      for (const auto& s : device_->segments) {
        if (s.end > start && s.start <= end) out.push_back(s);
      }
      return out;
    }

    void fetch(int, StreamQuality, const std::string&, Timestamp start,
               Timestamp, const ChunkSink& sink) override {
      ++device_->fetch_calls;
      const std::string key = format_compact(start);
      device_->enter(key, id_);
      struct Leave {
        FakeDevice* d;
        std::string k;
        ~Leave() { d->leave(k); }
      } leave{device_.get(), key};

      if (device_->fetch_delay.count() > 0)
        std::this_thread::sleep_for(device_->fetch_delay);

      FetchStep step = device_->next_step(key);
      switch (step) {
        case FetchStep::Busy:
          throw RemoteError("HTTP 503", 503, 0, true);
        case FetchStep::Broken:
          throw TransportError("please login first");
        case FetchStep::Timeout:
          throw Timeout("timed out");
        case FetchStep::Empty:
          return;
        case FetchStep::PartialThenReset: {
          const std::string& data = device_->payload;
          if (!sink(data.data(), data.size() / 2))
            throw TransferAborted("transfer aborted by receiver");
          throw TransportError("connection reset by peer");
        }
        case FetchStep::Ok:
          break;
      }
      const std::string& data = device_->payload;
      if (!data.empty() && !sink(data.data(), data.size()))
        throw TransferAborted("transfer aborted by receiver");
    }

    void release() noexcept override { ++device_->release_calls; }

   private:
    std::shared_ptr<FakeDevice> device_;
    int id_;
    bool logged_in_ = false;
  };

  FetchStep next_step(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (always_busy.count(key)) return FetchStep::Busy;
    if (steps_.empty()) return FetchStep::Ok;
    FetchStep step = steps_.front();
    steps_.pop_front();
    return step;
  }

  void enter(const std::string& key, int session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    fetchers_[key].insert(session_id);
    int now = ++in_flight_[key];
    if (now > max_in_flight_per_chunk.load()) max_in_flight_per_chunk = now;
  }

  void leave(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_[key];
  }

  std::mutex mutex_;
  std::deque<FetchStep> steps_;
  std::map<std::string, int> in_flight_;
  std::map<std::string, std::set<int>> fetchers_;
};

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  TempDir() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string("vod_fetch_") +
                       (info ? info->test_suite_name() : "suite") + "_" +
                       (info ? info->name() : "test") + "_" +
                       std::to_string(::getpid());
    path_ = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string str() const { return path_.string(); }
  std::filesystem::path path() const { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace vod_fetch::tests::fixtures

#endif  // VOD_FETCH_TESTS_FIXTURES_FAKE_SESSION_H_
