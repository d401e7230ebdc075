/**
 * @file reolink_session.cpp
 * @brief Reolink HTTP/JSON session implementation
 *
 * @details Implements:
 *
 *          - CurlHandle RAII wrapper and one-time global curl init
 *
 *          - JSON request builders / reply parsers (reolink namespace)
 *
 *          - ReolinkSession: login, search, streamed download, logout
 */

#include "vod_fetch/reolink_session.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

#include "vod_fetch/config.hpp"
#include "vod_fetch/errors.hpp"
#include "vod_fetch/logging.hpp"

namespace vod_fetch {

using json = nlohmann::json;

// **---- Internal Helpers ----**

namespace {

/// Bytes of a non-video reply kept for error reporting
constexpr size_t MAX_ERROR_BODY = 64 * 1024;

/// A stream slower than 1 byte/s for this long is treated as a timeout
constexpr long STALL_TIMEOUT_SEC = 60;

size_t collect_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  body->append(ptr, size * nmemb);
  return size * nmemb;
}

/**
 * @struct StreamContext
 * @brief State shared with the Download write callback.
 * @note The first callback decides whether the reply is video (forwarded to
 *       the sink) or an error document (kept for diagnosis).
 */
struct StreamContext {
  CURL *curl = nullptr;
  const ChunkSink *sink = nullptr;
  bool decided = false;
  bool pass_through = false;
  bool aborted = false;
  std::string error_body;
  std::exception_ptr error; //< Exception thrown by the sink, rethrown later
};

bool is_document_reply(CURL *curl) {
  char *type = nullptr;
  if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &type) != CURLE_OK ||
      type == nullptr)
    return false;
  std::string t(type);
  std::transform(t.begin(), t.end(), t.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return t.compare(0, 5, "text/") == 0 ||
         t.find("application/json") != std::string::npos;
}

size_t stream_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *ctx = static_cast<StreamContext *>(userdata);
  const size_t n = size * nmemb;

  if (!ctx->decided) {
    long http = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http);
    ctx->pass_through =
        http >= 200 && http < 300 && !is_document_reply(ctx->curl);
    ctx->decided = true;
  }

  if (!ctx->pass_through) {
    if (ctx->error_body.size() < MAX_ERROR_BODY)
      ctx->error_body.append(ptr, std::min(n, MAX_ERROR_BODY));
    return n;
  }

  /// Exceptions must not unwind through libcurl
  try {
    if (!(*ctx->sink)(ptr, n)) {
      ctx->aborted = true;
      return 0;
    }
  } catch (...) {
    ctx->error = std::current_exception();
    return 0;
  }
  return n;
}

[[noreturn]] void throw_transport(CURLcode code, const char *errbuf,
                                  bool login, const std::string &what) {
  std::string msg = fmt::format("{}: {}", what,
                                (errbuf && errbuf[0]) ? errbuf
                                                      : curl_easy_strerror(code));
  if (login)
    throw AuthError(msg);
  if (code == CURLE_OPERATION_TIMEDOUT)
    throw Timeout(msg);
  throw TransportError(msg);
}

void check_http_status(long http, bool login, const std::string &what) {
  if (http >= 200 && http < 300)
    return;
  std::string msg = fmt::format("{}: HTTP {}", what, http);
  if (login)
    throw AuthError(msg);
  if (http >= 500)
    throw RemoteError(msg + " (device busy)", static_cast<int>(http), 0, true);
  if (http == 401)
    throw TransportError(msg + " (session rejected)");
  throw RemoteError(msg, static_cast<int>(http), 0, false);
}

using CurlString = std::unique_ptr<char, decltype(&curl_free)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string escape(CURL *curl, const std::string &s) {
  CurlString out(curl_easy_escape(curl, s.c_str(), static_cast<int>(s.size())),
                 &curl_free);
  if (!out)
    throw std::runtime_error("curl_easy_escape failed");
  return std::string(out.get());
}

/**
 * @brief Clears the per-request pointer options when a request scope ends.
 *
 * @details The error buffer, header list, body and write target live on the
 *          caller's stack, so the reused handle must not keep them.
 */
class RequestOptionsGuard {
public:
  explicit RequestOptionsGuard(CURL *curl) : curl_(curl) {}
  ~RequestOptionsGuard() {
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, nullptr);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, nullptr);
  }

  RequestOptionsGuard(const RequestOptionsGuard &) = delete;
  RequestOptionsGuard &operator=(const RequestOptionsGuard &) = delete;

private:
  CURL *curl_;
};

} // anonymous namespace

// **---- DeviceEndpoint ----**

DeviceEndpoint DeviceEndpoint::from_config() {
  DeviceEndpoint ep;
  ep.host = Config::host();
  ep.username = Config::username();
  ep.password = Config::password();
  ep.use_https = Config::use_https();
  ep.verify_tls = Config::verify_tls();
  ep.connect_timeout_sec = Config::connect_timeout_sec();
  ep.request_timeout_sec = Config::request_timeout_sec();
  return ep;
}

// **---- CurlHandle ----**

void ensure_curl_global_init() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
      throw std::runtime_error("curl_global_init failed");
  });
}

CurlHandle::CurlHandle() {
  ensure_curl_global_init();
  curl_ = curl_easy_init();
  if (!curl_)
    throw std::runtime_error("curl_easy_init failed");
}

CurlHandle::~CurlHandle() {
  if (curl_)
    curl_easy_cleanup(curl_);
}

CurlHandle::CurlHandle(CurlHandle &&other) noexcept : curl_(other.curl_) {
  other.curl_ = nullptr;
}

CurlHandle &CurlHandle::operator=(CurlHandle &&other) noexcept {
  if (this != &other) {
    if (curl_)
      curl_easy_cleanup(curl_);
    curl_ = other.curl_;
    other.curl_ = nullptr;
  }
  return *this;
}

// **---- Wire format helpers ----**

namespace reolink {

json time_to_json(Timestamp ts) {
  CivilDateTime c = to_civil(ts);
  return json{{"year", c.date.year}, {"mon", c.date.month},
              {"day", c.date.day},   {"hour", c.hour},
              {"min", c.minute},     {"sec", c.second}};
}

Timestamp time_from_json(const json &j) {
  CivilDate date{j.at("year").get<int>(), j.at("mon").get<int>(),
                 j.at("day").get<int>()};
  return make_timestamp(date, j.at("hour").get<int>(), j.at("min").get<int>(),
                        j.at("sec").get<int>());
}

std::string compact_time(Timestamp ts) {
  CivilDateTime c = to_civil(ts);
  return fmt::format("{:04d}{:02d}{:02d}{:02d}{:02d}{:02d}", c.date.year,
                     c.date.month, c.date.day, c.hour, c.minute, c.second);
}

json login_request(const std::string &username, const std::string &password) {
  return json::array(
      {{{"cmd", "Login"},
        {"param",
         {{"User",
           {{"Version", "0"},
            {"userName", username},
            {"password", password}}}}}}});
}

json search_request(int channel, StreamQuality quality, Timestamp start,
                    Timestamp end) {
  return json::array({{{"cmd", "Search"},
                       {"action", 0},
                       {"param",
                        {{"Search",
                          {{"channel", channel},
                           {"onlyStatus", 0},
                           {"streamType", stream_name(quality)},
                           {"StartTime", time_to_json(start)},
                           {"EndTime", time_to_json(end)}}}}}}});
}

json first_reply(const std::string &body) {
  json doc = json::parse(body, nullptr, false);
  if (doc.is_discarded())
    throw RemoteError("device reply is not JSON", 0, 0, false);
  if (doc.is_array()) {
    if (doc.empty() || !doc[0].is_object())
      throw RemoteError("device reply is empty", 0, 0, false);
    return doc[0];
  }
  if (doc.is_object())
    return doc;
  throw RemoteError("unexpected device reply", 0, 0, false);
}

void throw_command_error(const json &reply, bool login) {
  std::string cmd = "command";
  std::string detail = "unknown error";
  int rsp = 0;
  if (reply.is_object()) {
    if (reply.contains("cmd") && reply["cmd"].is_string())
      cmd = reply["cmd"].get<std::string>();
    auto err = reply.find("error");
    if (err != reply.end() && err->is_object()) {
      if (err->contains("detail") && (*err)["detail"].is_string())
        detail = (*err)["detail"].get<std::string>();
      if (err->contains("rspCode") && (*err)["rspCode"].is_number_integer())
        rsp = (*err)["rspCode"].get<int>();
    }
  }

  std::string msg = fmt::format("{} failed: {} (rspCode {})", cmd, detail, rsp);
  if (login)
    throw AuthError(msg);
  if (rsp == RSP_LOGIN_REQUIRED)
    throw TransportError(msg);
  throw RemoteError(msg, 200, rsp, false);
}

namespace {

bool reply_ok(const json &reply) {
  auto code = reply.find("code");
  return code != reply.end() && code->is_number_integer() &&
         code->get<int>() == 0;
}

} // anonymous namespace

LoginToken parse_login_reply(const std::string &body) {
  json reply;
  try {
    reply = first_reply(body);
  } catch (const RemoteError &e) {
    throw AuthError(std::string("Login: ") + e.what());
  }
  if (!reply_ok(reply))
    throw_command_error(reply, true);

  const json *token = nullptr;
  auto value = reply.find("value");
  if (value != reply.end() && value->is_object()) {
    auto t = value->find("Token");
    if (t != value->end() && t->is_object())
      token = &*t;
  }
  if (!token || !token->contains("name") || !(*token)["name"].is_string())
    throw AuthError("Login: reply carries no token");

  LoginToken out;
  out.name = (*token)["name"].get<std::string>();
  if (token->contains("leaseTime") && (*token)["leaseTime"].is_number_integer())
    out.lease_sec = (*token)["leaseTime"].get<int>();
  return out;
}

std::vector<Segment> parse_search_reply(const std::string &body,
                                        StreamQuality quality) {
  json reply = first_reply(body);
  if (!reply_ok(reply))
    throw_command_error(reply, false);

  std::vector<Segment> segments;
  const json *files = nullptr;
  auto value = reply.find("value");
  if (value != reply.end() && value->is_object()) {
    auto result = value->find("SearchResult");
    if (result != value->end() && result->is_object()) {
      auto f = result->find("File");
      if (f != result->end() && f->is_array())
        files = &*f;
    }
  }
  if (!files)
    return segments;

  const std::string wanted = stream_name(quality);
  for (const auto &file : *files) {
    try {
      if (file.contains("type") && file["type"].is_string() &&
          file["type"].get<std::string>() != wanted)
        continue;
      Segment s;
      s.name = file.at("name").get<std::string>();
      s.start = time_from_json(file.at("StartTime"));
      s.end = time_from_json(file.at("EndTime"));
      segments.push_back(std::move(s));
    } catch (const json::exception &e) {
      LOG_DEBUG("Skipping malformed search entry: {}", e.what());
    }
  }

  std::sort(segments.begin(), segments.end(),
            [](const Segment &a, const Segment &b) {
              return a.start < b.start || (a.start == b.start && a.name < b.name);
            });
  return segments;
}

} // namespace reolink

// **---- ReolinkSession ----**

ReolinkSession::ReolinkSession(DeviceEndpoint endpoint)
    : endpoint_(std::move(endpoint)) {}

std::string ReolinkSession::api_url(const std::string &query) const {
  return fmt::format("{}://{}/cgi-bin/api.cgi?{}",
                     endpoint_.use_https ? "https" : "http", endpoint_.host,
                     query);
}

void ReolinkSession::apply_common_options(char *errbuf) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "vod_fetch/1.0");
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(endpoint_.connect_timeout_sec));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT,
                   static_cast<long>(endpoint_.request_timeout_sec));
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, STALL_TIMEOUT_SEC);
  curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, endpoint_.verify_tls ? 1L : 0L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, endpoint_.verify_tls ? 2L : 0L);
}

std::string ReolinkSession::post_command(const std::string &cmd,
                                         const json &body, RequestKind kind) {
  const bool login = (kind == RequestKind::Login);
  if (kind == RequestKind::Command)
    ensure_token();

  std::string query = "cmd=" + cmd;
  if (!login)
    query += "&token=" + token_;
  const std::string url = api_url(query);
  const std::string payload = body.dump();

  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  apply_common_options(errbuf);

  CurlHeaders headers(
      curl_slist_append(nullptr, "Content-Type: application/json"),
      &curl_slist_free_all);
  std::string response;
  RequestOptionsGuard scope(curl);

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(payload.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

  CURLcode rc = curl_easy_perform(curl);
  if (rc != CURLE_OK)
    throw_transport(rc, errbuf, login, cmd);

  long http = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http);
  check_http_status(http, login, cmd);
  return response;
}

void ReolinkSession::authenticate() {
  if (endpoint_.host.empty())
    throw AuthError("no device host configured");

  token_.clear();
  std::string body = post_command(
      "Login", reolink::login_request(endpoint_.username, endpoint_.password),
      RequestKind::Login);
  reolink::LoginToken token = reolink::parse_login_reply(body);

  int lease = token.lease_sec > 0 ? token.lease_sec : 3600;
  token_ = token.name;
  token_expiry_ = std::chrono::steady_clock::now() + std::chrono::seconds(lease);
  LOG_DEBUG("Logged in to {} (lease {}s)", endpoint_.host, lease);
}

void ReolinkSession::ensure_token() {
  if (token_.empty())
    throw TransportError("session is not logged in");
  auto margin = std::chrono::seconds(reolink::TOKEN_RENEW_MARGIN_SEC);
  if (std::chrono::steady_clock::now() + margin >= token_expiry_) {
    LOG_DEBUG("Token lease for {} expiring, logging in again", endpoint_.host);
    authenticate();
  }
}

std::vector<Segment> ReolinkSession::list_segments(int channel,
                                                   StreamQuality quality,
                                                   Timestamp start,
                                                   Timestamp end) {
  std::string body =
      post_command("Search", reolink::search_request(channel, quality, start, end),
                   RequestKind::Command);
  return reolink::parse_search_reply(body, quality);
}

void ReolinkSession::fetch(int channel, StreamQuality quality,
                           const std::string &segment_name, Timestamp start,
                           Timestamp end, const ChunkSink &sink) {
  ensure_token();

  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  apply_common_options(errbuf);

  std::string output = segment_name;
  size_t slash = output.find_last_of('/');
  if (slash != std::string::npos)
    output = output.substr(slash + 1);

  const std::string url = api_url(fmt::format(
      "cmd=Download&source={}&output={}&start={}&end={}&channel={}"
      "&streamType={}&token={}",
      escape(curl, segment_name), escape(curl, output),
      reolink::compact_time(start), reolink::compact_time(end), channel,
      stream_name(quality), token_));

  StreamContext ctx;
  ctx.curl = curl;
  ctx.sink = &sink;
  RequestOptionsGuard scope(curl);

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

  CURLcode rc = curl_easy_perform(curl);

  if (ctx.error)
    std::rethrow_exception(ctx.error);
  if (ctx.aborted)
    throw TransferAborted("transfer aborted by receiver");
  if (rc != CURLE_OK)
    throw_transport(rc, errbuf, false, "Download");

  if (ctx.pass_through)
    return;

  long http = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http);
  check_http_status(http, false, "Download");

  /// 2xx carrying a JSON/text document instead of video
  if (!ctx.error_body.empty()) {
    json reply = reolink::first_reply(ctx.error_body);
    reolink::throw_command_error(reply, false);
  }
}

void ReolinkSession::release() noexcept {
  if (token_.empty())
    return;
  try {
    json body = json::array({{{"cmd", "Logout"}, {"param", json::object()}}});
    post_command("Logout", body, RequestKind::Logout);
    LOG_DEBUG("Logged out of {}", endpoint_.host);
  } catch (const std::exception &e) {
    try {
      LOG_WARN("Logout from {} failed: {}", endpoint_.host, e.what());
    } catch (const std::exception &) {
      /// Logging itself failed; logout is best effort either way
    }
  }
  token_.clear();
}

// **---- Factory ----**

SessionFactory make_reolink_factory(DeviceEndpoint endpoint) {
  return [endpoint]() -> std::unique_ptr<RetrievalSession> {
    return std::make_unique<ReolinkSession>(endpoint);
  };
}

} // namespace vod_fetch
