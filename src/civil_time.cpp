/**
 * @file civil_time.cpp
 * @brief Calendar conversion and timestamp formatting
 */

#include "vod_fetch/civil_time.hpp"

#include <cctype>
#include <ctime>

#include <fmt/core.h>

namespace vod_fetch {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;

/// Floor division so timestamps before the epoch still map to the right day
std::int64_t floor_div(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0)))
    --q;
  return q;
}

bool parse_digits(const std::string &text, size_t pos, size_t count,
                  int &out) {
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      return false;
    value = value * 10 + (text[i] - '0');
  }
  out = value;
  return true;
}

} // anonymous namespace

bool operator==(const CivilDate &a, const CivilDate &b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const CivilDate &a, const CivilDate &b) { return !(a == b); }

bool operator<(const CivilDate &a, const CivilDate &b) {
  return days_from_civil(a) < days_from_civil(b);
}

// **---- Conversions ----**

std::int64_t days_from_civil(const CivilDate &date) {
  std::int64_t y = date.year;
  const std::int64_t m = date.month;
  const std::int64_t d = date.day;
  y -= m <= 2;
  const std::int64_t era = floor_div(y, 400);
  const std::int64_t yoe = y - era * 400;
  const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(std::int64_t days) {
  days += 719468;
  const std::int64_t era = floor_div(days, 146097);
  const std::int64_t doe = days - era * 146097;
  const std::int64_t yoe =
      (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = yoe + era * 400 + (m <= 2);
  return CivilDate{static_cast<int>(y), static_cast<int>(m),
                   static_cast<int>(d)};
}

Timestamp make_timestamp(const CivilDate &date, int hour, int minute,
                         int second) {
  std::int64_t secs = days_from_civil(date) * SECONDS_PER_DAY +
                      hour * 3600 + minute * 60 + second;
  return Timestamp(std::chrono::seconds(secs));
}

CivilDateTime to_civil(Timestamp ts) {
  std::int64_t secs = ts.time_since_epoch().count();
  std::int64_t days = floor_div(secs, SECONDS_PER_DAY);
  std::int64_t rem = secs - days * SECONDS_PER_DAY;

  CivilDateTime out;
  out.date = civil_from_days(days);
  out.hour = static_cast<int>(rem / 3600);
  out.minute = static_cast<int>((rem % 3600) / 60);
  out.second = static_cast<int>(rem % 60);
  return out;
}

Timestamp start_of_day(const CivilDate &date) { return make_timestamp(date); }

Timestamp end_of_day(const CivilDate &date) {
  return make_timestamp(date, 23, 59, 59);
}

CivilDate add_days(const CivilDate &date, int days) {
  return civil_from_days(days_from_civil(date) + days);
}

// **---- Parsing / Formatting ----**

std::optional<CivilDate> parse_date(const std::string &text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-')
    return std::nullopt;

  CivilDate date;
  if (!parse_digits(text, 0, 4, date.year) ||
      !parse_digits(text, 5, 2, date.month) ||
      !parse_digits(text, 8, 2, date.day))
    return std::nullopt;

  if (date.month < 1 || date.month > 12 || date.day < 1)
    return std::nullopt;

  /// Reject 2023-02-30 and friends: a valid day survives the round trip
  if (civil_from_days(days_from_civil(date)) != date)
    return std::nullopt;

  return date;
}

std::string format_date(const CivilDate &date) {
  return fmt::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day);
}

std::string format_compact(Timestamp ts) {
  CivilDateTime c = to_civil(ts);
  return fmt::format("{:04d}{:02d}{:02d}_{:02d}{:02d}{:02d}", c.date.year,
                     c.date.month, c.date.day, c.hour, c.minute, c.second);
}

std::string format_hhmm(Timestamp ts) {
  CivilDateTime c = to_civil(ts);
  return fmt::format("{:02d}:{:02d}", c.hour, c.minute);
}

std::string format_datetime(Timestamp ts) {
  CivilDateTime c = to_civil(ts);
  return fmt::format("{} {:02d}:{:02d}:{:02d}", format_date(c.date), c.hour,
                     c.minute, c.second);
}

CivilDate local_today() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return CivilDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

} // namespace vod_fetch
