/**
 * @file civil_time.hpp
 * @brief Device wall-clock timestamps and calendar helpers
 *
 * @details The recorder reports naive local times (no zone, no DST
 *          information). Timestamps are therefore kept as whole seconds on a
 *          proleptic Gregorian timeline with no zone conversion, which makes
 *          chunk arithmetic and file naming deterministic.
 *
 *          Day/civil conversion uses the days_from_civil / civil_from_days
 *          algorithms (H. Hinnant).
 */

#ifndef VOD_FETCH_CIVIL_TIME_HPP
#define VOD_FETCH_CIVIL_TIME_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vod_fetch {

/**
 * @struct DeviceClock
 * @brief Tag clock for timestamps in the device's local wall time.
 * @note Epoch is 1970-01-01 00:00:00 device time. There is no now().
 */
struct DeviceClock {
  using duration = std::chrono::seconds;
  using rep = duration::rep;
  using period = duration::period;
  using time_point = std::chrono::time_point<DeviceClock, duration>;
  static constexpr bool is_steady = false;
};

using Timestamp = DeviceClock::time_point;

/**
 * @struct CivilDate
 * @brief A calendar day (month and day are 1-based).
 */
struct CivilDate {
  int year = 1970;
  int month = 1;
  int day = 1;
};

bool operator==(const CivilDate &a, const CivilDate &b);
bool operator!=(const CivilDate &a, const CivilDate &b);
bool operator<(const CivilDate &a, const CivilDate &b);

/**
 * @struct CivilDateTime
 * @brief Broken-down form of a Timestamp.
 */
struct CivilDateTime {
  CivilDate date;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

// **---- Conversions ----**

/// Days since 1970-01-01 for a calendar day
std::int64_t days_from_civil(const CivilDate &date);

/// Calendar day for a count of days since 1970-01-01
CivilDate civil_from_days(std::int64_t days);

Timestamp make_timestamp(const CivilDate &date, int hour = 0, int minute = 0,
                         int second = 0);

CivilDateTime to_civil(Timestamp ts);

/// 00:00:00 of the given day
Timestamp start_of_day(const CivilDate &date);

/// 23:59:59 of the given day (the device's inclusive day-wide query bound)
Timestamp end_of_day(const CivilDate &date);

CivilDate add_days(const CivilDate &date, int days);

// **---- Parsing / Formatting ----**

/**
 * @brief Parse a strict YYYY-MM-DD date.
 * @return The date, or std::nullopt on malformed or impossible dates
 */
std::optional<CivilDate> parse_date(const std::string &text);

/// YYYY-MM-DD
std::string format_date(const CivilDate &date);

/// YYYYMMDD_HHMMSS (used in output file names)
std::string format_compact(Timestamp ts);

/// HH:MM
std::string format_hhmm(Timestamp ts);

/// YYYY-MM-DD HH:MM:SS
std::string format_datetime(Timestamp ts);

/// Today's date according to the host's local time zone
CivilDate local_today();

} // namespace vod_fetch

#endif // VOD_FETCH_CIVIL_TIME_HPP
