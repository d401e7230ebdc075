// Unit tests for device wall-clock conversions and formatting.

#include "vod_fetch/civil_time.hpp"

#include <gtest/gtest.h>

using namespace vod_fetch;

TEST(CivilTimeTest, DaysFromCivilKnownValues)
{
  EXPECT_EQ(days_from_civil(CivilDate{1970, 1, 1}), 0);
  EXPECT_EQ(days_from_civil(CivilDate{2000, 3, 1}), 11017);
  EXPECT_EQ(days_from_civil(CivilDate{1969, 12, 31}), -1);
}

TEST(CivilTimeTest, CivilFromDaysInvertsDaysFromCivil)
{
  for (std::int64_t d = -800; d < 30000; d += 37) {
    CivilDate c = civil_from_days(d);
    EXPECT_EQ(days_from_civil(c), d);
  }
}

TEST(CivilTimeTest, ToCivilBreaksDownTimestamp)
{
  Timestamp ts = make_timestamp(CivilDate{2024, 2, 29}, 23, 4, 5);
  CivilDateTime c = to_civil(ts);
  EXPECT_EQ(c.date, (CivilDate{2024, 2, 29}));
  EXPECT_EQ(c.hour, 23);
  EXPECT_EQ(c.minute, 4);
  EXPECT_EQ(c.second, 5);
}

TEST(CivilTimeTest, DayBoundsAreInclusiveOfLastSecond)
{
  CivilDate day{2023, 12, 31};
  EXPECT_EQ(format_datetime(start_of_day(day)), "2023-12-31 00:00:00");
  EXPECT_EQ(format_datetime(end_of_day(day)), "2023-12-31 23:59:59");
  EXPECT_EQ(end_of_day(day) - start_of_day(day), std::chrono::seconds(86399));
}

TEST(CivilTimeTest, AddDaysCrossesMonthAndYear)
{
  EXPECT_EQ(add_days(CivilDate{2024, 1, 1}, -1), (CivilDate{2023, 12, 31}));
  EXPECT_EQ(add_days(CivilDate{2024, 2, 28}, 1), (CivilDate{2024, 2, 29}));
  EXPECT_EQ(add_days(CivilDate{2023, 2, 28}, 1), (CivilDate{2023, 3, 1}));
}

TEST(CivilTimeTest, ParseDateAcceptsValidDates)
{
  auto d = parse_date("2024-02-29");
  ASSERT_TRUE(d.has_value());
  EXPECT_EQ(*d, (CivilDate{2024, 2, 29}));
}

TEST(CivilTimeTest, ParseDateRejectsMalformedInput)
{
  EXPECT_FALSE(parse_date("2023-02-29").has_value());
  EXPECT_FALSE(parse_date("2023-13-01").has_value());
  EXPECT_FALSE(parse_date("2023-04-31").has_value());
  EXPECT_FALSE(parse_date("2023-4-1").has_value());
  EXPECT_FALSE(parse_date("20230401").has_value());
  EXPECT_FALSE(parse_date("2023/04/01").has_value());
  EXPECT_FALSE(parse_date("").has_value());
  EXPECT_FALSE(parse_date("2023-04-0x").has_value());
}

TEST(CivilTimeTest, Formatting)
{
  Timestamp ts = make_timestamp(CivilDate{2024, 7, 4}, 9, 5, 7);
  EXPECT_EQ(format_date(CivilDate{2024, 7, 4}), "2024-07-04");
  EXPECT_EQ(format_compact(ts), "20240704_090507");
  EXPECT_EQ(format_hhmm(ts), "09:05");
  EXPECT_EQ(format_datetime(ts), "2024-07-04 09:05:07");
}

TEST(CivilTimeTest, DateOrdering)
{
  EXPECT_TRUE((CivilDate{2024, 1, 31}) < (CivilDate{2024, 2, 1}));
  EXPECT_FALSE((CivilDate{2024, 2, 1}) < (CivilDate{2024, 2, 1}));
  EXPECT_NE((CivilDate{2024, 2, 1}), (CivilDate{2024, 2, 2}));
}
