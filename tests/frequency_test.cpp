#include "jobmaster/scheduler/frequency.hpp"
#include "jobmaster/scheduler/state_strings.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace jobmaster;
using jobmaster::test::utc;
using namespace std::chrono_literals;

TEST(FrequencyTest, ContinuousIsDueImmediately) {
  auto now = utc(2024, 3, 15, 10, 30, 12);
  EXPECT_EQ(next_due(Frequency::Continuous, now), now);
}

TEST(FrequencyTest, IntervalFrequenciesAreRelativeToNow) {
  auto now = utc(2024, 3, 15, 10, 30, 12);
  EXPECT_EQ(next_due(Frequency::EveryMinute, now), now + 1min);
  EXPECT_EQ(next_due(Frequency::Every5Minutes, now), now + 5min);
  EXPECT_EQ(next_due(Frequency::Every15Minutes, now), now + 15min);
  EXPECT_EQ(next_due(Frequency::Every30Minutes, now), now + 30min);
  EXPECT_EQ(next_due(Frequency::Hourly, now), now + 1h);
}

TEST(FrequencyTest, DailyIsTomorrowAtTwo) {
  EXPECT_EQ(next_due(Frequency::Daily, utc(2024, 3, 15, 10, 30)),
            utc(2024, 3, 16, 2));
  // Even before 02:00 the next run is tomorrow, not today.
  EXPECT_EQ(next_due(Frequency::Daily, utc(2024, 3, 15, 1, 0)),
            utc(2024, 3, 16, 2));
}

TEST(FrequencyTest, DailyCrossesMonthAndYear) {
  EXPECT_EQ(next_due(Frequency::Daily, utc(2024, 2, 29, 12)),
            utc(2024, 3, 1, 2));
  EXPECT_EQ(next_due(Frequency::Daily, utc(2024, 12, 31, 23, 59)),
            utc(2025, 1, 1, 2));
}

TEST(FrequencyTest, WeeklyIsNextMonday) {
  // 2024-03-15 is a Friday.
  EXPECT_EQ(next_due(Frequency::Weekly, utc(2024, 3, 15, 10)),
            utc(2024, 3, 18, 2));
  // Sunday -> the following day.
  EXPECT_EQ(next_due(Frequency::Weekly, utc(2024, 3, 17, 23)),
            utc(2024, 3, 18, 2));
}

TEST(FrequencyTest, WeeklyOnMondayIsAFullWeekOut) {
  EXPECT_EQ(next_due(Frequency::Weekly, utc(2024, 3, 18, 0, 30)),
            utc(2024, 3, 25, 2));
  EXPECT_EQ(next_due(Frequency::Weekly, utc(2024, 3, 18, 10)),
            utc(2024, 3, 25, 2));
}

TEST(FrequencyTest, MonthlyIsFirstOfNextMonth) {
  EXPECT_EQ(next_due(Frequency::Monthly, utc(2024, 3, 15, 10)),
            utc(2024, 4, 1, 2));
  EXPECT_EQ(next_due(Frequency::Monthly, utc(2024, 1, 31, 22)),
            utc(2024, 2, 1, 2));
}

TEST(FrequencyTest, MonthlyRollsTheYearInDecember) {
  EXPECT_EQ(next_due(Frequency::Monthly, utc(2024, 12, 20, 10)),
            utc(2025, 1, 1, 2));
}

TEST(FrequencyTest, NamesRoundTrip) {
  EXPECT_EQ(frequency_name(Frequency::Every15Minutes), "every_15_minutes");
  EXPECT_EQ(parse_frequency("weekly"), Frequency::Weekly);
  EXPECT_FALSE(parse_frequency("fortnightly").has_value());

  EXPECT_EQ(priority_name(Priority::Critical), "critical");
  EXPECT_EQ(parse_priority("low"), Priority::Low);
  EXPECT_FALSE(parse_priority("urgent").has_value());
}

TEST(FrequencyTest, PriorityOrdersByUrgency) {
  EXPECT_GT(Priority::Critical, Priority::High);
  EXPECT_GT(Priority::High, Priority::Normal);
  EXPECT_GT(Priority::Normal, Priority::Low);
}
