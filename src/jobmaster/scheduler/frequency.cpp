#include "jobmaster/scheduler/frequency.hpp"

#include <ctime>

namespace jobmaster {
namespace {

auto to_utc(std::chrono::system_clock::time_point tp) -> std::tm {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  return tm;
}

auto from_utc(std::tm& tm) -> std::chrono::system_clock::time_point {
  tm.tm_isdst = 0;
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

// timegm normalises out-of-range days, so adding to tm_mday is enough to
// cross month and year boundaries.
auto days_ahead_at_run_hour(std::chrono::system_clock::time_point now,
                            int days) -> std::chrono::system_clock::time_point {
  auto tm = to_utc(now);
  tm.tm_mday += days;
  tm.tm_hour = kCalendarRunHour;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  return from_utc(tm);
}

auto first_of_next_month(std::chrono::system_clock::time_point now)
    -> std::chrono::system_clock::time_point {
  auto tm = to_utc(now);
  if (tm.tm_mon == 11) {
    tm.tm_mon = 0;
    ++tm.tm_year;
  } else {
    ++tm.tm_mon;
  }
  tm.tm_mday = 1;
  tm.tm_hour = kCalendarRunHour;
  tm.tm_min = 0;
  tm.tm_sec = 0;
  return from_utc(tm);
}

}  // namespace

auto next_due(Frequency frequency, std::chrono::system_clock::time_point now)
    -> std::chrono::system_clock::time_point {
  using namespace std::chrono_literals;

  switch (frequency) {
    case Frequency::Continuous:
      return now;
    case Frequency::EveryMinute:
      return now + 1min;
    case Frequency::Every5Minutes:
      return now + 5min;
    case Frequency::Every15Minutes:
      return now + 15min;
    case Frequency::Every30Minutes:
      return now + 30min;
    case Frequency::Hourly:
      return now + 1h;
    case Frequency::Daily:
      return days_ahead_at_run_hour(now, 1);
    case Frequency::Weekly: {
      // tm_wday counts from Sunday; shift so Monday is 0.
      int weekday = (to_utc(now).tm_wday + 6) % 7;
      return days_ahead_at_run_hour(now, 7 - weekday);
    }
    case Frequency::Monthly:
      return first_of_next_month(now);
  }
  return now + 1h;
}

}  // namespace jobmaster
