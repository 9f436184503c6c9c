#pragma once

#include <chrono>
#include <ctime>
#include <format>
#include <functional>
#include <optional>
#include <string>

namespace jobmaster {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Wall-clock source. Components take one so that tests can pin "now".
using ClockFn = std::function<TimePoint()>;

[[nodiscard]] inline auto system_clock_fn() -> ClockFn {
  return [] { return Clock::now(); };
}

[[nodiscard]] inline auto format_timestamp(TimePoint tp) -> std::string {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

[[nodiscard]] inline auto format_timestamp(const std::optional<TimePoint>& tp)
    -> std::string {
  return tp ? format_timestamp(*tp) : std::string{"-"};
}

}  // namespace jobmaster
