#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <chrono>

namespace jobmaster {

// Hour (UTC) at which daily, weekly and monthly tasks fire.
inline constexpr int kCalendarRunHour = 2;

// Next due time for `frequency` as seen from `now`. Interval frequencies are
// relative to now; calendar frequencies land on the next 02:00 UTC boundary:
// daily -> tomorrow, weekly -> next Monday (a full week out when today is
// Monday), monthly -> the 1st of next month. Continuous returns `now`.
[[nodiscard]] auto next_due(Frequency frequency,
                            std::chrono::system_clock::time_point now)
    -> std::chrono::system_clock::time_point;

}  // namespace jobmaster
