#include "jobmaster/handlers/conditions.hpp"

#include <ctime>

namespace jobmaster {

auto maintenance_window(ClockFn clock) -> Condition {
  return Condition{"maintenance_window", [clock = std::move(clock)] {
                     auto t = Clock::to_time_t(clock());
                     std::tm tm{};
                     gmtime_r(&t, &tm);
                     return tm.tm_hour >= kMaintenanceWindowStartHour &&
                            tm.tm_hour <= kMaintenanceWindowEndHour;
                   }};
}

auto low_system_load(const SystemMonitor& monitor) -> Condition {
  return Condition{"low_system_load", [&monitor] {
                     auto snap = monitor.latest();
                     double cpu = snap ? snap->cpu_percent : 0.0;
                     return cpu < kLowLoadCpuPercent &&
                            monitor.live_execution_count() <
                                kLowLoadMaxExecutions;
                   }};
}

auto builtin_condition(std::string_view name, const SystemMonitor& monitor,
                       ClockFn clock) -> std::optional<Condition> {
  if (name == "maintenance_window")
    return maintenance_window(std::move(clock));
  if (name == "low_system_load")
    return low_system_load(monitor);
  return std::nullopt;
}

}  // namespace jobmaster
