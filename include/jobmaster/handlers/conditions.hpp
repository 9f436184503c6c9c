#pragma once

#include "jobmaster/monitor/system_monitor.hpp"
#include "jobmaster/scheduler/task.hpp"

#include <optional>
#include <string_view>

namespace jobmaster {

inline constexpr int kMaintenanceWindowStartHour = 1;
inline constexpr int kMaintenanceWindowEndHour = 5;
inline constexpr double kLowLoadCpuPercent = 50.0;
inline constexpr std::size_t kLowLoadMaxExecutions = 5;

// True while the UTC hour is within [1, 5].
[[nodiscard]] auto maintenance_window(ClockFn clock) -> Condition;

// True while cpu is below 50% and fewer than five executions are live.
[[nodiscard]] auto low_system_load(const SystemMonitor& monitor) -> Condition;

// Looks up a built-in condition by name; nullopt for unknown names.
[[nodiscard]] auto builtin_condition(std::string_view name,
                                     const SystemMonitor& monitor,
                                     ClockFn clock)
    -> std::optional<Condition>;

}  // namespace jobmaster
