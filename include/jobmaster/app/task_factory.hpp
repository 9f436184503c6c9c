#pragma once

#include "jobmaster/config/system_config.hpp"
#include "jobmaster/core/error.hpp"
#include "jobmaster/monitor/system_monitor.hpp"
#include "jobmaster/scheduler/task.hpp"

namespace jobmaster {

// Turns a configured task into a definition: a shell handler when a command
// is given, a no-op handler otherwise, and built-in conditions by name.
// Unknown frequency, priority or condition names are InvalidArgument.
[[nodiscard]] auto build_task_definition(const TaskSpec& spec,
                                         const SystemMonitor& monitor,
                                         ClockFn clock)
    -> Result<TaskDefinition>;

}  // namespace jobmaster
