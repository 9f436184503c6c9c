#pragma once

#include "jobmaster/app/application.hpp"

#include <nlohmann/json.hpp>

namespace jobmaster {

using json = nlohmann::json;

// Timestamps are ISO-8601 UTC strings; absent ones are null.
[[nodiscard]] auto execution_to_json(const TaskExecution& exec) -> json;
[[nodiscard]] auto metrics_to_json(const TaskMetrics& m) -> json;
[[nodiscard]] auto task_status_to_json(const TaskStatus& status) -> json;
[[nodiscard]] auto snapshot_to_json(const SystemSnapshot& snap) -> json;
[[nodiscard]] auto overview_to_json(const SystemOverview& overview) -> json;

}  // namespace jobmaster
