#pragma once

#include "jobmaster/config/system_config.hpp"
#include "jobmaster/core/error.hpp"
#include "jobmaster/executor/live_executions.hpp"
#include "jobmaster/util/util.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string_view>
#include <thread>
#include <vector>

namespace jobmaster {

struct SystemSample {
  double cpu_percent{0.0};
  double memory_percent{0.0};
  double memory_total_mb{0.0};
};

class ISystemMetricsSource {
public:
  virtual ~ISystemMetricsSource() = default;
  virtual auto sample() -> Result<SystemSample> = 0;
};

// CPU usage from the delta between two /proc/stat readings (the first call
// reports the average since boot); memory from /proc/meminfo.
class ProcSystemMetricsSource final : public ISystemMetricsSource {
public:
  auto sample() -> Result<SystemSample> override;

private:
  std::uint64_t last_total_{0};
  std::uint64_t last_idle_{0};
};

enum class Alert : std::uint8_t {
  HighCpuUsage,
  HighMemoryUsage,
  HighTaskConcurrency,
};

[[nodiscard]] constexpr auto alert_name(Alert a) noexcept -> std::string_view {
  switch (a) {
    case Alert::HighCpuUsage: return "HIGH_CPU_USAGE";
    case Alert::HighMemoryUsage: return "HIGH_MEMORY_USAGE";
    case Alert::HighTaskConcurrency: return "HIGH_TASK_CONCURRENCY";
  }
  return "UNKNOWN";
}

struct SystemSnapshot {
  TimePoint sampled_at{};
  double cpu_percent{0.0};
  double memory_percent{0.0};
  double memory_total_mb{0.0};
  std::size_t active_executions{0};
  std::size_t queue_depth{0};
  std::vector<Alert> alerts;

  [[nodiscard]] auto has(Alert a) const -> bool;
};

class SystemMonitor {
public:
  SystemMonitor(MonitorConfig config,
                std::shared_ptr<ISystemMetricsSource> source,
                const LiveExecutions& live, ClockFn clock = system_clock_fn());
  ~SystemMonitor();

  SystemMonitor(const SystemMonitor&) = delete;
  auto operator=(const SystemMonitor&) -> SystemMonitor& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return loop_.joinable();
  }

  // One sampling pass; stores and returns the new snapshot.
  auto sample_now() -> Result<SystemSnapshot>;

  [[nodiscard]] auto latest() const -> std::optional<SystemSnapshot>;
  // True while a CPU or memory alert is active and mitigation is enabled.
  [[nodiscard]] auto shedding_low_priority() const -> bool;
  [[nodiscard]] auto live_execution_count() const -> std::size_t {
    return live_.size();
  }
  [[nodiscard]] auto config() const noexcept -> const MonitorConfig& {
    return config_;
  }

private:
  auto run(std::stop_token stop) -> void;

  MonitorConfig config_;
  std::shared_ptr<ISystemMetricsSource> source_;
  const LiveExecutions& live_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::optional<SystemSnapshot> latest_;
  bool shedding_{false};

  std::mutex wake_mu_;
  std::condition_variable_any wake_cv_;
  std::jthread loop_;
};

}  // namespace jobmaster
