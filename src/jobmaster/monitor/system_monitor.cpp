#include "jobmaster/monitor/system_monitor.hpp"

#include "jobmaster/util/log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

namespace jobmaster {

auto ProcSystemMetricsSource::sample() -> Result<SystemSample> {
  std::ifstream stat_file("/proc/stat");
  if (!stat_file.is_open()) {
    return fail(Error::SystemMetricsUnavailable);
  }

  std::string label;
  std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0,
                softirq = 0, steal = 0;
  stat_file >> label >> user >> nice >> system >> idle >> iowait >> irq >>
      softirq >> steal;
  if (!stat_file || label != "cpu") {
    return fail(Error::SystemMetricsUnavailable);
  }

  std::uint64_t total = user + nice + system + idle + iowait + irq + softirq +
                        steal;
  std::uint64_t idle_time = idle + iowait;
  std::uint64_t total_diff = total - last_total_;
  std::uint64_t idle_diff = idle_time - last_idle_;
  last_total_ = total;
  last_idle_ = idle_time;

  SystemSample s;
  s.cpu_percent = total_diff > 0
                      ? 100.0 * static_cast<double>(total_diff - idle_diff) /
                            static_cast<double>(total_diff)
                      : 0.0;

  std::ifstream meminfo("/proc/meminfo");
  if (!meminfo.is_open()) {
    return fail(Error::SystemMetricsUnavailable);
  }
  std::uint64_t total_kb = 0, available_kb = 0;
  std::string line;
  while (std::getline(meminfo, line)) {
    std::istringstream ls(line);
    std::string key;
    std::uint64_t value = 0;
    ls >> key >> value;
    if (key == "MemTotal:") {
      total_kb = value;
    } else if (key == "MemAvailable:") {
      available_kb = value;
    }
  }
  if (total_kb == 0) {
    return fail(Error::SystemMetricsUnavailable);
  }

  s.memory_total_mb = static_cast<double>(total_kb) / 1024.0;
  s.memory_percent = 100.0 *
                     static_cast<double>(total_kb - std::min(available_kb,
                                                             total_kb)) /
                     static_cast<double>(total_kb);
  return ok(s);
}

auto SystemSnapshot::has(Alert a) const -> bool {
  return std::ranges::find(alerts, a) != alerts.end();
}

SystemMonitor::SystemMonitor(MonitorConfig config,
                             std::shared_ptr<ISystemMetricsSource> source,
                             const LiveExecutions& live, ClockFn clock)
    : config_(config),
      source_(std::move(source)),
      live_(live),
      clock_(std::move(clock)) {
}

SystemMonitor::~SystemMonitor() {
  stop();
}

auto SystemMonitor::start() -> void {
  if (loop_.joinable())
    return;
  loop_ = std::jthread([this](std::stop_token st) { run(st); });
  log::info("System monitor started (interval {}ms)",
            config_.interval.count());
}

auto SystemMonitor::stop() -> void {
  if (!loop_.joinable())
    return;
  loop_.request_stop();
  wake_cv_.notify_all();
  loop_.join();
  log::info("System monitor stopped");
}

auto SystemMonitor::sample_now() -> Result<SystemSnapshot> {
  auto sample = source_->sample();
  if (!sample) {
    log::warn("System metrics unavailable: {}", sample.error().message());
    return fail(sample.error());
  }

  SystemSnapshot snap;
  snap.sampled_at = clock_();
  snap.cpu_percent = sample->cpu_percent;
  snap.memory_percent = sample->memory_percent;
  snap.memory_total_mb = sample->memory_total_mb;
  snap.active_executions = live_.size();
  snap.queue_depth = live_.pending_count();

  if (snap.cpu_percent > config_.cpu_alert) {
    snap.alerts.push_back(Alert::HighCpuUsage);
  }
  if (snap.memory_percent > config_.memory_alert) {
    snap.alerts.push_back(Alert::HighMemoryUsage);
  }
  if (snap.active_executions > config_.max_concurrent_executions) {
    snap.alerts.push_back(Alert::HighTaskConcurrency);
  }

  for (auto a : snap.alerts) {
    log::warn("System alert {}: cpu={:.1f}% memory={:.1f}% active={}",
              alert_name(a), snap.cpu_percent, snap.memory_percent,
              snap.active_executions);
  }

  bool shed = config_.auto_mitigation && (snap.has(Alert::HighCpuUsage) ||
                                          snap.has(Alert::HighMemoryUsage));
  bool was_shedding = false;
  {
    std::lock_guard lock(mu_);
    was_shedding = shedding_;
    shedding_ = shed;
    latest_ = snap;
  }
  if (shed && !was_shedding) {
    log::warn("Mitigation engaged: shedding low-priority tasks");
  } else if (!shed && was_shedding) {
    log::info("Mitigation lifted: low-priority tasks admitted again");
  }

  log::debug("System sample: cpu={:.1f}% memory={:.1f}% active={} queued={}",
             snap.cpu_percent, snap.memory_percent, snap.active_executions,
             snap.queue_depth);
  return ok(std::move(snap));
}

auto SystemMonitor::latest() const -> std::optional<SystemSnapshot> {
  std::lock_guard lock(mu_);
  return latest_;
}

auto SystemMonitor::shedding_low_priority() const -> bool {
  std::lock_guard lock(mu_);
  return shedding_;
}

auto SystemMonitor::run(std::stop_token stop) -> void {
  while (!stop.stop_requested()) {
    auto wait = config_.interval;
    try {
      if (!sample_now()) {
        wait = config_.error_backoff;
      }
    } catch (const std::exception& e) {
      log::error("System monitor error: {}", e.what());
      wait = config_.error_backoff;
    } catch (...) {
      log::error("System monitor error: non-standard exception");
      wait = config_.error_backoff;
    }

    std::unique_lock lock(wake_mu_);
    wake_cv_.wait_for(lock, stop, wait, [] { return false; });
  }
}

}  // namespace jobmaster
