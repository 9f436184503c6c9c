#include "jobmaster/config/config.hpp"

#include "jobmaster/config/yaml_utils.hpp"
#include "jobmaster/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<jobmaster::SchedulerConfig> {
  static bool decode(const Node& node, jobmaster::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = jobmaster::yaml_get_or<std::string>(node, "log_level", "info");
    s.tick_interval = jobmaster::yaml_get_duration_or<std::chrono::seconds>(
        node, "tick_interval_sec", s.tick_interval);
    s.error_backoff = jobmaster::yaml_get_duration_or<std::chrono::seconds>(
        node, "error_backoff_sec", s.error_backoff);
    // Loop waits must be positive.
    if (s.tick_interval.count() <= 0 || s.error_backoff.count() <= 0) {
      return false;
    }
    auto tie_break =
        jobmaster::yaml_get_or<std::string>(node, "tie_break", "registration");
    auto parsed = jobmaster::parse_tie_break(tie_break);
    if (!parsed) {
      return false;
    }
    s.tie_break = *parsed;
    return true;
  }
};

template <>
struct convert<jobmaster::AdmissionConfig> {
  static bool decode(const Node& node, jobmaster::AdmissionConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    a.dependency_freshness =
        jobmaster::yaml_get_duration_or<std::chrono::hours>(
            node, "dependency_freshness_hours", a.dependency_freshness);
    a.cpu_ceiling = jobmaster::yaml_get_or(node, "cpu_ceiling", 90.0);
    a.memory_ceiling = jobmaster::yaml_get_or(node, "memory_ceiling", 90.0);
    a.resource_backoff = jobmaster::yaml_get_duration_or<std::chrono::seconds>(
        node, "resource_backoff_sec", a.resource_backoff);
    return true;
  }
};

template <>
struct convert<jobmaster::MonitorConfig> {
  static bool decode(const Node& node, jobmaster::MonitorConfig& m) {
    if (!node.IsMap()) {
      return false;
    }
    m.interval = jobmaster::yaml_get_duration_or<std::chrono::seconds>(
        node, "interval_sec", m.interval);
    m.error_backoff = jobmaster::yaml_get_duration_or<std::chrono::seconds>(
        node, "error_backoff_sec", m.error_backoff);
    if (m.interval.count() <= 0 || m.error_backoff.count() <= 0) {
      return false;
    }
    m.cpu_alert = jobmaster::yaml_get_or(node, "cpu_alert", 90.0);
    m.memory_alert = jobmaster::yaml_get_or(node, "memory_alert", 90.0);
    m.max_concurrent_executions = jobmaster::yaml_get_or<std::size_t>(
        node, "max_concurrent_executions", 20);
    m.auto_mitigation = jobmaster::yaml_get_or(node, "auto_mitigation", true);
    return true;
  }
};

template <>
struct convert<jobmaster::FailureConfig> {
  static bool decode(const Node& node, jobmaster::FailureConfig& f) {
    if (!node.IsMap()) {
      return false;
    }
    f.consistent_failure_rate =
        jobmaster::yaml_get_or(node, "consistent_failure_rate", 50.0);
    f.consistent_failure_min_runs = jobmaster::yaml_get_or<std::uint64_t>(
        node, "consistent_failure_min_runs", 5);
    return true;
  }
};

template <>
struct convert<jobmaster::TaskSpec> {
  static bool decode(const Node& node, jobmaster::TaskSpec& t) {
    if (!node.IsMap() || !node["id"]) {
      return false;
    }
    t.id = node["id"].as<std::string>();
    t.name = jobmaster::yaml_get_or<std::string>(node, "name", t.id);
    t.description = jobmaster::yaml_get_or<std::string>(node, "description", "");
    t.frequency = jobmaster::yaml_get_or<std::string>(node, "frequency", "hourly");
    t.priority = jobmaster::yaml_get_or<std::string>(node, "priority", "normal");
    t.command = jobmaster::yaml_get_or<std::string>(node, "command", "");
    t.working_dir = jobmaster::yaml_get_or<std::string>(node, "working_dir", "");
    t.enabled = jobmaster::yaml_get_or(node, "enabled", true);
    t.timeout_sec = jobmaster::yaml_get_or(node, "timeout_sec", 300);
    t.max_concurrent = jobmaster::yaml_get_or(node, "max_concurrent", 1);
    t.notify_on_failure = jobmaster::yaml_get_or(node, "notify_on_failure", true);
    t.dependencies = jobmaster::yaml_get_or<std::vector<jobmaster::TaskId>>(
        node, "dependencies", {});
    t.conditions = jobmaster::yaml_get_or<std::vector<std::string>>(
        node, "conditions", {});

    if (auto retry = node["retry"]; retry && retry.IsMap()) {
      t.retry_count = jobmaster::yaml_get_or(retry, "count", 3);
      t.retry_delay_sec = jobmaster::yaml_get_or(retry, "delay_sec", 60);
    }
    if (auto res = node["resources"]; res && res.IsMap()) {
      t.cpu = jobmaster::yaml_get_or(res, "cpu", 0.5);
      t.memory_mb = jobmaster::yaml_get_or(res, "memory_mb", 256.0);
    }
    return true;
  }
};

template <>
struct convert<jobmaster::SystemConfig> {
  static bool decode(const Node& node, jobmaster::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<jobmaster::SchedulerConfig>();
    }
    if (auto admission = node["admission"]) {
      c.admission = admission.as<jobmaster::AdmissionConfig>();
    }
    if (auto monitor = node["monitor"]) {
      c.monitor = monitor.as<jobmaster::MonitorConfig>();
    }
    if (auto failure = node["failure"]) {
      c.failure = failure.as<jobmaster::FailureConfig>();
    }
    if (auto tasks = node["tasks"]) {
      if (!tasks.IsSequence()) {
        return false;
      }
      c.tasks = tasks.as<std::vector<jobmaster::TaskSpec>>();
    }
    return true;
  }
};

}  // namespace YAML

namespace jobmaster {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    log::debug("Loaded config with {} task(s)", config.tasks.size());
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace jobmaster
