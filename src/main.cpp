#include "jobmaster/app/application.hpp"
#include "jobmaster/app/status_json.hpp"
#include "jobmaster/config/config.hpp"
#include "jobmaster/scheduler/state_strings.hpp"
#include "jobmaster/util/log.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("jobmaster - scheduled task orchestration engine");
  std::println("Usage: {} -c <config> [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --validate            Load config, register tasks and exit");
  std::println("  -l, --list            List registered tasks and exit");
  std::println("  -t, --trigger <id>    Run one task now, print its status");
  std::println("  --overview            Print the system overview and exit");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Without a one-shot option the engine runs until SIGINT/SIGTERM.");
}

void print_version() {
  std::println("jobmaster v0.1.0");
}

struct Options {
  std::string config_file;
  std::string trigger_task;
  bool validate = false;
  bool list_tasks = false;
  bool overview = false;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--validate") {
      opts.validate = true;
    } else if (arg == "-l" || arg == "--list") {
      opts.list_tasks = true;
    } else if (arg == "-t" || arg == "--trigger") {
      if (++i >= argc) {
        std::println(stderr, "Error: --trigger requires an argument");
        std::exit(1);
      }
      opts.trigger_task = argv[i];
    } else if (arg == "--overview") {
      opts.overview = true;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto list_tasks(const jobmaster::Application& app) -> void {
  auto overview = app.get_system_overview();
  std::println("{:<28} {:<18} {:<10} {:<8} {:<22}", "TASK", "FREQUENCY",
               "PRIORITY", "ENABLED", "NEXT_DUE");
  for (const auto& t : overview.tasks) {
    auto status = app.get_task_status(t.id);
    std::println("{:<28} {:<18} {:<10} {:<8} {:<22}", t.id,
                 jobmaster::frequency_name(t.frequency),
                 status ? jobmaster::priority_name(status->priority) : "-",
                 t.enabled ? "yes" : "no",
                 jobmaster::format_timestamp(t.next_due));
  }
}

auto trigger_and_wait(jobmaster::Application& app, const std::string& id)
    -> int {
  auto handle = app.trigger_task(jobmaster::TaskId{id});
  if (!handle) {
    std::println(stderr, "Error: cannot trigger {}: {}", id,
                 handle.error().message());
    return 1;
  }

  const auto& exec = handle->wait();
  jobmaster::json out = {{"execution", jobmaster::execution_to_json(exec)}};
  if (auto status = app.get_task_status(jobmaster::TaskId{id})) {
    out["task"] = jobmaster::task_status_to_json(*status);
  }
  std::println("{}", out.dump(2));
  return exec.status == jobmaster::ExecutionStatus::Completed ? 0 : 1;
}

auto run(const Options& opts) -> int {
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: Config file required. Use -c <file>");
    return 1;
  }

  if (!std::filesystem::exists(opts.config_file)) {
    std::println(stderr, "Error: Config file not found: {}", opts.config_file);
    return 1;
  }

  auto config = jobmaster::ConfigLoader::load_from_file(opts.config_file);
  if (!config) {
    std::println(stderr, "Error: Failed to load config: {}",
                 config.error().message());
    return 1;
  }

  jobmaster::log::set_level(config->scheduler.log_level);
  jobmaster::log::start();

  jobmaster::Application app(std::move(*config));
  if (auto r = app.register_configured_tasks(); !r) {
    std::println(stderr, "Error: Failed to register tasks: {}",
                 r.error().message());
    jobmaster::log::stop();
    return 1;
  }

  int rc = 0;
  if (opts.validate) {
    std::println("Config OK: {} task(s)", app.registry().size());
  } else if (opts.list_tasks) {
    list_tasks(app);
  } else if (!opts.trigger_task.empty()) {
    rc = trigger_and_wait(app, opts.trigger_task);
  } else if (opts.overview) {
    if (auto r = app.monitor().sample_now(); !r) {
      jobmaster::log::warn("No system sample: {}", r.error().message());
    }
    std::println("{}",
                 jobmaster::overview_to_json(app.get_system_overview()).dump(2));
  } else {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    app.start();
    while (app.is_running() &&
           !g_shutdown_requested.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (g_shutdown_requested.load(std::memory_order_acquire)) {
      jobmaster::log::info("Received shutdown signal, stopping...");
    }
  }

  app.stop();
  jobmaster::log::stop();
  return rc;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  return run(parse_args(argc, argv));
}
