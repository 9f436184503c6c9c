#pragma once

#include "jobmaster/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace jobmaster::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

struct alignas(64) ThreadBuffer {
  std::string buffer;
  ThreadBuffer() {
    buffer.reserve(1024);
  }
};

inline thread_local ThreadBuffer t_buffer;

// Async logger. Producers format on their own thread and push finished
// lines; one writer thread drains the queue to the sink.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 4096;
  static constexpr std::size_t BATCH_SIZE = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> color_{true};
  std::FILE* sink_{stdout};
  BoundedMPSCQueue<std::string> queue_{QUEUE_CAPACITY};
  std::thread writer_;

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(BATCH_SIZE);

    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < BATCH_SIZE) {
        if (auto msg = queue_.try_pop()) {
          batch.push_back(std::move(*msg));
        } else {
          break;
        }
      }

      for (const auto& msg : batch) {
        std::print(sink_, "{}", msg);
      }
      if (batch.empty()) {
        std::fflush(sink_);
        std::this_thread::sleep_for(std::chrono::microseconds(200));
      }
    }

    // accepting_ is already false here, nothing new can arrive
    while (auto msg = queue_.try_pop()) {
      std::print(sink_, "{}", *msg);
    }
    std::fflush(sink_);
  }

  template <typename... Args>
  auto format_line(std::string& out, Level level,
                   std::format_string<Args...> fmt, Args&&... args) const
      -> void {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    bool color = color_.load(std::memory_order_relaxed);
    std::format_to(std::back_inserter(out), "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] ",
                   now, color ? level_color(level) : "", level_name(level),
                   color ? "\033[0m" : "", tid);
    std::format_to(std::back_inserter(out), fmt, std::forward<Args>(args)...);
    out.push_back('\n');
  }

public:
  Logger() = default;
  ~Logger() {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    running_.store(false, std::memory_order_release);
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // The sink must outlive the logger or be swapped back before it closes.
  // Only valid while stopped.
  auto set_sink(std::FILE* sink, bool color) noexcept -> void {
    if (running_.load(std::memory_order_acquire))
      return;
    sink_ = sink ? sink : stdout;
    color_.store(color, std::memory_order_relaxed);
  }

  auto start() -> void {
    if (running_.exchange(true))
      return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);

    if (!running_.exchange(false))
      return;

    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto& buf = t_buffer.buffer;
    buf.clear();
    format_line(buf, level, fmt, std::forward<Args>(args)...);

    if (!accepting_.load(std::memory_order_acquire)) {
      std::print(sink_, "{}", buf);
      return;
    }
    if (!queue_.push(std::string(buf))) {
      std::print(sink_, "{}", buf);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace jobmaster::log
