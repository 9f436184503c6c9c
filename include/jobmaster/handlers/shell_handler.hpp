#pragma once

#include "jobmaster/scheduler/task.hpp"

#include <cstddef>
#include <string>

namespace jobmaster {

// Runs `/bin/sh -c <command>` in its own process group. Succeeds with
// {"exit_code": 0, "output": ...}; a non-zero exit is a TaskError carrying
// the tail of the output. Cancellation kills the whole group.
class ShellHandler final : public ITaskHandler {
public:
  static constexpr std::size_t kMaxOutputSize = 1024 * 1024;

  explicit ShellHandler(std::string command, std::string working_dir = {})
      : command_(std::move(command)), working_dir_(std::move(working_dir)) {
  }

  auto execute(TaskContext& ctx) -> TaskResult override;

  [[nodiscard]] auto command() const noexcept -> const std::string& {
    return command_;
  }

private:
  std::string command_;
  std::string working_dir_;
};

// Succeeds immediately with a null payload.
class NoopHandler final : public ITaskHandler {
public:
  auto execute(TaskContext&) -> TaskResult override {
    return TaskPayload{};
  }
};

}  // namespace jobmaster
