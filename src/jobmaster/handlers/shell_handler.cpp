#include "jobmaster/handlers/shell_handler.hpp"

#include "jobmaster/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

namespace jobmaster {

namespace {

inline constexpr std::size_t READ_BUFFER_SIZE = 4096;
inline constexpr std::size_t ERROR_TAIL_SIZE = 512;
inline constexpr int POLL_SLICE_MS = 100;

auto create_pipe() -> std::pair<int, int> {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) {
    return {-1, -1};
  }
  return {fds[0], fds[1]};
}

auto fork_and_exec(const std::string& cmd, const std::string& working_dir,
                   int stdout_write_fd) -> pid_t {
  pid_t pid = fork();
  if (pid < 0) {
    return -1;
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    setpgid(0, 0);

    dup2(stdout_write_fd, STDOUT_FILENO);
    dup2(stdout_write_fd, STDERR_FILENO);
    close(stdout_write_fd);

    if (!working_dir.empty() && chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }

    execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
    _exit(127);
  }

  close(stdout_write_fd);
  setpgid(pid, pid);
  return pid;
}

auto get_exit_code(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Reads until EOF or cancellation. Returns false when cancelled.
auto read_output(int fd, const CancellationToken& cancel, std::string& output)
    -> bool {
  std::array<char, READ_BUFFER_SIZE> buffer;
  bool truncated = false;

  while (true) {
    if (cancel.is_cancelled()) {
      return false;
    }

    pollfd pfd{fd, POLLIN, 0};
    int rc = poll(&pfd, 1, POLL_SLICE_MS);
    if (rc == 0) {
      continue;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return true;
    }

    ssize_t bytes_read = read(fd, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      return true;
    }
    if (bytes_read == 0) {
      return true;
    }

    // Keep draining past the cap so the child never blocks on a full pipe.
    if (!truncated) {
      output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
      if (output.size() >= ShellHandler::kMaxOutputSize) {
        output.resize(ShellHandler::kMaxOutputSize);
        truncated = true;
      }
    }
  }
}

auto tail(const std::string& s, std::size_t n) -> std::string {
  return s.size() <= n ? s : s.substr(s.size() - n);
}

}  // namespace

auto ShellHandler::execute(TaskContext& ctx) -> TaskResult {
  auto [read_fd, write_fd] = create_pipe();
  if (read_fd < 0) {
    return std::unexpected(
        TaskError{std::format("failed to create pipe: {}", strerror(errno))});
  }

  pid_t pid = fork_and_exec(command_, working_dir_, write_fd);
  if (pid < 0) {
    close(read_fd);
    close(write_fd);
    return std::unexpected(
        TaskError{std::format("failed to fork: {}", strerror(errno))});
  }
  log::debug("Task {} started shell pid {}: {}", ctx.task_id, pid, command_);

  std::string output;
  bool finished = read_output(read_fd, ctx.cancel, output);
  close(read_fd);

  if (!finished) {
    kill(-pid, SIGKILL);
    log::info("Killed process group {} of task {}", pid, ctx.task_id);
  }

  int status = 0;
  int exit_code = -1;
  pid_t waited = 0;
  do {
    waited = waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited > 0) {
    exit_code = get_exit_code(status);
  } else {
    log::warn("waitpid failed for pid {}: {}", pid, strerror(errno));
  }

  if (!finished) {
    return std::unexpected(TaskError{"cancelled"});
  }
  if (exit_code != 0) {
    return std::unexpected(TaskError{std::format(
        "command exited with code {}: {}", exit_code,
        tail(output, ERROR_TAIL_SIZE))});
  }
  return TaskPayload{{"exit_code", exit_code}, {"output", std::move(output)}};
}

}  // namespace jobmaster
