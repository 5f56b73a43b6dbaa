#include "jobwatch/Syscall.hpp"

#include <cerrno>
#include <csignal>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace jobwatch::syscall {

auto kill_process(pid_t pid, int signal) -> Result<void> {
  if (kill(pid, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto kill_group(pid_t pgid, int signal) -> Result<void> {
  if (killpg(pgid, signal) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto wait_for_process(pid_t pid) -> Result<WaitInfo> {
  int   status     = 0;
  pid_t result_pid = -1;
  do {
    result_pid = waitpid(pid, &status, 0);
  } while (result_pid == -1 && errno == EINTR);

  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  return WaitInfo{result_pid, status};
}

auto try_wait_for_process(pid_t pid) -> Result<std::optional<WaitInfo>> {
  int   status     = 0;
  pid_t result_pid = waitpid(pid, &status, WNOHANG);
  if (result_pid == -1) {
    return std::unexpected(errno);
  }
  if (result_pid == 0) {
    return std::nullopt;
  }
  return WaitInfo{result_pid, status};
}

auto close_fd(int fd) -> Result<void> {
  if (close(fd) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto create_pipe() -> Result<std::array<int, 2>> {
  std::array<int, 2> fds;
  if (pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(errno);
  }
  return fds;
}

auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t> {
  ssize_t result = read(fd, buffer, size);
  if (result == -1) {
    return std::unexpected(errno);
  }
  return static_cast<size_t>(result);
}

auto set_nonblocking(int fd) -> Result<void> {
  int flags = fcntl(fd, F_GETFL);
  if (flags == -1) {
    return std::unexpected(errno);
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    return std::unexpected(errno);
  }
  return {};
}

auto decode_wait_status(int status) noexcept -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return -WTERMSIG(status);
  }
  return -1;
}

} // namespace jobwatch::syscall
