#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <optional>

#include <sys/types.h>

namespace jobwatch::syscall {

template<typename T>
using Result = std::expected<T, int>;

struct WaitInfo {
  pid_t pid_;
  int   status_;
};

auto kill_process(pid_t pid, int signal) -> Result<void>;
auto kill_group(pid_t pgid, int signal) -> Result<void>;
auto wait_for_process(pid_t pid) -> Result<WaitInfo>;
// Empty optional while the child is still running.
auto try_wait_for_process(pid_t pid) -> Result<std::optional<WaitInfo>>;

auto close_fd(int fd) -> Result<void>;
auto create_pipe() -> Result<std::array<int, 2>>;
auto read_fd(int fd, char* buffer, size_t size) -> Result<size_t>;
auto set_nonblocking(int fd) -> Result<void>;

// Python-style exit code: exit status, or the negated signal number.
auto decode_wait_status(int status) noexcept -> int;

} // namespace jobwatch::syscall
