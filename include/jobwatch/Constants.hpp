#pragma once

#include <chrono>
#include <csignal>
#include <string>
#include <string_view>

namespace jobwatch {

static constexpr inline std::string_view EXE_NAME = "jobwatch";
static constexpr inline std::string_view EXE_DESC = "Run a command and relay its output without blocking";
static constexpr inline std::string_view VERSION  = "v0.1.0-dev";

static constexpr inline std::chrono::milliseconds DEFAULT_READER_INTERVAL{120};
static constexpr inline std::chrono::milliseconds DEFAULT_TERMINATE_GRACE{1000};

// Execution flags handed to the spawner. Only MakeGroupLeader changes POSIX behaviour.
enum class ExecFlags : unsigned {
  Async           = 0,
  Sync            = 1,
  ShowConsole     = 2,
  MakeGroupLeader = 4,
  NoDisable       = 8,
  NoEvents        = 16,
  HideConsole     = 32,
  Block           = Sync | NoEvents,
};

[[nodiscard]] constexpr ExecFlags operator|(ExecFlags lhs, ExecFlags rhs) noexcept {
  return static_cast<ExecFlags>(static_cast<unsigned>(lhs) | static_cast<unsigned>(rhs));
}

[[nodiscard]] constexpr ExecFlags operator&(ExecFlags lhs, ExecFlags rhs) noexcept {
  return static_cast<ExecFlags>(static_cast<unsigned>(lhs) & static_cast<unsigned>(rhs));
}

constexpr ExecFlags& operator|=(ExecFlags& lhs, ExecFlags rhs) noexcept {
  lhs = lhs | rhs;
  return lhs;
}

[[nodiscard]] constexpr bool has_flag(ExecFlags flags, ExecFlags flag) noexcept {
  return static_cast<unsigned>(flags & flag) != 0;
}

// Only the signals that make sense on every platform.
enum class Signal : int {
  Term = SIGTERM,
  Kill = SIGKILL,
  Int  = SIGINT,
};

enum class KillScope {
  NoChildren, // signal the process only
  Children,   // signal its whole process group (needs ExecFlags::MakeGroupLeader)
};

enum class KillResult {
  Ok,
  BadSignal,
  AccessDenied,
  NoProcess,
  Error,
};

std::string to_string(ExecFlags flags);
std::string_view to_string(Signal signal) noexcept;
std::string_view to_string(KillScope scope) noexcept;
std::string_view to_string(KillResult result) noexcept;

} // namespace jobwatch
