#include "jobwatch/Constants.hpp"

#include <array>
#include <utility>

namespace jobwatch {

std::string to_string(ExecFlags flags) {
  static constexpr std::array<std::pair<ExecFlags, std::string_view>, 6> names{{
      {ExecFlags::Sync, "sync"},
      {ExecFlags::ShowConsole, "show-console"},
      {ExecFlags::MakeGroupLeader, "group-leader"},
      {ExecFlags::NoDisable, "no-disable"},
      {ExecFlags::NoEvents, "no-events"},
      {ExecFlags::HideConsole, "hide-console"},
  }};

  std::string out;
  for (auto const& [flag, name] : names) {
    if (has_flag(flags, flag)) {
      if (!out.empty()) {
        out += '|';
      }
      out += name;
    }
  }
  return out.empty() ? std::string{"async"} : out;
}

std::string_view to_string(Signal signal) noexcept {
  switch (signal) {
    case Signal::Term: return "SIGTERM";
    case Signal::Kill: return "SIGKILL";
    case Signal::Int: return "SIGINT";
  }
  return "SIG?";
}

std::string_view to_string(KillScope scope) noexcept {
  switch (scope) {
    case KillScope::NoChildren: return "process";
    case KillScope::Children: return "process group";
  }
  return "?";
}

std::string_view to_string(KillResult result) noexcept {
  switch (result) {
    case KillResult::Ok: return "ok";
    case KillResult::BadSignal: return "bad signal";
    case KillResult::AccessDenied: return "access denied";
    case KillResult::NoProcess: return "no such process";
    case KillResult::Error: return "error";
  }
  return "?";
}

} // namespace jobwatch
