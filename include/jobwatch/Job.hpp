#pragma once

#include <chrono>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "jobwatch/Constants.hpp"
#include "jobwatch/Error.hpp"
#include "jobwatch/HostContext.hpp"
#include "jobwatch/Spawner.hpp"
#include "jobwatch/StreamReader.hpp"

namespace jobwatch {

// Exit code reported when the child's status could not be collected (someone
// else reaped it). Distinct from every exit status and negated signal number.
inline constexpr int UNKNOWN_EXIT_CODE = std::numeric_limits<int>::min();

enum class JobState {
  Idle,
  Running,
  Terminated
};

struct JobOptions {
  ExecFlags                               flags_ = ExecFlags::Async;
  std::optional<std::chrono::milliseconds> poll_interval_;
  std::chrono::milliseconds               reader_interval_ = DEFAULT_READER_INTERVAL;
  std::chrono::milliseconds               terminate_grace_ = DEFAULT_TERMINATE_GRACE;
  std::optional<std::vector<std::string>> environment_;
};

// Supervises one child process on behalf of a single-threaded host.
//
// The child's stdout and stderr are drained by two StreamReaders; poll(),
// called by the host or by a periodic tick armed on the host loop, forwards
// whatever they staged to on_data/on_error and reports the exit through
// on_exit exactly once. Every callback is delivered through HostContext::post.
//
// A Job runs at most once: Idle -> Running -> Terminated. The HostContext and
// the Spawner must outlive it.
//
// terminate() waits up to terminate_grace_ for the child to die. A child that
// outlives the grace period (a signal handler still cleaning up, or a kill
// that failed) is never escalated behind the caller's back: the job is
// Terminated but keeps the handle, and a later poll() reaps it and reports its
// real exit code. shutdown() and destruction escalate to SIGKILL.
class Job {
public:
  using DataCallback = std::function<void(std::string const& text)>;
  using ExitCallback = std::function<void(pid_t pid, int exit_code)>;

  Job(HostContext&             host,
      std::vector<std::string> command,
      JobOptions               options = {},
      Spawner&                 spawner = PosixSpawner::instance());

  // Force-kills a child that is still running or still exiting; owners should
  // call shutdown() first.
  ~Job();

  Job(Job const&)            = delete;
  Job& operator=(Job const&) = delete;
  Job(Job&&)                 = delete;
  Job& operator=(Job&&)      = delete;

  auto start(std::optional<std::string> working_dir = std::nullopt) -> Result<pid_t>;
  auto terminate(Signal signal = Signal::Term, KillScope scope = KillScope::NoChildren) -> Result<void>;
  void poll();
  void shutdown();

  [[nodiscard]] bool is_running() const noexcept {
    return child_ != nullptr;
  }
  [[nodiscard]] JobState state() const noexcept {
    return state_;
  }
  [[nodiscard]] std::optional<pid_t> pid() const noexcept {
    return pid_;
  }

  [[nodiscard]] std::vector<std::string> const& command() const noexcept {
    return command_;
  }
  auto set_command(std::vector<std::string> command) -> Result<void>;

  [[nodiscard]] ExecFlags flags() const noexcept {
    return options_.flags_;
  }
  auto set_flags(ExecFlags flags) -> Result<void>;

  [[nodiscard]] std::optional<std::vector<std::string>> const& environment() const noexcept {
    return options_.environment_;
  }
  auto set_environment(std::optional<std::vector<std::string>> environment) -> Result<void>;

  [[nodiscard]] std::optional<std::chrono::milliseconds> poll_interval() const noexcept {
    return options_.poll_interval_;
  }
  auto set_poll_interval(std::optional<std::chrono::milliseconds> interval) -> Result<void>;

  [[nodiscard]] DataCallback const& on_data() const noexcept {
    return on_data_;
  }
  void set_on_data(DataCallback callback) {
    on_data_ = std::move(callback);
  }

  [[nodiscard]] DataCallback const& on_error() const noexcept {
    return on_error_;
  }
  void set_on_error(DataCallback callback) {
    on_error_ = std::move(callback);
  }

  [[nodiscard]] ExitCallback const& on_exit() const noexcept {
    return on_exit_;
  }
  void set_on_exit(ExitCallback callback) {
    on_exit_ = std::move(callback);
  }

private:
  void on_tick();
  void arm_tick();
  void disarm_tick();

  void reap_lingering();
  void force_kill(ChildProcess& child, char const* context) noexcept;

  void dispatch(StreamReader& reader, DataCallback const& callback);
  void stop_readers() noexcept;
  [[nodiscard]] bool readers_drained() const;

  // Empty optional while the child is still alive after the grace period.
  auto await_exit(KillResult kill_result) -> std::optional<int>;
  void finish(pid_t pid, int exit_code);
  auto reject_while_running(char const* property) const -> Result<void>;

  HostContext& host_;
  Spawner&     spawner_;

  std::vector<std::string> command_;
  JobOptions               options_;
  JobState                 state_ = JobState::Idle;

  std::unique_ptr<ChildProcess> child_;
  std::optional<pid_t>          pid_;
  // Signalled by terminate() but not yet reaped.
  std::unique_ptr<ChildProcess> lingering_;
  std::unique_ptr<StreamReader> stdout_reader_;
  std::unique_ptr<StreamReader> stderr_reader_;

  std::optional<TimerId> tick_;
  // Exit status seen by poll() while the readers were still draining.
  std::optional<int> pending_exit_;
  bool               exit_reported_ = false;

  DataCallback on_data_;
  DataCallback on_error_;
  ExitCallback on_exit_;
};

std::string_view to_string(JobState state) noexcept;

} // namespace jobwatch
