#include "jobwatch/Job.hpp"

#include <thread>

#include <fmt/format.h>

#include "jobwatch/Log.hpp"

namespace jobwatch {

namespace {

constexpr std::chrono::milliseconds REAP_POLL{5};

} // namespace

Job::Job(HostContext& host, std::vector<std::string> command, JobOptions options, Spawner& spawner)
    : host_(host), spawner_(spawner), command_(std::move(command)), options_(std::move(options)) {}

Job::~Job() {
  disarm_tick();

  if (child_) {
    force_kill(*child_, "discarded while running");
  }
  if (lingering_) {
    force_kill(*lingering_, "discarded while exiting");
  }

  stop_readers();
}

auto Job::start(std::optional<std::string> working_dir) -> Result<pid_t> {
  if (state_ == JobState::Running) {
    return fail(ErrorKind::InvalidState, "job is already running");
  }
  if (state_ == JobState::Terminated) {
    return fail(ErrorKind::InvalidState, "a terminated job cannot be restarted");
  }
  if (command_.empty()) {
    return fail(ErrorKind::InvalidState, "no command to run");
  }
  if (options_.poll_interval_ && options_.poll_interval_->count() <= 0) {
    return fail(
        ErrorKind::InvalidState,
        fmt::format("poll interval must be positive, got {}ms", options_.poll_interval_->count())
    );
  }

  SpawnRequest request{
      .args_        = command_,
      .working_dir_ = std::move(working_dir),
      .environment_ = options_.environment_,
      .flags_       = options_.flags_,
  };

  auto child = spawner_.spawn(request);
  if (!child) {
    log::debug("spawn of '{}' failed: {}", command_[0], child.error().message());
    return std::unexpected(std::move(child.error()));
  }

  child_ = std::move(*child);
  pid_   = child_->pid();

  stdout_reader_ = std::make_unique<StreamReader>(child_->take_stdout(), options_.reader_interval_);
  stderr_reader_ = std::make_unique<StreamReader>(child_->take_stderr(), options_.reader_interval_);
  stdout_reader_->start();
  stderr_reader_->start();

  state_ = JobState::Running;
  if (options_.poll_interval_) {
    arm_tick();
  }

  log::info("started '{}' as pid {}", command_[0], *pid_);
  return *pid_;
}

auto Job::terminate(Signal signal, KillScope scope) -> Result<void> {
  if (!is_running()) {
    return {};
  }

  // already exited and only waiting for the readers: nothing left to signal
  KillResult kill_result = pending_exit_ ? KillResult::Ok : child_->kill(signal, scope);
  stop_readers();

  std::optional<int> exit_code = pending_exit_ ? pending_exit_ : await_exit(kill_result);
  pid_t const        pid       = *pid_;

  pid_.reset();
  pending_exit_.reset();
  if (exit_code) {
    child_.reset();
    finish(pid, *exit_code);
  } else {
    // the tick, if any, keeps polling until the child is reaped
    log::debug("pid {} still alive {}ms after {}", pid, options_.terminate_grace_.count(), to_string(signal));
    lingering_ = std::move(child_);
    state_     = JobState::Terminated;
  }

  if (kill_result != KillResult::Ok) {
    return fail(
        ErrorKind::Termination,
        fmt::format("{} to {} {} failed: {}", to_string(signal), to_string(scope), pid, to_string(kill_result)),
        static_cast<int>(kill_result)
    );
  }
  return {};
}

void Job::poll() {
  if (lingering_) {
    reap_lingering();
    return;
  }
  if (!child_) {
    return;
  }

  std::optional<int> exit_code = pending_exit_;
  if (!exit_code) {
    if (auto status = child_->try_wait(); status) {
      exit_code = *status;
    } else {
      // someone else reaped our child; there is no status left to report
      log::warn("{}", status.error().message());
      exit_code = UNKNOWN_EXIT_CODE;
    }
  }

  dispatch(*stdout_reader_, on_data_);
  dispatch(*stderr_reader_, on_error_);

  if (!exit_code) {
    return;
  }

  if (!pending_exit_) {
    pending_exit_ = exit_code;
    // readers make one last pass over the pipes before they close them
    stop_readers();
  }

  if (!readers_drained()) {
    return;
  }

  pid_t const pid = *pid_;
  child_.reset();
  pid_.reset();
  pending_exit_.reset();
  finish(pid, *exit_code);
}

void Job::shutdown() {
  if (lingering_) {
    // exit still gets reported by a later poll(), with the real status
    force_kill(*lingering_, "shut down while exiting");
    return;
  }
  if (auto r = terminate(Signal::Kill, KillScope::Children); !r) {
    log::debug("shutdown: {}", r.error().message());
  }
}

auto Job::set_command(std::vector<std::string> command) -> Result<void> {
  if (auto r = reject_while_running("command"); !r) {
    return r;
  }
  command_ = std::move(command);
  return {};
}

auto Job::set_flags(ExecFlags flags) -> Result<void> {
  if (auto r = reject_while_running("flags"); !r) {
    return r;
  }
  options_.flags_ = flags;
  return {};
}

auto Job::set_environment(std::optional<std::vector<std::string>> environment) -> Result<void> {
  if (auto r = reject_while_running("environment"); !r) {
    return r;
  }
  options_.environment_ = std::move(environment);
  return {};
}

auto Job::set_poll_interval(std::optional<std::chrono::milliseconds> interval) -> Result<void> {
  if (interval && interval->count() <= 0) {
    return fail(ErrorKind::InvalidState, fmt::format("poll interval must be positive, got {}ms", interval->count()));
  }

  options_.poll_interval_ = interval;
  if (!interval) {
    disarm_tick();
  } else if (tick_) {
    host_.reschedule(*tick_, *interval);
  } else if (state_ == JobState::Running || lingering_) {
    arm_tick();
  }
  return {};
}

void Job::on_tick() {
  poll();
}

void Job::arm_tick() {
  disarm_tick();
  tick_ = host_.schedule_every(*options_.poll_interval_, [this] { on_tick(); });
}

void Job::disarm_tick() {
  if (tick_) {
    host_.cancel(*tick_);
    tick_.reset();
  }
}

void Job::reap_lingering() {
  auto status = lingering_->try_wait();
  if (status && !status->has_value()) {
    return;
  }
  if (!status) {
    log::warn("{}", status.error().message());
  }

  int const   exit_code = status ? **status : UNKNOWN_EXIT_CODE;
  pid_t const pid       = lingering_->pid();
  lingering_.reset();
  finish(pid, exit_code);
}

void Job::force_kill(ChildProcess& child, char const* context) noexcept {
  log::debug("pid {} {}, killing it", child.pid(), context);
  if (auto r = child.kill(Signal::Kill, KillScope::Children); r != KillResult::Ok) {
    log::debug("kill of pid {}: {}", child.pid(), to_string(r));
  }
}

void Job::dispatch(StreamReader& reader, DataCallback const& callback) {
  if (!reader.has_data()) {
    return;
  }

  std::string text = reader.read();
  if (callback) {
    host_.post([callback, text = std::move(text)] { callback(text); });
  }
}

void Job::stop_readers() noexcept {
  if (stdout_reader_) {
    stdout_reader_->stop();
  }
  if (stderr_reader_) {
    stderr_reader_->stop();
  }
}

bool Job::readers_drained() const {
  auto drained = [](std::unique_ptr<StreamReader> const& reader) {
    return !reader || (reader->finished() && !reader->has_data());
  };
  return drained(stdout_reader_) && drained(stderr_reader_);
}

auto Job::await_exit(KillResult kill_result) -> std::optional<int> {
  auto const deadline = std::chrono::steady_clock::now() + options_.terminate_grace_;
  while (true) {
    auto status = child_->try_wait();
    if (!status) {
      log::warn("{}", status.error().message());
      return UNKNOWN_EXIT_CODE;
    }
    if (status->has_value()) {
      return **status;
    }
    // a failed kill gives the child no reason to die within the grace period
    if (kill_result != KillResult::Ok || std::chrono::steady_clock::now() >= deadline) {
      return std::nullopt;
    }
    std::this_thread::sleep_for(REAP_POLL);
  }
}

void Job::finish(pid_t pid, int exit_code) {
  if (exit_reported_) {
    return;
  }
  exit_reported_ = true;

  disarm_tick();
  state_ = JobState::Terminated;
  log::info("pid {} finished with exit code {}", pid, exit_code);

  if (on_exit_) {
    host_.post([callback = on_exit_, pid, exit_code] { callback(pid, exit_code); });
  }
}

auto Job::reject_while_running(char const* property) const -> Result<void> {
  if (is_running()) {
    return fail(ErrorKind::InvalidState, fmt::format("cannot set {} while the process is running", property));
  }
  return {};
}

std::string_view to_string(JobState state) noexcept {
  switch (state) {
    case JobState::Idle: return "idle";
    case JobState::Running: return "running";
    case JobState::Terminated: return "terminated";
  }
  return "?";
}

} // namespace jobwatch
