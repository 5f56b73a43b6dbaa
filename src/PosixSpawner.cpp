#include <cerrno>
#include <csignal>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spawn.h>
#include <unistd.h>

#include "jobwatch/Log.hpp"
#include "jobwatch/Spawner.hpp"
#include "jobwatch/Syscall.hpp"

namespace jobwatch {

extern "C" {
  extern char** environ; // NOLINT
}

namespace {

class SpawnFileActions {
  posix_spawn_file_actions_t actions_;
  int                        init_error_;

public:
  SpawnFileActions()
      : init_error_(posix_spawn_file_actions_init(&actions_)) {}

  ~SpawnFileActions() {
    if (init_error_ == 0) {
      posix_spawn_file_actions_destroy(&actions_);
    }
  }

  SpawnFileActions(SpawnFileActions const&)            = delete;
  SpawnFileActions& operator=(SpawnFileActions const&) = delete;

  [[nodiscard]] int init_error() const noexcept {
    return init_error_;
  }
  posix_spawn_file_actions_t* get() noexcept {
    return &actions_;
  }
};

class SpawnAttributes {
  posix_spawnattr_t attrs_;
  int               init_error_;

public:
  SpawnAttributes()
      : init_error_(posix_spawnattr_init(&attrs_)) {}

  ~SpawnAttributes() {
    if (init_error_ == 0) {
      posix_spawnattr_destroy(&attrs_);
    }
  }

  SpawnAttributes(SpawnAttributes const&)            = delete;
  SpawnAttributes& operator=(SpawnAttributes const&) = delete;

  [[nodiscard]] int init_error() const noexcept {
    return init_error_;
  }
  posix_spawnattr_t* get() noexcept {
    return &attrs_;
  }
};

KillResult kill_result_from_errno(int err) noexcept {
  switch (err) {
    case EINVAL: return KillResult::BadSignal;
    case EPERM: return KillResult::AccessDenied;
    case ESRCH: return KillResult::NoProcess;
    default: return KillResult::Error;
  }
}

class PosixChild : public ChildProcess {
  pid_t              pid_;
  bool               group_leader_;
  FileDescriptor     stdout_;
  FileDescriptor     stderr_;
  std::optional<int> exit_code_;

public:
  PosixChild(pid_t pid, bool group_leader, FileDescriptor out, FileDescriptor err)
      : pid_(pid), group_leader_(group_leader), stdout_(std::move(out)), stderr_(std::move(err)) {}

  // Last-resort cleanup: a child nobody reaped is killed and waited for so it
  // does not linger as a zombie. If SIGKILL cannot be delivered the wait could
  // block forever, so the child is left unreaped.
  ~PosixChild() override {
    if (exit_code_) {
      return;
    }
    if (auto r = syscall::kill_process(pid_, SIGKILL); !r && r.error() != ESRCH) {
      log::debug("kill({}) during cleanup failed, leaving it unreaped: {}", pid_, std::strerror(r.error()));
      return;
    }
    if (auto r = syscall::wait_for_process(pid_); !r) {
      log::debug("waitpid({}) during cleanup failed: {}", pid_, std::strerror(r.error()));
    }
  }

  PosixChild(PosixChild const&)            = delete;
  PosixChild& operator=(PosixChild const&) = delete;

  [[nodiscard]] pid_t pid() const noexcept override {
    return pid_;
  }

  [[nodiscard]] bool is_group_leader() const noexcept override {
    return group_leader_;
  }

  FileDescriptor take_stdout() override {
    return std::move(stdout_);
  }

  FileDescriptor take_stderr() override {
    return std::move(stderr_);
  }

  auto try_wait() -> Result<std::optional<int>> override {
    if (exit_code_) {
      return exit_code_;
    }

    auto info = syscall::try_wait_for_process(pid_);
    if (!info) {
      return fail(
          ErrorKind::Io, fmt::format("waitpid({}) failed: {}", pid_, std::strerror(info.error())), info.error()
      );
    }
    if (!info->has_value()) {
      return std::nullopt;
    }

    exit_code_ = syscall::decode_wait_status((*info)->status_);
    return exit_code_;
  }

  auto kill(Signal signal, KillScope scope) -> KillResult override {
    if (exit_code_) {
      return KillResult::NoProcess;
    }

    auto const signo = static_cast<int>(signal);
    auto       r     = scope == KillScope::Children && group_leader_ ? syscall::kill_group(pid_, signo)
                                                                     : syscall::kill_process(pid_, signo);
    if (!r) {
      log::debug("{} to {} {} failed: {}", to_string(signal), to_string(scope), pid_, std::strerror(r.error()));
      return kill_result_from_errno(r.error());
    }
    return KillResult::Ok;
  }
};

} // namespace

auto PosixSpawner::spawn(SpawnRequest const& request) -> Result<std::unique_ptr<ChildProcess>> {
  if (request.args_.empty() || request.args_[0].empty()) {
    return fail(ErrorKind::Spawn, "empty command");
  }

  auto out_pipe = make_pipe();
  if (!out_pipe) {
    return fail(ErrorKind::Spawn, fmt::format("stdout pipe: {}", out_pipe.error().message()), out_pipe.error().code());
  }
  auto err_pipe = make_pipe();
  if (!err_pipe) {
    return fail(ErrorKind::Spawn, fmt::format("stderr pipe: {}", err_pipe.error().message()), err_pipe.error().code());
  }
  auto& [out_read, out_write] = *out_pipe;
  auto& [err_read, err_write] = *err_pipe;

  SpawnFileActions actions;
  if (int err = actions.init_error()) {
    return fail(ErrorKind::Spawn, fmt::format("posix_spawn_file_actions_init failed: {}", std::strerror(err)), err);
  }
  // the pipe ends themselves are close-on-exec, only the dup'ed copies survive
  if (int err = posix_spawn_file_actions_adddup2(actions.get(), out_write.get(), STDOUT_FILENO)) {
    return fail(ErrorKind::Spawn, fmt::format("posix_spawn_file_actions_adddup2 (stdout) failed: {}", std::strerror(err)), err);
  }
  if (int err = posix_spawn_file_actions_adddup2(actions.get(), err_write.get(), STDERR_FILENO)) {
    return fail(ErrorKind::Spawn, fmt::format("posix_spawn_file_actions_adddup2 (stderr) failed: {}", std::strerror(err)), err);
  }
  if (request.working_dir_) {
    if (int err = posix_spawn_file_actions_addchdir_np(actions.get(), request.working_dir_->c_str())) {
      return fail(ErrorKind::Spawn, fmt::format("posix_spawn_file_actions_addchdir_np failed: {}", std::strerror(err)), err);
    }
  }

  SpawnAttributes attrs;
  if (int err = attrs.init_error()) {
    return fail(ErrorKind::Spawn, fmt::format("posix_spawnattr_init failed: {}", std::strerror(err)), err);
  }

  short    spawn_flags = POSIX_SPAWN_SETSIGMASK;
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  if (int err = posix_spawnattr_setsigmask(attrs.get(), &empty_mask)) {
    return fail(ErrorKind::Spawn, fmt::format("posix_spawnattr_setsigmask failed: {}", std::strerror(err)), err);
  }

  bool const group_leader = has_flag(request.flags_, ExecFlags::MakeGroupLeader);
  if (group_leader) {
    // pgid 0 -> the child leads a new group named after its pid
    spawn_flags |= POSIX_SPAWN_SETPGROUP;
    if (int err = posix_spawnattr_setpgroup(attrs.get(), 0)) {
      return fail(ErrorKind::Spawn, fmt::format("posix_spawnattr_setpgroup failed: {}", std::strerror(err)), err);
    }
  }
  if (int err = posix_spawnattr_setflags(attrs.get(), spawn_flags)) {
    return fail(ErrorKind::Spawn, fmt::format("posix_spawnattr_setflags failed: {}", std::strerror(err)), err);
  }

  std::vector<char*> argv;
  argv.reserve(request.args_.size() + 1);
  for (auto const& arg : request.args_) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  std::vector<char*> envp;
  if (request.environment_) {
    envp.reserve(request.environment_->size() + 1);
    for (auto const& entry : *request.environment_) {
      envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);
  }

  pid_t pid = -1;
  int   err = posix_spawnp(&pid, argv[0], actions.get(), attrs.get(), argv.data(), request.environment_ ? envp.data() : environ);
  if (err != 0) {
    return fail(ErrorKind::Spawn, fmt::format("failed to spawn '{}': {}", request.args_[0], std::strerror(err)), err);
  }

  log::debug("spawned '{}' as pid {} ({})", request.args_[0], pid, to_string(request.flags_));

  return std::make_unique<PosixChild>(pid, group_leader, std::move(out_read), std::move(err_read));
}

} // namespace jobwatch
