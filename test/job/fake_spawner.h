#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "jobwatch/Spawner.hpp"

namespace jobwatch::test {

// Shared between a FakeSpawner, the children it hands out and the test.
struct FakeChildState {
  std::optional<int>                     exit_code_;
  std::optional<Error>                   wait_error_;
  std::vector<std::pair<Signal, KillScope>> kills_;
  KillResult                             kill_result_  = KillResult::Ok;
  bool                                   exit_on_kill_ = true;
  bool                                   destroyed_    = false;
  FileDescriptor                         stdout_write_;
  FileDescriptor                         stderr_write_;

  // Child "exits": status becomes visible and its pipe ends close.
  void exit(int code) {
    exit_code_ = code;
    stdout_write_.reset();
    stderr_write_.reset();
  }
};

class FakeChild : public ChildProcess {
  std::shared_ptr<FakeChildState> state_;
  pid_t                           pid_;
  bool                            group_leader_;
  FileDescriptor                  stdout_read_;
  FileDescriptor                  stderr_read_;

public:
  FakeChild(std::shared_ptr<FakeChildState> state, pid_t pid, bool group_leader, FileDescriptor out, FileDescriptor err)
      : state_(std::move(state))
      , pid_(pid)
      , group_leader_(group_leader)
      , stdout_read_(std::move(out))
      , stderr_read_(std::move(err)) {}

  ~FakeChild() override {
    state_->destroyed_ = true;
  }

  pid_t pid() const noexcept override {
    return pid_;
  }
  bool is_group_leader() const noexcept override {
    return group_leader_;
  }
  FileDescriptor take_stdout() override {
    return std::move(stdout_read_);
  }
  FileDescriptor take_stderr() override {
    return std::move(stderr_read_);
  }

  auto try_wait() -> Result<std::optional<int>> override {
    if (state_->wait_error_) {
      return std::unexpected(*state_->wait_error_);
    }
    return state_->exit_code_;
  }

  auto kill(Signal signal, KillScope scope) -> KillResult override {
    state_->kills_.emplace_back(signal, scope);
    if (state_->kill_result_ == KillResult::Ok && state_->exit_on_kill_ && !state_->exit_code_) {
      state_->exit(-static_cast<int>(signal));
    }
    return state_->kill_result_;
  }
};

class FakeSpawner : public Spawner {
public:
  static constexpr pid_t FAKE_PID = 4242;

  std::shared_ptr<FakeChildState> state_ = std::make_shared<FakeChildState>();
  std::optional<Error>            fail_with_;
  std::optional<SpawnRequest>     last_request_;
  int                             spawn_count_ = 0;

  auto spawn(SpawnRequest const& request) -> Result<std::unique_ptr<ChildProcess>> override {
    ++spawn_count_;
    last_request_ = request;
    if (fail_with_) {
      return std::unexpected(*fail_with_);
    }

    auto out = make_pipe();
    auto err = make_pipe();
    if (!out || !err) {
      return fail(ErrorKind::Spawn, "fake spawner could not create pipes");
    }
    state_->stdout_write_ = std::move(out->second);
    state_->stderr_write_ = std::move(err->second);

    return std::make_unique<FakeChild>(
        state_,
        FAKE_PID,
        has_flag(request.flags_, ExecFlags::MakeGroupLeader),
        std::move(out->first),
        std::move(err->first)
    );
  }
};

} // namespace jobwatch::test
