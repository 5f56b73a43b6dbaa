#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "jobwatch/Constants.hpp"
#include "jobwatch/Error.hpp"
#include "jobwatch/FileDescriptor.hpp"

namespace jobwatch {

struct SpawnRequest {
  std::vector<std::string>                args_;
  std::optional<std::string>              working_dir_;
  std::optional<std::vector<std::string>> environment_; // KEY=VALUE, empty optional inherits ours
  ExecFlags                               flags_ = ExecFlags::Async;
};

// A started child with its stdout/stderr redirected into pipes we own.
class ChildProcess {
public:
  virtual ~ChildProcess() = default;

  [[nodiscard]] virtual pid_t pid() const noexcept             = 0;
  [[nodiscard]] virtual bool  is_group_leader() const noexcept = 0;

  // Read ends of the output pipes. Each can be taken once.
  virtual FileDescriptor take_stdout() = 0;
  virtual FileDescriptor take_stderr() = 0;

  // Non-blocking. Empty optional while the child is alive, exit code once it
  // has been reaped (the negated signal number for signal deaths).
  virtual auto try_wait() -> Result<std::optional<int>> = 0;

  virtual auto kill(Signal signal, KillScope scope) -> KillResult = 0;
};

class Spawner {
public:
  virtual ~Spawner() = default;

  virtual auto spawn(SpawnRequest const& request) -> Result<std::unique_ptr<ChildProcess>> = 0;
};

// Spawner backed by posix_spawnp(3).
class PosixSpawner : public Spawner {
public:
  auto spawn(SpawnRequest const& request) -> Result<std::unique_ptr<ChildProcess>> override;

  static PosixSpawner& instance() {
    static PosixSpawner instance;
    return instance;
  }
};

} // namespace jobwatch
