#pragma once

#include <utility>

#include "jobwatch/Error.hpp"

namespace jobwatch {

// Owning wrapper around a POSIX file descriptor.
class FileDescriptor {
  int fd_ = -1;

public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd);
  ~FileDescriptor();
  FileDescriptor(FileDescriptor const&)            = delete;
  FileDescriptor& operator=(FileDescriptor const&) = delete;
  FileDescriptor(FileDescriptor&& other) noexcept;
  FileDescriptor& operator=(FileDescriptor&& other) noexcept;

  [[nodiscard]] int  get() const;
  [[nodiscard]] bool valid() const noexcept;
  int                release();
  void               reset(int fd = -1) noexcept;

  explicit operator bool() const noexcept {
    return valid();
  }
};

// {read end, write end}, both close-on-exec.
auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>>;

} // namespace jobwatch
