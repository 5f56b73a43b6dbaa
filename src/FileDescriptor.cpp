#include "jobwatch/FileDescriptor.hpp"

#include <cstring>

#include "jobwatch/Syscall.hpp"

namespace jobwatch {

FileDescriptor::FileDescriptor(int fd)
    : fd_(fd) {}

FileDescriptor::~FileDescriptor() {
  reset();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.fd_) {
  other.fd_ = -1;
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
  if (this != &other) {
    reset(other.fd_);
    other.fd_ = -1;
  }
  return *this;
}

int FileDescriptor::get() const {
  return fd_;
}

bool FileDescriptor::valid() const noexcept {
  return fd_ != -1;
}

int FileDescriptor::release() {
  int old_fd = fd_;
  fd_        = -1;
  return old_fd;
}

void FileDescriptor::reset(int fd) noexcept {
  if (fd_ != -1) {
    // EINTR/EIO on close leave nothing to retry on Linux
    (void)syscall::close_fd(fd_);
  }
  fd_ = fd;
}

auto make_pipe() -> Result<std::pair<FileDescriptor, FileDescriptor>> {
  auto fds = syscall::create_pipe();
  if (!fds) {
    return fail(ErrorKind::Io, std::strerror(fds.error()), fds.error());
  }
  return std::pair{FileDescriptor{(*fds)[0]}, FileDescriptor{(*fds)[1]}};
}

} // namespace jobwatch
