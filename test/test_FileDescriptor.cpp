#include "jobwatch/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace jobwatch;

TEST(FileDescriptor, DestructorClosesFd) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int r = fds[0];
  {
    FileDescriptor fd(r);
  }
  errno  = 0;
  int rc = close(r);
  EXPECT_EQ(rc, -1);
  EXPECT_EQ(errno, EBADF);
  close(fds[1]);
}

TEST(FileDescriptor, MoveSemantics) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);
  int w = fds[1];
  {
    FileDescriptor a(fds[0]);
    FileDescriptor b(std::move(a));
    EXPECT_FALSE(a.valid());

    char c = 'x';
    ASSERT_EQ(write(w, &c, 1), 1) << std::strerror(errno);
    char buf{};
    ASSERT_EQ(read(b.get(), &buf, 1), 1) << std::strerror(errno);
    EXPECT_EQ(buf, 'x');
  }
  close(w);
}

TEST(FileDescriptor, DefaultConstructor) {
  FileDescriptor fd;
  EXPECT_EQ(fd.get(), -1);
  EXPECT_FALSE(fd);
}

TEST(FileDescriptor, MoveAssignmentClosesPrevious) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor a(fds[0]);
  FileDescriptor b(fds[1]);

  b = std::move(a);

  char test_data = 'x';
  EXPECT_EQ(write(fds[1], &test_data, 1), -1);
  EXPECT_EQ(errno, EBADF);
  EXPECT_EQ(a.get(), -1);
  EXPECT_EQ(b.get(), fds[0]);
}

TEST(FileDescriptor, Release) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  int original_fd = fd.release();

  EXPECT_EQ(original_fd, fds[0]);
  EXPECT_EQ(fd.get(), -1);

  close(original_fd);
  close(fds[1]);
}

TEST(FileDescriptor, ResetClosesAndAdopts) {
  std::array<int, 2> fds{};
  ASSERT_EQ(pipe2(fds.data(), O_CLOEXEC), 0) << std::strerror(errno);

  FileDescriptor fd(fds[0]);
  fd.reset(fds[1]);
  EXPECT_EQ(fd.get(), fds[1]);

  errno = 0;
  EXPECT_EQ(close(fds[0]), -1);
  EXPECT_EQ(errno, EBADF);

  fd.reset();
  EXPECT_FALSE(fd.valid());
}

TEST(FileDescriptor, MakePipe) {
  auto pipe = make_pipe();
  ASSERT_TRUE(pipe.has_value()) << pipe.error().message();

  auto& [read_end, write_end] = *pipe;
  EXPECT_TRUE(read_end.valid());
  EXPECT_TRUE(write_end.valid());
  EXPECT_NE(read_end.get(), write_end.get());
  EXPECT_NE(fcntl(read_end.get(), F_GETFD) & FD_CLOEXEC, 0);

  char c = 'p';
  ASSERT_EQ(write(write_end.get(), &c, 1), 1);
  char buf{};
  ASSERT_EQ(read(read_end.get(), &buf, 1), 1);
  EXPECT_EQ(buf, 'p');
}
