#include "jobwatch/StreamReader.hpp"

#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <numeric>

#include "jobwatch/Log.hpp"
#include "jobwatch/Syscall.hpp"

namespace jobwatch {

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

std::string join_chunks(std::deque<std::string>& chunks, std::string tail = {}) {
  size_t total = std::accumulate(
      chunks.begin(), chunks.end(), tail.size(), [](size_t n, std::string const& c) { return n + c.size(); }
  );
  std::string out;
  out.reserve(total);
  for (auto& chunk : chunks) {
    out += chunk;
  }
  out += tail;
  chunks.clear();
  return out;
}

} // namespace

StreamReader::StreamReader(FileDescriptor source, std::chrono::milliseconds interval)
    : source_(std::move(source)), interval_(interval) {
  if (source_) {
    if (auto r = syscall::set_nonblocking(source_.get()); !r) {
      log::warn("cannot make pipe {} non-blocking: {}", source_.get(), std::strerror(r.error()));
    }
  }
}

StreamReader::~StreamReader() {
  stop();
}

void StreamReader::start() {
  if (started() || finished()) {
    return;
  }
  worker_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

void StreamReader::stop() noexcept {
  if (!worker_.joinable()) {
    // never started: nothing will close the pipe for us
    source_.reset();
    finished_.store(true, std::memory_order_release);
    return;
  }
  worker_.request_stop();
}

bool StreamReader::has_data() const {
  std::lock_guard lock(mutex_);
  return staged_.has_value();
}

std::string StreamReader::read() {
  std::lock_guard lock(mutex_);
  if (!staged_) {
    return {};
  }

  std::string out = std::move(*staged_);
  staged_.reset();
  if (!overflow_.empty()) {
    staged_ = join_chunks(overflow_);
  }
  return out;
}

void StreamReader::run(std::stop_token const& stop) {
  std::mutex                  sleep_mutex;
  std::condition_variable_any sleeper;

  while (true) {
    drain_pipe();

    {
      std::unique_lock lock(sleep_mutex);
      sleeper.wait_for(lock, stop, interval_, [] { return false; });
    }

    if (stop.stop_requested()) {
      break;
    }
  }

  // one last pass so bytes written just before the stop are not lost
  drain_pipe();
  source_.reset();
  finished_.store(true, std::memory_order_release);
}

void StreamReader::drain_pipe() {
  if (!source_ || at_eof()) {
    return;
  }

  std::array<char, READ_CHUNK_SIZE> buffer{};
  while (true) {
    auto n = syscall::read_fd(source_.get(), buffer.data(), buffer.size());
    if (!n) {
      if (n.error() == EINTR) {
        continue;
      }
      if (n.error() != EAGAIN && n.error() != EWOULDBLOCK) {
        log::debug("read from pipe {} failed: {}", source_.get(), std::strerror(n.error()));
        eof_.store(true, std::memory_order_release);
      }
      return;
    }

    if (*n == 0) {
      eof_.store(true, std::memory_order_release);
      return;
    }

    stage(std::string(buffer.data(), *n));
  }
}

void StreamReader::stage(std::string chunk) {
  std::lock_guard lock(mutex_);
  if (staged_) {
    overflow_.push_back(std::move(chunk));
    return;
  }

  if (overflow_.empty()) {
    staged_ = std::move(chunk);
  } else {
    staged_ = join_chunks(overflow_, std::move(chunk));
  }
}

} // namespace jobwatch
