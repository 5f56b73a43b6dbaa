#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "jobwatch/Constants.hpp"
#include "jobwatch/FileDescriptor.hpp"

namespace jobwatch {

// Drains one pipe on a background thread and hands the newest chunk to a
// non-blocking consumer.
//
// Chunks arriving while the previous one is still unread are queued in an
// overflow list and coalesced, in arrival order, into the slot as soon as it
// frees up. Nothing is dropped and per-pipe order is kept.
class StreamReader {
  FileDescriptor            source_;
  std::chrono::milliseconds interval_;

  mutable std::mutex         mutex_;
  std::optional<std::string> staged_;
  std::deque<std::string>    overflow_;

  std::atomic<bool> eof_{false};
  std::atomic<bool> finished_{false};

  // Declared last so the worker is joined before the buffers go away.
  std::jthread worker_;

public:
  explicit StreamReader(FileDescriptor source, std::chrono::milliseconds interval = DEFAULT_READER_INTERVAL);

  // Requests a stop and joins the worker.
  ~StreamReader();

  StreamReader(StreamReader const&)            = delete;
  StreamReader& operator=(StreamReader const&) = delete;
  StreamReader(StreamReader&&)                 = delete;
  StreamReader& operator=(StreamReader&&)      = delete;

  void start();
  void stop() noexcept;

  [[nodiscard]] bool has_data() const;
  std::string        read();

  [[nodiscard]] bool started() const noexcept {
    return worker_.joinable();
  }
  [[nodiscard]] bool at_eof() const noexcept {
    return eof_.load(std::memory_order_acquire);
  }
  [[nodiscard]] bool finished() const noexcept {
    return finished_.load(std::memory_order_acquire);
  }
  [[nodiscard]] std::chrono::milliseconds interval() const noexcept {
    return interval_;
  }

private:
  void run(std::stop_token const& stop);
  void drain_pipe();
  void stage(std::string chunk);
};

} // namespace jobwatch
