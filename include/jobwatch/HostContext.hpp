#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace jobwatch {

using Task    = std::function<void()>;
using TimerId = std::uint64_t;

// The thread a Job reports to. Everything a Job hands over through post() or
// a timer runs on that thread, never on a reader thread.
class HostContext {
public:
  virtual ~HostContext() = default;

  // Thread-safe.
  virtual void post(Task task) = 0;

  virtual TimerId schedule_every(std::chrono::milliseconds interval, Task task) = 0;
  virtual bool    reschedule(TimerId id, std::chrono::milliseconds interval)    = 0;
  virtual bool    cancel(TimerId id)                                            = 0;
};

// Single-threaded loop: posted tasks and repeating timers, run by whichever
// thread calls run*(). Only post() and stop() may be called from other threads.
class EventLoop : public HostContext {
  using Clock = std::chrono::steady_clock;

  struct Timer {
    std::chrono::milliseconds interval_;
    Clock::time_point         next_due_;
    Task                      task_;
  };

  std::mutex              mutex_;
  std::condition_variable wakeup_;
  std::deque<Task>        tasks_;
  bool                    stop_requested_ = false;

  std::map<TimerId, Timer> timers_;
  TimerId                  next_timer_id_ = 1;

public:
  EventLoop()           = default;
  ~EventLoop() override = default;

  EventLoop(EventLoop const&)            = delete;
  EventLoop& operator=(EventLoop const&) = delete;

  void    post(Task task) override;
  TimerId schedule_every(std::chrono::milliseconds interval, Task task) override;
  bool    reschedule(TimerId id, std::chrono::milliseconds interval) override;
  bool    cancel(TimerId id) override;

  // Waits up to `timeout` for work, then runs every due timer and every task
  // queued so far. Returns the number of callbacks run. An exception from a
  // callback propagates out of run*(); tasks not yet run stay queued.
  size_t run_once(std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

  void run_for(std::chrono::milliseconds duration);
  // True if `done` became true before the deadline.
  bool run_until(std::function<bool()> const& done, std::chrono::milliseconds timeout);
  // Runs until stop() is called.
  void run();
  // Thread-safe.
  void stop();

  [[nodiscard]] size_t timer_count() const noexcept {
    return timers_.size();
  }

private:
  size_t run_due_timers();
  size_t run_pending_tasks();
  auto   next_deadline() const -> Clock::time_point;
};

} // namespace jobwatch
