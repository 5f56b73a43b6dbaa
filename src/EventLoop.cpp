#include <algorithm>
#include <iterator>
#include <vector>

#include "jobwatch/HostContext.hpp"
#include "jobwatch/Log.hpp"

namespace jobwatch {

namespace {

constexpr std::chrono::milliseconds PREDICATE_RECHECK{5};
constexpr std::chrono::milliseconds IDLE_WAIT{1000};

} // namespace

void EventLoop::post(Task task) {
  {
    std::lock_guard lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  wakeup_.notify_one();
}

TimerId EventLoop::schedule_every(std::chrono::milliseconds interval, Task task) {
  TimerId id  = next_timer_id_++;
  timers_[id] = Timer{interval, Clock::now() + interval, std::move(task)};
  log::debug("timer {} armed every {}ms", id, interval.count());
  return id;
}

bool EventLoop::reschedule(TimerId id, std::chrono::milliseconds interval) {
  auto it = timers_.find(id);
  if (it == timers_.end()) {
    return false;
  }
  it->second.interval_ = interval;
  it->second.next_due_ = Clock::now() + interval;
  return true;
}

bool EventLoop::cancel(TimerId id) {
  return timers_.erase(id) > 0;
}

size_t EventLoop::run_once(std::chrono::milliseconds timeout) {
  {
    std::unique_lock lock(mutex_);
    auto             wake = std::min(Clock::now() + timeout, next_deadline());
    wakeup_.wait_until(lock, wake, [this] { return !tasks_.empty() || stop_requested_; });
  }

  size_t ran = run_due_timers();
  ran += run_pending_tasks();
  return ran;
}

void EventLoop::run_for(std::chrono::milliseconds duration) {
  auto const deadline = Clock::now() + duration;
  while (true) {
    auto now = Clock::now();
    if (now >= deadline) {
      break;
    }
    run_once(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));

    std::lock_guard lock(mutex_);
    if (stop_requested_) {
      stop_requested_ = false;
      break;
    }
  }
}

bool EventLoop::run_until(std::function<bool()> const& done, std::chrono::milliseconds timeout) {
  auto const deadline = Clock::now() + timeout;
  while (!done()) {
    auto now = Clock::now();
    if (now >= deadline) {
      return false;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    run_once(std::min(remaining, PREDICATE_RECHECK));
  }
  return true;
}

void EventLoop::run() {
  while (true) {
    run_once(IDLE_WAIT);

    std::lock_guard lock(mutex_);
    if (stop_requested_) {
      stop_requested_ = false;
      break;
    }
  }
}

void EventLoop::stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  wakeup_.notify_one();
}

size_t EventLoop::run_due_timers() {
  auto const now = Clock::now();

  std::vector<TimerId> due;
  for (auto const& [id, timer] : timers_) {
    if (timer.next_due_ <= now) {
      due.push_back(id);
    }
  }

  size_t ran = 0;
  for (TimerId id : due) {
    // an earlier callback may have cancelled this one
    auto it = timers_.find(id);
    if (it == timers_.end()) {
      continue;
    }
    it->second.next_due_ = now + it->second.interval_;
    Task task            = it->second.task_;
    task();
    ++ran;
  }
  return ran;
}

size_t EventLoop::run_pending_tasks() {
  std::deque<Task> pending;
  {
    std::lock_guard lock(mutex_);
    pending.swap(tasks_);
  }

  for (size_t i = 0; i < pending.size(); ++i) {
    try {
      pending[i]();
    } catch (...) {
      // tasks behind the throwing one run on the next pass, ahead of newer ones
      std::lock_guard lock(mutex_);
      tasks_.insert(
          tasks_.begin(), std::make_move_iterator(pending.begin() + i + 1), std::make_move_iterator(pending.end())
      );
      throw;
    }
  }
  return pending.size();
}

auto EventLoop::next_deadline() const -> Clock::time_point {
  auto deadline = Clock::time_point::max();
  for (auto const& [_, timer] : timers_) {
    deadline = std::min(deadline, timer.next_due_);
  }
  return deadline;
}

} // namespace jobwatch
