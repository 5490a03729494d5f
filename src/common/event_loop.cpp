// src/common/event_loop.cpp

#include "common/event_loop.hpp"

#include <algorithm>

namespace common {

namespace {

// Upper bound for a single wait so that "forever" never reaches
// time_point::max() arithmetic.
constexpr auto kMaxWait = std::chrono::hours(1);

} // namespace

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  wake_.notify_one();
}

EventLoop::TimerId EventLoop::schedule_repeating(Seconds period,
                                                 Seconds tolerance,
                                                 Task task) {
  const auto p = std::chrono::duration_cast<Clock::duration>(period);
  const auto tol = std::chrono::duration_cast<Clock::duration>(tolerance);
  std::lock_guard<std::mutex> lock(mutex_);
  const TimerId id = nextTimerId_++;
  timers_.push_back(Timer{id, p, tol, Clock::now() + p, std::move(task)});
  return id;
}

void EventLoop::cancel_timer(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                               [id](const Timer &t) { return t.id == id; }),
                timers_.end());
}

bool EventLoop::timer_active(TimerId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(timers_.begin(), timers_.end(),
                     [id](const Timer &t) { return t.id == id; });
}

std::size_t EventLoop::run_pending() {
  std::deque<Task> tasks;
  std::vector<TimerId> due;
  Clock::time_point now;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks.swap(tasks_);
    now = Clock::now();
    for (const auto &t : timers_) {
      if (now + t.tolerance >= t.due)
        due.push_back(t.id);
    }
  }

  std::size_t count = 0;
  for (auto &task : tasks) {
    task();
    ++count;
  }

  // A task may have cancelled a timer, so look each one up again.
  for (const TimerId id : due) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = std::find_if(timers_.begin(), timers_.end(),
                             [id](const Timer &t) { return t.id == id; });
      if (it == timers_.end())
        continue;
      task = it->task;
      it->due += it->period;
      if (it->due + it->tolerance <= now) {
        // Fell behind by more than a period: skip the missed ticks.
        it->due = now + it->period;
      }
    }
    task();
    ++count;
  }
  return count;
}

EventLoop::Clock::time_point
EventLoop::next_wakeup(Clock::time_point deadline) const {
  auto wakeup = std::min(deadline, Clock::now() + kMaxWait);
  for (const auto &t : timers_)
    wakeup = std::min(wakeup, t.due - t.tolerance);
  return wakeup;
}

bool EventLoop::drive(Clock::time_point deadline,
                      const std::function<bool()> &done, bool *quitRequested) {
  for (;;) {
    run_pending();
    if (done && done())
      return true;

    std::unique_lock<std::mutex> lock(mutex_);
    if (quit_) {
      quit_ = false;
      if (quitRequested)
        *quitRequested = true;
      break;
    }
    if (Clock::now() >= deadline)
      break;
    if (!tasks_.empty())
      continue;
    wake_.wait_until(lock, next_wakeup(deadline));
  }
  return done ? done() : false;
}

void EventLoop::run_for(Seconds duration) {
  drive(Clock::now() + std::chrono::duration_cast<Clock::duration>(duration),
        nullptr, nullptr);
}

bool EventLoop::run_until(const std::function<bool()> &done,
                          Seconds timeout) {
  return drive(Clock::now() +
                   std::chrono::duration_cast<Clock::duration>(timeout),
               done, nullptr);
}

void EventLoop::run() {
  bool quitRequested = false;
  while (!quitRequested)
    drive(Clock::now() + kMaxWait, nullptr, &quitRequested);
}

void EventLoop::quit() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    quit_ = true;
  }
  wake_.notify_all();
}

} // namespace common
