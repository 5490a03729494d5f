// src/common/event_loop.hpp
// A serial event context: posted tasks and repeating timers run one at a
// time on whichever thread drives the loop (run / run_for / run_until /
// run_pending). post() and quit() may be called from any thread, so audio
// and worker threads use post() to hand results back to the owner thread.
//
// Timers are only started, cancelled and fired on the driving thread.

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace common {

class EventLoop {
public:
  using Clock = std::chrono::steady_clock;
  using Seconds = std::chrono::duration<double>;
  using Task = std::function<void()>;
  using TimerId = std::uint64_t;

  EventLoop() = default;
  EventLoop(const EventLoop &) = delete;
  EventLoop &operator=(const EventLoop &) = delete;

  // Queue a task. Thread-safe.
  void post(Task task);

  // Start a repeating timer. The first tick is one period from now. A timer
  // is treated as due up to `tolerance` early so neighbouring wakeups can be
  // coalesced.
  TimerId schedule_repeating(Seconds period, Seconds tolerance, Task task);
  void cancel_timer(TimerId id);
  bool timer_active(TimerId id) const;

  // Run everything that is due right now. Returns the number of callbacks
  // invoked.
  std::size_t run_pending();

  // Drive the loop until the deadline passes or quit() is called.
  void run_for(Seconds duration);

  // Drive the loop until `done` returns true, the timeout elapses or quit()
  // is called. Returns the final value of `done`.
  bool run_until(const std::function<bool()> &done, Seconds timeout);

  // Drive the loop until quit().
  void run();

  // Thread-safe.
  void quit();

private:
  struct Timer {
    TimerId id;
    Clock::duration period;
    Clock::duration tolerance;
    Clock::time_point due;
    Task task;
  };

  bool drive(Clock::time_point deadline, const std::function<bool()> &done,
             bool *quitRequested);
  Clock::time_point next_wakeup(Clock::time_point deadline) const;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::deque<Task> tasks_;
  std::vector<Timer> timers_;
  TimerId nextTimerId_ = 1;
  bool quit_ = false;
};

} // namespace common
